#pragma once

#include <arrow/buffer.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace localdisk::persistence {

/*
  Exclusive, time-bounded write permission on one blob.

  Destroying the handle gives the lease up. Release() does the same
  eagerly and reports failures instead of logging them.
*/
class BlobLease {
 public:
  virtual ~BlobLease() = default;

  virtual const std::string& LeaseId() const = 0;

  virtual void Release() = 0;
};

/*
  Blob container abstraction.

  Implementations:
    LOCAL DISK → directory tree + lease side files
    (cloud object stores live behind the same interface elsewhere)

  Errors are reported with the util::errors exception types.
*/
class Blob {
 public:
  virtual ~Blob() = default;

  // ------------------------------------------------------------------
  // Lease
  // ------------------------------------------------------------------
  /*
    Take an exclusive lease on an existing blob.

    Throws NotFound if the blob does not exist, LeaseConflict if an
    unexpired lease is held by someone else.
  */
  virtual std::unique_ptr<BlobLease> LeaseBlob(const std::string& blob, std::chrono::milliseconds duration) = 0;

  // ------------------------------------------------------------------
  // Upload
  // ------------------------------------------------------------------
  /*
    Store data under the blob name. The payload length is data->size().

    Throws AlreadyExists when the blob exists and overwrite is false,
    LeaseNotFound when lease_id is given but no lease exists,
    LeaseConflict when an active lease is held and lease_id does not match.
  */
  virtual void UploadBlob(const std::string& blob, const std::shared_ptr<arrow::Buffer>& data, bool overwrite,
                          const std::optional<std::string>& lease_id) = 0;

  // ------------------------------------------------------------------
  // Download
  // ------------------------------------------------------------------
  virtual std::string DownloadBlob(const std::string& blob) = 0;

  // ------------------------------------------------------------------
  // Delete
  // ------------------------------------------------------------------
  /*
    Remove every blob, lease and lock of the container. Best effort,
    a crash midway leaves a partially emptied container.
  */
  virtual void DeleteContainer() = 0;
};

using BlobPtr = std::shared_ptr<Blob>;

} // namespace localdisk::persistence
