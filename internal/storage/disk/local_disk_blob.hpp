#pragma once

#include <arrow/buffer.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/persistence/blob.hpp"
#include "internal/util/retry.hpp"

namespace localdisk::v1 {
class LeaseRecord;
}

namespace localdisk::storage {

/*
  Blob container on the local file system.

  Layout under <path>/<name>:
    <blob>          payload
    <blob>.lease    active lease, JSON LeaseRecord
    <blob>.lease.lock
                    marker held while a lease is decided and written

  Properties:
    - atomic replace writes (temporary file + rename/link)
    - leases coordinate independent processes, no shared memory
    - expiry is checked lazily by the next reader

  Meant for development and single machine setups only.
*/

class LocalDiskBlob final : public persistence::Blob {
 public:
  explicit LocalDiskBlob(localdisk::runtime::config::BlobConfig config);

  // absolute <path>/<name>
  static std::filesystem::path WorkingPath(const localdisk::runtime::config::BlobConfig& config);

  const std::filesystem::path& Root() const {
    return root_;
  }

  std::unique_ptr<persistence::BlobLease> LeaseBlob(const std::string& blob, std::chrono::milliseconds duration) override;

  void UploadBlob(const std::string& blob, const std::shared_ptr<arrow::Buffer>& data, bool overwrite,
                  const std::optional<std::string>& lease_id) override;

  std::string DownloadBlob(const std::string& blob) override;

  void DeleteContainer() override;

 private:
  std::unique_ptr<persistence::BlobLease> TryLease(const std::string& blob, std::chrono::milliseconds duration);

  void CheckLease(const std::string& blob, const std::filesystem::path& lease_file, const std::optional<std::string>& lease_id);

  void ReclaimExpiredLease(const std::filesystem::path& lease_file, const localdisk::v1::LeaseRecord& expired);

  localdisk::runtime::config::BlobConfig config_;
  std::filesystem::path                  root_;
  std::chrono::milliseconds              poll_interval_;
  util::RetryPolicy                      lease_retry_;
};

}
