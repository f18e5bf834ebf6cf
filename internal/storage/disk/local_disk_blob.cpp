#include "local_disk_blob.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include "api/localdisk/v1/lease.pb.h"
#include "file_lock.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace localdisk::storage {

using namespace localdisk::storage::common;
using localdisk::observability::IntField;
using localdisk::observability::StringField;
using localdisk::v1::LeaseRecord;

namespace fs = std::filesystem;

namespace {

constexpr const char* kDefaultContainerPath = "scraping-results";

// Lease-file read races get one retry on the upload path.
constexpr uint32_t kUploadLeaseAttempts = 2;

/*
  Read the lease side file.

  nullopt       → no lease
  RaceLost      → file vanished mid-read or holds a half written record
*/
std::optional<LeaseRecord> ReadLease(const fs::path& lease_file) {
  if (!fs::exists(lease_file)) {
    return std::nullopt;
  }

  std::string raw;
  try {
    raw = ReadFile(lease_file)->ToString();
  } catch (const std::runtime_error&) {
    if (!fs::exists(lease_file)) {
      throw util::RaceLost("lease file removed while reading: " + lease_file.string());
    }
    throw;
  }

  LeaseRecord lease;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(raw, &lease, options);
  if (!status.ok() || lease.lease_id().empty()) {
    throw util::RaceLost("lease file is not a valid lease record: " + lease_file.string());
  }
  return lease;
}

// Lease files are replaced atomically so readers never see a partial record.
void WriteLease(const fs::path& lease_file, const LeaseRecord& lease) {
  std::string json;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  auto status = google::protobuf::util::MessageToJsonString(lease, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize lease: " + std::string(status.message()));
  }

  auto tmp_path = lease_file;
  tmp_path += "." + util::ToString(util::GenerateUUID()) + ".tmp";

  WriteFile(tmp_path, arrow::Buffer(json), /*fsync=*/true);
  fs::rename(tmp_path, lease_file);
}

bool IsExpired(const LeaseRecord& lease, util::TimePoint now) {
  return util::FromProto(lease.until()) <= now;
}

void RemoveIfPresent(const fs::path& path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    throw fs::filesystem_error("remove", path, ec);
  }
}

/*
  Lease handed to the caller.

  Release removes the side file under the same lock used to create it,
  and only while it still carries our id. After expiry another worker may
  have written its own lease there, that one is left alone.
*/
class FileBlobLease final : public persistence::BlobLease {
 public:
  FileBlobLease(fs::path lease_file, std::string lease_id, std::chrono::milliseconds poll_interval)
      : lease_file_(std::move(lease_file)), lease_id_(std::move(lease_id)), poll_interval_(poll_interval) {
  }

  ~FileBlobLease() override {
    try {
      Release();
    } catch (const std::exception& e) {
      LOCALDISK_LOG_WARN("Failed to release blob lease",
                         {StringField("lease_file", lease_file_.string()), StringField("lease_id", lease_id_), StringField("error", e.what())});
    }
  }

  const std::string& LeaseId() const override {
    return lease_id_;
  }

  void Release() override {
    if (released_) return;
    released_ = true;

    // container deleted, nothing left to release
    if (!fs::exists(lease_file_.parent_path())) return;

    auto lock = FileLock::Acquire(lease_file_, poll_interval_);

    std::optional<LeaseRecord> current;
    try {
      current = ReadLease(lease_file_);
    } catch (const util::RaceLost& e) {
      LOCALDISK_LOG_DEBUG("Lease file unreadable on release", {StringField("lease_id", lease_id_), StringField("reason", e.what())});
      return;
    }

    if (!current) return;

    if (current->lease_id() != lease_id_) {
      LOCALDISK_LOG_DEBUG("Lease was taken over after expiry, keeping it",
                          {StringField("lease_id", lease_id_), StringField("current_lease_id", current->lease_id())});
      return;
    }

    RemoveIfPresent(lease_file_);
  }

 private:
  fs::path                  lease_file_;
  std::string               lease_id_;
  std::chrono::milliseconds poll_interval_;
  bool                      released_ = false;
};

std::size_t Depth(const fs::path& path) {
  return static_cast<std::size_t>(std::distance(path.begin(), path.end()));
}

} // namespace

LocalDiskBlob::LocalDiskBlob(localdisk::runtime::config::BlobConfig config)
    : config_(std::move(config)),
      root_(WorkingPath(config_)),
      poll_interval_(config_.lock().poll_interval_ms() == 0 ? FileLock::kDefaultPollInterval
                                                            : std::chrono::milliseconds(config_.lock().poll_interval_ms())) {

  lease_retry_.max_attempts = config_.lease_retry().max_attempts();
  if (config_.lease_retry().backoff_ms() != 0) {
    lease_retry_.backoff = std::chrono::milliseconds(config_.lease_retry().backoff_ms());
  }

  LOCALDISK_LOG_INFO("Local Disk Blob is configured", {StringField("name", config_.name()), StringField("path", root_.string())});
  LOCALDISK_LOG_WARN(
      "Local Disk Blob is configured, it is not recommended for production. Prefer a redundant / high availability service (not a "
      "single computer / VM).");
}

fs::path LocalDiskBlob::WorkingPath(const localdisk::runtime::config::BlobConfig& config) {
  if (config.name().empty()) {
    throw std::invalid_argument("blob container name must not be empty");
  }
  fs::path parent = config.path().empty() ? fs::path{kDefaultContainerPath} : fs::path{config.path()};
  return fs::absolute(parent / config.name()).lexically_normal();
}

/*
  Lease creation is retried as a whole when the existing lease file
  vanishes or is unreadable, which happens when another worker releases
  it while we look at it. A lease file that stays unreadable past the
  retry budget is reported as a conflict.
*/
std::unique_ptr<persistence::BlobLease> LocalDiskBlob::LeaseBlob(const std::string& blob, std::chrono::milliseconds duration) {
  try {
    return util::RetryOnRace(lease_retry_, "lease_blob", [&] { return TryLease(blob, duration); });
  } catch (const util::RaceLost& e) {
    throw util::LeaseConflict("Lease for blob \"" + blob + "\" is contested: " + e.what());
  }
}

std::unique_ptr<persistence::BlobLease> LocalDiskBlob::TryLease(const std::string& blob, std::chrono::milliseconds duration) {
  if (!fs::is_regular_file(BlobPath(root_, blob))) {
    throw util::NotFound("Blob \"" + blob + "\" not found");
  }

  const auto lease_file = LeasePath(root_, blob);

  LeaseRecord lease;
  {
    // Ensure only this worker decides on the lease
    auto lock = FileLock::Acquire(lease_file, poll_interval_);

    const auto now = util::Now();
    if (auto previous = ReadLease(lease_file); previous && !IsExpired(*previous, now)) {
      LOCALDISK_LOG_DEBUG("Lease conflict", {StringField("blob", blob), StringField("lease_id", previous->lease_id())});
      throw util::LeaseConflict("Lease for blob \"" + blob + "\" already exists");
    }

    lease.set_lease_id(util::ToString(util::GenerateUUID()));
    *lease.mutable_until() = util::ToProto(now + duration);
    WriteLease(lease_file, lease);
  }

  LOCALDISK_LOG_DEBUG("Lease acquired",
                      {StringField("blob", blob), StringField("lease_id", lease.lease_id()), IntField("duration_ms", duration.count())});
  return std::make_unique<FileBlobLease>(lease_file, lease.lease_id(), poll_interval_);
}

void LocalDiskBlob::UploadBlob(const std::string& blob, const std::shared_ptr<arrow::Buffer>& data, bool overwrite,
                               const std::optional<std::string>& lease_id) {
  if (!data) {
    throw std::invalid_argument("blob data must not be null");
  }

  const auto blob_path = BlobPath(root_, blob);

  // Skip if the blob exists and overwrite is not set
  if (!overwrite && fs::exists(blob_path)) {
    throw util::AlreadyExists("Blob \"" + blob + "\" already exists");
  }

  const auto lease_file = LeasePath(root_, blob);
  try {
    util::RetryOnRace({lease_retry_.backoff, kUploadLeaseAttempts}, "upload_blob", [&] { CheckLease(blob, lease_file, lease_id); });
  } catch (const util::RaceLost& e) {
    throw util::LeaseConflict("Lease for blob \"" + blob + "\" is contested: " + e.what());
  }

  fs::create_directories(blob_path.parent_path());

  auto tmp_path = blob_path;
  tmp_path += "." + util::ToString(util::GenerateUUID()) + ".tmp";

  try {
    WriteFile(tmp_path, *data, /*fsync=*/true);

    if (overwrite) {
      fs::rename(tmp_path, blob_path);
      return;
    }

    // link() never replaces, exactly one concurrent creator wins
    std::error_code ec;
    fs::create_hard_link(tmp_path, blob_path, ec);
    RemoveIfPresent(tmp_path);
    if (ec == std::errc::file_exists) {
      throw util::AlreadyExists("Blob \"" + blob + "\" already exists");
    }
    if (ec) {
      throw fs::filesystem_error("install blob", tmp_path, blob_path, ec);
    }
  } catch (const std::exception&) {
    std::error_code ignored;
    fs::remove(tmp_path, ignored);
    throw;
  }
}

void LocalDiskBlob::CheckLease(const std::string& blob, const fs::path& lease_file, const std::optional<std::string>& lease_id) {
  auto lease = ReadLease(lease_file);

  // If the blob is not leased
  if (!lease) {
    if (lease_id) {
      throw util::LeaseNotFound("Lease for blob \"" + blob + "\" not found");
    }
    return;
  }

  if (IsExpired(*lease, util::Now())) {
    ReclaimExpiredLease(lease_file, *lease);
    return;
  }

  if (!lease_id) {
    throw util::LeaseConflict("Lease ID is required to overwrite a blob with an existing lease");
  }
  if (lease->lease_id() != *lease_id) {
    throw util::LeaseConflict("Provided lease ID does not match the existing");
  }
}

/*
  Remove an expired lease, but only if it is still the one we saw expire:
  the check and the delete run under the lease lock.
*/
void LocalDiskBlob::ReclaimExpiredLease(const fs::path& lease_file, const LeaseRecord& expired) {
  auto lock = FileLock::Acquire(lease_file, poll_interval_);

  auto current = ReadLease(lease_file);
  if (!current) return;

  if (current->lease_id() != expired.lease_id()) {
    throw util::RaceLost("lease replaced while reclaiming: " + lease_file.string());
  }

  RemoveIfPresent(lease_file);
  LOCALDISK_LOG_DEBUG("Reclaimed expired lease", {StringField("lease_file", lease_file.string()), StringField("lease_id", expired.lease_id())});
}

std::string LocalDiskBlob::DownloadBlob(const std::string& blob) {
  const auto blob_path = BlobPath(root_, blob);

  // Skip if the blob doesn't exist
  if (!fs::is_regular_file(blob_path)) {
    throw util::NotFound("Blob \"" + blob + "\" not found");
  }

  try {
    return ReadFile(blob_path)->ToString();
  } catch (const std::runtime_error&) {
    if (!fs::exists(blob_path)) {
      throw util::NotFound("Blob \"" + blob + "\" not found");
    }
    throw;
  }
}

/*
  Deepest entries go first so every directory is empty by the time we
  reach it. The container root itself is kept.
*/
void LocalDiskBlob::DeleteContainer() {
  if (!fs::exists(root_)) {
    LOCALDISK_LOG_INFO("Local Disk Blob already empty", {StringField("name", config_.name())});
    return;
  }

  std::vector<fs::path> entries;
  for (const auto& entry : fs::recursive_directory_iterator(root_)) {
    entries.push_back(entry.path());
  }

  std::stable_sort(entries.begin(), entries.end(), [](const fs::path& a, const fs::path& b) { return Depth(a) > Depth(b); });

  for (const auto& entry : entries) {
    RemoveIfPresent(entry);
  }

  LOCALDISK_LOG_INFO("Deleted Local Disk Blob", {StringField("name", config_.name()), IntField("entries", static_cast<int64_t>(entries.size()))});
}

}
