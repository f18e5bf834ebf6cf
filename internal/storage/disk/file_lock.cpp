#include "file_lock.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>
#include <thread>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace localdisk::storage {

namespace fs = std::filesystem;

FileLock FileLock::Acquire(const fs::path& path, std::chrono::milliseconds poll_interval) {
  const auto full_path = fs::absolute(path);
  const auto marker    = common::LockPath(full_path);

  fs::create_directories(full_path.parent_path());

  for (;;) {
    while (fs::exists(marker)) {
      std::this_thread::sleep_for(poll_interval);
    }

    int fd = ::open(marker.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd >= 0) {
      ::close(fd);
      return FileLock(marker);
    }

    const int err = errno;
    if (err == EEXIST) {
      // someone else created it between our check and our create
      continue;
    }
    if (err == ENOENT) {
      // directory removed under us (container deletion), recreate it
      fs::create_directories(full_path.parent_path());
      continue;
    }
    throw std::system_error(err, std::generic_category(), "create lock marker " + marker.string());
  }
}

FileLock::FileLock(fs::path marker) : marker_(std::move(marker)), held_(true) {
}

FileLock::FileLock(FileLock&& other) noexcept : marker_(std::move(other.marker_)), held_(std::exchange(other.held_, false)) {
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
  if (this != &other) {
    if (held_) {
      try {
        Release();
      } catch (const std::exception& e) {
        LOCALDISK_LOG_WARN("Failed to release file lock",
                           {observability::StringField("marker", marker_.string()), observability::StringField("error", e.what())});
      }
    }
    marker_ = std::move(other.marker_);
    held_   = std::exchange(other.held_, false);
  }
  return *this;
}

FileLock::~FileLock() {
  if (!held_) return;
  try {
    Release();
  } catch (const std::exception& e) {
    LOCALDISK_LOG_WARN("Failed to release file lock",
                       {observability::StringField("marker", marker_.string()), observability::StringField("error", e.what())});
  }
}

void FileLock::Release() {
  if (!held_) return;
  held_ = false;

  // remove() reports a missing file as false, not as an error
  std::error_code ec;
  fs::remove(marker_, ec);
  if (ec) {
    throw fs::filesystem_error("remove lock marker", marker_, ec);
  }
}

} // namespace localdisk::storage
