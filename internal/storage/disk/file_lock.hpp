#pragma once

#include <chrono>
#include <filesystem>

namespace localdisk::storage {

/*
  Cross-process mutual exclusion through a marker file.

  Acquire() polls until "<path>.lock" is absent, then creates it with
  O_EXCL so only one of several callers racing on the same observation
  wins; the losers go back to polling. The guard removes the marker when
  it goes out of scope, a marker that is already gone is not an error.

  No fairness and no stale-marker detection: a process killed inside the
  critical section blocks every later caller until the marker is removed
  by hand.
*/
class FileLock {
 public:
  static constexpr std::chrono::milliseconds kDefaultPollInterval{100};

  static FileLock Acquire(const std::filesystem::path& path, std::chrono::milliseconds poll_interval = kDefaultPollInterval);

  FileLock(FileLock&& other) noexcept;
  FileLock& operator=(FileLock&& other) noexcept;
  ~FileLock();

  FileLock(const FileLock&)            = delete;
  FileLock& operator=(const FileLock&) = delete;

  // Remove the marker now. Throws on failures other than "already gone".
  void Release();

  const std::filesystem::path& MarkerPath() const {
    return marker_;
  }

  bool Held() const {
    return held_;
  }

 private:
  explicit FileLock(std::filesystem::path marker);

  std::filesystem::path marker_;
  bool                  held_ = false;
};

} // namespace localdisk::storage
