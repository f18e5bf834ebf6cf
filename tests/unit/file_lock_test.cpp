#include "internal/storage/disk/file_lock.hpp"

#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using localdisk::storage::FileLock;

constexpr std::chrono::milliseconds kFastPoll{2};

std::filesystem::path FreshDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / ("localdisk_file_lock_tests_" + std::to_string(::getpid())) / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

void TestAcquireCreatesAndReleaseRemovesMarker() {
  const auto resource = FreshDir("acquire_release") / "blob.lease";

  auto lock = FileLock::Acquire(resource, kFastPoll);
  assert(lock.Held());
  assert(lock.MarkerPath().filename() == "blob.lease.lock");
  assert(std::filesystem::exists(lock.MarkerPath()));
  assert(std::filesystem::file_size(lock.MarkerPath()) == 0);

  const auto marker = lock.MarkerPath();
  lock.Release();
  assert(!lock.Held());
  assert(!std::filesystem::exists(marker));
}

void TestAcquireCreatesMissingParentDirectories() {
  const auto resource = FreshDir("parents") / "deep" / "nested" / "blob.lease";

  auto lock = FileLock::Acquire(resource, kFastPoll);
  assert(std::filesystem::exists(lock.MarkerPath()));
}

void TestReleaseToleratesMissingMarker() {
  const auto resource = FreshDir("missing_marker") / "blob.lease";

  auto lock = FileLock::Acquire(resource, kFastPoll);
  std::filesystem::remove(lock.MarkerPath());

  lock.Release();
  assert(!lock.Held());
}

void TestMarkerRemovedWhenScopeExitsByException() {
  const auto resource = FreshDir("exception_exit") / "blob.lease";

  bool threw = false;
  try {
    auto lock = FileLock::Acquire(resource, kFastPoll);
    throw std::runtime_error("critical section failed");
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw);
  assert(!std::filesystem::exists(resource.string() + ".lock"));
}

void TestMoveTransfersOwnership() {
  const auto resource = FreshDir("move") / "blob.lease";

  auto first  = FileLock::Acquire(resource, kFastPoll);
  auto marker = first.MarkerPath();

  FileLock second = std::move(first);
  assert(!first.Held());
  assert(second.Held());
  assert(std::filesystem::exists(marker));

  second.Release();
  assert(!std::filesystem::exists(marker));
}

void TestWaitsForExistingMarker() {
  const auto resource = FreshDir("wait") / "blob.lease";
  const auto marker   = std::filesystem::path(resource.string() + ".lock");
  std::ofstream(marker).close();

  std::atomic<bool> acquired{false};
  std::thread       waiter([&] {
    auto lock = FileLock::Acquire(resource, kFastPoll);
    acquired  = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  assert(!acquired && "Acquire must wait while another actor holds the marker.");

  std::filesystem::remove(marker);
  waiter.join();
  assert(acquired);
  assert(!std::filesystem::exists(marker));
}

void TestMutualExclusionAcrossThreads() {
  const auto resource = FreshDir("contention") / "blob.lease";

  constexpr int kThreads    = 8;
  constexpr int kIterations = 20;

  std::atomic<int> inside{0};
  std::atomic<int> max_inside{0};
  int              counter = 0;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kIterations; ++i) {
        auto lock = FileLock::Acquire(resource, std::chrono::milliseconds(1));

        int now = ++inside;
        int seen = max_inside.load();
        while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
        }

        int value = counter;
        std::this_thread::yield();
        counter = value + 1;

        --inside;
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(max_inside == 1);
  assert(counter == kThreads * kIterations);
  assert(!std::filesystem::exists(resource.string() + ".lock"));
}

} // namespace

int main() {
  TestAcquireCreatesAndReleaseRemovesMarker();
  TestAcquireCreatesMissingParentDirectories();
  TestReleaseToleratesMissingMarker();
  TestMarkerRemovedWhenScopeExitsByException();
  TestMoveTransfersOwnership();
  TestWaitsForExistingMarker();
  TestMutualExclusionAcrossThreads();

  std::cout << "localdisk_unit_file_lock: pass\n";
  return 0;
}
