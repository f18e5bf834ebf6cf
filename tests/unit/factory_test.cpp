#include "internal/factory.hpp"

#include <arrow/buffer.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace {

namespace fs = std::filesystem;

fs::path TestDir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / ("localdisk_factory_tests_" + std::to_string(::getpid())) / name;
  fs::remove_all(dir);
  return dir;
}

void TestBuildsConfiguredStores() {
  const auto dir = TestDir("both");

  localdisk::runtime::config::RuntimeConfig config;
  config.mutable_blob()->set_name("results");
  config.mutable_blob()->set_path(dir.string());
  config.mutable_queue()->set_name("work");
  config.mutable_queue()->set_cache_path((dir / "cache").string());

  auto runtime = localdisk::factory::Build(config);
  assert(runtime.blob);
  assert(runtime.queue);

  runtime.blob->UploadBlob("report.txt", arrow::Buffer::FromString("done"), false, std::nullopt);
  assert(runtime.blob->DownloadBlob("report.txt") == "done");
  assert(fs::exists(dir / "results" / "report.txt"));

  runtime.queue->SendMessage("job");
  auto received = runtime.queue->ReceiveMessages(1, std::chrono::seconds(30));
  assert(received.size() == 1);
  runtime.queue->DeleteMessage(received[0]);
  assert(fs::exists(dir / "cache" / "queues" / "work.db"));
}

void TestMissingSectionsStayNull() {
  const auto dir = TestDir("queue_only");

  localdisk::runtime::config::RuntimeConfig config;
  config.mutable_queue()->set_name("work");
  config.mutable_queue()->set_cache_path(dir.string());

  auto runtime = localdisk::factory::Build(config);
  assert(!runtime.blob);
  assert(runtime.queue);

  auto empty = localdisk::factory::Build(localdisk::runtime::config::RuntimeConfig{});
  assert(!empty.blob);
  assert(!empty.queue);
}

} // namespace

int main() {
  TestBuildsConfiguredStores();
  TestMissingSectionsStayNull();

  std::cout << "localdisk_unit_factory: pass\n";
  return 0;
}
