#include "internal/queue/local_disk_queue.hpp"

#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

namespace fs = std::filesystem;

using localdisk::persistence::Message;
using localdisk::queue::LocalDiskQueue;
using localdisk::runtime::config::QueueConfig;
using localdisk::util::MessageNotFound;

QueueConfig MakeConfig(const std::string& test_name) {
  const auto cache = fs::temp_directory_path() / ("localdisk_queue_tests_" + std::to_string(::getpid())) / test_name;
  fs::remove_all(cache);

  QueueConfig config;
  config.set_name("work");
  config.set_cache_path(cache.string());
  config.set_timeout_seconds(10);
  return config;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

constexpr std::chrono::seconds kLongVisibility{60};

void TestDbPathLivesUnderCacheQueues() {
  auto config = MakeConfig("db_path");
  assert(LocalDiskQueue::DbPath(config) == fs::absolute(fs::path(config.cache_path()) / "queues" / "work.db").lexically_normal());

  LocalDiskQueue queue(config);
  assert(fs::exists(queue.Path()));

  config.set_name("../escape");
  assert(Throws<std::invalid_argument>([&] { (void)LocalDiskQueue::DbPath(config); }));
}

void TestEndToEndScenario() {
  LocalDiskQueue queue(MakeConfig("end_to_end"));

  queue.SendMessage("A");
  auto first = queue.ReceiveMessages(1, kLongVisibility);
  assert(first.size() == 1);
  assert(first[0].content == "A");
  assert(first[0].dequeue_count == 1);
  assert(first[0].delete_token.size() == 12);

  queue.DeleteMessage(first[0]);
  assert(queue.ReceiveMessages(1, kLongVisibility).empty());

  queue.SendMessage("B");
  auto claimed = queue.ReceiveMessages(1, std::chrono::seconds(1));
  assert(claimed.size() == 1);
  assert(claimed[0].content == "B");
  assert(claimed[0].dequeue_count == 1);

  std::this_thread::sleep_for(std::chrono::milliseconds(1200));

  auto redelivered = queue.ReceiveMessages(1, kLongVisibility);
  assert(redelivered.size() == 1);
  assert(redelivered[0].content == "B");
  assert(redelivered[0].message_id == claimed[0].message_id);
  assert(redelivered[0].dequeue_count == 2);
}

void TestReceivedMessageStaysHidden() {
  LocalDiskQueue queue(MakeConfig("hidden"));

  queue.SendMessage("job");
  const auto before   = localdisk::util::Now();
  auto       received = queue.ReceiveMessages(10, kLongVisibility);
  assert(received.size() == 1);
  assert(received[0].visibility_timeout >= before + kLongVisibility - std::chrono::milliseconds(1));

  assert(queue.ReceiveMessages(10, kLongVisibility).empty());
  assert(queue.ReceiveMessages(10, kLongVisibility).empty());
}

void TestStaleTokenIsRejected() {
  LocalDiskQueue queue(MakeConfig("stale_token"));

  queue.SendMessage("job");
  auto first = queue.ReceiveMessages(1, std::chrono::seconds(1));
  assert(first.size() == 1);

  std::this_thread::sleep_for(std::chrono::milliseconds(1200));

  auto second = queue.ReceiveMessages(1, kLongVisibility);
  assert(second.size() == 1);
  assert(second[0].delete_token != first[0].delete_token);

  // the first reader's claim lapsed, it may no longer acknowledge
  assert(Throws<MessageNotFound>([&] { queue.DeleteMessage(first[0]); }));

  queue.DeleteMessage(second[0]);
  assert(Throws<MessageNotFound>([&] { queue.DeleteMessage(second[0]); }));
}

void TestMalformedAcknowledgementsAreNotFound() {
  LocalDiskQueue queue(MakeConfig("malformed_ack"));

  queue.SendMessage("job");

  Message unknown;
  unknown.message_id   = "not-a-number";
  unknown.delete_token = "whatever";
  assert(Throws<MessageNotFound>([&] { queue.DeleteMessage(unknown); }));

  // never claimed, so there is no token to match
  unknown.message_id   = "1";
  unknown.delete_token = "";
  assert(Throws<MessageNotFound>([&] { queue.DeleteMessage(unknown); }));
  assert(queue.ReceiveMessages(1, kLongVisibility).size() == 1);
}

void TestMaxMessagesIsRespected() {
  LocalDiskQueue queue(MakeConfig("max_messages"));

  for (int i = 0; i < 5; ++i) queue.SendMessage("m" + std::to_string(i));

  assert(queue.ReceiveMessages(0, kLongVisibility).empty());
  assert(queue.ReceiveMessages(2, kLongVisibility).size() == 2);
  assert(queue.ReceiveMessages(10, kLongVisibility).size() == 3);
  assert(queue.ReceiveMessages(10, kLongVisibility).empty());
}

void TestMessagesSurviveReopen() {
  const auto config = MakeConfig("reopen");
  {
    LocalDiskQueue writer(config);
    writer.SendMessage("durable");
  }

  LocalDiskQueue reader(config);
  auto           received = reader.ReceiveMessages(1, kLongVisibility);
  assert(received.size() == 1);
  assert(received[0].content == "durable");
}

void TestSeparateTablesAreIndependent() {
  auto config = MakeConfig("tables");

  auto other_config = config;
  other_config.set_table("other_queue");

  LocalDiskQueue queue(config);
  LocalDiskQueue other(other_config);
  assert(queue.Path() == other.Path());

  queue.SendMessage("for queue");
  assert(other.ReceiveMessages(10, kLongVisibility).empty());
  assert(queue.ReceiveMessages(10, kLongVisibility).size() == 1);
}

void TestInvalidTableNameIsRejected() {
  auto config = MakeConfig("bad_table");
  config.set_table("queue; DROP TABLE queue");
  assert(Throws<std::invalid_argument>([&] { LocalDiskQueue queue(config); }));
}

void TestConcurrentReceiversNeverShareMessages() {
  const auto config = MakeConfig("concurrent_receivers");

  constexpr int kMessages = 60;
  constexpr int kWorkers  = 4;
  {
    LocalDiskQueue producer(config);
    for (int i = 0; i < kMessages; ++i) producer.SendMessage("job-" + std::to_string(i));
  }

  std::mutex            seen_mu;
  std::multiset<std::string> seen;
  std::atomic<bool>     go{false};

  std::vector<std::thread> workers;
  for (int w = 0; w < kWorkers; ++w) {
    workers.emplace_back([&] {
      // one instance per worker: separate connections, like separate processes
      LocalDiskQueue queue(config);
      while (!go) std::this_thread::yield();

      int idle_rounds = 0;
      while (idle_rounds < 3) {
        auto batch = queue.ReceiveMessages(5, kLongVisibility);
        if (batch.empty()) {
          ++idle_rounds;
          continue;
        }
        idle_rounds = 0;
        std::lock_guard lock(seen_mu);
        for (const auto& message : batch) {
          assert(message.dequeue_count == 1);
          seen.insert(message.message_id);
        }
      }
    });
  }
  go = true;
  for (auto& worker : workers) worker.join();

  assert(seen.size() == kMessages);
  assert(std::set<std::string>(seen.begin(), seen.end()).size() == kMessages);
}

void TestSharedInstanceAcrossThreads() {
  LocalDiskQueue queue(MakeConfig("shared_instance"));

  constexpr int kMessages = 40;
  for (int i = 0; i < kMessages; ++i) queue.SendMessage("job-" + std::to_string(i));

  std::atomic<int> received{0};
  std::atomic<int> acknowledged{0};

  std::vector<std::thread> workers;
  for (int w = 0; w < 4; ++w) {
    workers.emplace_back([&] {
      for (;;) {
        auto batch = queue.ReceiveMessages(3, kLongVisibility);
        if (batch.empty()) return;
        received += static_cast<int>(batch.size());
        for (const auto& message : batch) {
          queue.DeleteMessage(message);
          ++acknowledged;
        }
      }
    });
  }
  for (auto& worker : workers) worker.join();

  assert(received == kMessages);
  assert(acknowledged == kMessages);
}

void TestDeleteQueueRemovesDatabase() {
  LocalDiskQueue queue(MakeConfig("delete_queue"));

  queue.SendMessage("doomed");
  queue.DeleteQueue();
  assert(!fs::exists(queue.Path()));

  // next use starts from an empty queue
  assert(queue.ReceiveMessages(10, kLongVisibility).empty());
  queue.SendMessage("fresh");
  auto received = queue.ReceiveMessages(10, kLongVisibility);
  assert(received.size() == 1);
  assert(received[0].content == "fresh");
}

void TestDeleteQueueIsSeenByOtherInstances() {
  const auto config = MakeConfig("delete_seen_elsewhere");

  LocalDiskQueue deleter(config);
  LocalDiskQueue other(config);

  other.SendMessage("before delete");
  deleter.DeleteQueue();

  // the old rows went with the file
  assert(other.ReceiveMessages(10, kLongVisibility).empty());

  // writes after the delete land in the file every new worker opens
  other.SendMessage("after delete");

  LocalDiskQueue fresh(config);
  auto           received = fresh.ReceiveMessages(10, kLongVisibility);
  assert(received.size() == 1);
  assert(received[0].content == "after delete");

  other.DeleteMessage(received[0]);
  assert(fresh.ReceiveMessages(10, kLongVisibility).empty());
  assert(deleter.ReceiveMessages(10, kLongVisibility).empty());
}

} // namespace

int main() {
  TestDbPathLivesUnderCacheQueues();
  TestEndToEndScenario();
  TestReceivedMessageStaysHidden();
  TestStaleTokenIsRejected();
  TestMalformedAcknowledgementsAreNotFound();
  TestMaxMessagesIsRespected();
  TestMessagesSurviveReopen();
  TestSeparateTablesAreIndependent();
  TestInvalidTableNameIsRejected();
  TestConcurrentReceiversNeverShareMessages();
  TestSharedInstanceAcrossThreads();
  TestDeleteQueueRemovesDatabase();
  TestDeleteQueueIsSeenByOtherInstances();

  std::cout << "localdisk_unit_local_disk_queue: pass\n";
  return 0;
}
