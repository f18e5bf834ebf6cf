#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/persistence/queue.hpp"

namespace localdisk::queue {

/*
  Visibility-timeout queue stored in one SQLite table.

  Schema (one row per message):
    id                  INTEGER PRIMARY KEY AUTOINCREMENT
    message             TEXT NOT NULL
    visibility_timeout  INTEGER, unix ms, claimable once <= now
    dequeue_count       INTEGER, claim counter and row version
    delete_token        TEXT, proof of the latest claim

  Claims are compare-and-swap updates keyed on (id, dequeue_count), so two
  readers racing for a row get one winner; the loser skips the row.

  An instance owns one connection and serializes its own statements.
  Workers in other processes (or other instances) coordinate purely
  through the database file. When the file at the path is no longer the
  one the connection opened (DeleteQueue elsewhere), the connection is
  dropped and the queue reopened before the next statement.
*/
class LocalDiskQueue final : public persistence::Queue {
 public:
  explicit LocalDiskQueue(localdisk::runtime::config::QueueConfig config);

  // <cache_path>/queues/<name>.db
  static std::filesystem::path DbPath(const localdisk::runtime::config::QueueConfig& config);

  // $XDG_CACHE_HOME/localdisk, $HOME/.cache/localdisk, or <tmp>/localdisk
  static std::filesystem::path DefaultCachePath();

  const std::filesystem::path& Path() const {
    return db_path_;
  }

  void SendMessage(const std::string& message) override;

  std::vector<persistence::Message> ReceiveMessages(uint32_t max_messages, std::chrono::seconds visibility_timeout) override;

  void DeleteMessage(const persistence::Message& message) override;

  // Removes the database file. The next call recreates an empty queue.
  void DeleteQueue() override;

 private:
  struct Candidate {
    int64_t     id;
    std::string content;
    int64_t     dequeue_count;
  };

  // Requires mutex_. Opens and bootstraps the database on first use,
  // and again whenever the file at db_path_ was replaced or removed.
  db::sqlite::SqliteDB& Connection();

  // Requires mutex_. true while db_path_ still names the opened file.
  bool ConnectionCurrent() const;

  std::vector<Candidate> SelectVisible(uint32_t max_messages);

  // true when this reader won the row
  bool Claim(const Candidate& candidate, const std::string& delete_token, int64_t visible_at_ms);

  localdisk::runtime::config::QueueConfig config_;
  std::string                             table_;
  std::filesystem::path                   db_path_;
  std::chrono::milliseconds               busy_timeout_;

  std::mutex                                  mutex_;
  std::shared_ptr<db::sqlite::SqliteDB>       db_;
  dev_t                                       db_dev_ = 0;
  ino_t                                       db_ino_ = 0;
};

} // namespace localdisk::queue
