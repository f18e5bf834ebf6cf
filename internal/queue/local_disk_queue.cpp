#include "local_disk_queue.hpp"

#include <sqlite3.h>
#include <sys/stat.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <system_error>

#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace localdisk::queue {

using localdisk::db::sqlite::SqliteDB;
using localdisk::db::sqlite::SqliteTransaction;
using localdisk::observability::IntField;
using localdisk::observability::StringField;
using localdisk::persistence::Message;

namespace fs = std::filesystem;

namespace {

constexpr const char*         kDefaultTable         = "queue";
constexpr std::chrono::seconds kDefaultBusyTimeout{30};
constexpr std::size_t          kDeleteTokenLength    = 12;

// The table name is spliced into SQL, keep it to a plain identifier.
std::string ValidateTableName(const std::string& table) {
  if (table.empty() || std::isdigit(static_cast<unsigned char>(table.front()))) {
    throw std::invalid_argument("queue table name must be a SQL identifier: \"" + table + "\"");
  }
  for (char c : table) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
      throw std::invalid_argument("queue table name must be a SQL identifier: \"" + table + "\"");
    }
  }
  return table;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

bool TableExists(SqliteDB& db, const std::string& table) {
  auto st = db.Prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?;");
  BindText(st.get(), 1, table);
  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite schema lookup: ") + sqlite3_errmsg(db.Handle()));
  }
  return rc == SQLITE_ROW;
}

void RemoveIfPresent(const fs::path& path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    throw fs::filesystem_error("remove", path, ec);
  }
}

} // namespace

LocalDiskQueue::LocalDiskQueue(localdisk::runtime::config::QueueConfig config)
    : config_(std::move(config)),
      table_(ValidateTableName(config_.table().empty() ? kDefaultTable : config_.table())),
      db_path_(DbPath(config_)),
      busy_timeout_(config_.timeout_seconds() == 0 ? kDefaultBusyTimeout : std::chrono::seconds(config_.timeout_seconds())) {

  LOCALDISK_LOG_INFO("Local Disk Queue is configured", {StringField("name", config_.name()), StringField("path", db_path_.string())});
  LOCALDISK_LOG_WARN(
      "Local Disk Queue is configured, it is not recommended for production. Prefer a redundant / high availability service (not a "
      "single computer / VM).");

  std::lock_guard lock(mutex_);
  Connection();
}

fs::path LocalDiskQueue::DefaultCachePath() {
  if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
    return fs::path(xdg) / "localdisk";
  }
  if (const char* home = std::getenv("HOME"); home && *home) {
    return fs::path(home) / ".cache" / "localdisk";
  }
  return fs::temp_directory_path() / "localdisk";
}

fs::path LocalDiskQueue::DbPath(const localdisk::runtime::config::QueueConfig& config) {
  if (config.name().empty()) {
    throw std::invalid_argument("queue name must not be empty");
  }
  if (config.name().find('/') != std::string::npos || config.name() == "." || config.name() == "..") {
    throw std::invalid_argument("queue name must not contain path components: \"" + config.name() + "\"");
  }
  fs::path cache = config.cache_path().empty() ? DefaultCachePath() : fs::path{config.cache_path()};
  return fs::absolute(cache / "queues" / (config.name() + ".db")).lexically_normal();
}

/*
  Table creation runs under BEGIN IMMEDIATE so a worker that opens the
  file while another one is creating it waits instead of racing.
*/
SqliteDB& LocalDiskQueue::Connection() {
  if (db_) {
    if (ConnectionCurrent()) return *db_;

    LOCALDISK_LOG_INFO("Local Disk Queue file was replaced, reopening",
                       {StringField("name", config_.name()), StringField("path", db_path_.string())});
    db_.reset();
  }

  fs::create_directories(db_path_.parent_path());

  auto db = std::make_shared<SqliteDB>(db_path_.string(), busy_timeout_);

  SqliteTransaction tx(db);
  if (!TableExists(*db, table_)) {
    db->Exec("CREATE TABLE IF NOT EXISTS " + table_ +
             " ("
             "id INTEGER PRIMARY KEY AUTOINCREMENT, "
             "message TEXT NOT NULL, "
             "visibility_timeout INTEGER NOT NULL DEFAULT (CAST((julianday('now') - 2440587.5) * 86400000 AS INTEGER)), "
             "dequeue_count INTEGER NOT NULL DEFAULT 0, "
             "delete_token TEXT DEFAULT NULL);");
    LOCALDISK_LOG_INFO("Created Local Disk Queue", {StringField("name", config_.name()), StringField("table", table_)});
  }
  tx.Commit();

  struct stat st {};
  if (::stat(db_path_.c_str(), &st) != 0) {
    throw std::system_error(errno, std::generic_category(), "stat queue database " + db_path_.string());
  }
  db_dev_ = st.st_dev;
  db_ino_ = st.st_ino;

  db_ = std::move(db);
  return *db_;
}

/*
  The open connection pins its inode, so a file recreated at the same
  path always carries a different inode number.
*/
bool LocalDiskQueue::ConnectionCurrent() const {
  struct stat st {};
  if (::stat(db_path_.c_str(), &st) != 0) {
    return false;
  }
  return st.st_dev == db_dev_ && st.st_ino == db_ino_;
}

void LocalDiskQueue::SendMessage(const std::string& message) {
  std::lock_guard lock(mutex_);
  auto&           db = Connection();

  // visibility is bound from the same clock ReceiveMessages compares with
  auto st = db.Prepare("INSERT INTO " + table_ + " (message, visibility_timeout) VALUES (?, ?);");
  BindText(st.get(), 1, message);
  BindI64(st.get(), 2, util::ToUnixMillis(util::Now()));
  db.StepDone(st.get(), "queue insert");
}

std::vector<LocalDiskQueue::Candidate> LocalDiskQueue::SelectVisible(uint32_t max_messages) {
  std::lock_guard lock(mutex_);
  auto&           db = Connection();

  auto st = db.Prepare("SELECT id, message, dequeue_count FROM " + table_ + " WHERE visibility_timeout <= ? ORDER BY id LIMIT ?;");
  BindI64(st.get(), 1, util::ToUnixMillis(util::Now()));
  BindI64(st.get(), 2, static_cast<int64_t>(max_messages));

  std::vector<Candidate> candidates;
  int                    rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    candidates.push_back({ColI64(st.get(), 0), ColText(st.get(), 1), ColI64(st.get(), 2)});
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("queue select: ") + sqlite3_errmsg(db.Handle()));
  }
  return candidates;
}

bool LocalDiskQueue::Claim(const Candidate& candidate, const std::string& delete_token, int64_t visible_at_ms) {
  std::lock_guard lock(mutex_);
  auto&           db = Connection();

  auto st = db.Prepare("UPDATE " + table_ +
                       " SET visibility_timeout = ?, delete_token = ?, dequeue_count = dequeue_count + 1"
                       " WHERE id = ? AND dequeue_count = ?;");
  BindI64(st.get(), 1, visible_at_ms);
  BindText(st.get(), 2, delete_token);
  BindI64(st.get(), 3, candidate.id);
  BindI64(st.get(), 4, candidate.dequeue_count);
  db.StepDone(st.get(), "queue claim");

  return db.Changes() > 0;
}

/*
  Two phases: snapshot the visible rows, then claim them one by one.
  A claim that changes nothing means the row was claimed or deleted by
  someone else after our snapshot; it is skipped, not reported.
*/
std::vector<Message> LocalDiskQueue::ReceiveMessages(uint32_t max_messages, std::chrono::seconds visibility_timeout) {
  std::vector<Message> messages;
  if (max_messages == 0) return messages;

  for (const auto& candidate : SelectVisible(max_messages)) {
    const auto delete_token = util::RandomToken(kDeleteTokenLength);
    const auto visible_at   = util::Now() + visibility_timeout;
    const auto visible_ms   = util::ToUnixMillis(visible_at);

    if (!Claim(candidate, delete_token, visible_ms)) {
      LOCALDISK_LOG_DEBUG("Message claimed by another reader, skipping",
                          {StringField("queue", config_.name()), IntField("message_id", candidate.id)});
      continue;
    }

    Message message;
    message.message_id         = std::to_string(candidate.id);
    message.content            = candidate.content;
    message.delete_token       = delete_token;
    message.visibility_timeout = util::FromUnixMillis(visible_ms);
    message.dequeue_count      = candidate.dequeue_count + 1;
    messages.push_back(std::move(message));
  }

  return messages;
}

void LocalDiskQueue::DeleteMessage(const Message& message) {
  int64_t id = 0;
  try {
    std::size_t consumed = 0;
    id                   = std::stoll(message.message_id, &consumed);
    if (consumed != message.message_id.size()) {
      throw std::invalid_argument("trailing characters");
    }
  } catch (const std::logic_error&) {
    throw util::MessageNotFound("Message with id \"" + message.message_id + "\" not found");
  }

  std::lock_guard lock(mutex_);
  auto&           db = Connection();

  auto st = db.Prepare("DELETE FROM " + table_ + " WHERE id = ? AND delete_token = ?;");
  BindI64(st.get(), 1, id);
  BindText(st.get(), 2, message.delete_token);
  db.StepDone(st.get(), "queue delete");

  // If the message was not found (deleted, or reclaimed by another reader)
  if (db.Changes() == 0) {
    throw util::MessageNotFound("Message with id \"" + message.message_id + "\" not found");
  }
}

void LocalDiskQueue::DeleteQueue() {
  std::lock_guard lock(mutex_);
  db_.reset();

  RemoveIfPresent(db_path_);
  RemoveIfPresent(fs::path(db_path_.string() + "-wal"));
  RemoveIfPresent(fs::path(db_path_.string() + "-shm"));

  LOCALDISK_LOG_INFO("Deleted Local Disk Queue", {StringField("name", config_.name())});
}

} // namespace localdisk::queue
