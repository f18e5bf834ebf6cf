#include "sqlite_db.hpp"

#include <stdexcept>

namespace localdisk::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, std::chrono::milliseconds busy_timeout) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  try {
    Configure(busy_timeout);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

Statement SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return Statement(stmt);
}

void SqliteDB::StepDone(sqlite3_stmt* stmt, const char* what) {
  int rc = sqlite3_step(stmt);
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db_));
  }
}

int SqliteDB::Changes() const {
  return sqlite3_changes(db_);
}

void SqliteDB::Configure(std::chrono::milliseconds busy_timeout) {
  // wait for locks instead of failing immediately, set first so the
  // journal_mode switch below also waits on a busy database
  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count())), db_, "busy_timeout");

  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");

  // NORMAL is a good tradeoff; use FULL if you want stronger durability
  Exec("PRAGMA synchronous=NORMAL;");
}

} // namespace localdisk::db::sqlite
