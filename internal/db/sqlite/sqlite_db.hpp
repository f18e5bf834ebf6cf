#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <string>

namespace localdisk::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Thin RAII wrapper around sqlite3*.

  One instance is one connection. Separate instances on the same file
  behave like separate workers: they only see each other through the
  database and its locks.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, std::chrono::milliseconds busy_timeout);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // Step a statement that returns no rows, throws on failure
  void StepDone(sqlite3_stmt* stmt, const char* what);

  // Rows modified by the most recent INSERT/UPDATE/DELETE on this connection
  int Changes() const;

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure(std::chrono::milliseconds busy_timeout);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace localdisk::db::sqlite
