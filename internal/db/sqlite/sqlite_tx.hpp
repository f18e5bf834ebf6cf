#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace localdisk::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  Destructor rolls back unless Commit() ran.
*/
class SqliteTransaction final {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void Commit();

 private:
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
};

}
