#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace localdisk::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      LOCALDISK_LOG_WARN("sqlite rollback failed",
                         {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
}

} // namespace localdisk::db::sqlite
