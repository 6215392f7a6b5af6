#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace graphflow::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_ && !rolled_back_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      GRAPHFLOW_LOG_WARN("sqlite rollback failed", {graphflow::observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  rolled_back_ = true;
}

} // namespace graphflow::db::sqlite
