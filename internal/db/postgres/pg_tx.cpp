#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace graphflow::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!committed_ && !rolled_back_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      GRAPHFLOW_LOG_WARN("postgres rollback failed", {graphflow::observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
  rolled_back_ = true;
}

}
