#include "pg_tx.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace stockroom::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()) {
  tx_ = std::make_unique<Work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  // pqxx aborts an open transaction in its destructor
  tx_.reset();
}

void PgTransaction::Commit() {
  finished_ = true;
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    DropCommitHooks();
    throw util::Conflict(std::string("transaction conflict: ") + e.what());
  } catch (const pqxx::in_doubt_error& e) {
    DropCommitHooks();
    STOCKROOM_LOG_ERROR("postgres commit outcome unknown", {observability::StringField("error", e.what())});
    throw;
  }
  committed_ = true;
  RunCommitHooks();
}

void PgTransaction::Rollback() {
  finished_ = true;
  DropCommitHooks();
  tx_->abort();
}

} // namespace stockroom::db::postgres
