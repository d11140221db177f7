#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace stockroom::db::postgres {

// SERIALIZABLE so a sale that reads stock and then writes it cannot lose a
// concurrent update; the loser fails with a retryable conflict.
using Work = pqxx::transaction<pqxx::isolation_level::serializable>;

class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction() override;

  Work& Tx() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<Work>             tx_;
  bool                              committed_ = false;
  bool                              finished_  = false;
};

} // namespace stockroom::db::postgres
