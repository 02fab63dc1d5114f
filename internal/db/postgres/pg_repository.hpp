#pragma once

#include "internal/db/sql/sql_repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace dispatch::db::postgres {

class PgRepository final : public sql::SqlRepository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  // pg_advisory_xact_lock on the account, released at commit/rollback
  Result LockAccount(Transaction&, const std::string& account_id) override;

protected:
  Result Execute(Transaction&, const char* sql, const sql::Params& params, uint64_t* affected) override;
  void   Query(Transaction&, const char* sql, const sql::Params& params, const RowFn& on_row) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
