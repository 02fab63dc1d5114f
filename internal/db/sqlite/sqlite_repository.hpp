#pragma once

#include <memory>

#include "internal/db/sql/sql_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace dispatch::db::sqlite {

class SqliteRepository final : public sql::SqlRepository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

protected:
  Result Execute(Transaction&, const char* sql, const sql::Params& params, uint64_t* affected) override;
  void   Query(Transaction&, const char* sql, const sql::Params& params, const RowFn& on_row) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
