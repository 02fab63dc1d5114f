#include "pg_repository.hpp"

#include <type_traits>

#include "internal/db/sql/sql_queries.hpp"

namespace dispatch::db::postgres {

namespace {

class PqxxRow final : public sql::Row {
 public:
  explicit PqxxRow(const pqxx::row& row) : row_(row) {
  }

  std::string GetText(int col) const override {
    return row_[col].is_null() ? "" : row_[col].c_str();
  }

  int GetInt(int col) const override {
    return row_[col].is_null() ? 0 : row_[col].as<int>();
  }

  int64_t GetInt64(int col) const override {
    return row_[col].is_null() ? 0 : row_[col].as<int64_t>();
  }

  double GetDouble(int col) const override {
    return row_[col].is_null() ? 0 : row_[col].as<double>();
  }

  bool IsNull(int col) const override {
    return row_[col].is_null();
  }

 private:
  const pqxx::row& row_;
};

pqxx::params ToParams(const sql::Params& params) {
  pqxx::params out;
  for (const auto& param : params) {
    std::visit(
        [&](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out.append();
          } else {
            out.append(v);
          }
        },
        param);
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::transaction_rollback*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::Execute(Transaction& t, const char* sql, const sql::Params& params, uint64_t* affected) {
  try {
    auto res = TX(t).Work().exec_params(sql::NumberPlaceholders(sql), ToParams(params));
    if (affected) {
      *affected = static_cast<uint64_t>(res.affected_rows());
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

void PgRepository::Query(Transaction& t, const char* sql, const sql::Params& params, const RowFn& on_row) {
  pqxx::result res;
  try {
    res = TX(t).Work().exec_params(sql::NumberPlaceholders(sql), ToParams(params));
  } catch (const pqxx::transaction_rollback& e) {
    throw TransactionConflict(e.what());
  }

  for (const auto& row : res) {
    PqxxRow wrapped(row);
    on_row(wrapped);
  }
}

Result PgRepository::LockAccount(Transaction& t, const std::string& account_id) {
  return Execute(t, "SELECT pg_advisory_xact_lock(hashtext(?));", {account_id}, nullptr);
}

} // namespace dispatch::db::postgres
