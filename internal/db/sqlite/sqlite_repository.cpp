#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <type_traits>

namespace dispatch::db::sqlite {

using dispatch::db::ErrorCode;
using dispatch::db::Result;

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

class StatementRow final : public sql::Row {
 public:
  explicit StatementRow(sqlite3_stmt* st) : st_(st) {
  }

  std::string GetText(int col) const override {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? reinterpret_cast<const char*>(t) : "";
  }

  int GetInt(int col) const override {
    return sqlite3_column_int(st_, col);
  }

  int64_t GetInt64(int col) const override {
    return sqlite3_column_int64(st_, col);
  }

  double GetDouble(int col) const override {
    return sqlite3_column_double(st_, col);
  }

  bool IsNull(int col) const override {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
  }

 private:
  sqlite3_stmt* st_;
};

int Bind(sqlite3_stmt* st, int idx, const sql::Param& param) {
  return std::visit(
      [&](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return sqlite3_bind_null(st, idx);
        } else if constexpr (std::is_same_v<T, int32_t>) {
          return sqlite3_bind_int(st, idx, v);
        } else if constexpr (std::is_same_v<T, double>) {
          return sqlite3_bind_double(st, idx, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return sqlite3_bind_text(st, idx, v.c_str(), -1, SQLITE_TRANSIENT);
        } else {
          return sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
        }
      },
      param);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

Result SqliteRepository::Execute(Transaction& t, const char* sql, const sql::Params& params, uint64_t* affected) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    for (size_t i = 0; i < params.size(); ++i) {
        int rc = Bind(st.get(), static_cast<int>(i + 1), params[i]);
        if (rc != SQLITE_OK) return Translate(db, rc);
    }

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE && affected) {
        *affected = static_cast<uint64_t>(sqlite3_changes(db));
    }
    return Translate(db, rc);
}

void SqliteRepository::Query(Transaction& t, const char* sql, const sql::Params& params, const RowFn& on_row) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    Statement st(raw);

    for (size_t i = 0; i < params.size(); ++i) {
        if (Bind(st.get(), static_cast<int>(i + 1), params[i]) != SQLITE_OK)
            throw std::runtime_error(std::string("sqlite bind: ") + sqlite3_errmsg(db));
    }

    StatementRow row(st.get());
    for (;;) {
        int rc = sqlite3_step(st.get());
        if (rc == SQLITE_ROW) {
            on_row(row);
            continue;
        }
        if (rc == SQLITE_DONE) return;

        auto result = Translate(db, rc);
        if (result.code == ErrorCode::Busy) throw TransactionConflict(result.message);
        throw std::runtime_error("sqlite query: " + result.message);
    }
}

} // namespace dispatch::db::sqlite
