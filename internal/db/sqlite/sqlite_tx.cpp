#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace dispatch::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  try {
    db_->Exec("BEGIN IMMEDIATE;");
  } catch (const SqliteBusy& e) {
    throw TransactionConflict(std::string("sqlite begin: ") + e.what());
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      DISPATCH_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const SqliteBusy& e) {
    throw TransactionConflict(std::string("sqlite commit: ") + e.what());
  }
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace dispatch::db::sqlite
