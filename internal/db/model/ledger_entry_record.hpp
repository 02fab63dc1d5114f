#pragma once

#include <cstdint>
#include <string>

#include "dispatch/core/v1/types.pb.h"

namespace dispatch::db::model {

/*
  Append-only wallet row. A debit or refund that converts a hold names
  it in settles_entry_id; at most one row may settle a given hold.
*/
struct LedgerEntryRecord {
  std::string id;
  std::string account_id;
  std::string trip_id; // empty when not trip related

  dispatch::core::v1::LedgerEntryType   type   = dispatch::core::v1::LEDGER_ENTRY_TYPE_UNSPECIFIED;
  dispatch::core::v1::LedgerEntryStatus status = dispatch::core::v1::LEDGER_ENTRY_STATUS_COMPLETED;

  int64_t     amount = 0;
  std::string currency;
  std::string reference;
  std::string settles_entry_id;

  uint64_t created_at_ms = 0;
};

} // namespace dispatch::db::model
