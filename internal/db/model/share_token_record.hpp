#pragma once

#include <cstdint>
#include <string>

namespace dispatch::db::model {

struct ShareTokenRecord {
  std::string token;
  std::string trip_id;
  std::string created_by;

  uint64_t created_at_ms = 0;
  uint64_t expires_at_ms = 0;
  uint64_t revoked_at_ms = 0; // 0 = live
};

} // namespace dispatch::db::model
