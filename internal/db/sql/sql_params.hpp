#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace dispatch::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Both use ordered binding; queries are written with `?` and the
  Postgres backend renumbers them.
*/

using Param = std::variant<std::nullptr_t, int32_t, int64_t, uint64_t, double, std::string>;

using Params = std::vector<Param>;

// Empty strings are stored as NULL (nullable foreign-key style columns).
inline Param NullableText(const std::string& value) {
  if (value.empty()) {
    return nullptr;
  }
  return value;
}

inline Param Bool(bool value) {
  return static_cast<int32_t>(value ? 1 : 0);
}

} // namespace dispatch::db::sql
