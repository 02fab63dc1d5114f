#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace dispatch::util {

/*
  UUID helpers

  Trip, offer, ledger and share-token ids are random RFC4122 v4 UUIDs
  in their canonical 36 character string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// GenerateUUID() rendered as a string
std::string NewId();

} // namespace dispatch::util
