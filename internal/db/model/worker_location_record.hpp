#pragma once

#include <cstdint>
#include <string>

namespace dispatch::db::model {

// Append-only; the latest row per worker is its current position.
struct WorkerLocationRecord {
  std::string worker_id;

  double lat      = 0;
  double lng      = 0;
  double heading  = 0;
  double speed    = 0;
  double accuracy = 0;

  bool online    = false;
  bool available = false;

  uint64_t captured_at_ms = 0;
};

} // namespace dispatch::db::model
