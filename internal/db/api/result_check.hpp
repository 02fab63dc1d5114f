#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace dispatch::db {

/*
  Converts a failed Result into an exception.

  Conflict, Busy and SerializationFailure become TransactionConflict so
  util::RetryOnConflict can replay the unit of work. Callers that give a
  conditional write a domain meaning (e.g. BindWorker -> AlreadyAssigned)
  inspect the code before calling this.
*/
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace dispatch::db
