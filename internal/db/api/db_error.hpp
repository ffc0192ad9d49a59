#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace meshdispatch::db {

// Store codes become the exceptions the core speaks.
inline void ThrowIfDbError(const Result& result, const std::string& what) {
  if (result) return;

  const std::string message = result.message.empty() ? what : what + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::Conflict:
      throw util::Conflict(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace meshdispatch::db
