#pragma once

#include <string>
#include <string_view>

namespace ragctx::db {

/*
  Outcome of a repository write.

  Backends map their native errors onto ErrorCode so callers never see
  sqlite result codes. NotFound describes the data (nothing to delete);
  every other non-OK code means the write did not happen because the
  backend refused or failed.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  // document id reused for a different path, or a required key missing
  ConstraintViolation,

  Busy,
  IOError,
  Corruption,
  InternalError,
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
    default:
      return "internal_error";
  }
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

inline bool IsBackendFailure(const Result& r) {
  return r.code != ErrorCode::OK && r.code != ErrorCode::NotFound;
}

} // namespace ragctx::db
