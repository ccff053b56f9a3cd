#pragma once

#include <string>
#include <utility>

namespace fabplan::knowledge {

/*
  Portable knowledge-store result codes.

  Backends translate their native errors into these. The planner never
  depends on sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  InvalidArgument,

  // The store could not be reached or answered; retry later.
  Unavailable,
  Busy,
  IOError,
  Corruption,

  // The injected query deadline passed before the store answered.
  DeadlineExceeded,

  InternalError
};

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

const char* ToString(ErrorCode code);

} // namespace fabplan::knowledge
