#include "internal/knowledge/api/result.hpp"

namespace fabplan::knowledge {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::InvalidArgument:
      return "invalid_argument";
    case ErrorCode::Unavailable:
      return "unavailable";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::DeadlineExceeded:
      return "deadline_exceeded";
    case ErrorCode::InternalError:
    default:
      return "internal_error";
  }
}

} // namespace fabplan::knowledge
