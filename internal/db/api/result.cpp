#include "result.hpp"

namespace connstate::db {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

} // namespace connstate::db
