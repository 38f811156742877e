#include "db_status.hpp"

#include "internal/util/errors.hpp"

namespace workledger::util {

namespace {

[[noreturn]] void Throw(db::ErrorCode code, const std::string& message) {
  switch (code) {
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::ConstraintViolation:
      throw Duplicate(message);
    case db::ErrorCode::NotFound:
      throw NotFound(message);
    case db::ErrorCode::Conflict:
      throw LeaseConflict(message);
    case db::ErrorCode::InvalidArgument:
      throw InvalidArgument(message);
    case db::ErrorCode::Busy:
    case db::ErrorCode::IOError:
    case db::ErrorCode::SerializationFailure:
      throw BackendFailure(message);
    default:
      throw db::BackendError(code, message);
  }
}

} // namespace

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }
  Throw(result.code, result.message.empty() ? context : context + ": " + result.message);
}

void RethrowBackendError(const db::BackendError& error, const std::string& context) {
  Throw(error.code(), context + ": " + error.what());
}

} // namespace workledger::util
