#include "grpc_error.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace workledger::grpc {

ErrorKind Classify(const std::exception& e) {
  using namespace workledger::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return ErrorKind::kNotFound;
  }
  if (dynamic_cast<const Duplicate*>(&e)) {
    return ErrorKind::kDuplicate;
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return ErrorKind::kInvalidArgument;
  }
  if (dynamic_cast<const LeaseConflict*>(&e)) {
    return ErrorKind::kLeaseConflict;
  }
  if (dynamic_cast<const BackendFailure*>(&e)) {
    return ErrorKind::kBackendFailure;
  }
  return ErrorKind::kUnknown;
}

std::string_view KindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNotFound:
      return "NotFound";
    case ErrorKind::kDuplicate:
      return "Duplicate";
    case ErrorKind::kInvalidArgument:
      return "InvalidArgument";
    case ErrorKind::kLeaseConflict:
      return "LeaseConflict";
    case ErrorKind::kBackendFailure:
      return "BackendFailure";
    case ErrorKind::kUnknown:
      break;
  }
  return "Unknown";
}

::grpc::Status ToStatus(const std::exception& e) {
  const auto kind    = Classify(e);
  const auto details = std::string(KindName(kind));

  switch (kind) {
    case ErrorKind::kNotFound:
      return {::grpc::StatusCode::NOT_FOUND, e.what(), details};
    case ErrorKind::kDuplicate:
      return {::grpc::StatusCode::ALREADY_EXISTS, e.what(), details};
    case ErrorKind::kInvalidArgument:
      return {::grpc::StatusCode::INVALID_ARGUMENT, e.what(), details};
    case ErrorKind::kLeaseConflict:
      return {::grpc::StatusCode::ABORTED, e.what(), details};
    case ErrorKind::kBackendFailure:
      return {::grpc::StatusCode::UNAVAILABLE, e.what(), details};
    case ErrorKind::kUnknown:
      break;
  }
  return {::grpc::StatusCode::UNKNOWN, e.what(), details};
}

bool IsRetryable(ErrorKind kind) {
  return kind == ErrorKind::kBackendFailure;
}

bool IsRetryable(const ::grpc::Status& status) {
  return !status.ok() && status.error_details() == KindName(ErrorKind::kBackendFailure);
}

} // namespace workledger::grpc
