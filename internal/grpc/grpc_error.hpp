#pragma once

#include <exception>
#include <string_view>

#include <grpcpp/grpcpp.h>

namespace workledger::grpc {

/*
  Converts internal exceptions into gRPC status codes.

    NotFound         -> NOT_FOUND
    Duplicate        -> ALREADY_EXISTS
    InvalidArgument  -> INVALID_ARGUMENT
    LeaseConflict    -> ABORTED
    BackendFailure   -> UNAVAILABLE
    anything else    -> UNKNOWN

  The error kind name travels in the status error_details.
*/

enum class ErrorKind {
  kNotFound,
  kDuplicate,
  kInvalidArgument,
  kLeaseConflict,
  kBackendFailure,
  kUnknown,
};

ErrorKind        Classify(const std::exception& e);
std::string_view KindName(ErrorKind kind);

::grpc::Status ToStatus(const std::exception& e);

// Only BackendFailure is worth retrying.
bool IsRetryable(ErrorKind kind);
bool IsRetryable(const ::grpc::Status& status);

} // namespace workledger::grpc
