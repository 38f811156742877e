#pragma once

#include <stdexcept>
#include <string>

namespace workledger::util {

/*
  Central error types.

  These get translated later to gRPC status codes (see grpc_error.hpp).
  Anything else thrown out of a service is an unexpected backend error and
  is passed through unmodified.
*/

// Lookup by key or id matched nothing.
class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Uniqueness violation on insert. The message carries the offending key.
class Duplicate : public std::runtime_error {
 public:
  explicit Duplicate(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed call, raised before any statement is issued.
class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transaction or connectivity failure. The only retryable kind.
class BackendFailure : public std::runtime_error {
 public:
  explicit BackendFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The caller's lease on a request was reclaimed or taken over.
class LeaseConflict : public std::runtime_error {
 public:
  explicit LeaseConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace workledger::util
