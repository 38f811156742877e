#include <cassert>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/db/api/result.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/request_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/db_status.hpp"
#include "internal/util/errors.hpp"

namespace {

using workledger::grpc::ErrorKind;

workledger::service::ServiceContext BuildServiceContext() {
  workledger::service::ServiceContext ctx;
  ctx.repository = std::make_shared<workledger::db::memory::MemoryRepository>();
  return ctx;
}

void TestErrorKindsMapToStatusCodes() {
  struct Case {
    std::exception_ptr error;
    ::grpc::StatusCode code;
    const char*        kind;
  };

  const Case cases[] = {
      {std::make_exception_ptr(workledger::util::NotFound("nf")), ::grpc::StatusCode::NOT_FOUND, "NotFound"},
      {std::make_exception_ptr(workledger::util::Duplicate("dup")), ::grpc::StatusCode::ALREADY_EXISTS, "Duplicate"},
      {std::make_exception_ptr(workledger::util::InvalidArgument("bad")), ::grpc::StatusCode::INVALID_ARGUMENT, "InvalidArgument"},
      {std::make_exception_ptr(workledger::util::LeaseConflict("lost")), ::grpc::StatusCode::ABORTED, "LeaseConflict"},
      {std::make_exception_ptr(workledger::util::BackendFailure("busy")), ::grpc::StatusCode::UNAVAILABLE, "BackendFailure"},
      {std::make_exception_ptr(std::runtime_error("boom")), ::grpc::StatusCode::UNKNOWN, "Unknown"},
  };

  for (const auto& c : cases) {
    try {
      std::rethrow_exception(c.error);
    } catch (const std::exception& e) {
      const auto status = workledger::grpc::ToStatus(e);
      assert(status.error_code() == c.code);
      assert(status.error_details() == c.kind);
      assert(status.error_message() == e.what());
    }
  }
}

void TestOnlyBackendFailureIsRetryable() {
  assert(workledger::grpc::IsRetryable(ErrorKind::kBackendFailure));
  assert(!workledger::grpc::IsRetryable(ErrorKind::kNotFound));
  assert(!workledger::grpc::IsRetryable(ErrorKind::kDuplicate));
  assert(!workledger::grpc::IsRetryable(ErrorKind::kInvalidArgument));
  assert(!workledger::grpc::IsRetryable(ErrorKind::kLeaseConflict));
  assert(!workledger::grpc::IsRetryable(ErrorKind::kUnknown));

  assert(workledger::grpc::IsRetryable(workledger::grpc::ToStatus(workledger::util::BackendFailure("io"))));
  assert(!workledger::grpc::IsRetryable(workledger::grpc::ToStatus(workledger::util::LeaseConflict("gen"))));
  assert(!workledger::grpc::IsRetryable(::grpc::Status::OK));
}

void TestDbResultTranslation() {
  using workledger::db::ErrorCode;
  using workledger::db::Result;

  const auto kind_of = [](const Result& result) {
    try {
      workledger::util::ThrowIfDbError(result, "ctx");
    } catch (const std::exception& e) {
      return workledger::grpc::Classify(e);
    }
    return ErrorKind::kUnknown;
  };

  assert(kind_of(Result::Err(ErrorCode::ConstraintViolation, "uq")) == ErrorKind::kDuplicate);
  assert(kind_of(Result::Err(ErrorCode::AlreadyExists, "uq")) == ErrorKind::kDuplicate);
  assert(kind_of(Result::Err(ErrorCode::NotFound, "x")) == ErrorKind::kNotFound);
  assert(kind_of(Result::Err(ErrorCode::Conflict, "gen")) == ErrorKind::kLeaseConflict);
  assert(kind_of(Result::Err(ErrorCode::Busy, "locked")) == ErrorKind::kBackendFailure);
  assert(kind_of(Result::Err(ErrorCode::SerializationFailure, "retry")) == ErrorKind::kBackendFailure);

  // Unknown driver errors pass through unmodified.
  bool passed_through = false;
  try {
    workledger::util::ThrowIfDbError(Result::Err(ErrorCode::Corruption, "bad row"), "ctx");
  } catch (const workledger::db::BackendError& e) {
    passed_through = e.code() == ErrorCode::Corruption;
  }
  assert(passed_through);

  // ThrowIfDbError is a no-op on success.
  workledger::util::ThrowIfDbError(Result::Ok(), "ctx");
}

void TestMissingRequestThroughServiceReturnsNotFound() {
  workledger::service::RequestService requests(BuildServiceContext());

  ::grpc::Status status;
  try {
    (void)requests.GetRequest(42);
  } catch (const std::exception& e) {
    status = workledger::grpc::ToStatus(e);
  }
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestCancelMissingRequestReturnsNotFound() {
  workledger::service::RequestService requests(BuildServiceContext());

  ::grpc::Status status;
  try {
    requests.CancelRequest(7);
  } catch (const std::exception& e) {
    status = workledger::grpc::ToStatus(e);
  }
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

} // namespace

int main() {
  TestErrorKindsMapToStatusCodes();
  TestOnlyBackendFailureIsRetryable();
  TestDbResultTranslation();
  TestMissingRequestThroughServiceReturnsNotFound();
  TestCancelMissingRequestReturnsNotFound();

  std::cout << "workledger_unit_grpc_status: pass\n";
  return 0;
}
