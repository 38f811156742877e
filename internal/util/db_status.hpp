#pragma once

#include <string>
#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/result.hpp"

namespace workledger::util {

/*
  Repository results -> service exceptions (errors.hpp).

    AlreadyExists, ConstraintViolation  -> Duplicate
    NotFound                            -> NotFound
    Conflict                            -> LeaseConflict
    InvalidArgument                     -> InvalidArgument
    Busy, IOError, SerializationFailure -> BackendFailure
    anything else                       -> db::BackendError, unmodified
*/

void ThrowIfDbError(const db::Result& result, const std::string& context);

[[noreturn]] void RethrowBackendError(const db::BackendError& error, const std::string& context);

namespace detail {

template <typename BeginFn, typename Fn>
auto RunWith(const std::string& context, BeginFn&& begin, Fn&& fn) {
  try {
    auto tx = begin();
    if constexpr (std::is_void_v<std::invoke_result_t<Fn, db::Transaction&>>) {
      fn(*tx);
      tx->Commit();
    } else {
      auto result = fn(*tx);
      tx->Commit();
      return result;
    }
  } catch (const db::BackendError& e) {
    RethrowBackendError(e, context);
  }
}

} // namespace detail

/*
  Runs fn(tx) in a fresh transaction and commits it. Any exception rolls the
  transaction back (by destruction) before it propagates; driver errors are
  translated on the way out.
*/
template <typename Fn>
auto RunInTransaction(db::Repository& repository, const std::string& context, Fn&& fn) {
  return detail::RunWith(context, [&] { return repository.Begin(); }, std::forward<Fn>(fn));
}

// Same as RunInTransaction, started with BeginRead(); fn must not write.
template <typename Fn>
auto RunReadTransaction(db::Repository& repository, const std::string& context, Fn&& fn) {
  return detail::RunWith(context, [&] { return repository.BeginRead(); }, std::forward<Fn>(fn));
}

} // namespace workledger::util
