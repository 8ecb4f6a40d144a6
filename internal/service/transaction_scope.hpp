#pragma once

#include <exception>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace draftstore::service {

inline const char* DescribeErrorKind(const std::exception& ex) {
  if (const auto* err = dynamic_cast<const draftstore::util::Error*>(&ex)) {
    return draftstore::util::ErrorKindName(err->Kind());
  }
  return "internal";
}

/*
  Runs fn(tx) in a fresh transaction and commits it.

  On any exception the transaction is left uncommitted (its destructor
  rolls back), the failure is logged at warn and rethrown unchanged.
*/
template <typename Fn>
auto RunInTransaction(draftstore::db::Repository& repository, std::string_view operation, Fn&& fn) {
  auto tx = repository.Begin();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn, draftstore::db::Transaction&>>) {
      fn(*tx);
      tx->Commit();
      DRAFTSTORE_LOG_DEBUG("operation committed", {draftstore::observability::StringField("op", operation)});
      return;
    } else {
      auto result = fn(*tx);
      tx->Commit();
      DRAFTSTORE_LOG_DEBUG("operation committed", {draftstore::observability::StringField("op", operation)});
      return result;
    }
  } catch (const std::exception& ex) {
    DRAFTSTORE_LOG_WARN("operation failed", {draftstore::observability::StringField("op", operation),
                                             draftstore::observability::StringField("kind", DescribeErrorKind(ex)),
                                             draftstore::observability::StringField("error", ex.what())});
    throw;
  }
}

} // namespace draftstore::service
