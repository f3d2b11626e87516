#pragma once

#include <tessera/schema/primitives.hpp>
#include <tessera/schema/transaction_error_code.hpp>
#include <optional>
#include <string>
#include <variant>

namespace tessera::execution {

struct success final {
  tessera::schema::bytes_t data;
  std::string info;
};

/// Result of one payload handler: result data, or the failure kind that
/// aborts the transaction.
using outcome_t = std::variant<success, tessera::schema::transaction_error_code>;

/// A single precondition: std::nullopt when it holds.
using failure_t = std::optional<tessera::schema::transaction_error_code>;

inline outcome_t ok(std::string info = {}) {
  return success{.data = {}, .info = std::move(info)};
}

}  // namespace tessera::execution
