#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: holder state.
// Per (resolver, holder) derived counters. valid_count only moves for
// revocable resolvers and always equals the number of valid records owned.
namespace tessera::schema {

template <uint16_t Version>
struct holder_state;

template <>
struct holder_state<1> final {
  uint16_t version{1};
  uint64_t token_count{};
  amount_t total_value{};
  uint64_t valid_count{};
};

using holder_state_t = holder_state<1>;

}  // namespace tessera::schema
