#pragma once
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/resolver_kind.hpp>

// Schema type: resolver state.
namespace tessera::schema {

template <uint16_t Version>
struct resolver_state;

template <>
struct resolver_state<1> final {
  uint16_t version{1};
  resolver_id_t resolver_id{};
  resolver_kind_t kind{resolver_kind_t::standard};
  // When set, every transfer also needs a TRANSFER capability attestation.
  bool require_transfer_capability{};
  // Distinct holders with at least one valid record (revocable kind).
  uint64_t valid_holder_count{};
  timestamp_milliseconds_t created_at{};
};

using resolver_state_t = resolver_state<1>;

}  // namespace tessera::schema
