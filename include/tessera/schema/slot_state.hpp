#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: slot state.
// Aggregate counters of one value-ledger slot. total_reserved counts value
// sitting in unclaimed reservations, total_minted value held by claimed
// records; holder_count is the number of addresses holding at least one
// record in the slot.
namespace tessera::schema {

template <uint16_t Version>
struct slot_state;

template <>
struct slot_state<1> final {
  uint16_t version{1};
  resolver_id_t resolver_id{};
  slot_id_t slot{};
  amount_t total_reserved{};
  amount_t total_minted{};
  uint64_t holder_count{};
};

using slot_state_t = slot_state<1>;

}  // namespace tessera::schema
