#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: approve slot.
// Value ledger payload: approves an operator for the caller's records in a slot.
namespace tessera::schema {

template <uint16_t Version>
struct approve_slot;

template <>
struct approve_slot<1> final {
  uint16_t version{1};
  resolver_id_t resolver_id{};
  slot_id_t slot{};
  address_t operator_address{};
  bool approved{};
};

using approve_slot_t = approve_slot<1>;

}  // namespace tessera::schema
