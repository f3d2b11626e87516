#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: set operator approval.
// Approves an operator for every record the caller holds in a resolver.
namespace tessera::schema {

template <uint16_t Version>
struct set_operator_approval;

template <>
struct set_operator_approval<1> final {
  uint16_t version{1};
  resolver_id_t resolver_id{};
  address_t operator_address{};
  bool approved{};
};

using set_operator_approval_t = set_operator_approval<1>;

}  // namespace tessera::schema
