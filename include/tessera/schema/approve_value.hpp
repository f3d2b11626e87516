#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: approve value.
// Value ledger payload: sets the value allowance of a spender on a record.
namespace tessera::schema {

template <uint16_t Version>
struct approve_value;

template <>
struct approve_value<1> final {
  uint16_t version{1};
  token_id_t token_id{};
  address_t operator_address{};
  amount_t amount{};
};

using approve_value_t = approve_value<1>;

}  // namespace tessera::schema
