#pragma once
#include <optional>
#include <tessera/schema/primitives.hpp>

// Schema type: transfer value to address.
// Value ledger payload: splits value off into a new record for an address.
namespace tessera::schema {

template <uint16_t Version>
struct transfer_value_to_address;

template <>
struct transfer_value_to_address<1> final {
  uint16_t version{1};
  token_id_t from_token_id{};
  address_t to{};
  amount_t amount{};
  std::optional<attestation_id_t> attestation_id;
};

using transfer_value_to_address_t = transfer_value_to_address<1>;

}  // namespace tessera::schema
