#pragma once
#include <optional>
#include <tessera/schema/primitives.hpp>

// Schema type: transfer value.
// Value ledger payload: moves value between two records of one slot.
namespace tessera::schema {

template <uint16_t Version>
struct transfer_value;

template <>
struct transfer_value<1> final {
  uint16_t version{1};
  token_id_t from_token_id{};
  token_id_t to_token_id{};
  amount_t amount{};
  std::optional<attestation_id_t> attestation_id;
};

using transfer_value_t = transfer_value<1>;

}  // namespace tessera::schema
