#pragma once
#include <optional>
#include <tessera/schema/primitives.hpp>

// Schema type: transfer token.
// Ownership transfer of a whole record.
namespace tessera::schema {

template <uint16_t Version>
struct transfer_token;

template <>
struct transfer_token<1> final {
  uint16_t version{1};
  token_id_t token_id{};
  address_t to{};
  std::optional<attestation_id_t> attestation_id;
};

using transfer_token_t = transfer_token<1>;

}  // namespace tessera::schema
