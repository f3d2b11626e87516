#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: set delegate signed.
// Delegated role payload: relayed delegation carrying the owner's signature.
namespace tessera::schema {

template <uint16_t Version>
struct set_delegate_signed;

template <>
struct set_delegate_signed<1> final {
  uint16_t version{1};
  token_id_t token_id{};
  address_t user{};
  timestamp_milliseconds_t expires_at{};
  signer_id_t owner_signer{};
  signature_t signature{};
};

using set_delegate_signed_t = set_delegate_signed<1>;

}  // namespace tessera::schema
