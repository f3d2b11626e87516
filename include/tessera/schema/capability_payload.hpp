#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: capability payload.
// The decoded body of an attestation: which document, which token and which
// capability bits, plus the identity verification detail the issuer vouched
// for.
namespace tessera::schema {

template <uint16_t Version>
struct capability_payload;

template <>
struct capability_payload<1> final {
  document_id_t document_id{};
  token_id_t token_id{};
  uint8_t capability_bits{};
  bytes_t verified_identity;
  bytes_t verification_method;
  timestamp_milliseconds_t verification_date{};
  bytes_t contract_role;
  bytes_t legal_entity_type;
  bytes_t notes;
};

using capability_payload_t = capability_payload<1>;

}  // namespace tessera::schema
