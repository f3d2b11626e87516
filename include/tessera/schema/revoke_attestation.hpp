#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: revoke attestation.
// Attestation service payload: stamps revoked_at on a mirrored attestation.
namespace tessera::schema {

template <uint16_t Version>
struct revoke_attestation;

template <>
struct revoke_attestation<1> final {
  uint16_t version{1};
  attestation_id_t attestation_id{};
};

using revoke_attestation_t = revoke_attestation<1>;

}  // namespace tessera::schema
