#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: claim.
// Lifecycle payload: turns a reservation into an owned token.
namespace tessera::schema {

template <uint16_t Version>
struct claim;

template <>
struct claim<1> final {
  uint16_t version{1};
  document_id_t document_id{};
  token_id_t token_id{};
  attestation_id_t attestation_id{};
};

using claim_t = claim<1>;

}  // namespace tessera::schema
