#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: set issuer.
// Registry payload: records the issuer allowed to attest for a document, once.
namespace tessera::schema {

template <uint16_t Version>
struct set_issuer;

template <>
struct set_issuer<1> final {
  uint16_t version{1};
  document_id_t document_id{};
  address_t issuer{};
};

using set_issuer_t = set_issuer<1>;

}  // namespace tessera::schema
