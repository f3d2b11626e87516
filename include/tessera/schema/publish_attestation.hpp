#pragma once
#include <tessera/schema/attestation_record.hpp>
#include <tessera/schema/primitives.hpp>

// Schema type: publish attestation.
// Attestation service payload: mirrors a newly issued attestation.
namespace tessera::schema {

template <uint16_t Version>
struct publish_attestation;

template <>
struct publish_attestation<1> final {
  uint16_t version{1};
  attestation_record_t record;
};

using publish_attestation_t = publish_attestation<1>;

}  // namespace tessera::schema
