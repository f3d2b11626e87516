#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: attestation record.
// Signed, schema-typed statement mirrored from the attestation service.
// Immutable once published except for revoked_at.
namespace tessera::schema {

template <uint16_t Version>
struct attestation_record;

template <>
struct attestation_record<1> final {
  uint16_t version{1};
  attestation_id_t id{};
  schema_id_t schema_id{};
  timestamp_milliseconds_t issued_at{};
  // 0 = never expires.
  timestamp_milliseconds_t expires_at{};
  // 0 = active.
  timestamp_milliseconds_t revoked_at{};
  address_t recipient{};
  address_t issuer{};
  // SCALE encoded capability_payload_t.
  bytes_t payload;
};

using attestation_record_t = attestation_record<1>;

}  // namespace tessera::schema
