#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: update capability schema.
// Governor payload: replaces the accepted attestation schema id.
namespace tessera::schema {

template <uint16_t Version>
struct update_capability_schema;

template <>
struct update_capability_schema<1> final {
  uint16_t version{1};
  schema_id_t schema_id{};
};

using update_capability_schema_t = update_capability_schema<1>;

}  // namespace tessera::schema
