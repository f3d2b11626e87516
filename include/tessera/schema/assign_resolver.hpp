#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: assign resolver.
// Registry payload: binds a document to its resolver, once.
namespace tessera::schema {

template <uint16_t Version>
struct assign_resolver;

template <>
struct assign_resolver<1> final {
  uint16_t version{1};
  document_id_t document_id{};
  resolver_id_t resolver_id{};
};

using assign_resolver_t = assign_resolver<1>;

}  // namespace tessera::schema
