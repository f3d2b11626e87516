#pragma once
#include <tessera/schema/resolver_kind.hpp>
#include <tessera/schema/primitives.hpp>

// Schema type: create resolver.
// Admin payload: registers a resolver instance of one token standard.
namespace tessera::schema {

template <uint16_t Version>
struct create_resolver;

template <>
struct create_resolver<1> final {
  uint16_t version{1};
  resolver_id_t resolver_id{};
  resolver_kind_t kind{resolver_kind_t::standard};
  bool require_transfer_capability{};
};

using create_resolver_t = create_resolver<1>;

}  // namespace tessera::schema
