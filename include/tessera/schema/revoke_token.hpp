#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: revoke token.
// Revocable resolver payload: invalidates a claimed record, keeping it.
namespace tessera::schema {

template <uint16_t Version>
struct revoke_token;

template <>
struct revoke_token<1> final {
  uint16_t version{1};
  token_id_t token_id{};
};

using revoke_token_t = revoke_token<1>;

}  // namespace tessera::schema
