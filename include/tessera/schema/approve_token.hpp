#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: approve token.
// Approves one address for a single record; zero clears.
namespace tessera::schema {

template <uint16_t Version>
struct approve_token;

template <>
struct approve_token<1> final {
  uint16_t version{1};
  token_id_t token_id{};
  address_t operator_address{};
};

using approve_token_t = approve_token<1>;

}  // namespace tessera::schema
