#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: set delegate.
// Delegated role payload: assigns a time-bound user to a record.
namespace tessera::schema {

template <uint16_t Version>
struct set_delegate;

template <>
struct set_delegate<1> final {
  uint16_t version{1};
  token_id_t token_id{};
  address_t user{};
  timestamp_milliseconds_t expires_at{};
};

using set_delegate_t = set_delegate<1>;

}  // namespace tessera::schema
