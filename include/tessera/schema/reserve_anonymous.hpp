#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: reserve anonymous.
// Lifecycle payload: reservation claimable by the first valid attestation holder.
namespace tessera::schema {

template <uint16_t Version>
struct reserve_anonymous;

template <>
struct reserve_anonymous<1> final {
  uint16_t version{1};
  document_id_t document_id{};
  slot_id_t slot{};
  amount_t value{};
  bytes_t label;
};

using reserve_anonymous_t = reserve_anonymous<1>;

}  // namespace tessera::schema
