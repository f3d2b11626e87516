#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: reserve.
// Lifecycle payload: targeted reservation for a known recipient.
namespace tessera::schema {

template <uint16_t Version>
struct reserve;

template <>
struct reserve<1> final {
  uint16_t version{1};
  document_id_t document_id{};
  slot_id_t slot{};
  address_t recipient{};
  amount_t value{};
};

using reserve_t = reserve<1>;

}  // namespace tessera::schema
