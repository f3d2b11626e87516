#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: cancel.
// Lifecycle payload: drops an unclaimed reservation.
namespace tessera::schema {

template <uint16_t Version>
struct cancel;

template <>
struct cancel<1> final {
  uint16_t version{1};
  document_id_t document_id{};
  token_id_t token_id{};
};

using cancel_t = cancel<1>;

}  // namespace tessera::schema
