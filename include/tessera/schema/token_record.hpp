#pragma once
#include <tessera/schema/primitives.hpp>
#include <vector>

// Schema type: token record.
// A reservation before claim and the token itself afterwards. `claimed` only
// ever goes false -> true and `document_id` is fixed at creation. Variant
// specific fields (lock, validity, delegate) are appended after the core
// lifecycle fields.
namespace tessera::schema {

struct value_allowance_t final {
  address_t spender{};
  amount_t amount{};
};

template <uint16_t Version>
struct token_record;

template <>
struct token_record<1> final {
  uint16_t version{1};
  token_id_t token_id{};
  document_id_t document_id{};
  resolver_id_t resolver_id{};
  slot_id_t slot{};
  amount_t value{};
  address_t owner{};
  // Zero for anonymous reservations and for every claimed record.
  address_t reserved_for{};
  bool claimed{};
  // Opaque encrypted bytes, bounded by kMaxLabelBytes.
  bytes_t label;
  timestamp_milliseconds_t created_at{};
  address_t approved{};
  std::vector<value_allowance_t> allowances;
  bool locked{};
  bool valid{true};
  timestamp_milliseconds_t revoked_at{};
  address_t delegate{};
  timestamp_milliseconds_t delegate_expires_at{};
  uint64_t delegation_nonce{};
};

using token_record_t = token_record<1>;

inline constexpr std::size_t kMaxLabelBytes = 1024;

}  // namespace tessera::schema
