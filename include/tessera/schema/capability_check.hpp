#pragma once
#include <tessera/schema/capability_payload.hpp>
#include <tessera/schema/primitives.hpp>
#include <optional>

// Schema type: capability check.
// Read-only verification answer returned by /capability/check. Never an error
// envelope: the failure kind travels in `error_code`.
namespace tessera::schema {

template <uint16_t Version>
struct capability_check;

template <>
struct capability_check<1> final {
  uint16_t version{1};
  bool verified{};
  // transaction_error_code value when !verified, 0 otherwise.
  uint32_t error_code{};
  uint8_t granted_bits{};
  std::optional<capability_payload_t> payload;
};

using capability_check_t = capability_check<1>;

}  // namespace tessera::schema
