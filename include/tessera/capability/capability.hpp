#pragma once

#include <tessera/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Capability bitmask algebra shared by every resolver variant. The bit
// assignments are part of the attestation payload format and never change.
namespace tessera::capability {

using capability_bits_t = uint8_t;

enum class capability_t : capability_bits_t {
  claim = 0x01,
  transfer = 0x02,
  request_payment = 0x04,
  approve_payment = 0x08,
  update_metadata = 0x10,
  delegate_rights = 0x20,
  revoke_access = 0x40,
  admin = 0x80,
};

inline constexpr auto kNone = capability_bits_t{0x00};
inline constexpr auto kAll = capability_bits_t{0xFF};

inline constexpr auto kCapabilityMappings = std::array{
    std::pair<std::string_view, capability_t>{"claim", capability_t::claim},
    std::pair<std::string_view, capability_t>{"transfer",
                                              capability_t::transfer},
    std::pair<std::string_view, capability_t>{"request_payment",
                                              capability_t::request_payment},
    std::pair<std::string_view, capability_t>{"approve_payment",
                                              capability_t::approve_payment},
    std::pair<std::string_view, capability_t>{"update_metadata",
                                              capability_t::update_metadata},
    std::pair<std::string_view, capability_t>{"delegate_rights",
                                              capability_t::delegate_rights},
    std::pair<std::string_view, capability_t>{"revoke_access",
                                              capability_t::revoke_access},
    std::pair<std::string_view, capability_t>{"admin", capability_t::admin},
};

constexpr capability_bits_t bits(const capability_t capability) {
  return static_cast<capability_bits_t>(capability);
}

constexpr bool is_admin(const capability_bits_t granted) {
  return (granted & bits(capability_t::admin)) != 0;
}

/// True when `granted` covers every bit of `required`. The admin bit covers
/// everything.
constexpr bool has_capability(const capability_bits_t granted,
                              const capability_bits_t required) {
  if (is_admin(granted)) {
    return true;
  }
  return (granted & required) == required;
}

constexpr bool has_capability(const capability_bits_t granted,
                              const capability_t required) {
  return has_capability(granted, bits(required));
}

constexpr capability_bits_t add_capability(const capability_bits_t granted,
                                           const capability_t capability) {
  return static_cast<capability_bits_t>(granted | bits(capability));
}

constexpr capability_bits_t remove_capability(const capability_bits_t granted,
                                              const capability_t capability) {
  return static_cast<capability_bits_t>(granted & ~bits(capability));
}

constexpr std::string_view to_string(const capability_t value) {
  return tessera::schema::to_string(value, kCapabilityMappings)
      .value_or("unknown");
}

inline std::optional<capability_t> try_parse(const std::string_view value) {
  return tessera::schema::from_string(value, kCapabilityMappings);
}

/// Comma separated names of the set bits, "none" for an empty mask.
std::string describe(capability_bits_t granted);

/// Parse "claim,transfer" style lists or a 0x-prefixed/decimal number.
std::optional<capability_bits_t> parse_bits(std::string_view text);

}  // namespace tessera::capability
