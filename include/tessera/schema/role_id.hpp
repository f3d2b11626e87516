#pragma once

#include <tessera/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: role id.
// Ledger operator roles. Holders are seeded from genesis configuration; this
// ledger never grants or revokes roles itself.
namespace tessera::schema {

enum class role_id_t : uint8_t {
  admin = 0,
  executor = 1,
  governor = 2,
  attestation_service = 3
};

inline constexpr auto kRoleIdMappings = std::array{
    std::pair<std::string_view, role_id_t>{"admin", role_id_t::admin},
    std::pair<std::string_view, role_id_t>{"executor", role_id_t::executor},
    std::pair<std::string_view, role_id_t>{"governor", role_id_t::governor},
    std::pair<std::string_view, role_id_t>{"attestation_service",
                                           role_id_t::attestation_service},
};

template <>
inline std::optional<role_id_t> try_from_string<role_id_t>(
    const std::string_view value) {
  return from_string(value, kRoleIdMappings);
}

inline constexpr std::string_view to_string(const role_id_t value) {
  return to_string(value, kRoleIdMappings).value_or("unknown");
}

}  // namespace tessera::schema
