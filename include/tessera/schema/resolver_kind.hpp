#pragma once

#include <tessera/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: resolver kind.
// Token standard a resolver implements on top of the shared reservation and
// claim lifecycle. Exactly one per resolver instance.
namespace tessera::schema {

enum class resolver_kind_t : uint8_t {
  standard = 0,
  value_ledger = 1,
  permanent_lock = 2,
  revocable = 3,
  delegated_role = 4
};

inline constexpr auto kResolverKindMappings = std::array{
    std::pair<std::string_view, resolver_kind_t>{"standard",
                                                 resolver_kind_t::standard},
    std::pair<std::string_view, resolver_kind_t>{
        "value_ledger", resolver_kind_t::value_ledger},
    std::pair<std::string_view, resolver_kind_t>{
        "permanent_lock", resolver_kind_t::permanent_lock},
    std::pair<std::string_view, resolver_kind_t>{"revocable",
                                                 resolver_kind_t::revocable},
    std::pair<std::string_view, resolver_kind_t>{
        "delegated_role", resolver_kind_t::delegated_role},
};

template <>
inline std::optional<resolver_kind_t> try_from_string<resolver_kind_t>(
    const std::string_view value) {
  return from_string(value, kResolverKindMappings);
}

inline constexpr std::string_view to_string(const resolver_kind_t value) {
  return to_string(value, kResolverKindMappings).value_or("unknown");
}

}  // namespace tessera::schema
