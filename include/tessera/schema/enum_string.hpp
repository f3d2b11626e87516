#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Name <-> value tables for the enums that show up in logs, query output and
// command-line options.
namespace tessera::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// "a|b|c" style listing for usage text.
template <typename Enum, std::size_t N>
std::string join_names(const enum_mappings_t<Enum, N>& mappings,
                       const std::string_view separator = "|") {
  auto out = std::string{};
  for (const auto& [name, enum_value] : mappings) {
    if (!out.empty()) {
      out.append(separator);
    }
    out.append(name);
  }
  return out;
}

// Specialised next to each enum that can be parsed from text.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value);

}  // namespace tessera::schema
