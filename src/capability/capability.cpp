#include <tessera/capability/capability.hpp>

#include <charconv>

namespace tessera::capability {

std::string describe(const capability_bits_t granted) {
  if (granted == kNone) {
    return "none";
  }
  auto out = std::string{};
  for (const auto& [name, value] : kCapabilityMappings) {
    if ((granted & bits(value)) == 0) {
      continue;
    }
    if (!out.empty()) {
      out.push_back(',');
    }
    out.append(name);
  }
  return out;
}

std::optional<capability_bits_t> parse_bits(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  auto base = 10;
  if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    text.remove_prefix(2);
    base = 16;
  }
  if (base == 16 || (text.front() >= '0' && text.front() <= '9')) {
    auto value = unsigned{};
    auto [end, error] =
        std::from_chars(text.data(), text.data() + text.size(), value, base);
    if (error != std::errc{} || end != text.data() + text.size() ||
        value > kAll) {
      return std::nullopt;
    }
    return static_cast<capability_bits_t>(value);
  }

  auto granted = kNone;
  while (!text.empty()) {
    auto comma = text.find(',');
    auto name = text.substr(0, comma);
    auto capability = try_parse(name);
    if (!capability) {
      return std::nullopt;
    }
    granted = add_capability(granted, *capability);
    if (comma == std::string_view::npos) {
      break;
    }
    text.remove_prefix(comma + 1);
  }
  return granted;
}

}  // namespace tessera::capability
