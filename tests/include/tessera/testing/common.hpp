#pragma once

#include <tessera/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace tessera::testing {

inline tessera::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = tessera::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

// Named signers double as ledger addresses.
inline tessera::schema::address_t make_address(const uint8_t seed) {
  auto address = tessera::schema::address_t{};
  address[0] = seed;
  address[31] = 0x01;
  return address;
}

inline tessera::schema::signer_id_t make_named_signer(
    const tessera::schema::address_t& address) {
  return tessera::schema::signer_id_t{address};
}

inline tessera::schema::ed25519_signer_id make_ed25519_signer(
    const uint8_t seed) {
  auto signer = tessera::schema::ed25519_signer_id{};
  for (std::size_t i = 0; i < signer.public_key.size(); ++i) {
    signer.public_key[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return signer;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace tessera::testing
