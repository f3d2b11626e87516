#pragma once
#include <blake3.h>
#include <tessera/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace tessera::blake3 {

/// Incremental BLAKE3 hasher. Feed fields in a fixed order and finalize once.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const tessera::schema::bytes_view_t& bytes);
  hasher& update(const tessera::schema::hash32_t& value);

  tessera::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

tessera::schema::hash32_t hash(const std::string_view& str);
tessera::schema::hash32_t hash(const tessera::schema::bytes_view_t& bytes);

}  // namespace tessera::blake3
