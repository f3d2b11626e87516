#pragma once
#include <tessera/schema/primitives.hpp>
#include <optional>

namespace tessera::schema::encoding {

/// Build-time selected codec. Every persisted value, key and wire payload
/// goes through one specialisation of this template, so swapping the codec
/// never touches calling code.
template <typename Library>
struct encoder {
  template <typename T>
  tessera::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, tessera::schema::bytes_t& out);

  template <typename T>
  T decode(const tessera::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tessera::schema::bytes_view_t& bytes);
};

}  // namespace tessera::schema::encoding
