#pragma once
#include <tessera/schema/primitives.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace tessera::storage {

using key_value_entry_t =
    std::pair<tessera::schema::bytes_t, tessera::schema::bytes_t>;

/// One key of a write set; std::nullopt deletes the key.
using write_entry_t = std::pair<tessera::schema::bytes_t,
                                std::optional<tessera::schema::bytes_t>>;

/// Last committed consensus checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  tessera::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const tessera::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const tessera::schema::bytes_view_t& key,
           const T& value);

  /// Raw value bytes at key, or std::nullopt when missing.
  std::optional<tessera::schema::bytes_t> get_bytes(
      const tessera::schema::bytes_view_t& key) const;

  /// Atomically apply every put/delete of a write set, together with the
  /// committed checkpoint when one is given.
  void apply(const std::vector<write_entry_t>& writes,
             const std::optional<committed_state>& checkpoint =
                 std::nullopt) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint (height + state_root).
  void save_committed_state(const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const tessera::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace tessera::storage
