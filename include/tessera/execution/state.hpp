#pragma once

#include <tessera/schema/encoding/scale/encoder.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/storage/rocksdb/storage.hpp>
#include <map>
#include <optional>
#include <vector>

namespace tessera::execution {

using encoder_t = tessera::schema::encoding::encoder<
    tessera::schema::encoding::scale_encoder_tag>;
using storage_t =
    tessera::storage::storage<tessera::storage::rocksdb_storage_tag>;

/// Ledger state seen by executing transactions.
///
/// Reads fall through the transaction overlay, then the block overlay, then
/// committed storage. Writes only ever land in the transaction overlay, which
/// is merged into the block overlay when the transaction succeeds and dropped
/// when it fails. The block overlay reaches RocksDB as one write batch.
class state final {
 public:
  state(encoder_t& encoder, storage_t& storage);

  template <typename T>
  std::optional<T> get(const tessera::schema::bytes_view_t& key) const;

  template <typename T>
  void put(const tessera::schema::bytes_t& key, const T& value);

  bool contains(const tessera::schema::bytes_view_t& key) const;
  void erase(const tessera::schema::bytes_t& key);

  /// Promote the transaction overlay into the block overlay.
  void commit_transaction();
  /// Drop every write of the current transaction.
  void rollback_transaction();

  /// Move the block overlay out as a storage write set.
  std::vector<tessera::storage::write_entry_t> take_block_writes();
  void discard_block();

  encoder_t& encoder() const { return encoder_; }

 private:
  using overlay_t = std::map<tessera::schema::bytes_t,
                             std::optional<tessera::schema::bytes_t>>;

  std::optional<tessera::schema::bytes_t> read(
      const tessera::schema::bytes_view_t& key) const;

  encoder_t& encoder_;
  storage_t& storage_;
  overlay_t block_;
  overlay_t transaction_;
};

template <typename T>
std::optional<T> state::get(const tessera::schema::bytes_view_t& key) const {
  auto raw = read(key);
  if (!raw) {
    return std::nullopt;
  }
  return encoder_.decode<T>(
      tessera::schema::bytes_view_t{raw->data(), raw->size()});
}

template <typename T>
void state::put(const tessera::schema::bytes_t& key, const T& value) {
  transaction_[key] = encoder_.encode(value);
}

}  // namespace tessera::execution
