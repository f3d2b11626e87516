#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <tessera/common/critical.hpp>
#include <tessera/schema/encoding/scale/encoder.hpp>
#include <tessera/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <scale/scale.hpp>
#include <string_view>
#include <tuple>

namespace tessera::storage {

namespace detail {

using encoder_t = tessera::schema::encoding::encoder<
    tessera::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED_STATE"};

inline tessera::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const tessera::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const tessera::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const tessera::schema::bytes_view_t& key,
           const T& value);

  std::optional<tessera::schema::bytes_t> get_bytes(
      const tessera::schema::bytes_view_t& key) const;
  void apply(const std::vector<write_entry_t>& writes,
             const std::optional<committed_state>& checkpoint =
                 std::nullopt) const;
  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const tessera::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const tessera::schema::bytes_view_t& key) const {
  auto value = get_bytes(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      tessera::schema::bytes_view_t{value->data(), value->size()})};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const tessera::schema::bytes_view_t& key,
                                       const T& value) {
  if (!database) {
    tessera::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(tessera::schema::bytes_view_t{encoded_value}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    tessera::common::critical("Failed to put value into RocksDB");
  }
}

inline std::optional<tessera::schema::bytes_t>
storage<rocksdb_storage_tag>::get_bytes(
    const tessera::schema::bytes_view_t& key) const {
  if (!database) {
    tessera::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    tessera::common::critical("Failed to get value from RocksDB");
  }
  return tessera::schema::bytes_t(std::begin(value), std::end(value));
}

inline void storage<rocksdb_storage_tag>::apply(
    const std::vector<write_entry_t>& writes,
    const std::optional<committed_state>& checkpoint) const {
  if (!database) {
    tessera::common::critical("RocksDB database is not initialized");
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto status = value.has_value()
                      ? batch.Put(detail::to_slice(key),
                                  detail::to_slice(tessera::schema::bytes_view_t{
                                      value.value()}))
                      : batch.Delete(detail::to_slice(key));
    if (!status.ok()) {
      tessera::common::critical("failed staging write batch entry: {}",
                                status.ToString());
    }
  }
  if (checkpoint) {
    auto encoder = detail::encoder_t{};
    auto key = tessera::schema::make_bytes(detail::kCommittedStateKey);
    auto value =
        encoder.encode(std::tuple{checkpoint->height, checkpoint->state_root});
    auto status = batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!status.ok()) {
      tessera::common::critical("failed staging committed state: {}",
                                status.ToString());
    }
  }
  auto write_status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    tessera::common::critical("failed to commit write batch: {}",
                              write_status.ToString());
  }
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto key = tessera::schema::make_bytes(detail::kCommittedStateKey);
  auto raw = get_bytes(key);
  if (!raw) {
    return std::nullopt;
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, tessera::schema::hash32_t>>(
          tessera::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded.has_value()) {
    tessera::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

inline void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  apply({}, state);
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const tessera::schema::bytes_view_t& prefix) const {
  if (!database) {
    tessera::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  return entries;
}

}  // namespace tessera::storage
