#include <tessera/execution/state.hpp>

#include <iterator>

namespace tessera::execution {

state::state(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

std::optional<tessera::schema::bytes_t> state::read(
    const tessera::schema::bytes_view_t& key) const {
  auto owned = tessera::schema::make_bytes(key);
  if (auto it = transaction_.find(owned); it != std::end(transaction_)) {
    return it->second;
  }
  if (auto it = block_.find(owned); it != std::end(block_)) {
    return it->second;
  }
  return storage_.get_bytes(key);
}

bool state::contains(const tessera::schema::bytes_view_t& key) const {
  return read(key).has_value();
}

void state::erase(const tessera::schema::bytes_t& key) {
  transaction_[key] = std::nullopt;
}

void state::commit_transaction() {
  for (auto& [key, value] : transaction_) {
    block_[key] = std::move(value);
  }
  transaction_.clear();
}

void state::rollback_transaction() {
  transaction_.clear();
}

std::vector<tessera::storage::write_entry_t> state::take_block_writes() {
  transaction_.clear();
  auto writes = std::vector<tessera::storage::write_entry_t>{};
  writes.reserve(block_.size());
  for (auto& [key, value] : block_) {
    writes.emplace_back(key, std::move(value));
  }
  block_.clear();
  return writes;
}

void state::discard_block() {
  transaction_.clear();
  block_.clear();
}

}  // namespace tessera::execution
