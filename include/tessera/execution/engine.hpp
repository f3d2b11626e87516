#pragma once

#include <tessera/execution/credential_issuer.hpp>
#include <tessera/execution/outcome.hpp>
#include <tessera/execution/signature_verifier.hpp>
#include <tessera/execution/state.hpp>
#include <tessera/schema/app_info.hpp>
#include <tessera/schema/block_result.hpp>
#include <tessera/schema/commit_result.hpp>
#include <tessera/schema/encoding/encoder.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/query_result.hpp>
#include <tessera/schema/transaction.hpp>
#include <tessera/schema/transaction_error_code.hpp>
#include <tessera/schema/transaction_result.hpp>
#include <tessera/storage/rocksdb/storage.hpp>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace tessera::execution {

inline constexpr auto kExecuteCodespace = std::string_view{"tessera.execute"};
inline constexpr auto kQueryCodespace = std::string_view{"tessera.query"};

struct context;

/// Role holders and settings written once into an empty ledger.
struct genesis_config final {
  std::vector<tessera::schema::address_t> admins;
  std::vector<tessera::schema::address_t> executors;
  std::vector<tessera::schema::address_t> governors;
  std::vector<tessera::schema::address_t> attestation_services;
  tessera::schema::schema_id_t capability_schema_id{};
};

/// Bytes covered by a transaction signature: SCALE of
/// (chain_id, nonce, signer, payload).
tessera::schema::bytes_t make_signing_bytes(
    encoder_t& encoder,
    const tessera::schema::transaction_t& tx);

/// Deterministic document-token ledger.
///
/// Validates transaction envelopes, dispatches payloads to the lifecycle,
/// value ledger and variant handlers, keeps every transaction atomic against
/// a block overlay and persists the block on commit.
class engine final {
 public:
  /// `require_strict_crypto` enables envelope signature verification; when
  /// false only delegation signatures are checked.
  explicit engine(encoder_t& encoder,
                  storage_t& storage,
                  const tessera::schema::hash32_t& chain_id,
                  bool require_strict_crypto = true);

  /// Seed roles and the capability schema. Only applies to a ledger that has
  /// never committed; returns whether it did.
  bool initialize(const genesis_config& genesis);

  /// Admission check against committed state. Never mutates state.
  tessera::schema::transaction_result_t check_transaction(
      const tessera::schema::bytes_view_t& raw_tx);

  /// Execute a block in order. Failed transactions leave no trace; the
  /// returned state_root folds every successful one.
  tessera::schema::block_result_t finalize_block(
      uint64_t height,
      tessera::schema::timestamp_milliseconds_t block_time,
      const std::vector<tessera::schema::bytes_t>& txs);

  /// Persist the last finalized block with one write batch.
  tessera::schema::commit_result_t commit();

  tessera::schema::app_info_t info() const;

  /// Read committed state by route.
  tessera::schema::query_result_t query(
      std::string_view path,
      const tessera::schema::bytes_view_t& data);

  /// Replace the signature check used for envelopes and signed delegations.
  void set_signature_verifier(signature_verifier_t verifier);

  /// Install the optional post-claim credential integration.
  void set_credential_issuer(credential_issuer_t issuer);

  const tessera::schema::hash32_t& chain_id() const { return chain_id_; }

 private:
  class execution_scope;

  tessera::schema::transaction_result_t execute_transaction(
      const tessera::schema::transaction_t& tx,
      tessera::schema::timestamp_milliseconds_t block_time);

  std::optional<tessera::schema::transaction_error_code> validate_transaction(
      const tessera::schema::transaction_t& tx,
      const state& ledger) const;

  outcome_t dispatch(context& ctx,
                     const tessera::schema::transaction_payload_t& payload);

  bool reentered() const;

  mutable std::mutex mutex_;
  std::atomic<std::thread::id> executing_thread_{};
  encoder_t& encoder_;
  storage_t& storage_;
  state block_state_;
  tessera::schema::hash32_t chain_id_;
  int64_t last_committed_height_{};
  tessera::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  tessera::schema::hash32_t pending_state_root_{};
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
  credential_issuer_t credential_issuer_;
};

}  // namespace tessera::execution
