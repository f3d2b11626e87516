#include <spdlog/spdlog.h>
#include <tessera/attestation/gateway.hpp>
#include <tessera/attestation/verifier.hpp>
#include <tessera/blake3/hash.hpp>
#include <tessera/crypto/verify.hpp>
#include <tessera/execution/context.hpp>
#include <tessera/execution/engine.hpp>
#include <tessera/execution/lifecycle.hpp>
#include <tessera/execution/queries.hpp>
#include <tessera/execution/records.hpp>
#include <tessera/execution/registry.hpp>
#include <tessera/execution/value_ledger.hpp>
#include <tessera/execution/variants.hpp>
#include <tessera/schema/key/engine_keys.hpp>
#include <tessera/schema/query_error_code.hpp>
#include <iterator>
#include <tuple>
#include <utility>

namespace key = tessera::schema::key;
using tessera::schema::transaction_error_code;

namespace {

using encoder_t = tessera::execution::encoder_t;

tessera::schema::hash32_t fold_state_root(
    const tessera::schema::hash32_t& seed,
    const tessera::schema::bytes_t& tx,
    const uint64_t height,
    const uint64_t index) {
  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  return tessera::blake3::hasher{}
      .update(seed)
      .update(tessera::schema::bytes_view_t{tx.data(), tx.size()})
      .update(tessera::schema::bytes_view_t{encoded_suffix.data(),
                                            encoded_suffix.size()})
      .finalize();
}

std::optional<tessera::schema::transaction_t> decode_transaction(
    const tessera::schema::bytes_view_t& raw_tx) {
  if (raw_tx.empty()) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  return encoder.try_decode<tessera::schema::transaction_t>(raw_tx);
}

tessera::schema::transaction_result_t make_error_result(
    const transaction_error_code error,
    std::string info = {}) {
  return tessera::schema::transaction_result_t{
      .code = tessera::schema::code(error),
      .log = std::string{tessera::schema::to_string(error)},
      .info = std::move(info),
      .codespace = std::string{tessera::execution::kExecuteCodespace}};
}

// Administration stays available while the ledger is paused.
bool is_administrative(const tessera::schema::transaction_payload_t& payload) {
  return std::holds_alternative<tessera::schema::set_paused_t>(payload) ||
         std::holds_alternative<tessera::schema::update_capability_schema_t>(
             payload) ||
         std::holds_alternative<tessera::schema::authorize_upgrade_t>(payload);
}

uint64_t load_nonce(const tessera::execution::state& ledger,
                    const tessera::schema::signer_id_t& signer) {
  return ledger.get<uint64_t>(key::make_nonce_key(ledger.encoder(), signer))
      .value_or(0);
}

}  // namespace

namespace tessera::execution {

/// Marks the calling thread as executing for the lifetime of the scope.
class engine::execution_scope final {
 public:
  explicit execution_scope(std::atomic<std::thread::id>& executing)
      : executing_{executing} {
    executing_.store(std::this_thread::get_id());
  }
  ~execution_scope() { executing_.store(std::thread::id{}); }

  execution_scope(const execution_scope&) = delete;
  execution_scope& operator=(const execution_scope&) = delete;

 private:
  std::atomic<std::thread::id>& executing_;
};

tessera::schema::bytes_t make_signing_bytes(
    encoder_t& encoder,
    const tessera::schema::transaction_t& tx) {
  return encoder.encode(
      std::tuple{tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

engine::engine(encoder_t& encoder,
               storage_t& storage,
               const tessera::schema::hash32_t& chain_id,
               const bool require_strict_crypto)
    : encoder_{encoder},
      storage_{storage},
      block_state_{encoder, storage},
      chain_id_{chain_id},
      require_strict_crypto_{require_strict_crypto},
      signature_verifier_{tessera::crypto::verify_signature} {
  auto lock = std::scoped_lock{mutex_};
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
  }
  if (require_strict_crypto_ && !tessera::crypto::available()) {
    spdlog::warn("OpenSSL lacks ed25519/secp256k1 support; signed "
                 "transactions will be rejected");
  }
  spdlog::info("Ledger engine ready at height {} (chain {}, strict crypto {})",
               last_committed_height_, tessera::schema::to_hex(chain_id_),
               require_strict_crypto_);
}

bool engine::initialize(const genesis_config& genesis) {
  auto lock = std::scoped_lock{mutex_};
  auto ledger = state{encoder_, storage_};
  if (storage_.load_committed_state() ||
      ledger.contains(key::make_engine_state_key(encoder_))) {
    spdlog::debug("Ledger already initialized; genesis skipped");
    return false;
  }

  auto grant = [&](const tessera::schema::role_id_t role,
                   const std::vector<tessera::schema::address_t>& holders) {
    for (const auto& holder : holders) {
      ledger.put(key::make_role_key(encoder_, role, holder), true);
      spdlog::info("Genesis: {} -> {}", tessera::schema::to_string(role),
                   tessera::schema::to_hex(holder));
    }
  };
  grant(tessera::schema::role_id_t::admin, genesis.admins);
  grant(tessera::schema::role_id_t::executor, genesis.executors);
  grant(tessera::schema::role_id_t::governor, genesis.governors);
  grant(tessera::schema::role_id_t::attestation_service,
        genesis.attestation_services);
  store_engine_state(ledger,
                     tessera::schema::engine_state_t{
                         .capability_schema_id = genesis.capability_schema_id});
  ledger.commit_transaction();

  storage_.apply(ledger.take_block_writes(),
                 tessera::storage::committed_state{
                     .height = 0,
                     .state_root = tessera::schema::make_zero_hash()});
  return true;
}

bool engine::reentered() const {
  return executing_thread_.load() == std::this_thread::get_id();
}

std::optional<transaction_error_code> engine::validate_transaction(
    const tessera::schema::transaction_t& tx,
    const state& ledger) const {
  if (tx.version != 1) {
    return transaction_error_code::unsupported_transaction_version;
  }
  if (tx.chain_id != chain_id_) {
    return transaction_error_code::invalid_chain_id;
  }
  if (tx.nonce != load_nonce(ledger, tx.signer)) {
    return transaction_error_code::invalid_nonce;
  }
  if (require_strict_crypto_) {
    auto message = make_signing_bytes(encoder_, tx);
    if (!signature_verifier_ ||
        !signature_verifier_(
            tessera::schema::bytes_view_t{message.data(), message.size()},
            tx.signer, tx.signature)) {
      return transaction_error_code::signature_verification_failed;
    }
  }
  return std::nullopt;
}

tessera::schema::transaction_result_t engine::check_transaction(
    const tessera::schema::bytes_view_t& raw_tx) {
  if (reentered()) {
    return make_error_result(transaction_error_code::reentrant_call);
  }
  auto lock = std::scoped_lock{mutex_};
  auto tx = decode_transaction(raw_tx);
  if (!tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             "undecodable transaction");
  }
  auto committed = state{encoder_, storage_};
  if (auto failure = validate_transaction(*tx, committed)) {
    return make_error_result(*failure);
  }
  return tessera::schema::transaction_result_t{};
}

outcome_t engine::dispatch(context& ctx,
                           const tessera::schema::transaction_payload_t&
                               payload) {
  return std::visit(
      overloaded{
          [&](const tessera::schema::create_resolver_t& value) {
            return registry::create_resolver(ctx, value);
          },
          [&](const tessera::schema::assign_resolver_t& value) {
            return registry::assign_resolver(ctx, value);
          },
          [&](const tessera::schema::set_issuer_t& value) {
            return registry::set_issuer(ctx, value);
          },
          [&](const tessera::schema::set_paused_t& value) {
            return registry::set_paused(ctx, value);
          },
          [&](const tessera::schema::update_capability_schema_t& value) {
            return registry::update_capability_schema(ctx, value);
          },
          [&](const tessera::schema::authorize_upgrade_t& value) {
            return registry::authorize_upgrade(ctx, value);
          },
          [&](const tessera::schema::publish_attestation_t& value) {
            return registry::publish_attestation(ctx, value);
          },
          [&](const tessera::schema::revoke_attestation_t& value) {
            return registry::revoke_attestation(ctx, value);
          },
          [&](const tessera::schema::reserve_t& value) {
            return lifecycle::reserve(ctx, value);
          },
          [&](const tessera::schema::reserve_anonymous_t& value) {
            return lifecycle::reserve_anonymous(ctx, value);
          },
          [&](const tessera::schema::claim_t& value) {
            return lifecycle::claim(ctx, value);
          },
          [&](const tessera::schema::cancel_t& value) {
            return lifecycle::cancel(ctx, value);
          },
          [&](const tessera::schema::transfer_token_t& value) {
            return value_ledger::transfer_token(ctx, value);
          },
          [&](const tessera::schema::transfer_value_t& value) {
            return value_ledger::transfer_value(ctx, value);
          },
          [&](const tessera::schema::transfer_value_to_address_t& value) {
            return value_ledger::transfer_value_to_address(ctx, value);
          },
          [&](const tessera::schema::approve_token_t& value) {
            return value_ledger::approve_token(ctx, value);
          },
          [&](const tessera::schema::set_operator_approval_t& value) {
            return value_ledger::set_operator_approval(ctx, value);
          },
          [&](const tessera::schema::approve_slot_t& value) {
            return value_ledger::approve_slot(ctx, value);
          },
          [&](const tessera::schema::approve_value_t& value) {
            return value_ledger::approve_value(ctx, value);
          },
          [&](const tessera::schema::revoke_token_t& value) {
            return variants::revoke_token(ctx, value);
          },
          [&](const tessera::schema::set_delegate_t& value) {
            return variants::set_delegate(ctx, value);
          },
          [&](const tessera::schema::set_delegate_signed_t& value) {
            return variants::set_delegate_signed(ctx, value);
          }},
      payload);
}

tessera::schema::transaction_result_t engine::execute_transaction(
    const tessera::schema::transaction_t& tx,
    const tessera::schema::timestamp_milliseconds_t block_time) {
  if (auto failure = validate_transaction(tx, block_state_)) {
    return make_error_result(*failure);
  }
  if (!is_administrative(tx.payload) &&
      load_engine_state(block_state_).paused) {
    return make_error_result(transaction_error_code::paused);
  }

  auto gateway = tessera::attestation::ledger_gateway{block_state_};
  auto verifier = tessera::attestation::verifier{gateway, block_state_};
  auto ctx = context{.ledger = block_state_,
                     .verifier = verifier,
                     .credential_issuer = credential_issuer_,
                     .signature_verifier = signature_verifier_,
                     .caller = tessera::crypto::derive_address(tx.signer),
                     .chain_id = chain_id_,
                     .now = block_time};

  auto outcome = dispatch(ctx, tx.payload);
  if (auto* failure = std::get_if<transaction_error_code>(&outcome)) {
    block_state_.rollback_transaction();
    spdlog::warn("Transaction from {} rejected: {}",
                 tessera::schema::to_hex(ctx.caller),
                 tessera::schema::to_string(*failure));
    return make_error_result(*failure);
  }

  block_state_.put(key::make_nonce_key(encoder_, tx.signer), tx.nonce + 1);
  block_state_.commit_transaction();

  auto& done = std::get<success>(outcome);
  return tessera::schema::transaction_result_t{
      .code = 0,
      .data = std::move(done.data),
      .log = "ok",
      .info = std::move(done.info),
      .events = std::move(ctx.events)};
}

tessera::schema::block_result_t engine::finalize_block(
    const uint64_t height,
    const tessera::schema::timestamp_milliseconds_t block_time,
    const std::vector<tessera::schema::bytes_t>& txs) {
  auto result = tessera::schema::block_result_t{};
  if (reentered()) {
    result.tx_results.assign(
        txs.size(), make_error_result(transaction_error_code::reentrant_call));
    result.state_root = pending_state_root_;
    return result;
  }
  auto lock = std::scoped_lock{mutex_};
  auto scope = execution_scope{executing_thread_};

  // A block that was finalized but never committed is superseded.
  block_state_.discard_block();
  auto engine_state = load_engine_state(block_state_);
  engine_state.last_block_time = block_time;
  store_engine_state(block_state_, engine_state);
  block_state_.commit_transaction();

  result.tx_results.reserve(txs.size());
  auto rolling_root = last_committed_state_root_;
  for (std::size_t i = 0; i < txs.size(); ++i) {
    auto tx = decode_transaction(
        tessera::schema::bytes_view_t{txs[i].data(), txs[i].size()});
    if (!tx) {
      result.tx_results.push_back(
          make_error_result(transaction_error_code::invalid_transaction,
                            "undecodable transaction"));
      continue;
    }
    auto tx_result = execute_transaction(*tx, block_time);
    if (tx_result.code == 0) {
      rolling_root = fold_state_root(rolling_root, txs[i], height, i);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  spdlog::debug("Finalized block {} with {} transaction(s)", height,
                txs.size());
  return result;
}

tessera::schema::commit_result_t engine::commit() {
  if (reentered()) {
    tessera::common::critical("commit re-entered from block execution");
  }
  auto lock = std::scoped_lock{mutex_};
  auto written = std::size_t{0};
  if (pending_height_ > 0) {
    auto writes = block_state_.take_block_writes();
    written = writes.size();
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_ = 0;
    storage_.apply(writes, tessera::storage::committed_state{
                               .height = last_committed_height_,
                               .state_root = last_committed_state_root_});
    spdlog::info("Committed height {} ({} key(s), root {})",
                 last_committed_height_, written,
                 tessera::schema::to_hex(last_committed_state_root_));
  }
  return tessera::schema::commit_result_t{
      .committed_height = last_committed_height_,
      .state_root = last_committed_state_root_,
      .written_keys = written};
}

tessera::schema::app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  return tessera::schema::app_info_t{
      .last_block_height = last_committed_height_,
      .last_block_state_root = last_committed_state_root_};
}

tessera::schema::query_result_t engine::query(
    const std::string_view path,
    const tessera::schema::bytes_view_t& data) {
  if (reentered()) {
    return tessera::schema::query_result_t{
        .code = static_cast<uint32_t>(
            tessera::schema::query_error_code::reentrant_call),
        .log = "query re-entered from block execution",
        .codespace = std::string{kQueryCodespace}};
  }
  auto lock = std::scoped_lock{mutex_};
  auto committed = state{encoder_, storage_};
  return route_query(query_scope{.ledger = committed,
                                 .storage = storage_,
                                 .chain_id = chain_id_,
                                 .height = last_committed_height_,
                                 .state_root = last_committed_state_root_},
                     path, data);
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

void engine::set_credential_issuer(credential_issuer_t issuer) {
  auto lock = std::scoped_lock{mutex_};
  credential_issuer_ = std::move(issuer);
}

}  // namespace tessera::execution
