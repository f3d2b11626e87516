#include <spdlog/spdlog.h>
#include <tessera/crypto/verify.hpp>
#include <tessera/execution/events.hpp>
#include <tessera/execution/holdings.hpp>
#include <tessera/execution/records.hpp>
#include <tessera/execution/resolver_policy.hpp>
#include <tessera/execution/value_ledger.hpp>
#include <tessera/execution/variants.hpp>

#include <string>
#include <tuple>

namespace tessera::execution::variants {

using tessera::schema::transaction_error_code;

namespace {

struct delegation_target final {
  tessera::schema::token_record_t record;
  resolver_policy_t policy;
};

std::variant<delegation_target, transaction_error_code> load_delegation_target(
    const context& ctx,
    const tessera::schema::token_id_t token_id) {
  auto record = load_token(ctx, token_id);
  if (!record) {
    return transaction_error_code::token_not_found;
  }
  if (!record->claimed) {
    return transaction_error_code::token_not_claimed;
  }
  auto resolver = load_resolver(ctx, record->resolver_id);
  if (!resolver) {
    return transaction_error_code::resolver_missing;
  }
  auto policy = make_policy(resolver->kind);
  if (!supports_delegation(policy)) {
    return transaction_error_code::unsupported_operation;
  }
  return delegation_target{.record = std::move(*record), .policy = policy};
}

outcome_t assign_delegate(context& ctx,
                          tessera::schema::token_record_t& record,
                          const tessera::schema::address_t& user,
                          const tessera::schema::timestamp_milliseconds_t
                              expires_at) {
  record.delegate = user;
  record.delegate_expires_at = expires_at;
  ++record.delegation_nonce;
  store_token(ctx, record);
  ctx.events.push_back(make_event(
      "delegate_set", {{"token_id", std::to_string(record.token_id)},
                       {"user", tessera::schema::to_hex(user)},
                       {"expires_at", std::to_string(expires_at)}}));
  return ok("delegate set");
}

}  // namespace

tessera::schema::bytes_t make_delegation_message(
    encoder_t& encoder,
    const tessera::schema::hash32_t& chain_id,
    const tessera::schema::token_id_t token_id,
    const tessera::schema::address_t& user,
    const tessera::schema::timestamp_milliseconds_t expires_at,
    const uint64_t delegation_nonce) {
  return encoder.encode(std::tuple{chain_id, std::string{kDelegationDomain},
                                   token_id, user, expires_at,
                                   delegation_nonce});
}

tessera::schema::address_t user_of(
    const tessera::schema::token_record_t& record,
    const tessera::schema::timestamp_milliseconds_t now) {
  if (now > record.delegate_expires_at) {
    return tessera::schema::make_zero_hash();
  }
  return record.delegate;
}

outcome_t revoke_token(context& ctx,
                       const tessera::schema::revoke_token_t& payload) {
  auto record = load_token(ctx, payload.token_id);
  if (!record) {
    return transaction_error_code::token_not_found;
  }
  if (!record->claimed) {
    return transaction_error_code::token_not_claimed;
  }
  auto issuer = load_issuer(ctx, record->document_id);
  auto is_issuer = issuer.has_value() && *issuer == ctx.caller;
  if (!is_issuer &&
      !has_role(ctx, tessera::schema::role_id_t::admin, ctx.caller)) {
    return transaction_error_code::authorization_denied;
  }
  auto resolver = load_resolver(ctx, record->resolver_id);
  if (!resolver) {
    return transaction_error_code::resolver_missing;
  }

  if (auto failure = on_revoke(make_policy(resolver->kind), *record, ctx.now)) {
    return *failure;
  }
  store_token(ctx, *record);
  invalidate_holding(ctx, *record);

  ctx.events.push_back(make_event(
      "token_revoked", {{"token_id", std::to_string(record->token_id)},
                        {"owner", tessera::schema::to_hex(record->owner)},
                        {"revoked_at", std::to_string(record->revoked_at)}}));
  spdlog::debug("Token {} revoked", record->token_id);
  return ok("revoked");
}

outcome_t set_delegate(context& ctx,
                       const tessera::schema::set_delegate_t& payload) {
  auto loaded = load_delegation_target(ctx, payload.token_id);
  if (auto* failure = std::get_if<transaction_error_code>(&loaded)) {
    return *failure;
  }
  auto& record = std::get<delegation_target>(loaded).record;
  if (record.owner != ctx.caller &&
      !value_ledger::is_operator(ctx, record.resolver_id, record.owner,
                                 ctx.caller)) {
    return transaction_error_code::not_authorized;
  }
  return assign_delegate(ctx, record, payload.user, payload.expires_at);
}

outcome_t set_delegate_signed(
    context& ctx,
    const tessera::schema::set_delegate_signed_t& payload) {
  auto loaded = load_delegation_target(ctx, payload.token_id);
  if (auto* failure = std::get_if<transaction_error_code>(&loaded)) {
    return *failure;
  }
  auto& record = std::get<delegation_target>(loaded).record;

  if (tessera::crypto::derive_address(payload.owner_signer) != record.owner) {
    return transaction_error_code::invalid_delegation_signature;
  }
  auto message = make_delegation_message(
      ctx.encoder(), ctx.chain_id, record.token_id, payload.user,
      payload.expires_at, record.delegation_nonce);
  if (!ctx.signature_verifier ||
      !ctx.signature_verifier(
          tessera::schema::bytes_view_t{message.data(), message.size()},
          payload.owner_signer, payload.signature)) {
    return transaction_error_code::invalid_delegation_signature;
  }
  return assign_delegate(ctx, record, payload.user, payload.expires_at);
}

}  // namespace tessera::execution::variants
