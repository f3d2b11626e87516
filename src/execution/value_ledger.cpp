#include <spdlog/spdlog.h>
#include <tessera/capability/capability.hpp>
#include <tessera/execution/events.hpp>
#include <tessera/execution/holdings.hpp>
#include <tessera/execution/records.hpp>
#include <tessera/execution/resolver_policy.hpp>
#include <tessera/execution/value_ledger.hpp>
#include <tessera/schema/key/engine_keys.hpp>

#include <algorithm>
#include <iterator>
#include <string>

namespace tessera::execution::value_ledger {

namespace key = tessera::schema::key;
using tessera::schema::transaction_error_code;

namespace {

struct loaded_record final {
  tessera::schema::token_record_t record;
  tessera::schema::resolver_state_t resolver;
};

std::variant<loaded_record, transaction_error_code> load_claimed(
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
  return loaded_record{.record = std::move(*record),
                       .resolver = std::move(*resolver)};
}

bool slot_approved(const context& ctx,
                   const tessera::schema::token_record_t& record) {
  return ctx.ledger
      .get<bool>(key::make_slot_approval_key(ctx.encoder(), record.resolver_id,
                                             record.owner, record.slot,
                                             ctx.caller))
      .value_or(false);
}

failure_t require_transfer_capability(
    context& ctx,
    const tessera::schema::resolver_state_t& resolver,
    const tessera::schema::token_record_t& record,
    const std::optional<tessera::schema::attestation_id_t>& attestation_id) {
  if (!resolver.require_transfer_capability) {
    return std::nullopt;
  }
  if (!attestation_id) {
    return transaction_error_code::attestation_not_found;
  }
  auto verification = ctx.verifier.verify(
      tessera::attestation::verification_request{
          .caller = ctx.caller,
          .document_id = record.document_id,
          .required = tessera::capability::bits(
              tessera::capability::capability_t::transfer),
          .attestation_id = *attestation_id,
          .now = ctx.now},
      ctx.events);
  if (auto* failure = std::get_if<transaction_error_code>(&verification)) {
    return *failure;
  }
  return std::nullopt;
}

bool owner_or_operator(const context& ctx,
                       const tessera::schema::token_record_t& record) {
  return record.owner == ctx.caller ||
         is_operator(ctx, record.resolver_id, record.owner, ctx.caller);
}

}  // namespace

bool is_operator(const context& ctx,
                 const tessera::schema::resolver_id_t& resolver_id,
                 const tessera::schema::address_t& owner,
                 const tessera::schema::address_t& operator_address) {
  return ctx.ledger
      .get<bool>(key::make_operator_key(ctx.encoder(), resolver_id, owner,
                                        operator_address))
      .value_or(false);
}

tessera::schema::amount_t allowance_of(
    const tessera::schema::token_record_t& record,
    const tessera::schema::address_t& spender) {
  auto it = std::find_if(
      std::begin(record.allowances), std::end(record.allowances),
      [&](const auto& allowance) { return allowance.spender == spender; });
  return it == std::end(record.allowances) ? tessera::schema::amount_t{0}
                                           : it->amount;
}

failure_t authorize(context& ctx,
                    tessera::schema::token_record_t& record,
                    const std::optional<tessera::schema::amount_t>& amount) {
  if (record.owner == ctx.caller) {
    return std::nullopt;
  }
  if (!tessera::schema::is_zero(record.approved) &&
      record.approved == ctx.caller) {
    return std::nullopt;
  }
  if (is_operator(ctx, record.resolver_id, record.owner, ctx.caller)) {
    return std::nullopt;
  }
  if (slot_approved(ctx, record)) {
    return std::nullopt;
  }
  if (amount) {
    auto it = std::find_if(
        std::begin(record.allowances), std::end(record.allowances),
        [&](const auto& allowance) { return allowance.spender == ctx.caller; });
    if (it != std::end(record.allowances)) {
      if (it->amount < *amount) {
        return transaction_error_code::insufficient_allowance;
      }
      it->amount -= *amount;
      if (it->amount == 0) {
        record.allowances.erase(it);
      }
      return std::nullopt;
    }
  }
  return transaction_error_code::not_authorized;
}

outcome_t transfer_value(context& ctx,
                         const tessera::schema::transfer_value_t& payload) {
  if (payload.from_token_id == payload.to_token_id) {
    return transaction_error_code::invalid_argument;
  }
  auto loaded_from = load_claimed(ctx, payload.from_token_id);
  if (auto* failure = std::get_if<transaction_error_code>(&loaded_from)) {
    return *failure;
  }
  auto& [from, resolver] = std::get<loaded_record>(loaded_from);

  auto policy = make_policy(resolver.kind);
  if (auto failure = on_transfer(policy, from, false)) {
    return *failure;
  }
  if (!supports_value(policy)) {
    return transaction_error_code::unsupported_operation;
  }

  auto to_token = load_token(ctx, payload.to_token_id);
  if (!to_token) {
    return transaction_error_code::token_not_found;
  }
  if (from.resolver_id != to_token->resolver_id ||
      from.slot != to_token->slot) {
    return transaction_error_code::slot_mismatch;
  }
  auto loaded_to = load_claimed(ctx, payload.to_token_id);
  if (auto* failure = std::get_if<transaction_error_code>(&loaded_to)) {
    return *failure;
  }
  auto& to = std::get<loaded_record>(loaded_to).record;

  if (payload.amount > from.value) {
    return transaction_error_code::insufficient_value;
  }
  if (auto failure = authorize(ctx, from, payload.amount)) {
    return *failure;
  }
  if (auto failure = require_transfer_capability(ctx, resolver, from,
                                                 payload.attestation_id)) {
    return *failure;
  }

  auto to_value = checked_add(to.value, payload.amount);
  if (!to_value) {
    return transaction_error_code::value_overflow;
  }

  from.value -= payload.amount;
  to.value = *to_value;
  store_token(ctx, from);
  store_token(ctx, to);
  debit_holder(ctx, resolver.resolver_id, from.owner, payload.amount);
  if (auto failure = credit_holder(ctx, resolver.resolver_id, to.owner,
                                   payload.amount)) {
    return *failure;
  }

  ctx.events.push_back(make_event(
      "value_transferred", {{"from_token_id", std::to_string(from.token_id)},
                            {"to_token_id", std::to_string(to.token_id)},
                            {"slot", std::to_string(from.slot)},
                            {"amount", payload.amount.str()}}));
  return ok("value transferred");
}

outcome_t transfer_value_to_address(
    context& ctx,
    const tessera::schema::transfer_value_to_address_t& payload) {
  if (tessera::schema::is_zero(payload.to)) {
    return transaction_error_code::invalid_argument;
  }
  auto loaded = load_claimed(ctx, payload.from_token_id);
  if (auto* failure = std::get_if<transaction_error_code>(&loaded)) {
    return *failure;
  }
  auto& [from, resolver] = std::get<loaded_record>(loaded);

  auto policy = make_policy(resolver.kind);
  if (auto failure = on_transfer(policy, from, false)) {
    return *failure;
  }
  if (!supports_value(policy)) {
    return transaction_error_code::unsupported_operation;
  }
  if (payload.amount > from.value) {
    return transaction_error_code::insufficient_value;
  }
  if (auto failure = authorize(ctx, from, payload.amount)) {
    return *failure;
  }
  if (auto failure = require_transfer_capability(ctx, resolver, from,
                                                 payload.attestation_id)) {
    return *failure;
  }

  from.value -= payload.amount;
  store_token(ctx, from);
  debit_holder(ctx, resolver.resolver_id, from.owner, payload.amount);

  auto created = tessera::schema::token_record_t{
      .token_id = allocate_token_id(ctx),
      .document_id = from.document_id,
      .resolver_id = from.resolver_id,
      .slot = from.slot,
      .value = payload.amount,
      .owner = payload.to,
      .claimed = true,
      .created_at = ctx.now};
  on_claimed(policy, created);
  if (auto failure = add_holding(ctx, created)) {
    return *failure;
  }
  store_token(ctx, created);

  ctx.events.push_back(make_event(
      "value_transferred", {{"from_token_id", std::to_string(from.token_id)},
                            {"to_token_id", std::to_string(created.token_id)},
                            {"to", tessera::schema::to_hex(payload.to)},
                            {"slot", std::to_string(from.slot)},
                            {"amount", payload.amount.str()}}));
  return success{.data = ctx.encoder().encode(created.token_id),
                 .info = "value transferred to new record"};
}

outcome_t transfer_token(context& ctx,
                         const tessera::schema::transfer_token_t& payload) {
  if (tessera::schema::is_zero(payload.to)) {
    return transaction_error_code::invalid_argument;
  }
  auto loaded = load_claimed(ctx, payload.token_id);
  if (auto* failure = std::get_if<transaction_error_code>(&loaded)) {
    return *failure;
  }
  auto& [record, resolver] = std::get<loaded_record>(loaded);

  auto policy = make_policy(resolver.kind);
  if (auto failure = on_transfer(policy, record, true)) {
    return *failure;
  }
  if (auto failure = authorize(ctx, record, std::nullopt)) {
    return *failure;
  }
  if (auto failure = require_transfer_capability(ctx, resolver, record,
                                                 payload.attestation_id)) {
    return *failure;
  }

  auto previous_owner = record.owner;
  remove_holding(ctx, record);
  record.owner = payload.to;
  record.approved = tessera::schema::make_zero_hash();
  record.allowances.clear();
  if (auto failure = add_holding(ctx, record)) {
    return *failure;
  }
  store_token(ctx, record);

  ctx.events.push_back(make_event(
      "token_transferred",
      {{"token_id", std::to_string(record.token_id)},
       {"from", tessera::schema::to_hex(previous_owner)},
       {"to", tessera::schema::to_hex(record.owner)}}));
  return ok("token transferred");
}

outcome_t approve_token(context& ctx,
                        const tessera::schema::approve_token_t& payload) {
  auto loaded = load_claimed(ctx, payload.token_id);
  if (auto* failure = std::get_if<transaction_error_code>(&loaded)) {
    return *failure;
  }
  auto& record = std::get<loaded_record>(loaded).record;
  if (!owner_or_operator(ctx, record)) {
    return transaction_error_code::not_authorized;
  }
  record.approved = payload.operator_address;
  store_token(ctx, record);
  ctx.events.push_back(make_event(
      "token_approved",
      {{"token_id", std::to_string(record.token_id)},
       {"operator", tessera::schema::to_hex(payload.operator_address)}}));
  return ok("token approval set");
}

outcome_t set_operator_approval(
    context& ctx,
    const tessera::schema::set_operator_approval_t& payload) {
  if (tessera::schema::is_zero(payload.operator_address) ||
      payload.operator_address == ctx.caller) {
    return transaction_error_code::invalid_argument;
  }
  if (!load_resolver(ctx, payload.resolver_id)) {
    return transaction_error_code::resolver_missing;
  }
  auto operator_key =
      key::make_operator_key(ctx.encoder(), payload.resolver_id, ctx.caller,
                             payload.operator_address);
  if (payload.approved) {
    ctx.ledger.put(operator_key, true);
  } else {
    ctx.ledger.erase(operator_key);
  }
  ctx.events.push_back(make_event(
      "operator_approval",
      {{"resolver_id", tessera::schema::to_hex(payload.resolver_id)},
       {"owner", tessera::schema::to_hex(ctx.caller)},
       {"operator", tessera::schema::to_hex(payload.operator_address)},
       {"approved", payload.approved ? "true" : "false"}}));
  return ok("operator approval updated");
}

outcome_t approve_slot(context& ctx,
                       const tessera::schema::approve_slot_t& payload) {
  if (tessera::schema::is_zero(payload.operator_address) ||
      payload.operator_address == ctx.caller) {
    return transaction_error_code::invalid_argument;
  }
  auto resolver = load_resolver(ctx, payload.resolver_id);
  if (!resolver) {
    return transaction_error_code::resolver_missing;
  }
  if (!supports_value(make_policy(resolver->kind))) {
    return transaction_error_code::unsupported_operation;
  }
  auto approval_key = key::make_slot_approval_key(
      ctx.encoder(), payload.resolver_id, ctx.caller, payload.slot,
      payload.operator_address);
  if (payload.approved) {
    ctx.ledger.put(approval_key, true);
  } else {
    ctx.ledger.erase(approval_key);
  }
  ctx.events.push_back(make_event(
      "slot_approval",
      {{"resolver_id", tessera::schema::to_hex(payload.resolver_id)},
       {"slot", std::to_string(payload.slot)},
       {"owner", tessera::schema::to_hex(ctx.caller)},
       {"operator", tessera::schema::to_hex(payload.operator_address)},
       {"approved", payload.approved ? "true" : "false"}}));
  return ok("slot approval updated");
}

outcome_t approve_value(context& ctx,
                        const tessera::schema::approve_value_t& payload) {
  if (tessera::schema::is_zero(payload.operator_address)) {
    return transaction_error_code::invalid_argument;
  }
  auto loaded = load_claimed(ctx, payload.token_id);
  if (auto* failure = std::get_if<transaction_error_code>(&loaded)) {
    return *failure;
  }
  auto& [record, resolver] = std::get<loaded_record>(loaded);
  if (!supports_value(make_policy(resolver.kind))) {
    return transaction_error_code::unsupported_operation;
  }
  if (!owner_or_operator(ctx, record)) {
    return transaction_error_code::not_authorized;
  }

  auto& allowances = record.allowances;
  allowances.erase(
      std::remove_if(std::begin(allowances), std::end(allowances),
                     [&](const auto& allowance) {
                       return allowance.spender == payload.operator_address;
                     }),
      std::end(allowances));
  if (payload.amount != 0) {
    allowances.push_back(tessera::schema::value_allowance_t{
        .spender = payload.operator_address, .amount = payload.amount});
  }
  store_token(ctx, record);
  ctx.events.push_back(make_event(
      "value_approved",
      {{"token_id", std::to_string(record.token_id)},
       {"operator", tessera::schema::to_hex(payload.operator_address)},
       {"amount", payload.amount.str()}}));
  return ok("value allowance set");
}

}  // namespace tessera::execution::value_ledger
