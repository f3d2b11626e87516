#include <spdlog/spdlog.h>
#include <tessera/capability/capability.hpp>
#include <tessera/common/critical.hpp>
#include <tessera/execution/events.hpp>
#include <tessera/execution/holdings.hpp>
#include <tessera/execution/lifecycle.hpp>
#include <tessera/execution/records.hpp>
#include <tessera/execution/resolver_policy.hpp>
#include <tessera/schema/key/engine_keys.hpp>

#include <algorithm>
#include <string>

namespace tessera::execution::lifecycle {

namespace key = tessera::schema::key;
using tessera::schema::transaction_error_code;

namespace {

struct reservation_request final {
  tessera::schema::document_id_t document_id{};
  tessera::schema::slot_id_t slot{};
  tessera::schema::address_t recipient{};
  tessera::schema::amount_t value{};
  tessera::schema::bytes_t label;
};

bool is_anonymous(const tessera::schema::address_t& recipient) {
  return tessera::schema::is_zero(recipient);
}

outcome_t place_reservation(context& ctx, reservation_request request) {
  auto resolver = load_document_resolver(ctx, request.document_id);
  if (!resolver) {
    return transaction_error_code::document_resolver_missing;
  }
  auto issuer = load_issuer(ctx, request.document_id);
  if (!issuer) {
    return transaction_error_code::issuer_not_registered;
  }
  if (ctx.caller != *issuer &&
      !has_role(ctx, tessera::schema::role_id_t::executor, ctx.caller)) {
    return transaction_error_code::authorization_denied;
  }
  if (request.label.size() > tessera::schema::kMaxLabelBytes) {
    return transaction_error_code::label_too_large;
  }

  auto policy = make_policy(resolver->kind);
  if (!supports_value(policy) && request.value != 0) {
    return transaction_error_code::invalid_argument;
  }
  request.slot = reservation_slot(policy, request.slot);

  auto reservation_key =
      key::make_reservation_key(ctx.encoder(), request.document_id, request.slot);
  auto slot = load_slot(ctx, resolver->resolver_id, request.slot);
  auto& encoder = ctx.encoder();

  if (auto existing_id =
          ctx.ledger.get<tessera::schema::token_id_t>(reservation_key)) {
    auto existing = load_token(ctx, *existing_id);
    if (!existing) {
      tessera::common::critical("reservation points at missing token {}",
                                *existing_id);
    }
    if (existing->claimed) {
      return transaction_error_code::already_claimed;
    }
    if (existing->reserved_for != request.recipient) {
      return transaction_error_code::already_reserved;
    }
    // Same path again: refresh value (and label for anonymous reservations).
    auto reserved = checked_add(
        slot.total_reserved - std::min(slot.total_reserved, existing->value),
        request.value);
    if (!reserved) {
      return transaction_error_code::value_overflow;
    }
    slot.total_reserved = *reserved;
    existing->value = request.value;
    if (is_anonymous(request.recipient)) {
      existing->label = std::move(request.label);
    }
    store_token(ctx, *existing);
    store_slot(ctx, slot);
    ctx.events.push_back(make_event(
        "reservation_updated",
        {{"token_id", std::to_string(existing->token_id)},
         {"document_id", tessera::schema::to_hex(request.document_id)},
         {"value", existing->value.str()}}));
    return success{.data = encoder.encode(existing->token_id),
                   .info = "reservation updated"};
  }

  auto reserved = checked_add(slot.total_reserved, request.value);
  if (!reserved) {
    return transaction_error_code::value_overflow;
  }

  auto record = tessera::schema::token_record_t{
      .token_id = allocate_token_id(ctx),
      .document_id = request.document_id,
      .resolver_id = resolver->resolver_id,
      .slot = request.slot,
      .value = request.value,
      .reserved_for = request.recipient,
      .label = std::move(request.label),
      .created_at = ctx.now};
  store_token(ctx, record);
  ctx.ledger.put(reservation_key, record.token_id);
  slot.total_reserved = *reserved;
  store_slot(ctx, slot);

  ctx.events.push_back(make_event(
      is_anonymous(request.recipient) ? "reserved_anonymous" : "reserved",
      {{"token_id", std::to_string(record.token_id)},
       {"document_id", tessera::schema::to_hex(record.document_id)},
       {"slot", std::to_string(record.slot)},
       {"recipient", tessera::schema::to_hex(record.reserved_for)},
       {"value", record.value.str()}}));
  spdlog::debug("Reserved token {} for document {}", record.token_id,
                tessera::schema::to_hex(record.document_id));
  return success{.data = encoder.encode(record.token_id),
                 .info = "reservation created"};
}

std::optional<tessera::schema::token_record_t> load_document_token(
    const context& ctx,
    const tessera::schema::document_id_t& document_id,
    const tessera::schema::token_id_t token_id) {
  auto record = load_token(ctx, token_id);
  if (!record || record->document_id != document_id) {
    return std::nullopt;
  }
  return record;
}

}  // namespace

outcome_t reserve(context& ctx, const tessera::schema::reserve_t& payload) {
  if (is_anonymous(payload.recipient)) {
    return transaction_error_code::invalid_argument;
  }
  return place_reservation(
      ctx, reservation_request{.document_id = payload.document_id,
                               .slot = payload.slot,
                               .recipient = payload.recipient,
                               .value = payload.value});
}

outcome_t reserve_anonymous(
    context& ctx,
    const tessera::schema::reserve_anonymous_t& payload) {
  return place_reservation(
      ctx, reservation_request{.document_id = payload.document_id,
                               .slot = payload.slot,
                               .value = payload.value,
                               .label = payload.label});
}

outcome_t claim(context& ctx, const tessera::schema::claim_t& payload) {
  auto record =
      load_document_token(ctx, payload.document_id, payload.token_id);
  if (!record) {
    return transaction_error_code::token_not_found;
  }
  if (record->claimed) {
    return transaction_error_code::already_claimed;
  }
  auto resolver = load_resolver(ctx, record->resolver_id);
  if (!resolver) {
    return transaction_error_code::resolver_missing;
  }

  auto verification = ctx.verifier.verify(
      tessera::attestation::verification_request{
          .caller = ctx.caller,
          .document_id = payload.document_id,
          .required = tessera::capability::bits(
              tessera::capability::capability_t::claim),
          .attestation_id = payload.attestation_id,
          .now = ctx.now},
      ctx.events);
  if (auto* failure = std::get_if<transaction_error_code>(&verification)) {
    return *failure;
  }
  if (!is_anonymous(record->reserved_for) &&
      record->reserved_for != ctx.caller) {
    return transaction_error_code::not_reserved_for_caller;
  }

  auto slot = load_slot(ctx, record->resolver_id, record->slot);
  auto minted = checked_add(slot.total_minted, record->value);
  if (!minted) {
    return transaction_error_code::value_overflow;
  }

  record->owner = ctx.caller;
  record->claimed = true;
  record->reserved_for = tessera::schema::make_zero_hash();
  on_claimed(make_policy(resolver->kind), *record);
  if (auto failure = add_holding(ctx, *record)) {
    return *failure;
  }
  store_token(ctx, *record);

  slot.total_reserved -= std::min(slot.total_reserved, record->value);
  slot.total_minted = *minted;
  store_slot(ctx, slot);

  ctx.events.push_back(make_event(
      "claimed", {{"token_id", std::to_string(record->token_id)},
                  {"document_id", tessera::schema::to_hex(record->document_id)},
                  {"owner", tessera::schema::to_hex(record->owner)},
                  {"attestation_id",
                   tessera::schema::to_hex(payload.attestation_id)}}));
  spdlog::debug("Token {} claimed by {}", record->token_id,
                tessera::schema::to_hex(record->owner));

  issue_credential_best_effort(ctx.credential_issuer, *record, ctx.events);
  return ok("claimed");
}

outcome_t cancel(context& ctx, const tessera::schema::cancel_t& payload) {
  auto record =
      load_document_token(ctx, payload.document_id, payload.token_id);
  if (!record) {
    return transaction_error_code::token_not_found;
  }
  auto issuer = load_issuer(ctx, payload.document_id);
  if (!issuer || *issuer != ctx.caller) {
    return transaction_error_code::only_issuer_may_cancel;
  }
  if (record->claimed) {
    return transaction_error_code::already_claimed;
  }

  ctx.ledger.erase(key::make_token_key(ctx.encoder(), record->token_id));
  ctx.ledger.erase(key::make_reservation_key(ctx.encoder(),
                                             record->document_id, record->slot));
  auto slot = load_slot(ctx, record->resolver_id, record->slot);
  slot.total_reserved -= std::min(slot.total_reserved, record->value);
  store_slot(ctx, slot);

  ctx.events.push_back(make_event(
      "reservation_cancelled",
      {{"token_id", std::to_string(record->token_id)},
       {"document_id", tessera::schema::to_hex(record->document_id)}}));
  return ok("cancelled");
}

}  // namespace tessera::execution::lifecycle
