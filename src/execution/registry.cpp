#include <spdlog/spdlog.h>
#include <tessera/execution/events.hpp>
#include <tessera/execution/records.hpp>
#include <tessera/execution/registry.hpp>
#include <tessera/schema/key/engine_keys.hpp>

#include <algorithm>
#include <string>

namespace tessera::execution::registry {

namespace key = tessera::schema::key;
using tessera::schema::role_id_t;
using tessera::schema::transaction_error_code;

outcome_t create_resolver(context& ctx,
                          const tessera::schema::create_resolver_t& payload) {
  if (!has_role(ctx, role_id_t::admin, ctx.caller)) {
    return transaction_error_code::authorization_denied;
  }
  if (tessera::schema::is_zero(payload.resolver_id)) {
    return transaction_error_code::invalid_argument;
  }
  if (load_resolver(ctx, payload.resolver_id)) {
    return transaction_error_code::resolver_exists;
  }
  store_resolver(ctx, tessera::schema::resolver_state_t{
                          .resolver_id = payload.resolver_id,
                          .kind = payload.kind,
                          .require_transfer_capability =
                              payload.require_transfer_capability,
                          .created_at = ctx.now});
  ctx.events.push_back(make_event(
      "resolver_created",
      {{"resolver_id", tessera::schema::to_hex(payload.resolver_id)},
       {"kind", std::string{tessera::schema::to_string(payload.kind)}}}));
  spdlog::info("Created {} resolver {}",
               tessera::schema::to_string(payload.kind),
               tessera::schema::to_hex(payload.resolver_id));
  return ok("resolver created");
}

outcome_t assign_resolver(context& ctx,
                          const tessera::schema::assign_resolver_t& payload) {
  if (!has_role(ctx, role_id_t::executor, ctx.caller)) {
    return transaction_error_code::authorization_denied;
  }
  if (!load_resolver(ctx, payload.resolver_id)) {
    return transaction_error_code::resolver_missing;
  }
  auto binding_key =
      key::make_document_resolver_key(ctx.encoder(), payload.document_id);
  if (ctx.ledger.contains(binding_key)) {
    return transaction_error_code::document_resolver_exists;
  }
  ctx.ledger.put(binding_key, payload.resolver_id);
  ctx.events.push_back(make_event(
      "resolver_assigned",
      {{"document_id", tessera::schema::to_hex(payload.document_id)},
       {"resolver_id", tessera::schema::to_hex(payload.resolver_id)}}));
  return ok("resolver assigned");
}

outcome_t set_issuer(context& ctx,
                     const tessera::schema::set_issuer_t& payload) {
  if (!has_role(ctx, role_id_t::executor, ctx.caller)) {
    return transaction_error_code::authorization_denied;
  }
  if (tessera::schema::is_zero(payload.issuer)) {
    return transaction_error_code::invalid_argument;
  }
  if (load_issuer(ctx, payload.document_id)) {
    return transaction_error_code::issuer_already_registered;
  }
  ctx.ledger.put(key::make_issuer_key(ctx.encoder(), payload.document_id),
                 payload.issuer);
  ctx.events.push_back(make_event(
      "issuer_registered",
      {{"document_id", tessera::schema::to_hex(payload.document_id)},
       {"issuer", tessera::schema::to_hex(payload.issuer)}}));
  return ok("issuer registered");
}

outcome_t publish_attestation(
    context& ctx,
    const tessera::schema::publish_attestation_t& payload) {
  if (!has_role(ctx, role_id_t::attestation_service, ctx.caller)) {
    return transaction_error_code::authorization_denied;
  }
  const auto& record = payload.record;
  if (tessera::schema::is_zero(record.id)) {
    return transaction_error_code::invalid_argument;
  }
  auto attestation_key = key::make_attestation_key(ctx.encoder(), record.id);
  if (ctx.ledger.contains(attestation_key)) {
    return transaction_error_code::attestation_exists;
  }
  // The payload is stored as published; malformed bodies are reported when a
  // verification reads them.
  ctx.ledger.put(attestation_key, record);
  ctx.events.push_back(make_event(
      "attestation_published",
      {{"attestation_id", tessera::schema::to_hex(record.id)},
       {"recipient", tessera::schema::to_hex(record.recipient)},
       {"issuer", tessera::schema::to_hex(record.issuer)}}));
  return ok("attestation published");
}

outcome_t revoke_attestation(
    context& ctx,
    const tessera::schema::revoke_attestation_t& payload) {
  if (!has_role(ctx, role_id_t::attestation_service, ctx.caller)) {
    return transaction_error_code::authorization_denied;
  }
  auto attestation_key =
      key::make_attestation_key(ctx.encoder(), payload.attestation_id);
  auto record =
      ctx.ledger.get<tessera::schema::attestation_record_t>(attestation_key);
  if (!record) {
    return transaction_error_code::attestation_not_found;
  }
  if (record->revoked_at != 0) {
    return transaction_error_code::attestation_revoked;
  }
  // Block time 0 would read as "active".
  record->revoked_at = std::max<tessera::schema::timestamp_milliseconds_t>(
      ctx.now, 1);
  ctx.ledger.put(attestation_key, *record);
  ctx.events.push_back(make_event(
      "attestation_revoked",
      {{"attestation_id", tessera::schema::to_hex(payload.attestation_id)}}));
  return ok("attestation revoked");
}

outcome_t set_paused(context& ctx,
                     const tessera::schema::set_paused_t& payload) {
  if (!has_role(ctx, role_id_t::admin, ctx.caller)) {
    return transaction_error_code::authorization_denied;
  }
  auto engine_state = load_engine_state(ctx.ledger);
  engine_state.paused = payload.paused;
  store_engine_state(ctx.ledger, engine_state);
  ctx.events.push_back(make_event(
      "paused", {{"paused", payload.paused ? "true" : "false"}}));
  spdlog::info("Ledger {}", payload.paused ? "paused" : "resumed");
  return ok(payload.paused ? "paused" : "resumed");
}

outcome_t update_capability_schema(
    context& ctx,
    const tessera::schema::update_capability_schema_t& payload) {
  if (!has_role(ctx, role_id_t::governor, ctx.caller)) {
    return transaction_error_code::authorization_denied;
  }
  auto engine_state = load_engine_state(ctx.ledger);
  engine_state.capability_schema_id = payload.schema_id;
  store_engine_state(ctx.ledger, engine_state);
  ctx.events.push_back(make_event(
      "capability_schema_updated",
      {{"schema_id", tessera::schema::to_hex(payload.schema_id)}}));
  spdlog::info("Capability schema set to {}",
               tessera::schema::to_hex(payload.schema_id));
  return ok("capability schema updated");
}

outcome_t authorize_upgrade(
    context& ctx,
    const tessera::schema::authorize_upgrade_t& payload) {
  if (!has_role(ctx, role_id_t::governor, ctx.caller)) {
    return transaction_error_code::authorization_denied;
  }
  auto engine_state = load_engine_state(ctx.ledger);
  engine_state.authorized_upgrade = payload.implementation_hash;
  store_engine_state(ctx.ledger, engine_state);
  ctx.events.push_back(make_event(
      "upgrade_authorized",
      {{"implementation_hash",
        tessera::schema::to_hex(payload.implementation_hash)}}));
  return ok("upgrade authorized");
}

}  // namespace tessera::execution::registry
