#include <tessera/execution/records.hpp>
#include <tessera/schema/key/engine_keys.hpp>

namespace tessera::execution {

namespace key = tessera::schema::key;

bool has_role(const context& ctx,
              const tessera::schema::role_id_t role,
              const tessera::schema::address_t& who) {
  return ctx.ledger.get<bool>(key::make_role_key(ctx.encoder(), role, who))
      .value_or(false);
}

std::optional<tessera::schema::address_t> load_issuer(
    const context& ctx,
    const tessera::schema::document_id_t& document_id) {
  return ctx.ledger.get<tessera::schema::address_t>(
      key::make_issuer_key(ctx.encoder(), document_id));
}

std::optional<tessera::schema::resolver_state_t> load_resolver(
    const context& ctx,
    const tessera::schema::resolver_id_t& resolver_id) {
  return ctx.ledger.get<tessera::schema::resolver_state_t>(
      key::make_resolver_key(ctx.encoder(), resolver_id));
}

void store_resolver(context& ctx,
                    const tessera::schema::resolver_state_t& resolver) {
  ctx.ledger.put(key::make_resolver_key(ctx.encoder(), resolver.resolver_id),
                 resolver);
}

std::optional<tessera::schema::resolver_state_t> load_document_resolver(
    const context& ctx,
    const tessera::schema::document_id_t& document_id) {
  auto resolver_id = ctx.ledger.get<tessera::schema::resolver_id_t>(
      key::make_document_resolver_key(ctx.encoder(), document_id));
  if (!resolver_id) {
    return std::nullopt;
  }
  return load_resolver(ctx, *resolver_id);
}

std::optional<tessera::schema::token_record_t> load_token(
    const context& ctx,
    const tessera::schema::token_id_t token_id) {
  return ctx.ledger.get<tessera::schema::token_record_t>(
      key::make_token_key(ctx.encoder(), token_id));
}

void store_token(context& ctx, const tessera::schema::token_record_t& record) {
  ctx.ledger.put(key::make_token_key(ctx.encoder(), record.token_id), record);
}

tessera::schema::engine_state_t load_engine_state(const state& ledger) {
  return ledger
      .get<tessera::schema::engine_state_t>(
          key::make_engine_state_key(ledger.encoder()))
      .value_or(tessera::schema::engine_state_t{});
}

void store_engine_state(state& ledger,
                        const tessera::schema::engine_state_t& value) {
  ledger.put(key::make_engine_state_key(ledger.encoder()), value);
}

tessera::schema::token_id_t allocate_token_id(context& ctx) {
  auto engine_state = load_engine_state(ctx.ledger);
  auto token_id = engine_state.next_token_id++;
  store_engine_state(ctx.ledger, engine_state);
  return token_id;
}

}  // namespace tessera::execution
