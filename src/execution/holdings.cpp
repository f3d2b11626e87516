#include <tessera/execution/holdings.hpp>
#include <tessera/execution/records.hpp>
#include <tessera/schema/key/engine_keys.hpp>

#include <algorithm>
#include <limits>

namespace tessera::execution {

namespace key = tessera::schema::key;

namespace {

void store_holder(context& ctx,
                  const tessera::schema::resolver_id_t& resolver_id,
                  const tessera::schema::address_t& holder,
                  const tessera::schema::holder_state_t& value) {
  auto holder_key = key::make_holder_key(ctx.encoder(), resolver_id, holder);
  if (value.token_count == 0 && value.total_value == 0 &&
      value.valid_count == 0) {
    ctx.ledger.erase(holder_key);
    return;
  }
  ctx.ledger.put(holder_key, value);
}

bool tracks_validity(const context& ctx,
                     const tessera::schema::resolver_id_t& resolver_id) {
  auto resolver = load_resolver(ctx, resolver_id);
  return resolver.has_value() &&
         resolver->kind == tessera::schema::resolver_kind_t::revocable;
}

void adjust_valid_holders(context& ctx,
                          const tessera::schema::resolver_id_t& resolver_id,
                          const bool increment) {
  auto resolver = load_resolver(ctx, resolver_id);
  if (!resolver) {
    return;
  }
  if (increment) {
    ++resolver->valid_holder_count;
  } else if (resolver->valid_holder_count > 0) {
    --resolver->valid_holder_count;
  }
  store_resolver(ctx, *resolver);
}

}  // namespace

std::optional<tessera::schema::amount_t> checked_add(
    const tessera::schema::amount_t& lhs,
    const tessera::schema::amount_t& rhs) {
  if (std::numeric_limits<tessera::schema::amount_t>::max() - lhs < rhs) {
    return std::nullopt;
  }
  return lhs + rhs;
}

tessera::schema::slot_state_t load_slot(
    const context& ctx,
    const tessera::schema::resolver_id_t& resolver_id,
    const tessera::schema::slot_id_t slot) {
  return ctx.ledger
      .get<tessera::schema::slot_state_t>(
          key::make_slot_key(ctx.encoder(), resolver_id, slot))
      .value_or(tessera::schema::slot_state_t{.resolver_id = resolver_id,
                                              .slot = slot});
}

void store_slot(context& ctx, const tessera::schema::slot_state_t& value) {
  auto slot_key =
      key::make_slot_key(ctx.encoder(), value.resolver_id, value.slot);
  if (value.total_reserved == 0 && value.total_minted == 0 &&
      value.holder_count == 0) {
    ctx.ledger.erase(slot_key);
    return;
  }
  ctx.ledger.put(slot_key, value);
}

tessera::schema::holder_state_t load_holder(
    const context& ctx,
    const tessera::schema::resolver_id_t& resolver_id,
    const tessera::schema::address_t& holder) {
  return ctx.ledger
      .get<tessera::schema::holder_state_t>(
          key::make_holder_key(ctx.encoder(), resolver_id, holder))
      .value_or(tessera::schema::holder_state_t{});
}

failure_t add_holding(context& ctx,
                      const tessera::schema::token_record_t& record) {
  auto holder = load_holder(ctx, record.resolver_id, record.owner);
  auto total = checked_add(holder.total_value, record.value);
  if (!total) {
    return tessera::schema::transaction_error_code::value_overflow;
  }
  ++holder.token_count;
  holder.total_value = *total;
  if (record.valid && tracks_validity(ctx, record.resolver_id)) {
    if (holder.valid_count++ == 0) {
      adjust_valid_holders(ctx, record.resolver_id, true);
    }
  }
  store_holder(ctx, record.resolver_id, record.owner, holder);

  ctx.ledger.put(key::make_holder_token_key(ctx.encoder(), record.resolver_id,
                                            record.owner, record.token_id),
                 record.token_id);

  // Holders are counted once per slot however many records they hold.
  auto slot_holder_key = key::make_slot_holder_key(
      ctx.encoder(), record.resolver_id, record.slot, record.owner);
  auto held = ctx.ledger.get<uint64_t>(slot_holder_key).value_or(0);
  if (held == 0) {
    auto slot = load_slot(ctx, record.resolver_id, record.slot);
    ++slot.holder_count;
    store_slot(ctx, slot);
  }
  ctx.ledger.put(slot_holder_key, held + 1);
  return std::nullopt;
}

void remove_holding(context& ctx,
                    const tessera::schema::token_record_t& record) {
  auto holder = load_holder(ctx, record.resolver_id, record.owner);
  if (holder.token_count > 0) {
    --holder.token_count;
  }
  holder.total_value -= std::min(holder.total_value, record.value);
  if (record.valid && holder.valid_count > 0 &&
      tracks_validity(ctx, record.resolver_id)) {
    if (--holder.valid_count == 0) {
      adjust_valid_holders(ctx, record.resolver_id, false);
    }
  }
  store_holder(ctx, record.resolver_id, record.owner, holder);

  ctx.ledger.erase(key::make_holder_token_key(
      ctx.encoder(), record.resolver_id, record.owner, record.token_id));

  auto slot_holder_key = key::make_slot_holder_key(
      ctx.encoder(), record.resolver_id, record.slot, record.owner);
  auto held = ctx.ledger.get<uint64_t>(slot_holder_key).value_or(0);
  if (held <= 1) {
    ctx.ledger.erase(slot_holder_key);
    if (held == 1) {
      auto slot = load_slot(ctx, record.resolver_id, record.slot);
      if (slot.holder_count > 0) {
        --slot.holder_count;
      }
      store_slot(ctx, slot);
    }
    return;
  }
  ctx.ledger.put(slot_holder_key, held - 1);
}

failure_t credit_holder(context& ctx,
                        const tessera::schema::resolver_id_t& resolver_id,
                        const tessera::schema::address_t& holder,
                        const tessera::schema::amount_t& amount) {
  auto value = load_holder(ctx, resolver_id, holder);
  auto total = checked_add(value.total_value, amount);
  if (!total) {
    return tessera::schema::transaction_error_code::value_overflow;
  }
  value.total_value = *total;
  store_holder(ctx, resolver_id, holder, value);
  return std::nullopt;
}

void debit_holder(context& ctx,
                  const tessera::schema::resolver_id_t& resolver_id,
                  const tessera::schema::address_t& holder,
                  const tessera::schema::amount_t& amount) {
  auto value = load_holder(ctx, resolver_id, holder);
  value.total_value -= std::min(value.total_value, amount);
  store_holder(ctx, resolver_id, holder, value);
}

void invalidate_holding(context& ctx,
                        const tessera::schema::token_record_t& record) {
  auto holder = load_holder(ctx, record.resolver_id, record.owner);
  if (holder.valid_count == 0) {
    return;
  }
  if (--holder.valid_count == 0) {
    adjust_valid_holders(ctx, record.resolver_id, false);
  }
  store_holder(ctx, record.resolver_id, record.owner, holder);
}

}  // namespace tessera::execution
