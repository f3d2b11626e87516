#pragma once

#include <tessera/execution/context.hpp>
#include <tessera/execution/outcome.hpp>
#include <tessera/schema/holder_state.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/slot_state.hpp>
#include <tessera/schema/token_record.hpp>
#include <optional>

// Derived indexes kept in step with claimed records: per holder counters,
// the holder token index, slot aggregates and the slot holder set.
namespace tessera::execution {

/// lhs + rhs, or std::nullopt when the sum does not fit in 256 bits.
std::optional<tessera::schema::amount_t> checked_add(
    const tessera::schema::amount_t& lhs,
    const tessera::schema::amount_t& rhs);

tessera::schema::slot_state_t load_slot(
    const context& ctx,
    const tessera::schema::resolver_id_t& resolver_id,
    tessera::schema::slot_id_t slot);

/// Persist slot aggregates; an empty slot is removed.
void store_slot(context& ctx, const tessera::schema::slot_state_t& value);

tessera::schema::holder_state_t load_holder(
    const context& ctx,
    const tessera::schema::resolver_id_t& resolver_id,
    const tessera::schema::address_t& holder);

/// Register a claimed record under its owner. Fails with value_overflow,
/// before writing anything, when the owner's total would not fit.
failure_t add_holding(context& ctx,
                      const tessera::schema::token_record_t& record);

/// Inverse of add_holding, using the record as it was registered.
void remove_holding(context& ctx,
                    const tessera::schema::token_record_t& record);

failure_t credit_holder(context& ctx,
                        const tessera::schema::resolver_id_t& resolver_id,
                        const tessera::schema::address_t& holder,
                        const tessera::schema::amount_t& amount);
void debit_holder(context& ctx,
                  const tessera::schema::resolver_id_t& resolver_id,
                  const tessera::schema::address_t& holder,
                  const tessera::schema::amount_t& amount);

/// Drop one valid record from the owner's valid count.
void invalidate_holding(context& ctx,
                        const tessera::schema::token_record_t& record);

}  // namespace tessera::execution
