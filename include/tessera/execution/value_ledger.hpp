#pragma once

#include <tessera/execution/context.hpp>
#include <tessera/execution/outcome.hpp>
#include <tessera/schema/approve_slot.hpp>
#include <tessera/schema/approve_token.hpp>
#include <tessera/schema/approve_value.hpp>
#include <tessera/schema/set_operator_approval.hpp>
#include <tessera/schema/token_record.hpp>
#include <tessera/schema/transfer_token.hpp>
#include <tessera/schema/transfer_value.hpp>
#include <tessera/schema/transfer_value_to_address.hpp>
#include <optional>

namespace tessera::execution::value_ledger {

/// Whether the caller may move `record`: owner, record approval, operator for
/// all, slot approval, then value allowance. An allowance is only consulted
/// when `amount` is set and is decremented in place on success.
failure_t authorize(context& ctx,
                    tessera::schema::token_record_t& record,
                    const std::optional<tessera::schema::amount_t>& amount);

bool is_operator(const context& ctx,
                 const tessera::schema::resolver_id_t& resolver_id,
                 const tessera::schema::address_t& owner,
                 const tessera::schema::address_t& operator_address);

/// Remaining allowance of `spender` on `record`, zero when none.
tessera::schema::amount_t allowance_of(
    const tessera::schema::token_record_t& record,
    const tessera::schema::address_t& spender);

/// Value move between two records of one slot. Σ value is conserved.
outcome_t transfer_value(context& ctx,
                         const tessera::schema::transfer_value_t& payload);

/// Value move into a fresh claimed record owned by `to`. The new token id is
/// returned as result data.
outcome_t transfer_value_to_address(
    context& ctx,
    const tessera::schema::transfer_value_to_address_t& payload);

/// Ownership transfer of a whole record, any resolver kind.
outcome_t transfer_token(context& ctx,
                         const tessera::schema::transfer_token_t& payload);

outcome_t approve_token(context& ctx,
                        const tessera::schema::approve_token_t& payload);
outcome_t set_operator_approval(
    context& ctx,
    const tessera::schema::set_operator_approval_t& payload);
outcome_t approve_slot(context& ctx,
                       const tessera::schema::approve_slot_t& payload);
outcome_t approve_value(context& ctx,
                        const tessera::schema::approve_value_t& payload);

}  // namespace tessera::execution::value_ledger
