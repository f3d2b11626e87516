#pragma once

#include <tessera/execution/context.hpp>
#include <tessera/execution/outcome.hpp>
#include <tessera/schema/cancel.hpp>
#include <tessera/schema/claim.hpp>
#include <tessera/schema/reserve.hpp>
#include <tessera/schema/reserve_anonymous.hpp>

// Reservation/claim lifecycle shared by every resolver kind.
//
//   Unreserved -> Reserved(targeted | anonymous) -> Claimed
//   Reserved   -> Cancelled
//
// Successful reserve calls return the SCALE encoded token id as result data.
namespace tessera::execution::lifecycle {

outcome_t reserve(context& ctx, const tessera::schema::reserve_t& payload);

outcome_t reserve_anonymous(context& ctx,
                            const tessera::schema::reserve_anonymous_t& payload);

outcome_t claim(context& ctx, const tessera::schema::claim_t& payload);

outcome_t cancel(context& ctx, const tessera::schema::cancel_t& payload);

}  // namespace tessera::execution::lifecycle
