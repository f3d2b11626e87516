#pragma once

#include <tessera/execution/context.hpp>
#include <tessera/execution/outcome.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/revoke_token.hpp>
#include <tessera/schema/set_delegate.hpp>
#include <tessera/schema/set_delegate_signed.hpp>
#include <tessera/schema/token_record.hpp>
#include <string_view>

// Operations that only exist for particular resolver kinds.
namespace tessera::execution::variants {

inline constexpr auto kDelegationDomain =
    std::string_view{"tessera.delegate.v1"};

/// Revocable kind: mark a claimed record invalid. Issuer or admin only.
outcome_t revoke_token(context& ctx,
                       const tessera::schema::revoke_token_t& payload);

/// Delegated-role kind: owner or operator assigns a temporary user.
outcome_t set_delegate(context& ctx,
                       const tessera::schema::set_delegate_t& payload);

/// Delegated-role kind: anyone relays an assignment signed by the owner.
outcome_t set_delegate_signed(
    context& ctx,
    const tessera::schema::set_delegate_signed_t& payload);

/// Bytes the owner signs for set_delegate_signed: SCALE of
/// (chain_id, domain, token_id, user, expires_at, delegation_nonce).
tessera::schema::bytes_t make_delegation_message(
    encoder_t& encoder,
    const tessera::schema::hash32_t& chain_id,
    tessera::schema::token_id_t token_id,
    const tessera::schema::address_t& user,
    tessera::schema::timestamp_milliseconds_t expires_at,
    uint64_t delegation_nonce);

/// Current delegate, or zero once `now` is past the expiry.
tessera::schema::address_t user_of(
    const tessera::schema::token_record_t& record,
    tessera::schema::timestamp_milliseconds_t now);

}  // namespace tessera::execution::variants
