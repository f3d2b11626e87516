#pragma once

#include <tessera/execution/outcome.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/resolver_kind.hpp>
#include <tessera/schema/token_record.hpp>
#include <variant>

// Per-resolver behaviour layered on the shared reservation/claim lifecycle.
// Every variant answers the same three hooks; the lifecycle never branches on
// the resolver kind itself.
namespace tessera::execution {

struct standard_policy final {};

/// Semi-fungible: records carry value and reservations are keyed per slot.
struct value_ledger_policy final {};

/// Claimed records are locked for good.
struct permanent_lock_policy final {};

/// Claimed records may be revoked; history is kept.
struct revocable_policy final {};

/// Owner may hand a time-bound user role to a second party.
struct delegated_role_policy final {};

using resolver_policy_t = std::variant<standard_policy,
                                       value_ledger_policy,
                                       permanent_lock_policy,
                                       revocable_policy,
                                       delegated_role_policy>;

resolver_policy_t make_policy(tessera::schema::resolver_kind_t kind);

/// Slot used for reservation keys; only value ledgers keep the caller's slot.
tessera::schema::slot_id_t reservation_slot(const resolver_policy_t& policy,
                                            tessera::schema::slot_id_t slot);

bool supports_value(const resolver_policy_t& policy);
bool supports_revocation(const resolver_policy_t& policy);
bool supports_delegation(const resolver_policy_t& policy);

/// Runs after the record becomes claimed.
void on_claimed(const resolver_policy_t& policy,
                tessera::schema::token_record_t& record);

/// Runs before a record moves value or changes owner. `owner_changes` is
/// false for value moves between records.
failure_t on_transfer(const resolver_policy_t& policy,
                      tessera::schema::token_record_t& record,
                      bool owner_changes);

/// Runs for revoke_token.
failure_t on_revoke(const resolver_policy_t& policy,
                    tessera::schema::token_record_t& record,
                    tessera::schema::timestamp_milliseconds_t now);

}  // namespace tessera::execution
