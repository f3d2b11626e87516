#include <tessera/execution/resolver_policy.hpp>

namespace tessera::execution {

using tessera::schema::resolver_kind_t;
using tessera::schema::transaction_error_code;

resolver_policy_t make_policy(const resolver_kind_t kind) {
  switch (kind) {
    case resolver_kind_t::value_ledger:
      return value_ledger_policy{};
    case resolver_kind_t::permanent_lock:
      return permanent_lock_policy{};
    case resolver_kind_t::revocable:
      return revocable_policy{};
    case resolver_kind_t::delegated_role:
      return delegated_role_policy{};
    case resolver_kind_t::standard:
      break;
  }
  return standard_policy{};
}

tessera::schema::slot_id_t reservation_slot(const resolver_policy_t& policy,
                                            const tessera::schema::slot_id_t slot) {
  return supports_value(policy) ? slot : tessera::schema::slot_id_t{0};
}

bool supports_value(const resolver_policy_t& policy) {
  return std::holds_alternative<value_ledger_policy>(policy);
}

bool supports_revocation(const resolver_policy_t& policy) {
  return std::holds_alternative<revocable_policy>(policy);
}

bool supports_delegation(const resolver_policy_t& policy) {
  return std::holds_alternative<delegated_role_policy>(policy);
}

void on_claimed(const resolver_policy_t& policy,
                tessera::schema::token_record_t& record) {
  std::visit(overloaded{[&](const permanent_lock_policy&) {
                          record.locked = true;
                        },
                        [&](const revocable_policy&) { record.valid = true; },
                        [](const auto&) {}},
             policy);
}

failure_t on_transfer(const resolver_policy_t& policy,
                      tessera::schema::token_record_t& record,
                      const bool owner_changes) {
  return std::visit(
      overloaded{[&](const permanent_lock_policy&) -> failure_t {
                   return transaction_error_code::token_locked;
                 },
                 [&](const delegated_role_policy&) -> failure_t {
                   if (owner_changes) {
                     record.delegate = tessera::schema::make_zero_hash();
                     record.delegate_expires_at = 0;
                   }
                   return std::nullopt;
                 },
                 [](const auto&) -> failure_t { return std::nullopt; }},
      policy);
}

failure_t on_revoke(const resolver_policy_t& policy,
                    tessera::schema::token_record_t& record,
                    const tessera::schema::timestamp_milliseconds_t now) {
  if (!supports_revocation(policy)) {
    return transaction_error_code::unsupported_operation;
  }
  if (!record.valid) {
    return transaction_error_code::already_revoked;
  }
  record.valid = false;
  record.revoked_at = now;
  return std::nullopt;
}

}  // namespace tessera::execution
