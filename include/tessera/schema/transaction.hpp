#pragma once
#include <tessera/schema/approve_slot.hpp>
#include <tessera/schema/approve_token.hpp>
#include <tessera/schema/approve_value.hpp>
#include <tessera/schema/assign_resolver.hpp>
#include <tessera/schema/authorize_upgrade.hpp>
#include <tessera/schema/cancel.hpp>
#include <tessera/schema/claim.hpp>
#include <tessera/schema/create_resolver.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/publish_attestation.hpp>
#include <tessera/schema/reserve.hpp>
#include <tessera/schema/reserve_anonymous.hpp>
#include <tessera/schema/revoke_attestation.hpp>
#include <tessera/schema/revoke_token.hpp>
#include <tessera/schema/set_delegate.hpp>
#include <tessera/schema/set_delegate_signed.hpp>
#include <tessera/schema/set_issuer.hpp>
#include <tessera/schema/set_operator_approval.hpp>
#include <tessera/schema/set_paused.hpp>
#include <tessera/schema/transfer_token.hpp>
#include <tessera/schema/transfer_value.hpp>
#include <tessera/schema/transfer_value_to_address.hpp>
#include <tessera/schema/update_capability_schema.hpp>
#include <variant>

namespace tessera::schema {

// Alternatives are appended only; the index is the wire discriminant.
using transaction_payload_t = std::variant<create_resolver_t,
                                           assign_resolver_t,
                                           set_issuer_t,
                                           set_paused_t,
                                           update_capability_schema_t,
                                           authorize_upgrade_t,
                                           publish_attestation_t,
                                           revoke_attestation_t,
                                           reserve_t,
                                           reserve_anonymous_t,
                                           claim_t,
                                           cancel_t,
                                           transfer_token_t,
                                           transfer_value_t,
                                           transfer_value_to_address_t,
                                           approve_token_t,
                                           set_operator_approval_t,
                                           approve_slot_t,
                                           approve_value_t,
                                           revoke_token_t,
                                           set_delegate_t,
                                           set_delegate_signed_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  signer_id_t signer{};
  transaction_payload_t payload{};
  signature_t signature;
};

using transaction_t = transaction<1>;

}  // namespace tessera::schema
