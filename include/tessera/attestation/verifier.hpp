#pragma once

#include <tessera/attestation/gateway.hpp>
#include <tessera/capability/capability.hpp>
#include <tessera/execution/state.hpp>
#include <tessera/schema/capability_check.hpp>
#include <tessera/schema/capability_payload.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/transaction_error_code.hpp>
#include <tessera/schema/transaction_event.hpp>
#include <variant>
#include <vector>

namespace tessera::attestation {

struct verification_request final {
  tessera::schema::address_t caller{};
  tessera::schema::document_id_t document_id{};
  tessera::capability::capability_bits_t required{};
  tessera::schema::attestation_id_t attestation_id{};
  tessera::schema::timestamp_milliseconds_t now{};
};

struct verified_capability final {
  tessera::capability::capability_bits_t granted{};
  tessera::schema::capability_payload_t payload;
};

using verification_t =
    std::variant<verified_capability, tessera::schema::transaction_error_code>;

/// Capability verifier.
///
/// Checks, in order: attestation exists, not revoked, not expired, schema id
/// matches the configured capability schema, recipient is the caller, issuer
/// is the document's registered issuer, payload decodes and names the
/// document, granted bits cover the requirement. The first failing check
/// decides the error.
class verifier final {
 public:
  verifier(const gateway& attestations, const tessera::execution::state& ledger);

  /// Mutating-path verification. Emits one `capability_verified` event on
  /// success.
  verification_t verify(const verification_request& request,
                        std::vector<tessera::schema::transaction_event_t>&
                            events) const;

  /// Same checks as verify, without events. Never fails: the outcome is
  /// folded into the returned record.
  tessera::schema::capability_check_t check(
      const verification_request& request) const;

 private:
  verification_t evaluate(const verification_request& request) const;

  const gateway& attestations_;
  const tessera::execution::state& ledger_;
};

}  // namespace tessera::attestation
