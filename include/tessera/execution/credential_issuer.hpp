#pragma once

#include <tessera/schema/primitives.hpp>
#include <tessera/schema/token_record.hpp>
#include <tessera/schema/transaction_event.hpp>
#include <functional>
#include <string>
#include <vector>

namespace tessera::execution {

struct credential_result final {
  bool issued{};
  std::string reason;
};

/// Optional downstream integration invoked after a successful claim, e.g. a
/// trust-credential registry. Reports failure through its result.
using credential_issuer_t = std::function<credential_result(
    const tessera::schema::token_record_t& record,
    const tessera::schema::address_t& holder)>;

/// Run the credential issuer without letting its outcome affect the claim.
/// Any exception thrown by the issuer counts as a failed issuance; the reason
/// is `what()` for std::exception and "non-standard exception" otherwise.
/// A failure is logged and recorded as a `credential_skipped` event.
void issue_credential_best_effort(
    const credential_issuer_t& issuer,
    const tessera::schema::token_record_t& record,
    std::vector<tessera::schema::transaction_event_t>& events);

}  // namespace tessera::execution
