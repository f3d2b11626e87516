#pragma once

#include <tessera/attestation/verifier.hpp>
#include <tessera/execution/credential_issuer.hpp>
#include <tessera/execution/signature_verifier.hpp>
#include <tessera/execution/state.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/transaction_event.hpp>
#include <vector>

namespace tessera::execution {

/// Everything one payload handler may touch while it runs.
struct context final {
  state& ledger;
  const tessera::attestation::verifier& verifier;
  const credential_issuer_t& credential_issuer;
  const signature_verifier_t& signature_verifier;
  tessera::schema::address_t caller{};
  tessera::schema::hash32_t chain_id{};
  tessera::schema::timestamp_milliseconds_t now{};
  std::vector<tessera::schema::transaction_event_t> events;

  encoder_t& encoder() const { return ledger.encoder(); }
};

}  // namespace tessera::execution
