#include <tessera/attestation/gateway.hpp>
#include <tessera/schema/key/engine_keys.hpp>

namespace tessera::attestation {

ledger_gateway::ledger_gateway(const tessera::execution::state& ledger)
    : ledger_{ledger} {}

std::optional<tessera::schema::attestation_record_t> ledger_gateway::get(
    const tessera::schema::attestation_id_t& id) const {
  auto key = tessera::schema::key::make_attestation_key(ledger_.encoder(), id);
  return ledger_.get<tessera::schema::attestation_record_t>(key);
}

}  // namespace tessera::attestation
