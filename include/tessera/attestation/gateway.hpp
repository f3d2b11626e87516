#pragma once

#include <tessera/execution/state.hpp>
#include <tessera/schema/attestation_record.hpp>
#include <tessera/schema/primitives.hpp>
#include <optional>

namespace tessera::attestation {

/// Read side of the attestation service. The ledger never issues or signs
/// attestations; it only looks them up by id.
class gateway {
 public:
  virtual ~gateway() = default;

  virtual std::optional<tessera::schema::attestation_record_t> get(
      const tessera::schema::attestation_id_t& id) const = 0;
};

/// Gateway backed by the attestation mirror keyspace, kept current by
/// publish_attestation / revoke_attestation transactions.
class ledger_gateway final : public gateway {
 public:
  explicit ledger_gateway(const tessera::execution::state& ledger);

  std::optional<tessera::schema::attestation_record_t> get(
      const tessera::schema::attestation_id_t& id) const override;

 private:
  const tessera::execution::state& ledger_;
};

}  // namespace tessera::attestation
