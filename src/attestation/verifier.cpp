#include <spdlog/spdlog.h>
#include <tessera/attestation/verifier.hpp>
#include <tessera/execution/events.hpp>
#include <tessera/schema/engine_state.hpp>
#include <tessera/schema/key/engine_keys.hpp>
#include <string>

namespace tessera::attestation {

using tessera::schema::transaction_error_code;

verifier::verifier(const gateway& attestations,
                   const tessera::execution::state& ledger)
    : attestations_{attestations}, ledger_{ledger} {}

verification_t verifier::evaluate(const verification_request& request) const {
  auto& encoder = ledger_.encoder();

  auto record = attestations_.get(request.attestation_id);
  if (!record) {
    return transaction_error_code::attestation_not_found;
  }
  if (record->revoked_at != 0) {
    return transaction_error_code::attestation_revoked;
  }
  if (record->expires_at != 0 && record->expires_at < request.now) {
    return transaction_error_code::attestation_expired;
  }

  auto engine_state = ledger_.get<tessera::schema::engine_state_t>(
      tessera::schema::key::make_engine_state_key(encoder));
  auto schema_id = engine_state ? engine_state->capability_schema_id
                                : tessera::schema::make_zero_hash();
  if (record->schema_id != schema_id) {
    return transaction_error_code::schema_mismatch;
  }
  if (record->recipient != request.caller) {
    return transaction_error_code::recipient_mismatch;
  }

  auto issuer = ledger_.get<tessera::schema::address_t>(
      tessera::schema::key::make_issuer_key(encoder, request.document_id));
  if (!issuer) {
    return transaction_error_code::issuer_not_registered;
  }
  if (*issuer != record->issuer) {
    return transaction_error_code::issuer_mismatch;
  }

  auto payload = encoder.try_decode<tessera::schema::capability_payload_t>(
      tessera::schema::bytes_view_t{record->payload.data(),
                                    record->payload.size()});
  if (!payload) {
    return transaction_error_code::attestation_payload_invalid;
  }
  if (payload->document_id != request.document_id) {
    return transaction_error_code::document_mismatch;
  }
  if (!tessera::capability::has_capability(payload->capability_bits,
                                           request.required)) {
    return transaction_error_code::insufficient_capability;
  }

  return verified_capability{.granted = payload->capability_bits,
                             .payload = std::move(*payload)};
}

verification_t verifier::verify(
    const verification_request& request,
    std::vector<tessera::schema::transaction_event_t>& events) const {
  auto outcome = evaluate(request);
  if (auto* failure = std::get_if<transaction_error_code>(&outcome)) {
    spdlog::debug("Attestation {} rejected: {}",
                  tessera::schema::to_hex(request.attestation_id),
                  tessera::schema::to_string(*failure));
    return outcome;
  }

  const auto& verified = std::get<verified_capability>(outcome);
  events.push_back(tessera::execution::make_event(
      "capability_verified",
      {{"attestation_id", tessera::schema::to_hex(request.attestation_id)},
       {"document_id", tessera::schema::to_hex(request.document_id)},
       {"recipient", tessera::schema::to_hex(request.caller)},
       {"required", tessera::capability::describe(request.required)},
       {"granted", std::to_string(verified.granted)}}));
  return outcome;
}

tessera::schema::capability_check_t verifier::check(
    const verification_request& request) const {
  auto outcome = evaluate(request);
  auto result = tessera::schema::capability_check_t{};
  std::visit(overloaded{[&](verified_capability& verified) {
                          result.verified = true;
                          result.granted_bits = verified.granted;
                          result.payload = std::move(verified.payload);
                        },
                        [&](const transaction_error_code error) {
                          result.verified = false;
                          result.error_code = tessera::schema::code(error);
                        }},
             outcome);
  return result;
}

}  // namespace tessera::attestation
