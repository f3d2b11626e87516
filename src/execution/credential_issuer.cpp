#include <spdlog/spdlog.h>
#include <tessera/execution/credential_issuer.hpp>
#include <tessera/execution/events.hpp>
#include <exception>

namespace tessera::execution {

void issue_credential_best_effort(
    const credential_issuer_t& issuer,
    const tessera::schema::token_record_t& record,
    std::vector<tessera::schema::transaction_event_t>& events) {
  if (!issuer) {
    return;
  }
  auto outcome = credential_result{};
  try {
    outcome = issuer(record, record.owner);
  } catch (const std::exception& e) {
    outcome = credential_result{.issued = false, .reason = e.what()};
  } catch (...) {
    outcome = credential_result{.issued = false,
                                .reason = "non-standard exception"};
  }
  if (outcome.issued) {
    events.push_back(make_event(
        "credential_issued",
        {{"token_id", std::to_string(record.token_id)},
         {"holder", tessera::schema::to_hex(record.owner)}}));
    return;
  }
  spdlog::warn("Credential issuance skipped for token {}: {}", record.token_id,
               outcome.reason);
  events.push_back(make_event("credential_skipped",
                              {{"token_id", std::to_string(record.token_id)},
                               {"reason", outcome.reason}}));
}

}  // namespace tessera::execution
