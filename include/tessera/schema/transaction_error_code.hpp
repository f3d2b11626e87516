#pragma once

#include <tessera/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Stable numeric failure kinds surfaced as transaction_result.code. Values
// are part of the client contract; append only.
namespace tessera::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  signature_verification_failed = 5,
  reentrant_call = 6,
  paused = 7,
  authorization_denied = 8,
  invalid_argument = 9,
  unsupported_operation = 10,

  issuer_already_registered = 20,
  resolver_exists = 21,
  resolver_missing = 22,
  document_resolver_exists = 23,
  document_resolver_missing = 24,

  attestation_not_found = 30,
  attestation_revoked = 31,
  attestation_expired = 32,
  schema_mismatch = 33,
  recipient_mismatch = 34,
  issuer_mismatch = 35,
  document_mismatch = 36,
  insufficient_capability = 37,
  issuer_not_registered = 38,
  attestation_payload_invalid = 39,
  attestation_exists = 40,

  already_reserved = 50,
  already_claimed = 51,
  not_reserved_for_caller = 52,
  token_not_found = 53,
  only_issuer_may_cancel = 54,
  label_too_large = 55,
  token_not_claimed = 56,

  slot_mismatch = 60,
  insufficient_value = 61,
  insufficient_allowance = 62,
  not_authorized = 63,
  value_overflow = 64,

  token_locked = 70,
  already_revoked = 71,
  invalid_delegation_signature = 72,
};

inline constexpr auto kTransactionErrorCodeMappings = std::array{
    std::pair<std::string_view, transaction_error_code>{
        "invalid_transaction", transaction_error_code::invalid_transaction},
    std::pair<std::string_view, transaction_error_code>{
        "unsupported_transaction_version",
        transaction_error_code::unsupported_transaction_version},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_chain_id", transaction_error_code::invalid_chain_id},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_nonce", transaction_error_code::invalid_nonce},
    std::pair<std::string_view, transaction_error_code>{
        "signature_verification_failed",
        transaction_error_code::signature_verification_failed},
    std::pair<std::string_view, transaction_error_code>{
        "reentrant_call", transaction_error_code::reentrant_call},
    std::pair<std::string_view, transaction_error_code>{
        "paused", transaction_error_code::paused},
    std::pair<std::string_view, transaction_error_code>{
        "authorization_denied", transaction_error_code::authorization_denied},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_argument", transaction_error_code::invalid_argument},
    std::pair<std::string_view, transaction_error_code>{
        "unsupported_operation", transaction_error_code::unsupported_operation},
    std::pair<std::string_view, transaction_error_code>{
        "issuer_already_registered",
        transaction_error_code::issuer_already_registered},
    std::pair<std::string_view, transaction_error_code>{
        "resolver_exists", transaction_error_code::resolver_exists},
    std::pair<std::string_view, transaction_error_code>{
        "resolver_missing", transaction_error_code::resolver_missing},
    std::pair<std::string_view, transaction_error_code>{
        "document_resolver_exists",
        transaction_error_code::document_resolver_exists},
    std::pair<std::string_view, transaction_error_code>{
        "document_resolver_missing",
        transaction_error_code::document_resolver_missing},
    std::pair<std::string_view, transaction_error_code>{
        "attestation_not_found", transaction_error_code::attestation_not_found},
    std::pair<std::string_view, transaction_error_code>{
        "attestation_revoked", transaction_error_code::attestation_revoked},
    std::pair<std::string_view, transaction_error_code>{
        "attestation_expired", transaction_error_code::attestation_expired},
    std::pair<std::string_view, transaction_error_code>{
        "schema_mismatch", transaction_error_code::schema_mismatch},
    std::pair<std::string_view, transaction_error_code>{
        "recipient_mismatch", transaction_error_code::recipient_mismatch},
    std::pair<std::string_view, transaction_error_code>{
        "issuer_mismatch", transaction_error_code::issuer_mismatch},
    std::pair<std::string_view, transaction_error_code>{
        "document_mismatch", transaction_error_code::document_mismatch},
    std::pair<std::string_view, transaction_error_code>{
        "insufficient_capability",
        transaction_error_code::insufficient_capability},
    std::pair<std::string_view, transaction_error_code>{
        "issuer_not_registered", transaction_error_code::issuer_not_registered},
    std::pair<std::string_view, transaction_error_code>{
        "attestation_payload_invalid",
        transaction_error_code::attestation_payload_invalid},
    std::pair<std::string_view, transaction_error_code>{
        "attestation_exists", transaction_error_code::attestation_exists},
    std::pair<std::string_view, transaction_error_code>{
        "already_reserved", transaction_error_code::already_reserved},
    std::pair<std::string_view, transaction_error_code>{
        "already_claimed", transaction_error_code::already_claimed},
    std::pair<std::string_view, transaction_error_code>{
        "not_reserved_for_caller",
        transaction_error_code::not_reserved_for_caller},
    std::pair<std::string_view, transaction_error_code>{
        "token_not_found", transaction_error_code::token_not_found},
    std::pair<std::string_view, transaction_error_code>{
        "only_issuer_may_cancel",
        transaction_error_code::only_issuer_may_cancel},
    std::pair<std::string_view, transaction_error_code>{
        "label_too_large", transaction_error_code::label_too_large},
    std::pair<std::string_view, transaction_error_code>{
        "token_not_claimed", transaction_error_code::token_not_claimed},
    std::pair<std::string_view, transaction_error_code>{
        "slot_mismatch", transaction_error_code::slot_mismatch},
    std::pair<std::string_view, transaction_error_code>{
        "insufficient_value", transaction_error_code::insufficient_value},
    std::pair<std::string_view, transaction_error_code>{
        "insufficient_allowance",
        transaction_error_code::insufficient_allowance},
    std::pair<std::string_view, transaction_error_code>{
        "not_authorized", transaction_error_code::not_authorized},
    std::pair<std::string_view, transaction_error_code>{
        "value_overflow", transaction_error_code::value_overflow},
    std::pair<std::string_view, transaction_error_code>{
        "token_locked", transaction_error_code::token_locked},
    std::pair<std::string_view, transaction_error_code>{
        "already_revoked", transaction_error_code::already_revoked},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_delegation_signature",
        transaction_error_code::invalid_delegation_signature},
};

constexpr uint32_t code(const transaction_error_code value) {
  return static_cast<uint32_t>(value);
}

inline constexpr std::string_view to_string(
    const transaction_error_code value) {
  return to_string(value, kTransactionErrorCodeMappings).value_or("unknown");
}

}  // namespace tessera::schema
