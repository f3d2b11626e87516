#pragma once

#include <tessera/schema/primitives.hpp>
#include <tessera/schema/role_id.hpp>

#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Canonical key prefixes and key builders for every ledger keyspace. A key is
// SCALE(prefix) || SCALE(id tuple); tuples encode as concatenated fields, so
// any leading subset of the tuple is itself a valid scan prefix.
namespace tessera::schema::key {

inline constexpr std::string_view kEngineStateKeyPrefix{
    "SYS|STATE|ENGINE|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kRoleKeyPrefix{"SYS|STATE|ROLE|"};
inline constexpr std::string_view kIssuerKeyPrefix{"SYS|STATE|ISSUER|"};
inline constexpr std::string_view kResolverKeyPrefix{"SYS|STATE|RESOLVER|"};
inline constexpr std::string_view kDocumentResolverKeyPrefix{
    "SYS|STATE|DOCUMENT_RESOLVER|"};
inline constexpr std::string_view kAttestationKeyPrefix{"SYS|STATE|ATTEST|"};
inline constexpr std::string_view kTokenKeyPrefix{"SYS|STATE|TOKEN|"};
inline constexpr std::string_view kReservationKeyPrefix{
    "SYS|STATE|RESERVATION|"};
inline constexpr std::string_view kSlotKeyPrefix{"SYS|STATE|SLOT|"};
inline constexpr std::string_view kSlotHolderKeyPrefix{
    "SYS|STATE|SLOT_HOLDER|"};
inline constexpr std::string_view kHolderKeyPrefix{"SYS|STATE|HOLDER|"};
inline constexpr std::string_view kHolderTokenKeyPrefix{
    "SYS|STATE|HOLDER_TOKEN|"};
inline constexpr std::string_view kOperatorKeyPrefix{"SYS|STATE|OPERATOR|"};
inline constexpr std::string_view kSlotApprovalKeyPrefix{
    "SYS|STATE|SLOT_APPROVAL|"};

template <typename Encoder, typename T>
tessera::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                           std::string_view prefix,
                                           const T& id) {
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
tessera::schema::bytes_t make_prefix_key(Encoder& encoder,
                                         std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
tessera::schema::bytes_t make_engine_state_key(Encoder& encoder) {
  return make_prefix_key(encoder, kEngineStateKeyPrefix);
}

template <typename Encoder>
tessera::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const tessera::schema::signer_id_t& signer) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, signer);
}

template <typename Encoder>
tessera::schema::bytes_t make_role_key(Encoder& encoder,
                                       const tessera::schema::role_id_t role,
                                       const tessera::schema::address_t& who) {
  return make_prefixed_key(encoder, kRoleKeyPrefix, std::tuple{role, who});
}

template <typename Encoder>
tessera::schema::bytes_t make_issuer_key(
    Encoder& encoder,
    const tessera::schema::document_id_t& document_id) {
  return make_prefixed_key(encoder, kIssuerKeyPrefix, document_id);
}

template <typename Encoder>
tessera::schema::bytes_t make_resolver_key(
    Encoder& encoder,
    const tessera::schema::resolver_id_t& resolver_id) {
  return make_prefixed_key(encoder, kResolverKeyPrefix, resolver_id);
}

template <typename Encoder>
tessera::schema::bytes_t make_document_resolver_key(
    Encoder& encoder,
    const tessera::schema::document_id_t& document_id) {
  return make_prefixed_key(encoder, kDocumentResolverKeyPrefix, document_id);
}

template <typename Encoder>
tessera::schema::bytes_t make_attestation_key(
    Encoder& encoder,
    const tessera::schema::attestation_id_t& attestation_id) {
  return make_prefixed_key(encoder, kAttestationKeyPrefix, attestation_id);
}

template <typename Encoder>
tessera::schema::bytes_t make_token_key(Encoder& encoder,
                                        const tessera::schema::token_id_t id) {
  return make_prefixed_key(encoder, kTokenKeyPrefix, id);
}

template <typename Encoder>
tessera::schema::bytes_t make_reservation_key(
    Encoder& encoder,
    const tessera::schema::document_id_t& document_id,
    const tessera::schema::slot_id_t slot) {
  return make_prefixed_key(encoder, kReservationKeyPrefix,
                           std::tuple{document_id, slot});
}

template <typename Encoder>
tessera::schema::bytes_t make_slot_key(
    Encoder& encoder,
    const tessera::schema::resolver_id_t& resolver_id,
    const tessera::schema::slot_id_t slot) {
  return make_prefixed_key(encoder, kSlotKeyPrefix,
                           std::tuple{resolver_id, slot});
}

template <typename Encoder>
tessera::schema::bytes_t make_slot_holder_key(
    Encoder& encoder,
    const tessera::schema::resolver_id_t& resolver_id,
    const tessera::schema::slot_id_t slot,
    const tessera::schema::address_t& holder) {
  return make_prefixed_key(encoder, kSlotHolderKeyPrefix,
                           std::tuple{resolver_id, slot, holder});
}

template <typename Encoder>
tessera::schema::bytes_t make_holder_key(
    Encoder& encoder,
    const tessera::schema::resolver_id_t& resolver_id,
    const tessera::schema::address_t& holder) {
  return make_prefixed_key(encoder, kHolderKeyPrefix,
                           std::tuple{resolver_id, holder});
}

template <typename Encoder>
tessera::schema::bytes_t make_holder_token_key(
    Encoder& encoder,
    const tessera::schema::resolver_id_t& resolver_id,
    const tessera::schema::address_t& holder,
    const tessera::schema::token_id_t token_id) {
  return make_prefixed_key(encoder, kHolderTokenKeyPrefix,
                           std::tuple{resolver_id, holder, token_id});
}

template <typename Encoder>
tessera::schema::bytes_t make_holder_token_prefix(
    Encoder& encoder,
    const tessera::schema::resolver_id_t& resolver_id,
    const tessera::schema::address_t& holder) {
  return make_prefixed_key(encoder, kHolderTokenKeyPrefix,
                           std::tuple{resolver_id, holder});
}

template <typename Encoder>
tessera::schema::bytes_t make_operator_key(
    Encoder& encoder,
    const tessera::schema::resolver_id_t& resolver_id,
    const tessera::schema::address_t& owner,
    const tessera::schema::address_t& operator_address) {
  return make_prefixed_key(encoder, kOperatorKeyPrefix,
                           std::tuple{resolver_id, owner, operator_address});
}

template <typename Encoder>
tessera::schema::bytes_t make_slot_approval_key(
    Encoder& encoder,
    const tessera::schema::resolver_id_t& resolver_id,
    const tessera::schema::address_t& owner,
    const tessera::schema::slot_id_t slot,
    const tessera::schema::address_t& operator_address) {
  return make_prefixed_key(
      encoder, kSlotApprovalKeyPrefix,
      std::tuple{resolver_id, owner, slot, operator_address});
}

}  // namespace tessera::schema::key
