#pragma once

#include <gtest/gtest.h>

#include <tessera/capability/capability.hpp>
#include <tessera/execution/engine.hpp>
#include <tessera/schema/attestation_record.hpp>
#include <tessera/schema/capability_payload.hpp>
#include <tessera/schema/encoding/scale/encoder.hpp>
#include <tessera/schema/transaction.hpp>
#include <tessera/schema/transaction_result.hpp>
#include <tessera/testing/common.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace tessera::testing {

using scale_encoder_t = tessera::schema::encoding::encoder<
    tessera::schema::encoding::scale_encoder_tag>;

inline tessera::schema::transaction_t make_transaction(
    const tessera::schema::hash32_t& chain_id,
    const uint64_t nonce,
    const tessera::schema::signer_id_t& signer,
    const tessera::schema::transaction_payload_t& payload) {
  return tessera::schema::transaction_t{
      .version = 1,
      .chain_id = chain_id,
      .nonce = nonce,
      .signer = signer,
      .payload = payload,
      .signature = tessera::schema::ed25519_signature_t{}};
}

inline tessera::schema::bytes_t encode_transaction(
    const tessera::schema::transaction_t& tx) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(tx);
}

inline tessera::schema::hash32_t chain_id_from_engine(
    tessera::execution::engine& engine) {
  const auto query = engine.query("/engine/info", {});
  EXPECT_EQ(query.code, 0u);
  auto encoder = scale_encoder_t{};
  const auto decoded = encoder.decode<std::tuple<
      int64_t, tessera::schema::hash32_t, tessera::schema::hash32_t>>(
      tessera::schema::bytes_view_t{query.value.data(), query.value.size()});
  return std::get<2>(decoded);
}

/// Finalize and commit a block holding `tx` alone.
inline tessera::schema::transaction_result_t finalize_single(
    tessera::execution::engine& engine,
    const uint64_t height,
    const tessera::schema::timestamp_milliseconds_t block_time,
    const tessera::schema::transaction_t& tx) {
  auto block =
      engine.finalize_block(height, block_time, {encode_transaction(tx)});
  EXPECT_EQ(block.tx_results.size(), 1u);
  auto result = block.tx_results.front();
  static_cast<void>(engine.commit());
  return result;
}

inline tessera::schema::attestation_record_t make_capability_attestation(
    const tessera::schema::attestation_id_t& id,
    const tessera::schema::schema_id_t& schema_id,
    const tessera::schema::address_t& recipient,
    const tessera::schema::address_t& issuer,
    const tessera::schema::document_id_t& document_id,
    const tessera::capability::capability_bits_t granted,
    const tessera::schema::timestamp_milliseconds_t expires_at = 0) {
  auto encoder = scale_encoder_t{};
  auto payload = tessera::schema::capability_payload_t{
      .document_id = document_id,
      .capability_bits = granted,
      .verified_identity =
          tessera::schema::make_bytes(std::string_view{"did:example:holder"}),
      .verification_method =
          tessera::schema::make_bytes(std::string_view{"document-check"}),
      .verification_date = 1,
      .contract_role = tessera::schema::make_bytes(std::string_view{"party"}),
      .legal_entity_type =
          tessera::schema::make_bytes(std::string_view{"individual"})};
  return tessera::schema::attestation_record_t{
      .id = id,
      .schema_id = schema_id,
      .issued_at = 1,
      .expires_at = expires_at,
      .recipient = recipient,
      .issuer = issuer,
      .payload = encoder.encode(payload)};
}

inline tessera::schema::token_id_t decode_token_id(
    const tessera::schema::transaction_result_t& result) {
  EXPECT_EQ(result.code, 0u) << result.log;
  auto encoder = scale_encoder_t{};
  return encoder.decode<tessera::schema::token_id_t>(
      tessera::schema::bytes_view_t{result.data.data(), result.data.size()});
}

inline bool has_event(const tessera::schema::transaction_result_t& result,
                      const std::string_view type) {
  return std::any_of(
      std::begin(result.events), std::end(result.events),
      [&](const tessera::schema::transaction_event_t& event) {
        return event.type == type;
      });
}

inline std::optional<std::string> event_attribute(
    const tessera::schema::transaction_result_t& result,
    const std::string_view type,
    const std::string_view key) {
  for (const auto& event : result.events) {
    if (event.type != type) {
      continue;
    }
    for (const auto& attribute : event.attributes) {
      if (attribute.key == key) {
        return attribute.value;
      }
    }
  }
  return std::nullopt;
}

inline uint32_t code_of(const tessera::schema::transaction_error_code error) {
  return tessera::schema::code(error);
}

}  // namespace tessera::testing
