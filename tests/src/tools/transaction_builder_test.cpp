#include <gtest/gtest.h>
#include <tessera/config/config.hpp>
#include <tessera/crypto/verify.hpp>
#include <tessera/execution/variants.hpp>
#include <tessera/schema/encoding/scale/encoder.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/transaction.hpp>
#include <tessera/testing/common.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>

#include <sys/wait.h>

#ifndef TESSERA_TRANSACTION_BUILDER_PATH
#define TESSERA_TRANSACTION_BUILDER_PATH ""
#endif

namespace {

using encoder_t = tessera::schema::encoding::encoder<
    tessera::schema::encoding::scale_encoder_tag>;

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1) {
    return {-1, output};
  }
  if (WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string run_builder(const std::string& builder,
                        const std::string_view command,
                        const std::string_view args) {
  auto line = shell_quote(builder) + " " + std::string{command} + " " +
              std::string{args} + " 2>/dev/null";
  auto [exit_code, output] = run_capture(line);
  EXPECT_EQ(exit_code, 0) << "command failed: " << line << '\n' << output;
  return trim_ascii_whitespace(output);
}

std::string builder_path() {
  return std::string{TESSERA_TRANSACTION_BUILDER_PATH};
}

std::string hex(const tessera::schema::hash32_t& value) {
  return tessera::schema::to_hex(value);
}

}  // namespace

TEST(transaction_builder, encodes_transactions_the_engine_can_decode) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  auto signer = tessera::testing::make_address(0xA1);
  auto resolver = tessera::testing::make_hash(0x30);
  auto output = run_builder(
      builder, "transaction",
      "--payload create_resolver --nonce 3 --signer " + hex(signer) +
          " --resolver-id " + hex(resolver) +
          " --resolver-kind value_ledger --require-transfer-capability true");

  auto encoder = encoder_t{};
  auto bytes = tessera::schema::from_hex(output);
  auto tx = encoder.decode<tessera::schema::transaction_t>(
      tessera::schema::make_bytes_view(bytes));
  EXPECT_EQ(tx.version, 1);
  EXPECT_EQ(tx.nonce, 3u);
  EXPECT_EQ(tx.chain_id, tessera::config::make_chain_id("tessera-local"));
  ASSERT_TRUE(std::holds_alternative<tessera::schema::named_signer_t>(tx.signer));
  EXPECT_EQ(std::get<tessera::schema::named_signer_t>(tx.signer), signer);

  const auto* payload =
      std::get_if<tessera::schema::create_resolver_t>(&tx.payload);
  ASSERT_NE(payload, nullptr);
  EXPECT_EQ(payload->resolver_id, resolver);
  EXPECT_EQ(payload->kind, tessera::schema::resolver_kind_t::value_ledger);
  EXPECT_TRUE(payload->require_transfer_capability);
}

TEST(transaction_builder, carries_amounts_and_labels) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  auto document = tessera::testing::make_hash(0x40);
  auto output = run_builder(
      builder, "transaction",
      "--payload reserve_anonymous --signer " +
          hex(tessera::testing::make_address(0xE1)) + " --document-id " +
          hex(document) +
          " --slot 2 --amount 340282366920938463463374607431768211456"
          " --label 0a0b0c");

  auto encoder = encoder_t{};
  auto bytes = tessera::schema::from_hex(output);
  auto tx = encoder.decode<tessera::schema::transaction_t>(
      tessera::schema::make_bytes_view(bytes));
  const auto* payload =
      std::get_if<tessera::schema::reserve_anonymous_t>(&tx.payload);
  ASSERT_NE(payload, nullptr);
  EXPECT_EQ(payload->document_id, document);
  EXPECT_EQ(payload->slot, 2u);
  EXPECT_EQ(payload->value,
            tessera::schema::amount_t{"340282366920938463463374607431768211456"});
  EXPECT_EQ(payload->label, (tessera::schema::bytes_t{0x0a, 0x0b, 0x0c}));
}

TEST(transaction_builder, query_keys_match_the_route_contract) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  auto encoder = encoder_t{};
  auto document = tessera::testing::make_hash(0x40);
  auto resolver = tessera::testing::make_hash(0x30);
  auto holder = tessera::testing::make_address(0x77);

  EXPECT_EQ(run_builder(builder, "query-key", "--path /engine/state"), "");
  EXPECT_EQ(run_builder(builder, "query-key", "--path /token --token-id 9"),
            tessera::schema::to_hex(encoder.encode(uint64_t{9})));
  EXPECT_EQ(run_builder(builder, "query-key",
                        "--path /reservation --document-id " + hex(document) +
                            " --slot 4"),
            tessera::schema::to_hex(
                encoder.encode(std::tuple{document, uint64_t{4}})));
  EXPECT_EQ(run_builder(builder, "query-key",
                        "--path /holder/tokens --resolver-id " + hex(resolver) +
                            " --holder " + hex(holder)),
            tessera::schema::to_hex(encoder.encode(std::tuple{resolver, holder})));
  EXPECT_EQ(
      run_builder(builder, "query-key",
                  "--path /issuer --document-id " + hex(document)),
      tessera::schema::to_hex(encoder.encode(document)));
}

TEST(transaction_builder, derives_chain_ids_addresses_and_delegation_messages) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  auto chain_id = tessera::config::make_chain_id("tessera-test");
  EXPECT_EQ(run_builder(builder, "chain-id", "--chain-id tessera-test"),
            hex(chain_id));

  auto key = tessera::testing::make_ed25519_signer(0x10);
  EXPECT_EQ(
      run_builder(builder, "address",
                  "--signer-ed25519 " +
                      tessera::schema::to_hex(tessera::schema::bytes_view_t{
                          key.public_key.data(), key.public_key.size()})),
      hex(tessera::crypto::derive_address(tessera::schema::signer_id_t{key})));

  auto user = tessera::testing::make_address(0x55);
  auto encoder = encoder_t{};
  auto expected = tessera::execution::variants::make_delegation_message(
      encoder, chain_id, 7, user, 5'000, 2);
  EXPECT_EQ(run_builder(builder, "delegation-message",
                        "--chain-id tessera-test --token-id 7 --user " +
                            hex(user) +
                            " --expires-at 5000 --delegation-nonce 2"),
            tessera::schema::to_hex(expected));
}

TEST(transaction_builder, rejects_unknown_payloads) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  auto command = shell_quote(builder) +
                 " transaction --payload mint --signer " +
                 hex(tessera::testing::make_address(0xA1)) + " 2>/dev/null";
  auto [exit_code, output] = run_capture(command);
  EXPECT_NE(exit_code, 0);
  EXPECT_TRUE(trim_ascii_whitespace(output).empty());
}
