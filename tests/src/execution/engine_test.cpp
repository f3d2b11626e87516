#include <gtest/gtest.h>
#include <tessera/crypto/verify.hpp>
#include <tessera/schema/capability_check.hpp>
#include <tessera/schema/engine_state.hpp>
#include <tessera/schema/query_error_code.hpp>
#include <tessera/schema/resolver_state.hpp>
#include <tessera/testing/ed25519_key.hpp>
#include <tessera/testing/execution_fixture.hpp>

#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace {

using tessera::schema::resolver_kind_t;
using tessera::schema::transaction_error_code;
using tessera::testing::code_of;
using tessera::testing::encode_transaction;
using tessera::testing::execution_fixture;
using tessera::testing::kAdmin;
using tessera::testing::kExecutor;
using tessera::testing::kGovernor;
using tessera::testing::kTestChainId;
using tessera::testing::make_address;
using tessera::testing::make_hash;
using tessera::testing::make_named_signer;
using tessera::testing::make_transaction;

const auto kResolver = make_hash(0x10);
const auto kOutsider = make_address(0x0F);

tessera::schema::transaction_payload_t make_create_resolver(
    const tessera::schema::resolver_id_t& id) {
  return tessera::schema::create_resolver_t{.resolver_id = id,
                                            .kind = resolver_kind_t::standard};
}

std::optional<tessera::schema::engine_state_t> engine_state_of(
    execution_fixture& fixture) {
  auto result = fixture.engine().query("/engine/state", {});
  if (result.code != 0) {
    return std::nullopt;
  }
  return fixture.encoder().decode<tessera::schema::engine_state_t>(
      tessera::schema::bytes_view_t{result.value.data(), result.value.size()});
}

uint32_t single_code(const tessera::schema::block_result_t& block) {
  EXPECT_EQ(block.tx_results.size(), 1u);
  return block.tx_results.empty() ? 0 : block.tx_results.front().code;
}

}  // namespace

TEST(engine, nonce_must_match_and_only_moves_on_success) {
  auto fixture = execution_fixture{"tessera_engine_nonce"};
  auto admin = make_named_signer(kAdmin);

  auto ahead = make_transaction(kTestChainId, 3, admin,
                                make_create_resolver(kResolver));
  EXPECT_EQ(single_code(fixture.execute_raw({encode_transaction(ahead)})),
            code_of(transaction_error_code::invalid_nonce));

  auto first = make_transaction(kTestChainId, 0, admin,
                                make_create_resolver(kResolver));
  EXPECT_EQ(single_code(fixture.execute_raw({encode_transaction(first)})), 0u);

  // Rejected by the handler: the nonce stays at 1.
  auto duplicate = make_transaction(kTestChainId, 1, admin,
                                    make_create_resolver(kResolver));
  EXPECT_EQ(single_code(fixture.execute_raw({encode_transaction(duplicate)})),
            code_of(transaction_error_code::resolver_exists));

  auto replay = make_transaction(kTestChainId, 0, admin,
                                 make_create_resolver(make_hash(0x11)));
  EXPECT_EQ(single_code(fixture.execute_raw({encode_transaction(replay)})),
            code_of(transaction_error_code::invalid_nonce));

  auto next = make_transaction(kTestChainId, 1, admin,
                               make_create_resolver(make_hash(0x11)));
  EXPECT_EQ(single_code(fixture.execute_raw({encode_transaction(next)})), 0u);
}

TEST(engine, envelope_must_match_chain_and_version) {
  auto fixture = execution_fixture{"tessera_engine_envelope"};
  auto admin = make_named_signer(kAdmin);

  auto foreign = make_transaction(make_hash(0x99), 0, admin,
                                  make_create_resolver(kResolver));
  auto future = make_transaction(kTestChainId, 0, admin,
                                 make_create_resolver(kResolver));
  future.version = 2;

  auto block = fixture.execute_raw(
      {encode_transaction(foreign), encode_transaction(future),
       tessera::schema::bytes_t{0xDE, 0xAD}, tessera::schema::bytes_t{}});
  ASSERT_EQ(block.tx_results.size(), 4u);
  EXPECT_EQ(block.tx_results[0].code,
            code_of(transaction_error_code::invalid_chain_id));
  EXPECT_EQ(block.tx_results[1].code,
            code_of(transaction_error_code::unsupported_transaction_version));
  EXPECT_EQ(block.tx_results[2].code,
            code_of(transaction_error_code::invalid_transaction));
  EXPECT_EQ(block.tx_results[3].code,
            code_of(transaction_error_code::invalid_transaction));
  EXPECT_EQ(block.tx_results[0].codespace, "tessera.execute");
  EXPECT_EQ(block.tx_results[0].log, "invalid_chain_id");
}

TEST(engine, check_transaction_does_not_mutate_state) {
  auto fixture = execution_fixture{"tessera_engine_check"};
  auto tx = encode_transaction(make_transaction(
      kTestChainId, 0, make_named_signer(kAdmin),
      make_create_resolver(kResolver)));
  auto view = tessera::schema::bytes_view_t{tx.data(), tx.size()};

  EXPECT_EQ(fixture.engine().check_transaction(view).code, 0u);
  EXPECT_EQ(fixture.engine().check_transaction(view).code, 0u);
  EXPECT_FALSE(fixture
                   .query<tessera::schema::resolver_state_t>("/resolver",
                                                             kResolver)
                   .has_value());

  EXPECT_EQ(single_code(fixture.execute_raw({tx})), 0u);
  EXPECT_EQ(fixture.engine().check_transaction(view).code,
            code_of(transaction_error_code::invalid_nonce));

  auto garbage = tessera::schema::bytes_t{0x01, 0x02, 0x03};
  EXPECT_EQ(fixture.engine()
                .check_transaction(
                    tessera::schema::bytes_view_t{garbage.data(),
                                                  garbage.size()})
                .code,
            code_of(transaction_error_code::invalid_transaction));
}

TEST(engine, strict_crypto_checks_envelope_signatures) {
  if (!tessera::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = execution_fixture{"tessera_engine_strict", true, false};
  auto key = tessera::testing::ed25519_key::generate();
  ASSERT_TRUE(key.has_value());

  auto tx = make_transaction(kTestChainId, 0,
                             tessera::schema::signer_id_t{key->signer()},
                             make_create_resolver(kResolver));
  tx.signature = key->sign(
      tessera::execution::make_signing_bytes(fixture.encoder(), tx));
  auto signed_tx = encode_transaction(tx);
  EXPECT_EQ(fixture.engine()
                .check_transaction(tessera::schema::bytes_view_t{
                    signed_tx.data(), signed_tx.size()})
                .code,
            0u);

  auto tampered = tx;
  tampered.payload = make_create_resolver(make_hash(0x11));
  auto tampered_tx = encode_transaction(tampered);
  EXPECT_EQ(fixture.engine()
                .check_transaction(tessera::schema::bytes_view_t{
                    tampered_tx.data(), tampered_tx.size()})
                .code,
            code_of(transaction_error_code::signature_verification_failed));

  // Named signers carry no key, so they cannot pass strict checks.
  EXPECT_EQ(fixture.execute(kAdmin, make_create_resolver(kResolver)).code,
            code_of(transaction_error_code::signature_verification_failed));

  // A valid envelope reaches the handler, which checks roles.
  EXPECT_EQ(single_code(fixture.execute_raw({signed_tx})),
            code_of(transaction_error_code::authorization_denied));
}

TEST(engine, pause_blocks_everything_but_administration) {
  auto fixture = execution_fixture{"tessera_engine_pause"};
  fixture.create_resolver(kResolver, resolver_kind_t::standard);

  auto paused = fixture.execute(kAdmin,
                                tessera::schema::set_paused_t{.paused = true});
  ASSERT_EQ(paused.code, 0u) << paused.log;
  auto engine_state = engine_state_of(fixture);
  ASSERT_TRUE(engine_state.has_value());
  EXPECT_TRUE(engine_state->paused);

  EXPECT_EQ(fixture
                .execute(kExecutor,
                         tessera::schema::assign_resolver_t{
                             .document_id = make_hash(0xD1),
                             .resolver_id = kResolver})
                .code,
            code_of(transaction_error_code::paused));
  EXPECT_EQ(fixture
                .execute(kGovernor,
                         tessera::schema::update_capability_schema_t{
                             .schema_id = make_hash(0x5D)})
                .code,
            0u);

  ASSERT_EQ(fixture
                .execute(kAdmin, tessera::schema::set_paused_t{.paused = false})
                .code,
            0u);
  EXPECT_EQ(fixture
                .execute(kExecutor,
                         tessera::schema::assign_resolver_t{
                             .document_id = make_hash(0xD1),
                             .resolver_id = kResolver})
                .code,
            0u);
}

TEST(engine, administrative_payloads_need_their_roles) {
  auto fixture = execution_fixture{"tessera_engine_roles"};
  auto denied = code_of(transaction_error_code::authorization_denied);

  EXPECT_EQ(fixture.execute(kOutsider, make_create_resolver(kResolver)).code,
            denied);
  EXPECT_EQ(fixture.execute(kExecutor, make_create_resolver(kResolver)).code,
            denied);
  EXPECT_EQ(
      fixture.execute(kOutsider, tessera::schema::set_paused_t{.paused = true})
          .code,
      denied);
  EXPECT_EQ(fixture
                .execute(kAdmin, tessera::schema::update_capability_schema_t{
                                     .schema_id = make_hash(0x5D)})
                .code,
            denied);
  EXPECT_EQ(fixture
                .execute(kAdmin, tessera::schema::publish_attestation_t{
                                     .record = tessera::testing::
                                         make_capability_attestation(
                                             make_hash(0x40),
                                             tessera::testing::
                                                 kCapabilitySchemaId,
                                             kOutsider, kOutsider,
                                             make_hash(0xD1), 0x01)})
                .code,
            denied);

  fixture.create_resolver(kResolver, resolver_kind_t::standard);
  EXPECT_EQ(fixture
                .execute(kAdmin, tessera::schema::assign_resolver_t{
                                     .document_id = make_hash(0xD1),
                                     .resolver_id = kResolver})
                .code,
            denied);
  EXPECT_EQ(fixture
                .execute(kOutsider, tessera::schema::set_issuer_t{
                                        .document_id = make_hash(0xD1),
                                        .issuer = kOutsider})
                .code,
            denied);
}

TEST(engine, governor_updates_schema_and_upgrade_target) {
  auto fixture = execution_fixture{"tessera_engine_governor"};
  auto implementation = make_hash(0xAB);

  ASSERT_EQ(fixture
                .execute(kGovernor, tessera::schema::update_capability_schema_t{
                                        .schema_id = make_hash(0x5D)})
                .code,
            0u);
  ASSERT_EQ(fixture
                .execute(kGovernor, tessera::schema::authorize_upgrade_t{
                                        .implementation_hash = implementation})
                .code,
            0u);

  auto engine_state = engine_state_of(fixture);
  ASSERT_TRUE(engine_state.has_value());
  EXPECT_EQ(engine_state->capability_schema_id, make_hash(0x5D));
  EXPECT_EQ(engine_state->authorized_upgrade, implementation);
  EXPECT_EQ(engine_state->last_block_time, fixture.now());
}

TEST(registry, bindings_are_write_once) {
  auto fixture = execution_fixture{"tessera_registry_once"};
  auto document = make_hash(0xD1);
  fixture.create_resolver(kResolver, resolver_kind_t::standard);
  fixture.register_document(document, kResolver, make_address(0x1E));

  EXPECT_EQ(fixture.execute(kAdmin, make_create_resolver(kResolver)).code,
            code_of(transaction_error_code::resolver_exists));
  EXPECT_EQ(fixture
                .execute(kExecutor, tessera::schema::assign_resolver_t{
                                        .document_id = document,
                                        .resolver_id = kResolver})
                .code,
            code_of(transaction_error_code::document_resolver_exists));
  EXPECT_EQ(fixture
                .execute(kExecutor, tessera::schema::set_issuer_t{
                                        .document_id = document,
                                        .issuer = make_address(0x2E)})
                .code,
            code_of(transaction_error_code::issuer_already_registered));
  EXPECT_EQ(fixture
                .execute(kExecutor, tessera::schema::assign_resolver_t{
                                        .document_id = make_hash(0xD2),
                                        .resolver_id = make_hash(0x77)})
                .code,
            code_of(transaction_error_code::resolver_missing));
  EXPECT_EQ(fixture.query<tessera::schema::address_t>("/issuer", document),
            make_address(0x1E));
}

TEST(registry, attestations_publish_once_and_revoke_once) {
  auto fixture = execution_fixture{"tessera_registry_attestations"};
  auto id = fixture.attest(0x40, kOutsider, make_address(0x1E),
                           make_hash(0xD1), 0x01);

  auto again = fixture.execute(
      tessera::testing::kAttestationService,
      tessera::schema::publish_attestation_t{
          .record = tessera::testing::make_capability_attestation(
              id, tessera::testing::kCapabilitySchemaId, kOutsider,
              make_address(0x1E), make_hash(0xD1), 0x01)});
  EXPECT_EQ(again.code, code_of(transaction_error_code::attestation_exists));

  auto revoke = tessera::schema::revoke_attestation_t{.attestation_id = id};
  ASSERT_EQ(
      fixture.execute(tessera::testing::kAttestationService, revoke).code, 0u);
  EXPECT_EQ(
      fixture.execute(tessera::testing::kAttestationService, revoke).code,
      code_of(transaction_error_code::attestation_revoked));

  auto stored =
      fixture.query<tessera::schema::attestation_record_t>("/attestation", id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->revoked_at, fixture.now());
}

TEST(engine, state_root_is_deterministic_and_ignores_failures) {
  auto run = [](const std::string_view prefix) {
    auto fixture = execution_fixture{prefix};
    fixture.create_resolver(kResolver, resolver_kind_t::value_ledger);
    auto before = fixture.engine().info().last_block_state_root;
    auto failed = fixture.execute(kOutsider, make_create_resolver(kResolver));
    EXPECT_NE(failed.code, 0u);
    auto info = fixture.engine().info();
    EXPECT_EQ(info.last_block_state_root, before);
    EXPECT_EQ(info.last_block_height, 2);
    return info.last_block_state_root;
  };

  auto first = run("tessera_engine_root_a");
  auto second = run("tessera_engine_root_b");
  EXPECT_EQ(first, second);
  EXPECT_FALSE(tessera::schema::is_zero(first));
}

TEST(engine, uncommitted_blocks_are_superseded) {
  auto fixture = execution_fixture{"tessera_engine_superseded"};
  auto tx = encode_transaction(make_transaction(
      kTestChainId, 0, make_named_signer(kAdmin),
      make_create_resolver(kResolver)));
  auto pending = fixture.engine().finalize_block(fixture.height() + 1,
                                                 fixture.now(), {tx});
  ASSERT_EQ(single_code(pending), 0u);

  // The next finalize starts from committed state again.
  auto result = fixture.execute(kAdmin, make_create_resolver(kResolver));
  EXPECT_EQ(result.code, 0u) << result.log;
}

TEST(engine, genesis_only_applies_to_an_empty_ledger) {
  auto fixture = execution_fixture{"tessera_engine_genesis"};
  EXPECT_FALSE(fixture.engine().initialize(tessera::execution::genesis_config{
      .admins = {kOutsider}}));
  EXPECT_EQ(fixture.execute(kOutsider, make_create_resolver(kResolver)).code,
            code_of(transaction_error_code::authorization_denied));

  auto reopened = tessera::execution::engine{fixture.encoder(),
                                             fixture.storage(), kTestChainId,
                                             false};
  EXPECT_EQ(reopened.info().last_block_height,
            fixture.engine().info().last_block_height);
  EXPECT_EQ(tessera::testing::chain_id_from_engine(reopened), kTestChainId);
}

TEST(engine, query_errors_echo_key_and_codespace) {
  auto fixture = execution_fixture{"tessera_engine_query_errors"};
  fixture.create_resolver(kResolver, resolver_kind_t::standard);

  auto key = fixture.encoder().encode(uint64_t{42});
  auto unsupported = fixture.engine().query(
      "/nope", tessera::schema::bytes_view_t{key.data(), key.size()});
  EXPECT_EQ(unsupported.code,
            static_cast<uint32_t>(
                tessera::schema::query_error_code::unsupported_path));
  EXPECT_EQ(unsupported.codespace, "tessera.query");
  EXPECT_EQ(unsupported.key, key);

  auto missing = fixture.engine().query(
      "/token", tessera::schema::bytes_view_t{key.data(), key.size()});
  EXPECT_EQ(missing.code,
            static_cast<uint32_t>(tessera::schema::query_error_code::not_found));
  EXPECT_EQ(missing.height, fixture.engine().info().last_block_height);

  auto short_key = tessera::schema::bytes_t{0x01, 0x02, 0x03};
  auto invalid = fixture.engine().query(
      "/token",
      tessera::schema::bytes_view_t{short_key.data(), short_key.size()});
  EXPECT_EQ(invalid.code,
            static_cast<uint32_t>(tessera::schema::query_error_code::invalid_key));
}

TEST(engine, queries_read_committed_state_only) {
  auto fixture = execution_fixture{"tessera_engine_committed_reads"};
  auto tx = encode_transaction(make_transaction(
      kTestChainId, 0, make_named_signer(kAdmin),
      make_create_resolver(kResolver)));
  auto block = fixture.engine().finalize_block(fixture.height() + 1,
                                               fixture.now(), {tx});
  ASSERT_EQ(single_code(block), 0u);
  EXPECT_FALSE(fixture
                   .query<tessera::schema::resolver_state_t>("/resolver",
                                                             kResolver)
                   .has_value());

  auto committed = fixture.engine().commit();
  EXPECT_EQ(committed.state_root, block.state_root);
  EXPECT_GT(committed.written_keys, 0u);
  EXPECT_TRUE(fixture
                  .query<tessera::schema::resolver_state_t>("/resolver",
                                                            kResolver)
                  .has_value());
}

TEST(engine, calls_from_inside_execution_are_rejected) {
  auto fixture = execution_fixture{"tessera_engine_reentrancy"};
  auto& engine = fixture.engine();
  auto query_code = std::optional<uint32_t>{};
  auto finalize_code = std::optional<uint32_t>{};
  auto check_code = std::optional<uint32_t>{};
  engine.set_credential_issuer(
      [&](const tessera::schema::token_record_t& record,
          const tessera::schema::address_t&) {
        auto key = fixture.encoder().encode(record.token_id);
        query_code =
            engine
                .query("/token",
                       tessera::schema::bytes_view_t{key.data(), key.size()})
                .code;
        auto nested = engine.finalize_block(999, 0, {key});
        finalize_code = nested.tx_results.front().code;
        check_code =
            engine
                .check_transaction(
                    tessera::schema::bytes_view_t{key.data(), key.size()})
                .code;
        return tessera::execution::credential_result{.issued = true};
      });

  auto document = make_hash(0xD1);
  auto issuer = make_address(0x1E);
  fixture.create_resolver(kResolver, resolver_kind_t::standard);
  fixture.register_document(document, kResolver, issuer);
  auto token_id = fixture.reserve_anonymous(issuer, document, 0, 0);
  auto attestation = fixture.attest(0x40, kOutsider, issuer, document, 0x01);
  auto claimed = fixture.claim(kOutsider, document, token_id, attestation);
  ASSERT_EQ(claimed.code, 0u) << claimed.log;

  EXPECT_EQ(query_code,
            static_cast<uint32_t>(
                tessera::schema::query_error_code::reentrant_call));
  EXPECT_EQ(finalize_code, code_of(transaction_error_code::reentrant_call));
  EXPECT_EQ(check_code, code_of(transaction_error_code::reentrant_call));
  EXPECT_EQ(fixture.query<tessera::schema::address_t>("/token/owner", token_id),
            kOutsider);
}

TEST(engine, capability_check_query_reports_without_failing) {
  auto fixture = execution_fixture{"tessera_engine_capability_check"};
  auto document = make_hash(0xD2);
  auto issuer = make_address(0x1E);
  fixture.create_resolver(kResolver, resolver_kind_t::standard);
  fixture.register_document(document, kResolver, issuer);
  auto id = fixture.attest(0x41, kOutsider, issuer, document, 0x03);
  auto height = fixture.engine().info().last_block_height;

  auto check = [&](const tessera::schema::address_t& caller,
                   const uint8_t required) {
    auto result = fixture.query<tessera::schema::capability_check_t>(
        "/capability/check", std::tuple{caller, document, required, id});
    EXPECT_TRUE(result.has_value());
    return result.value_or(tessera::schema::capability_check_t{});
  };

  auto granted = check(kOutsider, 0x02);
  EXPECT_TRUE(granted.verified);
  EXPECT_EQ(granted.error_code, 0u);
  EXPECT_EQ(granted.granted_bits, 0x03);
  ASSERT_TRUE(granted.payload.has_value());
  EXPECT_EQ(granted.payload->document_id, document);

  auto missing = check(kOutsider, 0x04);
  EXPECT_FALSE(missing.verified);
  EXPECT_EQ(missing.error_code,
            code_of(transaction_error_code::insufficient_capability));

  auto stranger = check(make_address(0x0E), 0x01);
  EXPECT_FALSE(stranger.verified);
  EXPECT_EQ(stranger.error_code,
            code_of(transaction_error_code::recipient_mismatch));

  EXPECT_EQ(fixture.engine().info().last_block_height, height);
}
