#include <gtest/gtest.h>
#include <tessera/crypto/verify.hpp>
#include <tessera/execution/variants.hpp>
#include <tessera/schema/holder_state.hpp>
#include <tessera/schema/resolver_state.hpp>
#include <tessera/schema/token_record.hpp>
#include <tessera/testing/ed25519_key.hpp>
#include <tessera/testing/execution_fixture.hpp>

#include <tuple>

namespace {

using tessera::schema::resolver_kind_t;
using tessera::schema::token_id_t;
using tessera::schema::transaction_error_code;
using tessera::testing::code_of;
using tessera::testing::ed25519_key;
using tessera::testing::execution_fixture;
using tessera::testing::make_address;
using tessera::testing::make_hash;

const auto kResolver = make_hash(0x10);
const auto kDocument = make_hash(0xD1);
const auto kIssuer = make_address(0x1E);
const auto kAlice = make_address(0x01);
const auto kBob = make_address(0x02);
const auto kCarol = make_address(0x03);
constexpr auto kClaim = tessera::capability::capability_bits_t{0x01};

token_id_t claimed_token(execution_fixture& fixture,
                         const resolver_kind_t kind,
                         const tessera::schema::address_t& holder) {
  fixture.create_resolver(kResolver, kind);
  fixture.register_document(kDocument, kResolver, kIssuer);
  auto token_id = fixture.reserve_anonymous(kIssuer, kDocument, 0, 0);
  auto attestation = fixture.attest(0x40, holder, kIssuer, kDocument, kClaim);
  auto result = fixture.claim(holder, kDocument, token_id, attestation);
  EXPECT_EQ(result.code, 0u) << result.log;
  return token_id;
}

}  // namespace

TEST(revocable, revocation_keeps_ownership_and_clears_validity) {
  auto fixture = execution_fixture{"tessera_variants_revoke"};
  auto token_id = claimed_token(fixture, resolver_kind_t::revocable, kAlice);
  EXPECT_EQ(fixture.query<bool>("/token/valid", token_id), true);
  EXPECT_EQ(fixture.query<bool>("/holder/valid", std::tuple{kResolver, kAlice}),
            true);

  auto revoked = fixture.execute(
      kIssuer, tessera::schema::revoke_token_t{.token_id = token_id});
  ASSERT_EQ(revoked.code, 0u) << revoked.log;
  EXPECT_TRUE(tessera::testing::has_event(revoked, "token_revoked"));

  EXPECT_EQ(fixture.query<bool>("/token/valid", token_id), false);
  EXPECT_EQ(fixture.query<tessera::schema::address_t>("/token/owner", token_id),
            kAlice);
  EXPECT_EQ(fixture.query<bool>("/holder/valid", std::tuple{kResolver, kAlice}),
            false);
  auto record =
      fixture.query<tessera::schema::token_record_t>("/token", token_id);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->revoked_at, fixture.now());

  auto resolver =
      fixture.query<tessera::schema::resolver_state_t>("/resolver", kResolver);
  ASSERT_TRUE(resolver.has_value());
  EXPECT_EQ(resolver->valid_holder_count, 0u);

  EXPECT_EQ(fixture
                .execute(kIssuer,
                         tessera::schema::revoke_token_t{.token_id = token_id})
                .code,
            code_of(transaction_error_code::already_revoked));
}

TEST(revocable, valid_holder_count_tracks_distinct_holders) {
  auto fixture = execution_fixture{"tessera_variants_valid_holders"};
  auto first = claimed_token(fixture, resolver_kind_t::revocable, kAlice);
  auto second_document = make_hash(0xD2);
  fixture.register_document(second_document, kResolver, kIssuer);
  auto second = fixture.reserve_anonymous(kIssuer, second_document, 0, 0);
  ASSERT_EQ(fixture
                .claim(kAlice, second_document, second,
                       fixture.attest(0x41, kAlice, kIssuer, second_document,
                                      kClaim))
                .code,
            0u);

  auto valid_holders = [&] {
    auto resolver = fixture.query<tessera::schema::resolver_state_t>(
        "/resolver", kResolver);
    return resolver ? resolver->valid_holder_count : uint64_t{99};
  };
  EXPECT_EQ(valid_holders(), 1u);

  ASSERT_EQ(fixture
                .execute(kIssuer,
                         tessera::schema::revoke_token_t{.token_id = first})
                .code,
            0u);
  EXPECT_EQ(valid_holders(), 1u);
  EXPECT_EQ(fixture.query<bool>("/holder/valid", std::tuple{kResolver, kAlice}),
            true);

  ASSERT_EQ(fixture
                .execute(tessera::testing::kAdmin,
                         tessera::schema::revoke_token_t{.token_id = second})
                .code,
            0u);
  EXPECT_EQ(valid_holders(), 0u);
}

TEST(revocable, only_issuer_or_admin_revokes) {
  auto fixture = execution_fixture{"tessera_variants_revoke_auth"};
  auto token_id = claimed_token(fixture, resolver_kind_t::revocable, kAlice);
  EXPECT_EQ(fixture
                .execute(kAlice,
                         tessera::schema::revoke_token_t{.token_id = token_id})
                .code,
            code_of(transaction_error_code::authorization_denied));
}

TEST(revocable, other_kinds_cannot_revoke) {
  auto fixture = execution_fixture{"tessera_variants_revoke_standard"};
  auto token_id = claimed_token(fixture, resolver_kind_t::standard, kAlice);
  EXPECT_EQ(fixture
                .execute(kIssuer,
                         tessera::schema::revoke_token_t{.token_id = token_id})
                .code,
            code_of(transaction_error_code::unsupported_operation));
  EXPECT_EQ(fixture.query<bool>("/token/valid", token_id), true);
}

TEST(permanent_lock, claimed_records_never_move) {
  auto fixture = execution_fixture{"tessera_variants_lock"};
  auto token_id =
      claimed_token(fixture, resolver_kind_t::permanent_lock, kAlice);
  EXPECT_EQ(fixture.query<bool>("/token/locked", token_id), true);

  auto result = fixture.execute(
      kAlice, tessera::schema::transfer_token_t{.token_id = token_id,
                                                .to = kBob});
  EXPECT_EQ(result.code, code_of(transaction_error_code::token_locked));
  EXPECT_EQ(fixture.query<tessera::schema::address_t>("/token/owner", token_id),
            kAlice);

  // The lock wins over the value and slot checks.
  auto other_document = make_hash(0xD2);
  fixture.register_document(other_document, kResolver, kIssuer);
  auto other = fixture.reserve_anonymous(kIssuer, other_document, 1, 0);
  ASSERT_EQ(fixture
                .claim(kBob, other_document, other,
                       fixture.attest(0x41, kBob, kIssuer, other_document,
                                      kClaim))
                .code,
            0u);
  EXPECT_EQ(fixture
                .execute(kAlice, tessera::schema::transfer_value_t{
                                     .from_token_id = token_id,
                                     .to_token_id = other,
                                     .amount = 0})
                .code,
            code_of(transaction_error_code::token_locked));
  EXPECT_EQ(fixture
                .execute(kAlice, tessera::schema::transfer_value_to_address_t{
                                     .from_token_id = token_id,
                                     .to = kBob,
                                     .amount = 0})
                .code,
            code_of(transaction_error_code::token_locked));
}

TEST(standard, records_transfer_freely) {
  auto fixture = execution_fixture{"tessera_variants_standard"};
  auto token_id = claimed_token(fixture, resolver_kind_t::standard, kAlice);
  EXPECT_EQ(fixture.query<bool>("/token/locked", token_id), false);
  auto result = fixture.execute(
      kAlice, tessera::schema::transfer_token_t{.token_id = token_id,
                                                .to = kBob});
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(fixture.query<tessera::schema::address_t>("/token/owner", token_id),
            kBob);
}

TEST(delegated_role, delegate_expires_with_block_time) {
  auto fixture = execution_fixture{"tessera_variants_delegate"};
  auto token_id =
      claimed_token(fixture, resolver_kind_t::delegated_role, kAlice);
  auto expires_at = fixture.now() + 1'000;

  auto result = fixture.execute(
      kAlice, tessera::schema::set_delegate_t{
                  .token_id = token_id, .user = kBob, .expires_at = expires_at});
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(fixture.query<tessera::schema::address_t>("/token/user", token_id),
            kBob);

  fixture.set_now(expires_at);
  static_cast<void>(fixture.execute_block({}));
  EXPECT_EQ(fixture.query<tessera::schema::address_t>("/token/user", token_id),
            kBob);

  fixture.set_now(expires_at + 1);
  static_cast<void>(fixture.execute_block({}));
  auto user =
      fixture.query<tessera::schema::address_t>("/token/user", token_id);
  ASSERT_TRUE(user.has_value());
  EXPECT_TRUE(tessera::schema::is_zero(*user));
}

TEST(delegated_role, owner_change_clears_the_delegate) {
  auto fixture = execution_fixture{"tessera_variants_delegate_transfer"};
  auto token_id =
      claimed_token(fixture, resolver_kind_t::delegated_role, kAlice);
  ASSERT_EQ(fixture
                .execute(kAlice, tessera::schema::set_delegate_t{
                                     .token_id = token_id,
                                     .user = kBob,
                                     .expires_at = fixture.now() + 10'000})
                .code,
            0u);

  ASSERT_EQ(fixture
                .execute(kAlice, tessera::schema::transfer_token_t{
                                     .token_id = token_id, .to = kCarol})
                .code,
            0u);
  auto record =
      fixture.query<tessera::schema::token_record_t>("/token", token_id);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->owner, kCarol);
  EXPECT_TRUE(tessera::schema::is_zero(record->delegate));
  EXPECT_EQ(record->delegate_expires_at, 0u);
}

TEST(delegated_role, strangers_cannot_delegate) {
  auto fixture = execution_fixture{"tessera_variants_delegate_auth"};
  auto token_id =
      claimed_token(fixture, resolver_kind_t::delegated_role, kAlice);
  EXPECT_EQ(fixture
                .execute(kBob, tessera::schema::set_delegate_t{
                                   .token_id = token_id,
                                   .user = kBob,
                                   .expires_at = fixture.now() + 10})
                .code,
            code_of(transaction_error_code::not_authorized));
}

TEST(delegated_role, other_kinds_reject_delegation) {
  auto fixture = execution_fixture{"tessera_variants_delegate_standard"};
  auto token_id = claimed_token(fixture, resolver_kind_t::standard, kAlice);
  EXPECT_EQ(fixture
                .execute(kAlice, tessera::schema::set_delegate_t{
                                     .token_id = token_id,
                                     .user = kBob,
                                     .expires_at = fixture.now() + 10})
                .code,
            code_of(transaction_error_code::unsupported_operation));
}

TEST(delegated_role, relayed_delegation_needs_the_owner_signature) {
  if (!tessera::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  // Envelope checks stay off; the delegation signature is still verified.
  auto fixture = execution_fixture{"tessera_variants_signed_delegate", false,
                                   false};
  auto owner_key = ed25519_key::generate();
  ASSERT_TRUE(owner_key.has_value());
  auto owner_signer = tessera::schema::signer_id_t{owner_key->signer()};
  auto owner = tessera::crypto::derive_address(owner_signer);

  fixture.create_resolver(kResolver, resolver_kind_t::delegated_role);
  fixture.register_document(kDocument, kResolver, kIssuer);
  auto token_id = fixture.reserve_anonymous(kIssuer, kDocument, 0, 0);
  auto attestation = fixture.attest(0x40, owner, kIssuer, kDocument, kClaim);
  auto claimed = fixture.execute(
      owner_signer, tessera::schema::claim_t{.document_id = kDocument,
                                             .token_id = token_id,
                                             .attestation_id = attestation});
  ASSERT_EQ(claimed.code, 0u) << claimed.log;

  auto expires_at = fixture.now() + 5'000;
  auto message = tessera::execution::variants::make_delegation_message(
      fixture.encoder(), fixture.chain_id(), token_id, kBob, expires_at, 0);
  auto payload = tessera::schema::set_delegate_signed_t{
      .token_id = token_id,
      .user = kBob,
      .expires_at = expires_at,
      .owner_signer = owner_signer,
      .signature = owner_key->sign(message)};

  auto tampered = payload;
  tampered.expires_at += 1;
  EXPECT_EQ(fixture.execute(kCarol, tampered).code,
            code_of(transaction_error_code::invalid_delegation_signature));

  auto relayed = fixture.execute(kCarol, payload);
  ASSERT_EQ(relayed.code, 0u) << relayed.log;
  EXPECT_EQ(fixture.query<tessera::schema::address_t>("/token/user", token_id),
            kBob);

  // The delegation nonce moved on, so the same signature cannot be replayed.
  EXPECT_EQ(fixture.execute(kCarol, payload).code,
            code_of(transaction_error_code::invalid_delegation_signature));
}

TEST(delegated_role, delegation_signed_by_someone_else_is_rejected) {
  if (!tessera::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = execution_fixture{"tessera_variants_foreign_delegate", false,
                                   false};
  auto token_id =
      claimed_token(fixture, resolver_kind_t::delegated_role, kAlice);
  auto other_key = ed25519_key::generate();
  ASSERT_TRUE(other_key.has_value());

  auto expires_at = fixture.now() + 5'000;
  auto message = tessera::execution::variants::make_delegation_message(
      fixture.encoder(), fixture.chain_id(), token_id, kBob, expires_at, 0);
  auto result = fixture.execute(
      kCarol, tessera::schema::set_delegate_signed_t{
                  .token_id = token_id,
                  .user = kBob,
                  .expires_at = expires_at,
                  .owner_signer =
                      tessera::schema::signer_id_t{other_key->signer()},
                  .signature = other_key->sign(message)});
  EXPECT_EQ(result.code,
            code_of(transaction_error_code::invalid_delegation_signature));
}
