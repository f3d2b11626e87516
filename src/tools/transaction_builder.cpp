#include <boost/program_options.hpp>
#include <tessera/capability/capability.hpp>
#include <tessera/common/critical.hpp>
#include <tessera/config/config.hpp>
#include <tessera/crypto/verify.hpp>
#include <tessera/execution/engine.hpp>
#include <tessera/execution/variants.hpp>
#include <tessera/schema/capability_payload.hpp>
#include <tessera/schema/encoding/scale/encoder.hpp>
#include <tessera/schema/resolver_kind.hpp>
#include <tessera/schema/transaction.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

using encoder_t = tessera::schema::encoding::encoder<
    tessera::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

inline constexpr auto kPayloadNames = std::array<std::string_view, 22>{
    "create_resolver",
    "assign_resolver",
    "set_issuer",
    "set_paused",
    "update_capability_schema",
    "authorize_upgrade",
    "publish_attestation",
    "revoke_attestation",
    "reserve",
    "reserve_anonymous",
    "claim",
    "cancel",
    "transfer_token",
    "transfer_value",
    "transfer_value_to_address",
    "approve_token",
    "set_operator_approval",
    "approve_slot",
    "approve_value",
    "revoke_token",
    "set_delegate",
    "set_delegate_signed"};

tessera::schema::bytes_t get_bytes(const po::variables_map& vm,
                                   const std::string& name) {
  if (!vm.contains(name)) {
    return {};
  }
  auto bytes = tessera::schema::try_from_hex(vm[name].as<std::string>());
  if (!bytes) {
    tessera::common::critical("--{} must be hex", name);
  }
  return *bytes;
}

tessera::schema::hash32_t get_hash32(const po::variables_map& vm,
                                     const std::string& name) {
  if (!vm.contains(name)) {
    tessera::common::critical("missing required argument --{}", name);
  }
  auto hash = tessera::schema::try_make_hash32(vm[name].as<std::string>());
  if (!hash) {
    tessera::common::critical("--{} must be 32 byte hex", name);
  }
  return *hash;
}

std::optional<tessera::schema::hash32_t> get_optional_hash32(
    const po::variables_map& vm,
    const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return get_hash32(vm, name);
}

uint64_t get_uint64(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    tessera::common::critical("missing required argument --{}", name);
  }
  return vm[name].as<uint64_t>();
}

tessera::schema::amount_t get_amount(const po::variables_map& vm) {
  const auto& text = vm["amount"].as<std::string>();
  if (text.empty() || !std::all_of(std::begin(text), std::end(text),
                                   [](const char c) {
                                     return c >= '0' && c <= '9';
                                   })) {
    tessera::common::critical("--amount must be a decimal integer");
  }
  return tessera::schema::amount_t{text};
}

template <std::size_t N>
std::array<uint8_t, N> to_fixed(const tessera::schema::bytes_t& bytes,
                                const std::string_view what) {
  auto out = std::array<uint8_t, N>{};
  if (bytes.size() != N) {
    tessera::common::critical("{} must be {} bytes", what, N);
  }
  std::copy(std::begin(bytes), std::end(bytes), std::begin(out));
  return out;
}

// --<prefix> (named hash32), --<prefix>-ed25519 or --<prefix>-secp256k1
// public key hex.
std::optional<tessera::schema::signer_id_t> try_make_signer(
    const po::variables_map& vm,
    const std::string& prefix) {
  if (vm.contains(prefix + "-ed25519")) {
    return tessera::schema::signer_id_t{tessera::schema::ed25519_signer_id{
        .public_key = to_fixed<32>(get_bytes(vm, prefix + "-ed25519"),
                                   "ed25519 public key")}};
  }
  if (vm.contains(prefix + "-secp256k1")) {
    return tessera::schema::signer_id_t{tessera::schema::secp256k1_signer_id{
        .public_key = to_fixed<33>(get_bytes(vm, prefix + "-secp256k1"),
                                   "secp256k1 public key")}};
  }
  if (vm.contains(prefix)) {
    return tessera::schema::signer_id_t{get_hash32(vm, prefix)};
  }
  return std::nullopt;
}

tessera::schema::signer_id_t make_signer(const po::variables_map& vm,
                                         const std::string& prefix) {
  auto signer = try_make_signer(vm, prefix);
  if (!signer) {
    tessera::common::critical("missing --{} or a --{}-<scheme> public key",
                              prefix, prefix);
  }
  return *signer;
}

tessera::schema::signature_t make_signature(const po::variables_map& vm,
                                            const std::string& prefix) {
  auto kind = vm[prefix + "-kind"].as<std::string>();
  auto bytes = get_bytes(vm, prefix + "-hex");
  if (kind == "ed25519") {
    if (bytes.empty()) {
      return tessera::schema::ed25519_signature_t{};
    }
    return to_fixed<64>(bytes, "ed25519 signature");
  }
  if (kind == "secp256k1") {
    if (bytes.empty()) {
      return tessera::schema::secp256k1_signature_t{};
    }
    return to_fixed<65>(bytes, "secp256k1 signature");
  }
  tessera::common::critical("--{}-kind must be ed25519|secp256k1", prefix);
}

tessera::schema::resolver_kind_t parse_resolver_kind(const std::string& kind) {
  auto value =
      tessera::schema::try_from_string<tessera::schema::resolver_kind_t>(kind);
  if (!value) {
    tessera::common::critical(
        "--resolver-kind must be {}",
        tessera::schema::join_names(tessera::schema::kResolverKindMappings));
  }
  return *value;
}

tessera::capability::capability_bits_t parse_capabilities(
    const std::string& text) {
  auto bits = tessera::capability::parse_bits(text);
  if (!bits) {
    tessera::common::critical(
        "--capabilities must be a number or a list of {}",
        tessera::schema::join_names(tessera::capability::kCapabilityMappings,
                                    ","));
  }
  return *bits;
}

tessera::schema::attestation_record_t build_attestation(
    const po::variables_map& vm) {
  auto payload = tessera::schema::capability_payload_t{
      .document_id = get_hash32(vm, "document-id"),
      .token_id =
          vm.contains("token-id") ? vm["token-id"].as<uint64_t>() : 0,
      .capability_bits =
          parse_capabilities(vm["capabilities"].as<std::string>()),
      .verified_identity = get_bytes(vm, "verified-identity"),
      .verification_method = get_bytes(vm, "verification-method"),
      .verification_date = vm["verification-date"].as<uint64_t>(),
      .contract_role = get_bytes(vm, "contract-role"),
      .legal_entity_type = get_bytes(vm, "legal-entity-type"),
      .notes = get_bytes(vm, "notes")};
  return tessera::schema::attestation_record_t{
      .id = get_hash32(vm, "attestation-id"),
      .schema_id = get_hash32(vm, "schema-id"),
      .issued_at = vm["issued-at"].as<uint64_t>(),
      .expires_at = vm["expires-at"].as<uint64_t>(),
      .recipient = get_hash32(vm, "recipient"),
      .issuer = get_hash32(vm, "issuer"),
      .payload = encoder_t{}.encode(payload)};
}

tessera::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "create_resolver") {
    return tessera::schema::create_resolver_t{
        .resolver_id = get_hash32(vm, "resolver-id"),
        .kind = parse_resolver_kind(vm["resolver-kind"].as<std::string>()),
        .require_transfer_capability =
            vm["require-transfer-capability"].as<bool>()};
  }
  if (payload == "assign_resolver") {
    return tessera::schema::assign_resolver_t{
        .document_id = get_hash32(vm, "document-id"),
        .resolver_id = get_hash32(vm, "resolver-id")};
  }
  if (payload == "set_issuer") {
    return tessera::schema::set_issuer_t{
        .document_id = get_hash32(vm, "document-id"),
        .issuer = get_hash32(vm, "issuer")};
  }
  if (payload == "set_paused") {
    return tessera::schema::set_paused_t{.paused = vm["paused"].as<bool>()};
  }
  if (payload == "update_capability_schema") {
    return tessera::schema::update_capability_schema_t{
        .schema_id = get_hash32(vm, "schema-id")};
  }
  if (payload == "authorize_upgrade") {
    return tessera::schema::authorize_upgrade_t{
        .implementation_hash = get_hash32(vm, "implementation-hash")};
  }
  if (payload == "publish_attestation") {
    return tessera::schema::publish_attestation_t{
        .record = build_attestation(vm)};
  }
  if (payload == "revoke_attestation") {
    return tessera::schema::revoke_attestation_t{
        .attestation_id = get_hash32(vm, "attestation-id")};
  }
  if (payload == "reserve") {
    return tessera::schema::reserve_t{
        .document_id = get_hash32(vm, "document-id"),
        .slot = vm["slot"].as<uint64_t>(),
        .recipient = get_hash32(vm, "recipient"),
        .value = get_amount(vm)};
  }
  if (payload == "reserve_anonymous") {
    return tessera::schema::reserve_anonymous_t{
        .document_id = get_hash32(vm, "document-id"),
        .slot = vm["slot"].as<uint64_t>(),
        .value = get_amount(vm),
        .label = get_bytes(vm, "label")};
  }
  if (payload == "claim") {
    return tessera::schema::claim_t{
        .document_id = get_hash32(vm, "document-id"),
        .token_id = get_uint64(vm, "token-id"),
        .attestation_id = get_hash32(vm, "attestation-id")};
  }
  if (payload == "cancel") {
    return tessera::schema::cancel_t{
        .document_id = get_hash32(vm, "document-id"),
        .token_id = get_uint64(vm, "token-id")};
  }
  if (payload == "transfer_token") {
    return tessera::schema::transfer_token_t{
        .token_id = get_uint64(vm, "token-id"),
        .to = get_hash32(vm, "to"),
        .attestation_id = get_optional_hash32(vm, "attestation-id")};
  }
  if (payload == "transfer_value") {
    return tessera::schema::transfer_value_t{
        .from_token_id = get_uint64(vm, "from-token-id"),
        .to_token_id = get_uint64(vm, "to-token-id"),
        .amount = get_amount(vm),
        .attestation_id = get_optional_hash32(vm, "attestation-id")};
  }
  if (payload == "transfer_value_to_address") {
    return tessera::schema::transfer_value_to_address_t{
        .from_token_id = get_uint64(vm, "from-token-id"),
        .to = get_hash32(vm, "to"),
        .amount = get_amount(vm),
        .attestation_id = get_optional_hash32(vm, "attestation-id")};
  }
  if (payload == "approve_token") {
    return tessera::schema::approve_token_t{
        .token_id = get_uint64(vm, "token-id"),
        .operator_address = get_hash32(vm, "operator")};
  }
  if (payload == "set_operator_approval") {
    return tessera::schema::set_operator_approval_t{
        .resolver_id = get_hash32(vm, "resolver-id"),
        .operator_address = get_hash32(vm, "operator"),
        .approved = vm["approved"].as<bool>()};
  }
  if (payload == "approve_slot") {
    return tessera::schema::approve_slot_t{
        .resolver_id = get_hash32(vm, "resolver-id"),
        .slot = vm["slot"].as<uint64_t>(),
        .operator_address = get_hash32(vm, "operator"),
        .approved = vm["approved"].as<bool>()};
  }
  if (payload == "approve_value") {
    return tessera::schema::approve_value_t{
        .token_id = get_uint64(vm, "token-id"),
        .operator_address = get_hash32(vm, "operator"),
        .amount = get_amount(vm)};
  }
  if (payload == "revoke_token") {
    return tessera::schema::revoke_token_t{
        .token_id = get_uint64(vm, "token-id")};
  }
  if (payload == "set_delegate") {
    return tessera::schema::set_delegate_t{
        .token_id = get_uint64(vm, "token-id"),
        .user = get_hash32(vm, "user"),
        .expires_at = vm["expires-at"].as<uint64_t>()};
  }
  if (payload == "set_delegate_signed") {
    return tessera::schema::set_delegate_signed_t{
        .token_id = get_uint64(vm, "token-id"),
        .user = get_hash32(vm, "user"),
        .expires_at = vm["expires-at"].as<uint64_t>(),
        .owner_signer = make_signer(vm, "owner"),
        .signature = make_signature(vm, "delegation-signature")};
  }
  tessera::common::critical("unsupported payload type '{}'", payload);
}

tessera::schema::transaction_t build_transaction(const po::variables_map& vm) {
  if (!vm.contains("payload")) {
    tessera::common::critical("--payload is required");
  }
  return tessera::schema::transaction_t{
      .version = 1,
      .chain_id = tessera::config::make_chain_id(
          vm["chain-id"].as<std::string>()),
      .nonce = vm["nonce"].as<uint64_t>(),
      .signer = make_signer(vm, "signer"),
      .payload = build_payload(vm),
      .signature = make_signature(vm, "signature")};
}

tessera::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/engine/state") {
    return {};
  }
  if (path == "/token" || path == "/token/owner" || path == "/token/valid" ||
      path == "/token/user" || path == "/token/locked") {
    return encoder.encode(get_uint64(vm, "token-id"));
  }
  if (path == "/capability/check") {
    return encoder.encode(std::tuple{
        get_hash32(vm, "caller"), get_hash32(vm, "document-id"),
        parse_capabilities(vm["capabilities"].as<std::string>()),
        get_hash32(vm, "attestation-id")});
  }
  if (path == "/reservation") {
    return encoder.encode(
        std::tuple{get_hash32(vm, "document-id"), vm["slot"].as<uint64_t>()});
  }
  if (path == "/slot") {
    return encoder.encode(
        std::tuple{get_hash32(vm, "resolver-id"), vm["slot"].as<uint64_t>()});
  }
  if (path == "/holder" || path == "/holder/valid" ||
      path == "/holder/tokens") {
    return encoder.encode(
        std::tuple{get_hash32(vm, "resolver-id"), get_hash32(vm, "holder")});
  }
  if (path == "/issuer") {
    return encoder.encode(get_hash32(vm, "document-id"));
  }
  if (path == "/resolver") {
    return encoder.encode(get_hash32(vm, "resolver-id"));
  }
  if (path == "/allowance") {
    return encoder.encode(
        std::tuple{get_uint64(vm, "token-id"), get_hash32(vm, "operator")});
  }
  if (path == "/attestation") {
    return encoder.encode(get_hash32(vm, "attestation-id"));
  }
  tessera::common::critical("unsupported query path '{}'", path);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  tessera_transaction_builder transaction [options]\n"
            << "  tessera_transaction_builder signing-bytes [options]\n"
            << "  tessera_transaction_builder delegation-message [options]\n"
            << "  tessera_transaction_builder query-key [options]\n"
            << "  tessera_transaction_builder chain-id [--chain-id name]\n"
            << "  tessera_transaction_builder address [signer options]\n\n"
            << "Payloads:";
  for (const auto& name : kPayloadNames) {
    std::cout << ' ' << name;
  }
  std::cout << "\n\n" << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"tessera_transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|signing-bytes|delegation-message|query-key|chain-id|"
      "address")("payload", po::value<std::string>(), "payload type")(
      "path", po::value<std::string>(), "query route")(
      "chain-id", po::value<std::string>()->default_value("tessera-local"),
      "chain name or 32 byte hex chain id")(
      "nonce", po::value<uint64_t>()->default_value(0), "transaction nonce")(
      "signer", po::value<std::string>(), "named signer hash32 hex")(
      "signer-ed25519", po::value<std::string>(), "ed25519 public key hex")(
      "signer-secp256k1", po::value<std::string>(),
      "compressed secp256k1 public key hex")(
      "signature-kind", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")("signature-hex", po::value<std::string>(),
                           "envelope signature hex")(
      "resolver-id", po::value<std::string>(), "resolver hash32 hex")(
      "resolver-kind", po::value<std::string>()->default_value("standard"),
      tessera::schema::join_names(tessera::schema::kResolverKindMappings)
          .c_str())("require-transfer-capability",
                    po::value<bool>()->default_value(false),
                    "transfers need a TRANSFER attestation")(
      "document-id", po::value<std::string>(), "document hash32 hex")(
      "issuer", po::value<std::string>(), "issuer address hex")(
      "paused", po::value<bool>()->default_value(true), "pause flag")(
      "schema-id", po::value<std::string>(), "attestation schema hash32 hex")(
      "implementation-hash", po::value<std::string>(),
      "authorized upgrade hash32 hex")(
      "attestation-id", po::value<std::string>(), "attestation hash32 hex")(
      "recipient", po::value<std::string>(), "recipient address hex")(
      "capabilities", po::value<std::string>()->default_value("claim"),
      "capability names (comma separated) or bit mask")(
      "issued-at", po::value<uint64_t>()->default_value(0),
      "attestation issue time ms")("expires-at",
                                   po::value<uint64_t>()->default_value(0),
                                   "attestation or delegation expiry ms")(
      "verified-identity", po::value<std::string>(), "identity bytes hex")(
      "verification-method", po::value<std::string>(), "method bytes hex")(
      "verification-date", po::value<uint64_t>()->default_value(0),
      "verification time ms")("contract-role", po::value<std::string>(),
                              "contract role bytes hex")(
      "legal-entity-type", po::value<std::string>(), "entity type bytes hex")(
      "notes", po::value<std::string>(), "notes bytes hex")(
      "slot", po::value<uint64_t>()->default_value(0), "slot id")(
      "amount", po::value<std::string>()->default_value("0"),
      "decimal amount")("label", po::value<std::string>(),
                        "encrypted label bytes hex")(
      "token-id", po::value<uint64_t>(), "token id")(
      "from-token-id", po::value<uint64_t>(), "source token id")(
      "to-token-id", po::value<uint64_t>(), "destination token id")(
      "to", po::value<std::string>(), "destination address hex")(
      "operator", po::value<std::string>(), "operator address hex")(
      "approved", po::value<bool>()->default_value(true), "approval flag")(
      "user", po::value<std::string>(), "delegate address hex")(
      "owner", po::value<std::string>(), "named owner signer hash32 hex")(
      "owner-ed25519", po::value<std::string>(), "owner ed25519 key hex")(
      "owner-secp256k1", po::value<std::string>(), "owner secp256k1 key hex")(
      "delegation-signature-kind",
      po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")("delegation-signature-hex",
                           po::value<std::string>(),
                           "owner delegation signature hex")(
      "delegation-nonce", po::value<uint64_t>()->default_value(0),
      "token delegation nonce")("caller", po::value<std::string>(),
                                "caller address hex")(
      "holder", po::value<std::string>(), "holder address hex");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  auto encoder = encoder_t{};

  if (command == "transaction" || command == "tx") {
    auto transaction = build_transaction(vm);
    std::cout << tessera::schema::to_hex(encoder.encode(transaction)) << '\n';
    return 0;
  }

  if (command == "signing-bytes") {
    auto transaction = build_transaction(vm);
    std::cout << tessera::schema::to_hex(
                     tessera::execution::make_signing_bytes(encoder,
                                                            transaction))
              << '\n';
    return 0;
  }

  if (command == "delegation-message") {
    auto message = tessera::execution::variants::make_delegation_message(
        encoder,
        tessera::config::make_chain_id(vm["chain-id"].as<std::string>()),
        get_uint64(vm, "token-id"), get_hash32(vm, "user"),
        vm["expires-at"].as<uint64_t>(),
        vm["delegation-nonce"].as<uint64_t>());
    std::cout << tessera::schema::to_hex(message) << '\n';
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      tessera::common::critical("query-key mode requires --path");
    }
    std::cout << tessera::schema::to_hex(build_query_key(vm)) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    std::cout << tessera::schema::to_hex(tessera::config::make_chain_id(
                     vm["chain-id"].as<std::string>()))
              << '\n';
    return 0;
  }

  if (command == "address") {
    std::cout << tessera::schema::to_hex(
                     tessera::crypto::derive_address(make_signer(vm, "signer")))
              << '\n';
    return 0;
  }

  tessera::common::critical(
      "command must be transaction|signing-bytes|delegation-message|"
      "query-key|chain-id|address");
}
