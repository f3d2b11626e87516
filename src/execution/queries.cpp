#include <spdlog/spdlog.h>
#include <tessera/attestation/gateway.hpp>
#include <tessera/attestation/verifier.hpp>
#include <tessera/execution/engine.hpp>
#include <tessera/execution/queries.hpp>
#include <tessera/execution/records.hpp>
#include <tessera/execution/value_ledger.hpp>
#include <tessera/execution/variants.hpp>
#include <tessera/schema/attestation_record.hpp>
#include <tessera/schema/holder_state.hpp>
#include <tessera/schema/key/engine_keys.hpp>
#include <tessera/schema/query_error_code.hpp>
#include <tessera/schema/resolver_state.hpp>
#include <tessera/schema/slot_state.hpp>
#include <tessera/schema/token_record.hpp>

#include <array>
#include <functional>
#include <string>
#include <tuple>

namespace tessera::execution {

namespace key = tessera::schema::key;
using tessera::schema::query_error_code;

namespace {

using handler_t = std::function<tessera::schema::query_result_t(
    const query_scope&,
    const tessera::schema::bytes_view_t&)>;

tessera::schema::query_result_t make_query_error(
    const query_scope& scope,
    const query_error_code code,
    std::string log,
    const tessera::schema::bytes_view_t& key = {}) {
  return tessera::schema::query_result_t{
      .code = static_cast<uint32_t>(code),
      .log = std::move(log),
      .key = tessera::schema::make_bytes(key),
      .height = scope.height,
      .codespace = std::string{kQueryCodespace}};
}

template <typename T>
tessera::schema::query_result_t make_query_value(
    const query_scope& scope,
    const tessera::schema::bytes_view_t& key,
    const T& value) {
  return tessera::schema::query_result_t{
      .key = tessera::schema::make_bytes(key),
      .value = scope.ledger.encoder().encode(value),
      .height = scope.height};
}

/// Decode the request key, look the value up at `storage_key(key)` and
/// answer with `project(value)`.
template <typename Key, typename Stored, typename KeyFn, typename ProjectFn>
handler_t lookup(KeyFn storage_key, ProjectFn project) {
  return [storage_key, project](const query_scope& scope,
                                const tessera::schema::bytes_view_t& data) {
    auto& encoder = scope.ledger.encoder();
    auto request = encoder.try_decode<Key>(data);
    if (!request) {
      return make_query_error(scope, query_error_code::invalid_key,
                              "invalid query key", data);
    }
    auto value = scope.ledger.get<Stored>(storage_key(encoder, *request));
    if (!value) {
      return make_query_error(scope, query_error_code::not_found, "not found",
                              data);
    }
    return make_query_value(scope, data, project(scope, *value));
  }
}

template <typename Key, typename Stored, typename KeyFn>
handler_t lookup(KeyFn storage_key) {
  return lookup<Key, Stored>(
      storage_key, [](const query_scope&, const Stored& value) {
        return value;
      });
}

auto token_key() {
  return [](encoder_t& encoder, const tessera::schema::token_id_t id) {
    return key::make_token_key(encoder, id);
  };
}

auto pair_key(tessera::schema::bytes_t (*builder)(
    encoder_t&,
    const tessera::schema::resolver_id_t&,
    const tessera::schema::address_t&)) {
  return [builder](encoder_t& encoder,
                   const std::tuple<tessera::schema::resolver_id_t,
                                    tessera::schema::address_t>& request) {
    return builder(encoder, std::get<0>(request), std::get<1>(request));
  };
}

tessera::schema::query_result_t engine_info(
    const query_scope& scope,
    const tessera::schema::bytes_view_t& data) {
  return make_query_value(
      scope, data, std::tuple{scope.height, scope.state_root, scope.chain_id});
}

tessera::schema::query_result_t engine_state(
    const query_scope& scope,
    const tessera::schema::bytes_view_t& data) {
  return make_query_value(scope, data, load_engine_state(scope.ledger));
}

tessera::schema::query_result_t capability_check(
    const query_scope& scope,
    const tessera::schema::bytes_view_t& data) {
  auto request = scope.ledger.encoder()
                     .try_decode<std::tuple<tessera::schema::address_t,
                                            tessera::schema::document_id_t,
                                            uint8_t,
                                            tessera::schema::attestation_id_t>>(
                         data);
  if (!request) {
    return make_query_error(scope, query_error_code::invalid_key,
                            "invalid capability check request", data);
  }
  auto gateway = tessera::attestation::ledger_gateway{scope.ledger};
  auto verifier = tessera::attestation::verifier{gateway, scope.ledger};
  auto check = verifier.check(tessera::attestation::verification_request{
      .caller = std::get<0>(*request),
      .document_id = std::get<1>(*request),
      .required = std::get<2>(*request),
      .attestation_id = std::get<3>(*request),
      .now = load_engine_state(scope.ledger).last_block_time});
  return make_query_value(scope, data, check);
}

tessera::schema::query_result_t holder_tokens(
    const query_scope& scope,
    const tessera::schema::bytes_view_t& data) {
  auto& encoder = scope.ledger.encoder();
  auto request = encoder.try_decode<
      std::tuple<tessera::schema::resolver_id_t, tessera::schema::address_t>>(
      data);
  if (!request) {
    return make_query_error(scope, query_error_code::invalid_key,
                            "invalid holder key", data);
  }
  auto prefix = key::make_holder_token_prefix(encoder, std::get<0>(*request),
                                              std::get<1>(*request));
  auto tokens = std::vector<tessera::schema::token_id_t>{};
  for (const auto& [entry_key, entry_value] : scope.storage.list_by_prefix(
           tessera::schema::bytes_view_t{prefix.data(), prefix.size()})) {
    tokens.push_back(encoder.decode<tessera::schema::token_id_t>(
        tessera::schema::bytes_view_t{entry_value.data(), entry_value.size()}));
  }
  return make_query_value(scope, data, tokens);
}

const std::array<std::pair<std::string_view, handler_t>, 17>& routes() {
  using tessera::schema::token_record_t;
  static const auto kRoutes = std::array<std::pair<std::string_view, handler_t>,
                                         17>{
      std::pair<std::string_view, handler_t>{"/engine/info", engine_info},
      {"/engine/state", engine_state},
      {"/capability/check", capability_check},
      {"/token", lookup<tessera::schema::token_id_t, token_record_t>(
                     token_key())},
      {"/token/owner",
       lookup<tessera::schema::token_id_t, token_record_t>(
           token_key(),
           [](const query_scope&, const token_record_t& record) {
             return record.owner;
           })},
      {"/token/valid",
       lookup<tessera::schema::token_id_t, token_record_t>(
           token_key(),
           [](const query_scope&, const token_record_t& record) {
             return record.valid;
           })},
      {"/token/user",
       lookup<tessera::schema::token_id_t, token_record_t>(
           token_key(),
           [](const query_scope& scope, const token_record_t& record) {
             return variants::user_of(
                 record, load_engine_state(scope.ledger).last_block_time);
           })},
      {"/token/locked",
       lookup<tessera::schema::token_id_t, token_record_t>(
           token_key(),
           [](const query_scope&, const token_record_t& record) {
             return record.locked;
           })},
      {"/reservation",
       lookup<std::tuple<tessera::schema::document_id_t,
                         tessera::schema::slot_id_t>,
              tessera::schema::token_id_t>(
           [](encoder_t& encoder, const auto& request) {
             return key::make_reservation_key(encoder, std::get<0>(request),
                                              std::get<1>(request));
           })},
      {"/slot",
       lookup<std::tuple<tessera::schema::resolver_id_t,
                         tessera::schema::slot_id_t>,
              tessera::schema::slot_state_t>(
           [](encoder_t& encoder, const auto& request) {
             return key::make_slot_key(encoder, std::get<0>(request),
                                       std::get<1>(request));
           })},
      {"/holder",
       lookup<std::tuple<tessera::schema::resolver_id_t,
                         tessera::schema::address_t>,
              tessera::schema::holder_state_t>(
           pair_key(key::make_holder_key<encoder_t>))},
      {"/holder/valid",
       lookup<std::tuple<tessera::schema::resolver_id_t,
                         tessera::schema::address_t>,
              tessera::schema::holder_state_t>(
           pair_key(key::make_holder_key<encoder_t>),
           [](const query_scope&, const tessera::schema::holder_state_t& value) {
             return value.valid_count > 0;
           })},
      {"/holder/tokens", holder_tokens},
      {"/issuer",
       lookup<tessera::schema::document_id_t, tessera::schema::address_t>(
           [](encoder_t& encoder, const tessera::schema::document_id_t& id) {
             return key::make_issuer_key(encoder, id);
           })},
      {"/resolver",
       lookup<tessera::schema::resolver_id_t, tessera::schema::resolver_state_t>(
           [](encoder_t& encoder, const tessera::schema::resolver_id_t& id) {
             return key::make_resolver_key(encoder, id);
           })},
      {"/allowance",
       [](const query_scope& scope, const tessera::schema::bytes_view_t& data) {
         auto& encoder = scope.ledger.encoder();
         auto request = encoder.try_decode<std::tuple<
             tessera::schema::token_id_t, tessera::schema::address_t>>(data);
         if (!request) {
           return make_query_error(scope, query_error_code::invalid_key,
                                   "invalid allowance key", data);
         }
         auto record = scope.ledger.get<token_record_t>(
             key::make_token_key(encoder, std::get<0>(*request)));
         if (!record) {
           return make_query_error(scope, query_error_code::not_found,
                                   "not found", data);
         }
         return make_query_value(
             scope, data,
             value_ledger::allowance_of(*record, std::get<1>(*request)));
       }},
      {"/attestation",
       lookup<tessera::schema::attestation_id_t,
              tessera::schema::attestation_record_t>(
           [](encoder_t& encoder, const tessera::schema::attestation_id_t& id) {
             return key::make_attestation_key(encoder, id);
           })},
  };
  return kRoutes;
}

}  // namespace

tessera::schema::query_result_t route_query(
    const query_scope& scope,
    const std::string_view path,
    const tessera::schema::bytes_view_t& data) {
  for (const auto& [route, handler] : routes()) {
    if (route == path) {
      return handler(scope, data);
    }
  }
  spdlog::debug("Unsupported query path '{}'", path);
  return make_query_error(scope, query_error_code::unsupported_path,
                          "unsupported query path", data);
}

}  // namespace tessera::execution
