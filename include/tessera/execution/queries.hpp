#pragma once

#include <tessera/execution/state.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/query_result.hpp>
#include <string_view>

namespace tessera::execution {

/// Committed view a query runs against.
struct query_scope final {
  const state& ledger;
  const storage_t& storage;
  tessera::schema::hash32_t chain_id{};
  int64_t height{};
  tessera::schema::hash32_t state_root{};
};

/// Route a read request. `data` is the SCALE encoded key of the route:
///
///   /engine/info        -                    -> (height, state_root, chain_id)
///   /engine/state       -                    -> engine_state
///   /capability/check   (caller, document, required bits, attestation)
///                                            -> capability_check
///   /token              token_id             -> token_record
///   /token/owner        token_id             -> address
///   /token/valid        token_id             -> bool
///   /token/user         token_id             -> address (zero once expired)
///   /token/locked       token_id             -> bool
///   /reservation        (document, slot)     -> token_id
///   /slot               (resolver, slot)     -> slot_state
///   /holder             (resolver, holder)   -> holder_state
///   /holder/valid       (resolver, holder)   -> bool
///   /holder/tokens      (resolver, holder)   -> vector<token_id>
///   /issuer             document             -> address
///   /resolver           resolver             -> resolver_state
///   /allowance          (token_id, spender)  -> amount
///   /attestation        attestation          -> attestation_record
tessera::schema::query_result_t route_query(
    const query_scope& scope,
    std::string_view path,
    const tessera::schema::bytes_view_t& data);

}  // namespace tessera::execution
