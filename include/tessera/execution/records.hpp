#pragma once

#include <tessera/execution/context.hpp>
#include <tessera/schema/engine_state.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/resolver_state.hpp>
#include <tessera/schema/role_id.hpp>
#include <tessera/schema/token_record.hpp>
#include <optional>

// Typed accessors over the ledger keyspaces shared by every handler.
namespace tessera::execution {

bool has_role(const context& ctx,
              tessera::schema::role_id_t role,
              const tessera::schema::address_t& who);

std::optional<tessera::schema::address_t> load_issuer(
    const context& ctx,
    const tessera::schema::document_id_t& document_id);

std::optional<tessera::schema::resolver_state_t> load_resolver(
    const context& ctx,
    const tessera::schema::resolver_id_t& resolver_id);
void store_resolver(context& ctx,
                    const tessera::schema::resolver_state_t& resolver);

/// Resolver bound to a document, if the document has one.
std::optional<tessera::schema::resolver_state_t> load_document_resolver(
    const context& ctx,
    const tessera::schema::document_id_t& document_id);

std::optional<tessera::schema::token_record_t> load_token(
    const context& ctx,
    tessera::schema::token_id_t token_id);
void store_token(context& ctx, const tessera::schema::token_record_t& record);

tessera::schema::engine_state_t load_engine_state(const state& ledger);
void store_engine_state(state& ledger,
                        const tessera::schema::engine_state_t& value);

/// Take the next ledger-wide token id.
tessera::schema::token_id_t allocate_token_id(context& ctx);

}  // namespace tessera::execution
