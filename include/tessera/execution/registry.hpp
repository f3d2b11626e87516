#pragma once

#include <tessera/execution/context.hpp>
#include <tessera/execution/outcome.hpp>
#include <tessera/schema/assign_resolver.hpp>
#include <tessera/schema/authorize_upgrade.hpp>
#include <tessera/schema/create_resolver.hpp>
#include <tessera/schema/publish_attestation.hpp>
#include <tessera/schema/revoke_attestation.hpp>
#include <tessera/schema/set_issuer.hpp>
#include <tessera/schema/set_paused.hpp>
#include <tessera/schema/update_capability_schema.hpp>

// Role gated configuration of the ledger: resolvers, document bindings,
// issuers, the attestation mirror and engine-wide switches.
namespace tessera::execution::registry {

outcome_t create_resolver(context& ctx,
                          const tessera::schema::create_resolver_t& payload);
outcome_t assign_resolver(context& ctx,
                          const tessera::schema::assign_resolver_t& payload);
outcome_t set_issuer(context& ctx, const tessera::schema::set_issuer_t& payload);

outcome_t publish_attestation(
    context& ctx,
    const tessera::schema::publish_attestation_t& payload);
outcome_t revoke_attestation(
    context& ctx,
    const tessera::schema::revoke_attestation_t& payload);

outcome_t set_paused(context& ctx, const tessera::schema::set_paused_t& payload);
outcome_t update_capability_schema(
    context& ctx,
    const tessera::schema::update_capability_schema_t& payload);
outcome_t authorize_upgrade(context& ctx,
                            const tessera::schema::authorize_upgrade_t& payload);

}  // namespace tessera::execution::registry
