#pragma once

#include <tessera/schema/role_id.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    tessera::schema,
    role_id_t,
    tessera::schema::role_id_t::admin,
    tessera::schema::role_id_t::executor,
    tessera::schema::role_id_t::governor,
    tessera::schema::role_id_t::attestation_service)
