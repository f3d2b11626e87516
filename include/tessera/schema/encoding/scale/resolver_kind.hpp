#pragma once

#include <tessera/schema/resolver_kind.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(tessera::schema,
                             resolver_kind_t,
                             tessera::schema::resolver_kind_t::standard,
                             tessera::schema::resolver_kind_t::value_ledger,
                             tessera::schema::resolver_kind_t::permanent_lock,
                             tessera::schema::resolver_kind_t::revocable,
                             tessera::schema::resolver_kind_t::delegated_role)
