#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: authorize upgrade.
// Governor payload: records the implementation hash approved for upgrade.
namespace tessera::schema {

template <uint16_t Version>
struct authorize_upgrade;

template <>
struct authorize_upgrade<1> final {
  uint16_t version{1};
  hash32_t implementation_hash{};
};

using authorize_upgrade_t = authorize_upgrade<1>;

}  // namespace tessera::schema
