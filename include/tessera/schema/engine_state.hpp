#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: engine state.
// Ledger-wide settings and sequences. schema_version tracks the persisted
// layout revision; layouts only ever grow by appended fields.
namespace tessera::schema {

inline constexpr uint32_t kCurrentSchemaVersion = 1;

template <uint16_t Version>
struct engine_state;

template <>
struct engine_state<1> final {
  uint16_t version{1};
  bool paused{};
  schema_id_t capability_schema_id{};
  hash32_t authorized_upgrade{};
  uint32_t schema_version{kCurrentSchemaVersion};
  token_id_t next_token_id{};
  timestamp_milliseconds_t last_block_time{};
};

using engine_state_t = engine_state<1>;

}  // namespace tessera::schema
