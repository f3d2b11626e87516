#pragma once

#include <cstdint>

// Schema type: query error code.
// Read-path failure taxonomy surfaced as query_result.code in the
// "tessera.query" codespace.
namespace tessera::schema {

enum class query_error_code : uint32_t {
  unsupported_path = 1,
  not_found = 2,
  invalid_key = 3,
  reentrant_call = 4,
};

}  // namespace tessera::schema
