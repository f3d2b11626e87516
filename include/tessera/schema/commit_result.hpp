#pragma once

#include <tessera/schema/primitives.hpp>
#include <cstdint>

namespace tessera::schema {

template <uint16_t Version>
struct commit_result;

template <>
struct commit_result<1> final {
  uint16_t version{1};
  int64_t committed_height{};
  hash32_t state_root{};
  // Number of state keys written by the commit.
  uint64_t written_keys{};
};

using commit_result_t = commit_result<1>;

}  // namespace tessera::schema
