#pragma once

#include <tessera/schema/primitives.hpp>
#include <tessera/schema/transaction_event.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tessera::execution {

using event_attributes_t = std::vector<std::pair<std::string, std::string>>;

inline tessera::schema::transaction_event_t make_event(
    const std::string_view type,
    const event_attributes_t& attributes) {
  auto event = tessera::schema::transaction_event_t{.type = std::string{type}};
  event.attributes.reserve(attributes.size());
  for (const auto& [key, value] : attributes) {
    event.attributes.push_back(tessera::schema::transaction_event_attribute_t{
        .key = key, .value = value, .index = true});
  }
  return event;
}

}  // namespace tessera::execution
