#pragma once

#include <prizepool/schema/event_type.hpp>
#include <prizepool/schema/transaction_event_attribute.hpp>
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: transaction event.
// Pool workflow: observable state transition for listeners and indexers.
// Indexed attributes (vault_id, account, winner) are the ones a listener
// filters on.
namespace prizepool::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  event_type_t type{};
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

inline std::optional<std::string_view> find_attribute(
    const transaction_event_t& event,
    const std::string_view key) {
  auto it = std::ranges::find_if(event.attributes, [&](const auto& attribute) {
    return attribute.key == key;
  });
  if (it == std::end(event.attributes)) {
    return std::nullopt;
  }
  return std::string_view{it->value};
}

}  // namespace prizepool::schema
