#pragma once

#include <prizepool/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: event type.
// Pool workflow: names of the events emitted per committed state transition.
namespace prizepool::schema {

enum class event_type_t : uint8_t {
  vault_created = 0,
  deposited = 1,
  withdrawn = 2,
  winner_selected = 3,
  vault_deleted = 4,
  admin_changed = 5,
  reserve_funded = 6
};

inline constexpr auto kEventTypeMappings = std::array{
    std::pair<std::string_view, event_type_t>{"vault_created",
                                              event_type_t::vault_created},
    std::pair<std::string_view, event_type_t>{"deposited",
                                              event_type_t::deposited},
    std::pair<std::string_view, event_type_t>{"withdrawn",
                                              event_type_t::withdrawn},
    std::pair<std::string_view, event_type_t>{"winner_selected",
                                              event_type_t::winner_selected},
    std::pair<std::string_view, event_type_t>{"vault_deleted",
                                              event_type_t::vault_deleted},
    std::pair<std::string_view, event_type_t>{"admin_changed",
                                              event_type_t::admin_changed},
    std::pair<std::string_view, event_type_t>{"reserve_funded",
                                              event_type_t::reserve_funded},
};

template <>
inline std::optional<event_type_t> try_from_string<event_type_t>(
    const std::string_view value) {
  return from_string(value, kEventTypeMappings);
}

inline constexpr std::string_view to_string(const event_type_t value) {
  return to_string(value, kEventTypeMappings).value_or("unknown");
}

}  // namespace prizepool::schema
