#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: event type.
// Identity lifecycle transitions observed from the identity store.
namespace warden::schema {

enum class event_type_t : uint8_t {
  created = 0,
  renamed = 1,
  deactivated = 2,
  reactivated = 3,
  deleted = 4,
  membership_changed = 5
};

inline constexpr auto kEventTypeMappings = std::array{
    std::pair<std::string_view, event_type_t>{"created", event_type_t::created},
    std::pair<std::string_view, event_type_t>{"renamed", event_type_t::renamed},
    std::pair<std::string_view, event_type_t>{"deactivated",
                                              event_type_t::deactivated},
    std::pair<std::string_view, event_type_t>{"reactivated",
                                              event_type_t::reactivated},
    std::pair<std::string_view, event_type_t>{"deleted", event_type_t::deleted},
    std::pair<std::string_view, event_type_t>{
        "membership_changed", event_type_t::membership_changed},
};

template <>
inline std::optional<event_type_t> try_from_string<event_type_t>(
    const std::string_view value) {
  return from_string(value, kEventTypeMappings);
}

inline constexpr std::string_view to_string(const event_type_t value) {
  return to_string(value, kEventTypeMappings).value_or("unknown");
}

}  // namespace warden::schema
