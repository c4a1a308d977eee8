#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: identity kind.
// Which side of the application identity model an event or role belongs to.
namespace warden::schema {

enum class identity_kind_t : uint8_t { user = 0, group = 1 };

inline constexpr auto kIdentityKindMappings = std::array{
    std::pair<std::string_view, identity_kind_t>{"user", identity_kind_t::user},
    std::pair<std::string_view, identity_kind_t>{"group",
                                                 identity_kind_t::group},
};

template <>
inline std::optional<identity_kind_t> try_from_string<identity_kind_t>(
    const std::string_view value) {
  return from_string(value, kIdentityKindMappings);
}

inline constexpr std::string_view to_string(const identity_kind_t value) {
  return to_string(value, kIdentityKindMappings).value_or("unknown");
}

}  // namespace warden::schema
