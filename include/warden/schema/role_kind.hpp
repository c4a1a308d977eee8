#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: role kind.
// Classification of a database role: managed on behalf of a user, managed on
// behalf of a group, or owned by someone else and never touched.
namespace warden::schema {

enum class role_kind_t : uint8_t { user_role = 0, group_role = 1, unmanaged = 2 };

inline constexpr auto kRoleKindMappings = std::array{
    std::pair<std::string_view, role_kind_t>{"user_role",
                                             role_kind_t::user_role},
    std::pair<std::string_view, role_kind_t>{"group_role",
                                             role_kind_t::group_role},
    std::pair<std::string_view, role_kind_t>{"unmanaged",
                                             role_kind_t::unmanaged},
};

template <>
inline std::optional<role_kind_t> try_from_string<role_kind_t>(
    const std::string_view value) {
  return from_string(value, kRoleKindMappings);
}

inline constexpr std::string_view to_string(const role_kind_t value) {
  return to_string(value, kRoleKindMappings).value_or("unknown");
}

}  // namespace warden::schema
