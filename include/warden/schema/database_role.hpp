#pragma once

#include <warden/schema/identity.hpp>
#include <warden/schema/role_kind.hpp>

#include <optional>
#include <set>
#include <string>

// Schema type: database role.
// A database-native principal as read back from the catalog.
namespace warden::schema {

template <uint16_t Version>
struct database_role;

template <>
struct database_role<1> final {
  uint16_t version{1};
  std::string name;
  role_kind_t kind{role_kind_t::unmanaged};
  bool can_login{false};
  bool superuser{false};
  std::set<std::string> member_of;  // roles this role has been granted
  std::string marker;               // empty for unmanaged roles
};

using database_role_t = database_role<1>;

/// Derive kind from the marker; unmanaged when the marker is absent or
/// malformed.
inline role_kind_t classify_marker(const std::string_view marker) {
  auto identity = parse_role_marker(marker);
  if (!identity) {
    return role_kind_t::unmanaged;
  }
  return identity->kind == identity_kind_t::user ? role_kind_t::user_role
                                                 : role_kind_t::group_role;
}

}  // namespace warden::schema
