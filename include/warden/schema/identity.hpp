#pragma once

#include <warden/schema/identity_kind.hpp>

#include <compare>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

// Schema type: identity.
// Application-side principals as observed from the identity store. `id` is the
// stable, immutable key; `name` is the mutable handle roles are named after.
namespace warden::schema {

struct identity_ref final {
  identity_kind_t kind{identity_kind_t::user};
  std::string id;

  friend bool operator==(const identity_ref&, const identity_ref&) = default;
  friend auto operator<=>(const identity_ref&, const identity_ref&) = default;
};

using identity_ref_t = identity_ref;

template <uint16_t Version>
struct application_user;

template <>
struct application_user<1> final {
  uint16_t version{1};
  std::string id;
  std::string username;
  std::string display_name;
  bool active{true};
};

using application_user_t = application_user<1>;

template <uint16_t Version>
struct application_group;

template <>
struct application_group<1> final {
  uint16_t version{1};
  std::string id;
  std::string name;
  std::set<std::string> members;  // application user ids
};

using application_group_t = application_group<1>;

/// Full view of the identity store used by a reconciliation pass.
struct directory_snapshot final {
  std::vector<application_user_t> users;
  std::vector<application_group_t> groups;
};

using directory_snapshot_t = directory_snapshot;

/// Stable textual key for per-identity locking and logging, e.g. `user:42`.
std::string identity_key(const identity_ref_t& identity);

/// Marker stored on a managed role binding it to its identity, e.g.
/// `warden:user:42`.
std::string make_role_marker(const identity_ref_t& identity);

/// Inverse of make_role_marker; std::nullopt for anything that is not a
/// well-formed marker (which makes the role unmanaged).
std::optional<identity_ref_t> parse_role_marker(std::string_view marker);

}  // namespace warden::schema
