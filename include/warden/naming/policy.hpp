#pragma once

#include <warden/schema/error_code.hpp>
#include <warden/schema/identity_kind.hpp>
#include <warden/schema/operation_result.hpp>

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace warden::naming {

inline constexpr std::size_t kMaxRoleNameLength = 63;  // NAMEDATALEN - 1
inline constexpr std::string_view kHashMarker{"_h"};
inline constexpr std::size_t kHashNibbles = 16;

struct policy_options final {
  std::string user_prefix{"user_"};
  std::string group_prefix{"role_"};
  std::vector<std::string> reserved_prefixes{"pg_"};
  /// Exact names that must never be produced: built-in pseudo roles plus
  /// operator-configured unmanaged roles.
  std::set<std::string> reserved_names{"public",       "postgres",
                                       "current_user", "session_user",
                                       "current_role", "none",
                                       "all"};
  std::size_t max_length{kMaxRoleNameLength};
};

struct name_result final {
  warden::schema::error_code code{warden::schema::error_code::ok};
  std::string name;
  std::string log;

  bool ok() const { return code == warden::schema::error_code::ok; }
};

/// Deterministic mapping from (kind, identifier) to database role name.
///
/// The mapping is stateless and stable across restarts. Identifier bytes
/// outside `[a-z0-9]` are escaped as `_xx`, so distinct identifiers never share
/// a name. Over-long names are truncated and suffixed with `_h` plus a BLAKE3
/// digest of the full identity. Escaped text never contains `_h`, so past the
/// prefix it only ever marks a digest; the prefix boundary itself can read as
/// `_h` (`user_` + `hank`).
class policy final {
 public:
  explicit policy(policy_options options = {});

  /// Check the configured prefixes and limits; non-ok means every name this
  /// policy produces would be ambiguous.
  warden::schema::operation_result_t validate() const;

  name_result role_name(warden::schema::identity_kind_t kind,
                        std::string_view identifier) const;

  /// Which managed kind a role name would belong to, judged by prefix only.
  std::optional<warden::schema::identity_kind_t> classify(
      std::string_view role_name) const;

  bool is_reserved(std::string_view role_name) const;

  const policy_options& options() const { return options_; }

 private:
  const std::string& prefix(warden::schema::identity_kind_t kind) const;

  policy_options options_;
};

/// Injective escaping used for the identifier part of a role name.
std::string escape_identifier(std::string_view identifier);

}  // namespace warden::naming
