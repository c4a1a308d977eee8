#pragma once
#include <warden/schema/database_role.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace warden::database {

inline constexpr std::string_view kInsufficientPrivilege{"42501"};
inline constexpr std::string_view kDuplicateObject{"42710"};
inline constexpr std::string_view kUndefinedObject{"42704"};
inline constexpr std::string_view kDependentObjectsStillExist{"2BP01"};
inline constexpr std::string_view kInvalidParameterValue{"22023"};
inline constexpr std::string_view kInFailedSqlTransaction{"25P02"};

/// Row of text values; SQL NULL reads as an empty string.
using text_row_t = std::vector<std::string>;

/// Failure reported by a session backend. `connection_lost` means the session
/// can no longer be trusted and must not be reused.
class session_error final : public std::runtime_error {
 public:
  session_error(const std::string& message,
                bool connection_lost,
                std::string sqlstate = {})
      : std::runtime_error{message},
        connection_lost_{connection_lost},
        sqlstate_{std::move(sqlstate)} {}

  bool connection_lost() const { return connection_lost_; }
  const std::string& sqlstate() const { return sqlstate_; }

 private:
  bool connection_lost_{false};
  std::string sqlstate_;
};

/// One database session (connection). Never shared between concurrent units
/// of work. All operations throw session_error on failure.
template <typename Library>
struct session {
  /// Look a role up by exact name.
  std::optional<warden::schema::database_role_t> find_role(
      std::string_view name);

  /// Look a role up by its identity marker.
  std::optional<warden::schema::database_role_t> find_role_by_marker(
      std::string_view marker);

  /// Every role carrying a well-formed identity marker.
  std::vector<warden::schema::database_role_t> list_managed_roles();

  /// Names of roles that are direct members of `name`.
  std::vector<std::string> members_of(std::string_view name);

  void create_role(std::string_view name,
                   bool can_login,
                   std::string_view marker);
  void rename_role(std::string_view from, std::string_view to);
  void set_login(std::string_view name, bool can_login);
  void drop_role(std::string_view name);
  void grant_membership(std::string_view group, std::string_view member);
  void revoke_membership(std::string_view group, std::string_view member);

  /// True when the role owns objects in any database of the cluster.
  bool owns_objects(std::string_view name);
  /// Sessions currently authenticated as the role.
  uint64_t active_sessions(std::string_view name);

  /// Identity the session authenticated as.
  std::string session_role();
  /// Identity statements currently execute as.
  std::string current_role();
  /// Whether the session identity may switch to `name`.
  bool can_assume(std::string_view name);
  void set_role(std::string_view name);
  void reset_role();

  /// Execute a raw statement under the current privilege context.
  void execute(std::string_view statement);

  bool ledger_contains(std::string_view entity, std::string_view digest);
  void ledger_record(std::string_view entity, std::string_view digest);

  /// Rows of a read-only query, every column as text.
  std::vector<text_row_t> fetch_rows(std::string_view query);

  /// Run `fn` inside one transaction; nested calls join the outer one. Any
  /// exception rolls the transaction back and propagates.
  template <typename Fn>
  void transaction(Fn&& fn);

  bool healthy() const;
  /// Flag the session as untrustworthy; pools discard it on release.
  void mark_unsafe();
};

/// Open a session for the backend from a backend-specific locator.
template <typename Library>
session<Library> make_session(const std::string_view& locator);

}  // namespace warden::database
