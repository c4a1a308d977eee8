#pragma once

#include <warden/database/session.hpp>
#include <warden/schema/identity.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <string>
#include <string_view>

namespace warden::database {

/// Queries that read the identity store. Every column is read as text.
///   users:   id, username, display name, active (true/false)
///   groups:  id, name
///   members: group id, user id
struct directory_queries final {
  std::string users{
      "SELECT id::text, username, "
      "COALESCE(NULLIF(trim(first_name || ' ' || last_name), ''), username), "
      "is_active::text FROM auth_user ORDER BY id"};
  std::string groups{"SELECT id::text, name FROM auth_group ORDER BY id"};
  std::string members{
      "SELECT group_id::text, user_id::text FROM auth_user_groups "
      "ORDER BY group_id, user_id"};
};

inline bool parse_flag(const std::string_view value) {
  return value == "true" || value == "t" || value == "1" || value == "yes" ||
         value == "on";
}

/// Snapshot the identity store for a reconciliation pass. Throws
/// session_error when a query fails; malformed rows are skipped.
template <typename Library>
warden::schema::directory_snapshot_t load_directory(
    session<Library>& session,
    const directory_queries& queries) {
  auto snapshot = warden::schema::directory_snapshot_t{};

  for (const auto& row : session.fetch_rows(queries.users)) {
    if (row.size() < 2 || row[0].empty()) {
      spdlog::warn("Skipping user row with {} column(s)", row.size());
      continue;
    }
    auto user = warden::schema::application_user_t{};
    user.id = row[0];
    user.username = row[1];
    user.display_name = row.size() > 2 ? row[2] : row[1];
    user.active = row.size() > 3 ? parse_flag(row[3]) : true;
    snapshot.users.push_back(std::move(user));
  }

  auto index = std::map<std::string, std::size_t>{};
  for (const auto& row : session.fetch_rows(queries.groups)) {
    if (row.size() < 2 || row[0].empty()) {
      spdlog::warn("Skipping group row with {} column(s)", row.size());
      continue;
    }
    index[row[0]] = snapshot.groups.size();
    snapshot.groups.push_back(
        warden::schema::application_group_t{.id = row[0], .name = row[1]});
  }

  for (const auto& row : session.fetch_rows(queries.members)) {
    if (row.size() < 2) {
      continue;
    }
    auto it = index.find(row[0]);
    if (it == std::end(index)) {
      spdlog::debug("Membership row for unknown group {}", row[0]);
      continue;
    }
    snapshot.groups[it->second].members.insert(row[1]);
  }

  spdlog::debug("Loaded directory snapshot: {} user(s), {} group(s)",
                snapshot.users.size(), snapshot.groups.size());
  return snapshot;
}

}  // namespace warden::database
