#include <warden/database/postgres/session.hpp>

using warden::schema::classify_marker;
using warden::schema::database_role_t;
using warden::schema::role_kind_t;

namespace warden::database {

namespace {

constexpr auto kRoleColumns = std::string_view{
    "SELECT r.rolname, r.rolcanlogin, r.rolsuper, "
    "COALESCE(shobj_description(r.oid, 'pg_authid'), '') "
    "FROM pg_roles r "};

constexpr auto kMembershipQuery = std::string_view{
    "SELECT g.rolname FROM pg_auth_members m "
    "JOIN pg_roles g ON g.oid = m.roleid "
    "JOIN pg_roles u ON u.oid = m.member "
    "WHERE u.rolname = $1 ORDER BY 1"};

constexpr auto kLedgerTable = std::string_view{
    "CREATE TABLE IF NOT EXISTS warden_permission_ledger ("
    "entity text NOT NULL, "
    "digest text NOT NULL, "
    "applied_at timestamptz NOT NULL DEFAULT now(), "
    "PRIMARY KEY (entity, digest))"};

std::string sql(const std::string_view head, const std::string_view tail = {}) {
  auto text = std::string{head};
  text.append(tail);
  return text;
}

}  // namespace

template <>
session<postgres_session_tag> make_session<postgres_session_tag>(
    const std::string_view& locator) {
  auto opened = session<postgres_session_tag>{};
  try {
    opened.connection =
        std::make_unique<pqxx::connection>(std::string{locator});
  } catch (const pqxx::broken_connection& ex) {
    spdlog::error("Failed to connect to PostgreSQL: {}", ex.what());
    throw session_error{ex.what(), true};
  }
  spdlog::debug("Opened PostgreSQL session to database '{}'",
                opened.connection->dbname());
  return opened;
}

std::string session<postgres_session_tag>::quote_name(
    const std::string_view name) const {
  return connection->quote_name(name);
}

std::vector<database_role_t> session<postgres_session_tag>::read_roles(
    const pqxx::result& rows) {
  return guarded([&] {
    auto roles = std::vector<database_role_t>{};
    roles.reserve(rows.size());
    for (const auto& row : rows) {
      auto role = database_role_t{};
      role.name = row[0].as<std::string>();
      role.can_login = row[1].as<bool>();
      role.superuser = row[2].as<bool>();
      role.marker = row[3].as<std::string>();
      role.kind = classify_marker(role.marker);
      for (const auto& membership :
           run(std::string{kMembershipQuery}, role.name)) {
        role.member_of.insert(membership[0].as<std::string>());
      }
      roles.push_back(std::move(role));
    }
    return roles;
  });
}

std::optional<database_role_t> session<postgres_session_tag>::find_role(
    const std::string_view name) {
  auto roles = read_roles(
      run(sql(kRoleColumns, "WHERE r.rolname = $1"), std::string{name}));
  if (roles.empty()) {
    return std::nullopt;
  }
  return std::move(roles.front());
}

std::optional<database_role_t>
session<postgres_session_tag>::find_role_by_marker(
    const std::string_view marker) {
  auto roles = read_roles(
      run(sql(kRoleColumns,
              "WHERE shobj_description(r.oid, 'pg_authid') = $1 ORDER BY 1"),
          std::string{marker}));
  if (roles.empty()) {
    return std::nullopt;
  }
  if (roles.size() > 1) {
    spdlog::warn("Marker '{}' is carried by {} roles; using '{}'", marker,
                 roles.size(), roles.front().name);
  }
  return std::move(roles.front());
}

std::vector<database_role_t>
session<postgres_session_tag>::list_managed_roles() {
  auto roles = read_roles(run(sql(
      kRoleColumns,
      "WHERE shobj_description(r.oid, 'pg_authid') LIKE 'warden:%' "
      "ORDER BY 1")));
  std::erase_if(roles, [](const database_role_t& role) {
    return role.kind == role_kind_t::unmanaged;
  });
  return roles;
}

std::vector<std::string> session<postgres_session_tag>::members_of(
    const std::string_view name) {
  auto members = std::vector<std::string>{};
  auto rows = run(
      "SELECT u.rolname FROM pg_auth_members m "
      "JOIN pg_roles g ON g.oid = m.roleid "
      "JOIN pg_roles u ON u.oid = m.member "
      "WHERE g.rolname = $1 ORDER BY 1",
      std::string{name});
  guarded([&] {
    for (const auto& row : rows) {
      members.push_back(row[0].as<std::string>());
    }
  });
  return members;
}

void session<postgres_session_tag>::create_role(const std::string_view name,
                                                const bool can_login,
                                                const std::string_view marker) {
  auto quoted = quote_name(name);
  run(fmt::format("CREATE ROLE {} {} NOSUPERUSER NOCREATEDB NOCREATEROLE "
                  "INHERIT",
                  quoted, can_login ? "LOGIN" : "NOLOGIN"));
  run(fmt::format("COMMENT ON ROLE {} IS {}", quoted,
                  connection->quote(std::string{marker})));
}

void session<postgres_session_tag>::rename_role(const std::string_view from,
                                                const std::string_view to) {
  run(fmt::format("ALTER ROLE {} RENAME TO {}", quote_name(from),
                  quote_name(to)));
}

void session<postgres_session_tag>::set_login(const std::string_view name,
                                              const bool can_login) {
  run(fmt::format("ALTER ROLE {} {}", quote_name(name),
                  can_login ? "LOGIN" : "NOLOGIN"));
}

void session<postgres_session_tag>::drop_role(const std::string_view name) {
  run(fmt::format("DROP ROLE IF EXISTS {}", quote_name(name)));
}

void session<postgres_session_tag>::grant_membership(
    const std::string_view group,
    const std::string_view member) {
  run(fmt::format("GRANT {} TO {}", quote_name(group), quote_name(member)));
}

void session<postgres_session_tag>::revoke_membership(
    const std::string_view group,
    const std::string_view member) {
  run(fmt::format("REVOKE {} FROM {}", quote_name(group), quote_name(member)));
}

bool session<postgres_session_tag>::owns_objects(const std::string_view name) {
  auto rows = run(
      "SELECT EXISTS (SELECT 1 FROM pg_shdepend d "
      "JOIN pg_roles r ON r.oid = d.refobjid "
      "WHERE r.rolname = $1 "
      "AND d.refclassid = 'pg_authid'::regclass AND d.deptype = 'o')",
      std::string{name});
  return guarded([&] { return rows[0][0].as<bool>(); });
}

uint64_t session<postgres_session_tag>::active_sessions(
    const std::string_view name) {
  auto rows = run("SELECT count(*) FROM pg_stat_activity WHERE usename = $1",
                  std::string{name});
  return guarded([&] { return rows[0][0].as<uint64_t>(); });
}

std::string session<postgres_session_tag>::session_role() {
  auto rows = run("SELECT session_user");
  return guarded([&] { return rows[0][0].as<std::string>(); });
}

std::string session<postgres_session_tag>::current_role() {
  auto rows = run("SELECT current_user");
  return guarded([&] { return rows[0][0].as<std::string>(); });
}

bool session<postgres_session_tag>::can_assume(const std::string_view name) {
  auto rows = run(
      "SELECT pg_has_role(session_user, r.oid, 'MEMBER') "
      "FROM pg_roles r WHERE r.rolname = $1",
      std::string{name});
  return guarded([&] { return !rows.empty() && rows[0][0].as<bool>(); });
}

void session<postgres_session_tag>::set_role(const std::string_view name) {
  run(fmt::format("SET ROLE {}", quote_name(name)));
}

void session<postgres_session_tag>::reset_role() {
  run("RESET ROLE");
}

void session<postgres_session_tag>::execute(const std::string_view statement) {
  run(std::string{statement});
}

bool session<postgres_session_tag>::ledger_contains(
    const std::string_view entity,
    const std::string_view digest) {
  run(std::string{kLedgerTable});
  auto rows = run(
      "SELECT EXISTS (SELECT 1 FROM warden_permission_ledger "
      "WHERE entity = $1 AND digest = $2)",
      std::string{entity}, std::string{digest});
  return guarded([&] { return rows[0][0].as<bool>(); });
}

void session<postgres_session_tag>::ledger_record(
    const std::string_view entity,
    const std::string_view digest) {
  run(std::string{kLedgerTable});
  run("INSERT INTO warden_permission_ledger (entity, digest) VALUES ($1, $2) "
      "ON CONFLICT DO NOTHING",
      std::string{entity}, std::string{digest});
}

std::vector<text_row_t> session<postgres_session_tag>::fetch_rows(
    const std::string_view query) {
  auto rows = run(std::string{query});
  return guarded([&] {
    auto out = std::vector<text_row_t>{};
    for (const auto& row : rows) {
      auto values = text_row_t{};
      values.reserve(row.size());
      for (const auto& field : row) {
        values.push_back(field.is_null() ? std::string{}
                                         : field.as<std::string>());
      }
      out.push_back(std::move(values));
    }
    return out;
  });
}

}  // namespace warden::database
