#pragma once

#include <warden/blake3/hash.hpp>
#include <warden/database/session.hpp>
#include <warden/schema/apply_result.hpp>
#include <warden/schema/permission_declaration.hpp>

#include <spdlog/spdlog.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace warden::migration {

/// Ledger key of a statement: BLAKE3 of its text.
inline std::string statement_digest(const std::string_view statement) {
  return warden::blake3::hex_digest(statement);
}

/// Applies permission declarations during schema migration.
///
/// Runs at the session's own identity. Each entity's statements execute in
/// declared order in one transaction together with their ledger rows, so a
/// batch is either recorded completely or not at all and re-running it skips
/// what already landed.
template <typename Library>
class applier final {
 public:
  using session_t = warden::database::session<Library>;

  explicit applier(session_t& session) : session_{session} {}

  warden::schema::apply_result_t apply(
      std::string_view entity,
      const std::vector<std::string>& statements);

  warden::schema::apply_result_t apply(
      const warden::schema::permission_declaration_t& declaration) {
    return apply(declaration.entity, declaration.statements);
  }

  /// Apply entities in order; stops after the first failure.
  std::vector<warden::schema::apply_result_t> apply_all(
      const std::vector<warden::schema::permission_declaration_t>&
          declarations);

 private:
  session_t& session_;
};

template <typename Library>
warden::schema::apply_result_t applier<Library>::apply(
    const std::string_view entity,
    const std::vector<std::string>& statements) {
  using warden::schema::error_code;

  auto result = warden::schema::apply_result_t{};
  result.entity = std::string{entity};

  if (!session_.healthy()) {
    result.code = error_code::connection_unsafe;
    result.log = "session is marked unsafe";
    return result;
  }
  try {
    auto current = session_.current_role();
    auto own = session_.session_role();
    if (current != own) {
      result.code = error_code::already_in_context;
      result.log = fmt::format(
          "declarations must run as '{}', session is running as '{}'", own,
          current);
      spdlog::warn("Refused declarations for '{}': {}", entity, result.log);
      return result;
    }
  } catch (const warden::database::session_error& ex) {
    result.code = error_code::connection_unsafe;
    result.log = ex.what();
    return result;
  }

  auto index = std::size_t{};
  auto applied = std::size_t{};
  auto skipped = std::size_t{};
  try {
    session_.transaction([&] {
      for (index = 0; index < statements.size(); ++index) {
        auto digest = statement_digest(statements[index]);
        if (session_.ledger_contains(entity, digest)) {
          ++skipped;
          continue;
        }
        session_.execute(statements[index]);
        session_.ledger_record(entity, digest);
        ++applied;
      }
    });
  } catch (const warden::database::session_error& ex) {
    result.code = ex.connection_lost() ? error_code::connection_unsafe
                                       : error_code::statement_failed;
    result.failed_index = index;
    result.log = ex.what();
    spdlog::error("Declaration {} for '{}' failed, batch rolled back: {}",
                  index, entity, ex.what());
    return result;
  }

  result.applied = applied;
  result.skipped = skipped;
  spdlog::info("Applied {} declaration(s) for '{}', {} already present",
               applied, entity, skipped);
  return result;
}

template <typename Library>
std::vector<warden::schema::apply_result_t> applier<Library>::apply_all(
    const std::vector<warden::schema::permission_declaration_t>& declarations) {
  auto results = std::vector<warden::schema::apply_result_t>{};
  for (const auto& declaration : declarations) {
    results.push_back(apply(declaration));
    if (!results.back().ok()) {
      break;
    }
  }
  return results;
}

}  // namespace warden::migration
