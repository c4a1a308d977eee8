#pragma once

#include <warden/database/pool.hpp>
#include <warden/database/session.hpp>
#include <warden/naming/policy.hpp>
#include <warden/schema/identity.hpp>
#include <warden/schema/identity_event.hpp>
#include <warden/schema/sync_result.hpp>
#include <warden/sync/identity_locks.hpp>
#include <warden/sync/journal.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace warden::sync {

/// Keeps managed database roles consistent with application identities.
///
/// Every event is applied in one transaction on a leased session while the
/// identity's lock is held. Events that cannot finish yet are journaled and
/// replayed in arrival order; a new event for an identity with a blocked
/// backlog queues behind it. Entries that only wait for another identity's
/// role (`identity_missing`) do not block: later events for the same
/// identity supersede or narrow them instead.
template <typename Library>
class synchronizer final {
 public:
  using session_t = warden::database::session<Library>;

  synchronizer(warden::database::pool<Library>& pool,
               warden::naming::policy policy,
               journal& journal)
      : pool_{pool}, policy_{std::move(policy)}, journal_{journal} {}

  synchronizer(const synchronizer&) = delete;
  synchronizer& operator=(const synchronizer&) = delete;

  warden::schema::sync_result_t apply(
      const warden::schema::identity_event_t& event);

  /// Replay the journal. Succeeding entries are removed; the first retryable
  /// failure for an identity stops that identity's replay.
  std::vector<warden::schema::sync_result_t> retry_pending();

  /// Converge the database on a full snapshot of the identity store.
  warden::schema::reconcile_report_t reconcile(
      const warden::schema::directory_snapshot_t& directory);

  std::vector<warden::schema::flagged_identity_t> flagged() const {
    return journal_.flagged();
  }

  const warden::naming::policy& naming() const { return policy_; }

 private:
  using result_t = warden::schema::sync_result_t;

  template <typename Fn>
  result_t in_transaction(const warden::schema::identity_event_t& event,
                          Fn&& fn);

  result_t execute(const warden::schema::identity_event_t& event);
  std::vector<result_t> drain(const warden::schema::identity_ref_t& identity);
  bool blocked(const warden::schema::identity_ref_t& identity) const;
  void supersede(const warden::schema::identity_event_t& event);
  void retire_for_snapshot(const warden::schema::identity_ref_t& identity);
  void settle(const warden::schema::identity_event_t& event,
              const result_t& result);

  result_t dispatch(session_t& session,
                    const warden::schema::identity_event_t& event);
  result_t ensure_role(session_t& session,
                       const warden::schema::identity_event_t& event,
                       std::optional<bool> can_login);
  result_t set_login(session_t& session,
                     const warden::schema::identity_event_t& event,
                     bool can_login);
  result_t revoke_login(session_t& session,
                        const warden::schema::identity_event_t& event);
  result_t remove_role(session_t& session,
                       const warden::schema::identity_event_t& event);
  result_t change_membership(session_t& session,
                             const warden::schema::identity_event_t& event);
  result_t converge_members(session_t& session,
                            const warden::schema::application_group_t& group,
                            const std::string& group_role);

  std::optional<warden::schema::database_role_t> managed_role(
      session_t& session,
      const warden::schema::identity_ref_t& identity);

  warden::database::pool<Library>& pool_;
  warden::naming::policy policy_;
  journal& journal_;
  identity_locks locks_;
};

namespace detail {

inline warden::schema::sync_result_t make_result(
    const warden::schema::identity_event_t& event,
    const warden::schema::error_code code = warden::schema::error_code::ok,
    std::string log = {},
    std::string role = {}) {
  auto result = warden::schema::sync_result_t{};
  result.code = code;
  result.identity = event.identity;
  result.type = event.type;
  result.role = std::move(role);
  result.log = std::move(log);
  return result;
}

inline bool is_waiting(const warden::schema::error_code code) {
  return code == warden::schema::error_code::identity_missing;
}

/// The part of `event` still to do after `result`: a membership change that
/// waits for member roles keeps only the missing members.
inline warden::schema::identity_event_t remaining(
    const warden::schema::identity_event_t& event,
    const warden::schema::sync_result_t& result) {
  if (event.type != warden::schema::event_type_t::membership_changed ||
      !is_waiting(result.code) || result.missing.empty()) {
    return event;
  }
  auto rest = event;
  rest.added = result.missing;
  rest.removed.clear();
  return rest;
}

}  // namespace detail

template <typename Library>
warden::schema::sync_result_t synchronizer<Library>::apply(
    const warden::schema::identity_event_t& event) {
  using warden::schema::error_code;
  using warden::schema::event_type_t;

  if (auto reason = warden::schema::validate_event(event)) {
    spdlog::warn("Rejected {} event for {}: {}", to_string(event.type),
                 identity_key(event.identity), *reason);
    return detail::make_result(event, error_code::invalid_event, *reason);
  }

  auto held = locks_.lock(event.identity);
  supersede(event);

  if (blocked(event.identity)) {
    journal_.enqueue(event, error_code::queued, "queued behind pending events");
    auto results = drain(event.identity);
    auto backlog = journal_.pending_for(event.identity);
    auto still_pending = std::ranges::find_if(
        backlog, [&](const warden::schema::pending_entry_t& entry) {
          return entry.event == event;
        });
    if (still_pending != std::end(backlog)) {
      if (detail::is_waiting(still_pending->last_code)) {
        return detail::make_result(event, still_pending->last_code,
                                   still_pending->last_error);
      }
      return detail::make_result(event, error_code::queued,
                                 "queued behind pending events");
    }
    auto mine = std::ranges::find_if(
        std::rbegin(results), std::rend(results),
        [&](const result_t& result) { return result.type == event.type; });
    if (mine != std::rend(results)) {
      return *mine;
    }
    return detail::make_result(event);
  }

  auto waiting = journal_.has_pending(event.identity);
  auto result = execute(event);
  if (warden::schema::is_retryable(result.code)) {
    journal_.enqueue(detail::remaining(event, result), result.code, result.log);
  }
  settle(event, result);
  if (waiting && result.ok()) {
    drain(event.identity);
  }
  return result;
}

template <typename Library>
std::vector<warden::schema::sync_result_t>
synchronizer<Library>::retry_pending() {
  auto identities = std::vector<warden::schema::identity_ref_t>{};
  for (const auto& entry : journal_.pending()) {
    if (std::ranges::find(identities, entry.event.identity) ==
        std::end(identities)) {
      identities.push_back(entry.event.identity);
    }
  }

  auto results = std::vector<result_t>{};
  for (const auto& identity : identities) {
    auto held = locks_.lock(identity);
    for (auto& result : drain(identity)) {
      results.push_back(std::move(result));
    }
  }
  if (!results.empty()) {
    auto done = std::ranges::count_if(
        results, [](const result_t& result) { return result.ok(); });
    spdlog::info("Retried {} pending event(s), {} applied", results.size(),
                 done);
  }
  return results;
}

template <typename Library>
warden::schema::reconcile_report_t synchronizer<Library>::reconcile(
    const warden::schema::directory_snapshot_t& directory) {
  using warden::schema::error_code;
  using warden::schema::event_type_t;
  using warden::schema::identity_kind_t;

  auto report = warden::schema::reconcile_report_t{};
  auto record = [&](result_t result) {
    if (!result.ok()) {
      ++report.failures;
    }
    report.results.push_back(std::move(result));
  };

  for (const auto& user : directory.users) {
    const auto identity = warden::schema::identity_ref_t{
        .kind = identity_kind_t::user, .id = user.id};
    auto held = locks_.lock(identity);
    retire_for_snapshot(identity);
  }
  for (const auto& group : directory.groups) {
    const auto identity = warden::schema::identity_ref_t{
        .kind = identity_kind_t::group, .id = group.id};
    auto held = locks_.lock(identity);
    retire_for_snapshot(identity);
  }

  for (auto& result : retry_pending()) {
    record(std::move(result));
  }

  auto user_ids = std::set<std::string>{};
  for (const auto& user : directory.users) {
    user_ids.insert(user.id);
    ++report.users;
    auto event = warden::schema::identity_event_t{};
    event.type = event_type_t::created;
    event.identity = {.kind = identity_kind_t::user, .id = user.id};
    event.name = user.username;

    auto held = locks_.lock(event.identity);
    if (blocked(event.identity)) {
      record(detail::make_result(event, error_code::queued,
                                 "identity has pending events"));
      continue;
    }
    auto result = in_transaction(event, [&](session_t& session) {
      return ensure_role(session, event, user.active);
    });
    settle(event, result);
    record(std::move(result));
  }

  auto group_ids = std::set<std::string>{};
  for (const auto& group : directory.groups) {
    group_ids.insert(group.id);
    ++report.groups;
    auto event = warden::schema::identity_event_t{};
    event.type = event_type_t::membership_changed;
    event.identity = {.kind = identity_kind_t::group, .id = group.id};
    event.name = group.name;

    auto held = locks_.lock(event.identity);
    if (blocked(event.identity)) {
      record(detail::make_result(event, error_code::queued,
                                 "identity has pending events"));
      continue;
    }
    auto result = in_transaction(event, [&](session_t& session) {
      auto ensured = ensure_role(session, event, false);
      if (!ensured.ok()) {
        return ensured;
      }
      return converge_members(session, group, ensured.role);
    });
    settle(event, result);
    record(std::move(result));
  }

  auto orphans = std::vector<warden::schema::identity_ref_t>{};
  try {
    auto leased = pool_.acquire();
    for (const auto& role : leased->list_managed_roles()) {
      auto identity = warden::schema::parse_role_marker(role.marker);
      if (!identity) {
        continue;
      }
      const auto& known =
          identity->kind == identity_kind_t::user ? user_ids : group_ids;
      if (!known.contains(identity->id)) {
        orphans.push_back(*identity);
      }
    }
  } catch (const warden::database::session_error& ex) {
    spdlog::error("Could not list managed roles: {}", ex.what());
    ++report.failures;
  }

  for (const auto& identity : orphans) {
    ++report.orphans;
    auto event = warden::schema::identity_event_t{};
    event.type = event_type_t::deleted;
    event.identity = identity;
    record(apply(event));
  }

  spdlog::info(
      "Reconciled {} user(s), {} group(s), {} orphan role(s), {} failure(s)",
      report.users, report.groups, report.orphans, report.failures);
  return report;
}

template <typename Library>
template <typename Fn>
warden::schema::sync_result_t synchronizer<Library>::in_transaction(
    const warden::schema::identity_event_t& event,
    Fn&& fn) {
  using warden::schema::error_code;

  auto leased = warden::database::lease<Library>{};
  try {
    leased = pool_.acquire();
  } catch (const warden::database::session_error& ex) {
    spdlog::error("No database session for {}: {}",
                  identity_key(event.identity), ex.what());
    return detail::make_result(event, error_code::connection_unsafe, ex.what());
  }

  auto result = detail::make_result(event);
  try {
    leased->transaction([&] { result = fn(*leased); });
  } catch (const warden::database::session_error& ex) {
    spdlog::error("Failed to apply {} for {}: {}", to_string(event.type),
                  identity_key(event.identity), ex.what());
    if (ex.connection_lost()) {
      leased->mark_unsafe();
      leased.discard();
      return detail::make_result(event, error_code::connection_unsafe,
                                 ex.what());
    }
    if (ex.sqlstate() == warden::database::kDependentObjectsStillExist) {
      return detail::make_result(
          event, error_code::role_removal_pending,
          fmt::format("role still has dependent privileges or objects: {}",
                      ex.what()));
    }
    return detail::make_result(event, error_code::database_error, ex.what());
  }
  return result;
}

template <typename Library>
warden::schema::sync_result_t synchronizer<Library>::execute(
    const warden::schema::identity_event_t& event) {
  if (event.type == warden::schema::event_type_t::deleted) {
    // Committed on its own so a deferred drop still leaves the role unable
    // to log in.
    auto revoked = in_transaction(event, [&](session_t& session) {
      return revoke_login(session, event);
    });
    if (!revoked.ok()) {
      return revoked;
    }
  }
  return in_transaction(
      event, [&](session_t& session) { return dispatch(session, event); });
}

template <typename Library>
std::vector<warden::schema::sync_result_t> synchronizer<Library>::drain(
    const warden::schema::identity_ref_t& identity) {
  // Entries waiting for other roles are stepped over; when a later entry
  // completes they get another pass, since it may have created what they
  // wait for.
  auto results = std::map<uint64_t, result_t>{};
  auto again = true;
  while (again) {
    again = false;
    auto waiting = false;
    auto progressed = false;
    for (const auto& entry : journal_.pending_for(identity)) {
      auto result = execute(entry.event);
      if (warden::schema::is_retryable(result.code)) {
        auto updated = entry;
        updated.event = detail::remaining(entry.event, result);
        journal_.record_failure(updated, result.code, result.log);
        spdlog::debug("Pending {} for {} still blocked ({}), attempt {}",
                      to_string(entry.event.type), identity_key(identity),
                      to_string(result.code), entry.attempts + 1);
        const auto waits = detail::is_waiting(result.code);
        results.insert_or_assign(entry.sequence, std::move(result));
        if (waits) {
          waiting = true;
          continue;
        }
        break;
      }
      journal_.complete(entry);
      settle(entry.event, result);
      results.insert_or_assign(entry.sequence, std::move(result));
      progressed = true;
    }
    again = waiting && progressed;
  }

  auto ordered = std::vector<result_t>{};
  ordered.reserve(results.size());
  for (auto& [sequence, result] : results) {
    ordered.push_back(std::move(result));
  }
  return ordered;
}

template <typename Library>
bool synchronizer<Library>::blocked(
    const warden::schema::identity_ref_t& identity) const {
  return std::ranges::any_of(
      journal_.pending_for(identity),
      [](const warden::schema::pending_entry_t& entry) {
        return !detail::is_waiting(entry.last_code);
      });
}

template <typename Library>
void synchronizer<Library>::supersede(
    const warden::schema::identity_event_t& event) {
  using warden::schema::event_type_t;

  auto touched = std::set<std::string>{std::begin(event.added),
                                       std::end(event.added)};
  touched.insert(std::begin(event.removed), std::end(event.removed));

  journal_.revise(
      event.identity,
      [&](const warden::schema::pending_entry_t& entry)
          -> std::optional<warden::schema::identity_event_t> {
        const auto& queued = entry.event;
        if (event.type == event_type_t::created &&
            queued.type == event_type_t::deleted) {
          return std::nullopt;
        }
        if (queued.type == event_type_t::membership_changed) {
          if (event.type == event_type_t::deleted) {
            return std::nullopt;
          }
          if (event.type != event_type_t::membership_changed) {
            return queued;
          }
          // The newer change decides membership for every id it names.
          auto rest = queued;
          std::erase_if(rest.added, [&](const std::string& id) {
            return touched.contains(id);
          });
          std::erase_if(rest.removed, [&](const std::string& id) {
            return touched.contains(id);
          });
          if (rest.added.empty() && rest.removed.empty()) {
            return std::nullopt;
          }
          return rest;
        }
        if (event.type != event_type_t::membership_changed &&
            detail::is_waiting(entry.last_code)) {
          return std::nullopt;
        }
        return queued;
      });
}

template <typename Library>
void synchronizer<Library>::retire_for_snapshot(
    const warden::schema::identity_ref_t& identity) {
  // The identity exists in the snapshot, which is authoritative for its
  // membership and for anything that was only waiting on other roles.
  journal_.revise(
      identity,
      [](const warden::schema::pending_entry_t& entry)
          -> std::optional<warden::schema::identity_event_t> {
        const auto type = entry.event.type;
        if (type == warden::schema::event_type_t::membership_changed ||
            type == warden::schema::event_type_t::deleted ||
            detail::is_waiting(entry.last_code)) {
          return std::nullopt;
        }
        return entry.event;
      });
}

template <typename Library>
void synchronizer<Library>::settle(const warden::schema::identity_event_t& event,
                                   const result_t& result) {
  using warden::schema::error_code;
  if (result.code == error_code::naming_conflict) {
    journal_.flag(warden::schema::flagged_identity_t{
        .identity = event.identity,
        .name = event.name,
        .code = result.code,
        .message = result.log});
  } else if (result.ok()) {
    journal_.clear_flag(event.identity);
  }
}

template <typename Library>
warden::schema::sync_result_t synchronizer<Library>::dispatch(
    session_t& session,
    const warden::schema::identity_event_t& event) {
  using warden::schema::event_type_t;
  using warden::schema::identity_kind_t;

  const auto is_user = event.identity.kind == identity_kind_t::user;
  switch (event.type) {
    case event_type_t::created:
      return ensure_role(session, event, is_user);
    case event_type_t::renamed:
      return ensure_role(session, event,
                         is_user ? std::nullopt : std::optional<bool>{false});
    case event_type_t::deactivated:
      return set_login(session, event, false);
    case event_type_t::reactivated:
      return set_login(session, event, true);
    case event_type_t::deleted:
      return remove_role(session, event);
    case event_type_t::membership_changed:
      return change_membership(session, event);
  }
  return detail::make_result(event, warden::schema::error_code::invalid_event,
                             "unknown event type");
}

template <typename Library>
std::optional<warden::schema::database_role_t>
synchronizer<Library>::managed_role(
    session_t& session,
    const warden::schema::identity_ref_t& identity) {
  return session.find_role_by_marker(warden::schema::make_role_marker(identity));
}

template <typename Library>
warden::schema::sync_result_t synchronizer<Library>::ensure_role(
    session_t& session,
    const warden::schema::identity_event_t& event,
    const std::optional<bool> can_login) {
  using warden::schema::error_code;
  using warden::schema::role_kind_t;

  auto naming = policy_.role_name(event.identity.kind, event.name);
  if (!naming.ok()) {
    spdlog::warn("No role name for {}: {}", identity_key(event.identity),
                 naming.log);
    return detail::make_result(event, naming.code, naming.log);
  }
  const auto& name = naming.name;
  auto marker = warden::schema::make_role_marker(event.identity);

  auto existing = session.find_role_by_marker(marker);
  if (existing && existing->superuser) {
    return detail::make_result(
        event, error_code::unmanaged_role,
        fmt::format("role '{}' is a superuser and is left alone",
                    existing->name),
        existing->name);
  }

  auto occupant = session.find_role(name);
  if (occupant && occupant->marker != marker) {
    auto log =
        occupant->kind == role_kind_t::unmanaged
            ? fmt::format("role name '{}' is held by an unmanaged role", name)
            : fmt::format("role name '{}' is held by {}", name,
                          occupant->marker);
    spdlog::warn("Naming conflict for {}: {}", identity_key(event.identity),
                 log);
    return detail::make_result(event, error_code::naming_conflict,
                               std::move(log), name);
  }

  if (!existing) {
    const auto login = can_login.value_or(event.identity.kind ==
                                          warden::schema::identity_kind_t::user);
    session.create_role(name, login, marker);
    spdlog::info("Created role '{}' for {} ({})", name,
                 identity_key(event.identity), login ? "LOGIN" : "NOLOGIN");
    return detail::make_result(event, error_code::ok, {}, name);
  }

  if (existing->name != name) {
    session.rename_role(existing->name, name);
    spdlog::info("Renamed role '{}' to '{}' for {}", existing->name, name,
                 identity_key(event.identity));
  }
  if (can_login && existing->can_login != *can_login) {
    session.set_login(name, *can_login);
    spdlog::info("Set {} on role '{}'", *can_login ? "LOGIN" : "NOLOGIN",
                 name);
  }
  return detail::make_result(event, error_code::ok, {}, name);
}

template <typename Library>
warden::schema::sync_result_t synchronizer<Library>::set_login(
    session_t& session,
    const warden::schema::identity_event_t& event,
    const bool can_login) {
  using warden::schema::error_code;

  auto existing = managed_role(session, event.identity);
  if (!existing) {
    if (event.name.empty()) {
      return detail::make_result(event, error_code::identity_missing,
                                 "no role exists for the identity yet");
    }
    return ensure_role(session, event, can_login);
  }
  if (existing->superuser) {
    return detail::make_result(event, error_code::unmanaged_role,
                               "superuser roles are left alone",
                               existing->name);
  }
  if (existing->can_login != can_login) {
    session.set_login(existing->name, can_login);
    spdlog::info("Set {} on role '{}'", can_login ? "LOGIN" : "NOLOGIN",
                 existing->name);
  }
  return detail::make_result(event, error_code::ok, {}, existing->name);
}

template <typename Library>
warden::schema::sync_result_t synchronizer<Library>::revoke_login(
    session_t& session,
    const warden::schema::identity_event_t& event) {
  using warden::schema::error_code;

  auto existing = managed_role(session, event.identity);
  if (!existing) {
    return detail::make_result(event);
  }
  if (existing->superuser) {
    return detail::make_result(event, error_code::unmanaged_role,
                               "superuser roles are left alone",
                               existing->name);
  }
  if (existing->can_login) {
    session.set_login(existing->name, false);
    spdlog::info("Revoked login from role '{}'", existing->name);
  }
  return detail::make_result(event, error_code::ok, {}, existing->name);
}

template <typename Library>
warden::schema::sync_result_t synchronizer<Library>::remove_role(
    session_t& session,
    const warden::schema::identity_event_t& event) {
  using warden::schema::error_code;

  auto existing = managed_role(session, event.identity);
  if (!existing) {
    spdlog::debug("No role left for deleted {}", identity_key(event.identity));
    return detail::make_result(event);
  }
  const auto& name = existing->name;
  if (existing->superuser) {
    return detail::make_result(event, error_code::unmanaged_role,
                               "superuser roles are left alone", name);
  }

  const auto owns = session.owns_objects(name);
  const auto sessions = session.active_sessions(name);
  if (owns || sessions > 0) {
    auto log = owns ? fmt::format("role '{}' still owns objects", name)
                    : fmt::format("role '{}' has {} active session(s)", name,
                                  sessions);
    spdlog::warn("Deferring removal of {}: {}", identity_key(event.identity),
                 log);
    return detail::make_result(event, error_code::role_removal_pending,
                               std::move(log), name);
  }

  for (const auto& group : existing->member_of) {
    session.revoke_membership(group, name);
  }
  for (const auto& member : session.members_of(name)) {
    session.revoke_membership(name, member);
  }
  session.drop_role(name);
  spdlog::info("Dropped role '{}' for {}", name, identity_key(event.identity));
  return detail::make_result(event, error_code::ok, {}, name);
}

template <typename Library>
warden::schema::sync_result_t synchronizer<Library>::change_membership(
    session_t& session,
    const warden::schema::identity_event_t& event) {
  using warden::schema::error_code;
  using warden::schema::identity_kind_t;

  auto group = managed_role(session, event.identity);
  if (!group) {
    if (event.name.empty()) {
      return detail::make_result(event, error_code::identity_missing,
                                 "group role does not exist yet");
    }
    auto ensured = ensure_role(session, event, false);
    if (!ensured.ok()) {
      return ensured;
    }
    group = session.find_role(ensured.role);
    if (!group) {
      return detail::make_result(event, error_code::database_error,
                                 "group role vanished after creation");
    }
  }
  const auto& group_name = group->name;
  auto current = session.members_of(group_name);
  auto is_member = [&](const std::string& role) {
    return std::ranges::find(current, role) != std::end(current);
  };

  auto missing = std::vector<std::string>{};
  for (const auto& id : event.added) {
    auto user = managed_role(session, {.kind = identity_kind_t::user, .id = id});
    if (!user) {
      missing.push_back(id);
      continue;
    }
    if (!is_member(user->name)) {
      session.grant_membership(group_name, user->name);
      current.push_back(user->name);
      spdlog::info("Granted '{}' to '{}'", group_name, user->name);
    }
  }
  for (const auto& id : event.removed) {
    auto user = managed_role(session, {.kind = identity_kind_t::user, .id = id});
    if (user && is_member(user->name)) {
      session.revoke_membership(group_name, user->name);
      std::erase(current, user->name);
      spdlog::info("Revoked '{}' from '{}'", group_name, user->name);
    }
  }

  if (!missing.empty()) {
    auto log = std::string{"no role for user(s):"};
    for (const auto& id : missing) {
      log.push_back(' ');
      log.append(id);
    }
    auto result = detail::make_result(event, error_code::identity_missing,
                                      std::move(log), group_name);
    result.missing = std::move(missing);
    return result;
  }
  return detail::make_result(event, error_code::ok, {}, group_name);
}

template <typename Library>
warden::schema::sync_result_t synchronizer<Library>::converge_members(
    session_t& session,
    const warden::schema::application_group_t& group,
    const std::string& group_role) {
  using warden::schema::error_code;
  using warden::schema::identity_kind_t;
  using warden::schema::role_kind_t;

  auto event = warden::schema::identity_event_t{};
  event.type = warden::schema::event_type_t::membership_changed;
  event.identity = {.kind = identity_kind_t::group, .id = group.id};
  event.name = group.name;

  auto desired = std::set<std::string>{};
  auto missing = std::vector<std::string>{};
  for (const auto& id : group.members) {
    auto user = managed_role(session, {.kind = identity_kind_t::user, .id = id});
    if (!user) {
      missing.push_back(id);
      continue;
    }
    desired.insert(user->name);
  }

  auto current = std::set<std::string>{};
  for (const auto& member : session.members_of(group_role)) {
    auto role = session.find_role(member);
    if (role && role->kind == role_kind_t::user_role) {
      current.insert(member);
    }
  }

  for (const auto& member : current) {
    if (!desired.contains(member)) {
      session.revoke_membership(group_role, member);
      spdlog::info("Revoked '{}' from '{}'", group_role, member);
    }
  }
  for (const auto& member : desired) {
    if (!current.contains(member)) {
      session.grant_membership(group_role, member);
      spdlog::info("Granted '{}' to '{}'", group_role, member);
    }
  }

  if (!missing.empty()) {
    auto log = std::string{"no role for user(s):"};
    for (const auto& id : missing) {
      log.push_back(' ');
      log.append(id);
    }
    auto result = detail::make_result(event, error_code::identity_missing,
                                      std::move(log), group_role);
    result.missing = std::move(missing);
    return result;
  }
  return detail::make_result(event, error_code::ok, {}, group_role);
}

}  // namespace warden::sync
