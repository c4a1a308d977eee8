#pragma once

#include <warden/database/session.hpp>
#include <warden/schema/operation_result.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace warden::privilege {

inline constexpr std::string_view kCodespace{"warden.privilege"};

template <typename Library>
class manager;

/// Scoped privilege context. Move-only; leaving scope restores the privilege
/// state that was active before the matching enter. A context that outlives
/// its manager is detached: the manager already unwound it.
template <typename Library>
class context final {
 public:
  context(std::weak_ptr<manager<Library>*> owner, uint64_t id, std::string role)
      : owner_{std::move(owner)}, id_{id}, role_{std::move(role)} {}

  context(context&& other) noexcept
      : owner_{std::move(other.owner_)},
        id_{other.id_},
        role_{std::move(other.role_)} {
    other.owner_.reset();
  }

  context& operator=(context&& other) noexcept {
    if (this != &other) {
      exit();
      owner_ = std::move(other.owner_);
      other.owner_.reset();
      id_ = other.id_;
      role_ = std::move(other.role_);
    }
    return *this;
  }

  context(const context&) = delete;
  context& operator=(const context&) = delete;

  ~context() { exit(); }

  /// Restore the prior state. Safe to call more than once; later calls are
  /// no-ops that report ok.
  warden::schema::operation_result_t exit() {
    auto owner = std::exchange(owner_, {}).lock();
    if (!owner) {
      return warden::schema::operation_result_t{
          .codespace = std::string{kCodespace}};
    }
    return (*owner)->exit(id_);
  }

  bool active() const {
    auto owner = owner_.lock();
    return owner && (*owner)->holds(id_);
  }
  const std::string& role() const { return role_; }

 private:
  std::weak_ptr<manager<Library>*> owner_;
  uint64_t id_{};
  std::string role_;
};

template <typename Library>
struct enter_result final {
  warden::schema::operation_result_t status;
  std::optional<context<Library>> handle;

  bool ok() const { return status.ok(); }
};

struct manager_options final {
  bool allow_nesting{true};
};

/// Switches the effective role of one session. Bound to that session for its
/// whole life and never shared between threads.
///
/// Open contexts outside `session::transaction`, or at least before anything
/// in the transaction can fail: once PostgreSQL aborts a transaction it
/// rejects SET ROLE and RESET ROLE until rollback, and a restore that cannot
/// run leaves the session unsafe.
template <typename Library>
class manager final {
 public:
  using session_t = warden::database::session<Library>;

  explicit manager(session_t& session, manager_options options = {})
      : session_{session},
        options_{options},
        self_{std::make_shared<manager*>(this)} {}

  manager(const manager&) = delete;
  manager& operator=(const manager&) = delete;

  ~manager() {
    if (!frames_.empty()) {
      spdlog::warn("Privilege manager destroyed with {} open context(s)",
                   frames_.size());
      unwind(0);
    }
    // Outstanding contexts see the expired handle and turn into no-ops.
    self_.reset();
  }

  enter_result<Library> enter(std::string_view role);

  /// Run `fn` under `role`. `fn` never runs when the switch fails; the prior
  /// state is restored on every path out of `fn`.
  template <typename Fn>
  warden::schema::operation_result_t run(std::string_view role, Fn&& fn);

  std::size_t depth() const { return frames_.size(); }

  /// Role the manager believes is active; the session identity when no
  /// context is open.
  std::string active_role();

  session_t& session() { return session_; }

 private:
  friend class context<Library>;

  struct frame final {
    std::string role;
    std::string previous;
    uint64_t id{};
  };

  warden::schema::operation_result_t exit(uint64_t id);
  warden::schema::operation_result_t unwind(std::size_t depth);
  bool holds(uint64_t id) const;
  const std::string& default_role();

  static warden::schema::operation_result_t make_status(
      warden::schema::error_code code,
      std::string log = {}) {
    return warden::schema::operation_result_t{
        .code = code,
        .log = std::move(log),
        .codespace = std::string{kCodespace}};
  }

  session_t& session_;
  manager_options options_;
  std::vector<frame> frames_;
  std::optional<std::string> default_role_;
  uint64_t next_id_{1};
  std::shared_ptr<manager*> self_;
};

template <typename Library>
enter_result<Library> manager<Library>::enter(const std::string_view role) {
  using warden::schema::error_code;

  if (!session_.healthy()) {
    return {.status = make_status(error_code::connection_unsafe,
                                  "session is marked unsafe")};
  }
  if (!frames_.empty() && !options_.allow_nesting) {
    return {.status = make_status(
                error_code::already_in_context,
                fmt::format("already running as '{}'", frames_.back().role))};
  }

  auto previous = std::string{};
  try {
    default_role();
    if (!session_.find_role(role)) {
      return {.status = make_status(error_code::unknown_role,
                                    fmt::format("role '{}' does not exist",
                                                role))};
    }
    if (!session_.can_assume(role)) {
      return {.status = make_status(
                  error_code::privilege_denied,
                  fmt::format("session may not assume role '{}'", role))};
    }
    previous = session_.current_role();
    session_.set_role(role);
  } catch (const warden::database::session_error& ex) {
    if (ex.sqlstate() == warden::database::kInsufficientPrivilege) {
      return {.status = make_status(error_code::privilege_denied, ex.what())};
    }
    if (ex.sqlstate() == warden::database::kInvalidParameterValue ||
        ex.sqlstate() == warden::database::kUndefinedObject) {
      return {.status = make_status(error_code::unknown_role, ex.what())};
    }
    if (!ex.connection_lost()) {
      // The server rejected the switch, e.g. 25P02 inside an aborted
      // transaction; the session still runs as before.
      spdlog::warn("Could not enter role '{}': {}", role, ex.what());
      return {.status = make_status(error_code::database_error, ex.what())};
    }
    spdlog::error("Failed to enter role '{}': {}", role, ex.what());
    session_.mark_unsafe();
    return {.status = make_status(error_code::connection_unsafe, ex.what())};
  }

  auto confirmed = std::string{};
  try {
    confirmed = session_.current_role();
  } catch (const warden::database::session_error& ex) {
    confirmed.clear();
    spdlog::error("Could not confirm role '{}': {}", role, ex.what());
  }
  if (confirmed != role) {
    spdlog::error("Session runs as '{}' after switching to '{}'", confirmed,
                  role);
    session_.mark_unsafe();
    return {.status = make_status(error_code::connection_unsafe,
                                  "role switch could not be confirmed")};
  }

  auto id = next_id_++;
  frames_.push_back(
      frame{.role = std::string{role}, .previous = previous, .id = id});
  spdlog::debug("Entered role '{}' (depth {})", role, frames_.size());
  return {.status = make_status(error_code::ok),
          .handle = context<Library>{self_, id, std::string{role}}};
}

template <typename Library>
template <typename Fn>
warden::schema::operation_result_t manager<Library>::run(
    const std::string_view role,
    Fn&& fn) {
  auto entered = enter(role);
  if (!entered.ok()) {
    return entered.status;
  }
  std::invoke(std::forward<Fn>(fn));
  return entered.handle->exit();
}

template <typename Library>
std::string manager<Library>::active_role() {
  if (!frames_.empty()) {
    return frames_.back().role;
  }
  return default_role();
}

template <typename Library>
warden::schema::operation_result_t manager<Library>::exit(const uint64_t id) {
  auto it = std::ranges::find_if(
      frames_, [&](const frame& open) { return open.id == id; });
  if (it == std::end(frames_)) {
    return make_status(warden::schema::error_code::ok);
  }
  return unwind(static_cast<std::size_t>(std::distance(std::begin(frames_), it)));
}

template <typename Library>
warden::schema::operation_result_t manager<Library>::unwind(
    const std::size_t depth) {
  using warden::schema::error_code;

  while (frames_.size() > depth) {
    auto closing = std::move(frames_.back());
    frames_.pop_back();
    try {
      if (closing.previous == default_role()) {
        session_.reset_role();
      } else {
        session_.set_role(closing.previous);
      }
      auto confirmed = session_.current_role();
      if (confirmed != closing.previous) {
        spdlog::error("Restored '{}' but session runs as '{}'",
                      closing.previous, confirmed);
        session_.mark_unsafe();
        frames_.clear();
        return make_status(error_code::connection_unsafe,
                           "restore could not be confirmed");
      }
    } catch (const warden::database::session_error& ex) {
      spdlog::error("Failed to leave role '{}': {}", closing.role, ex.what());
      session_.mark_unsafe();
      frames_.clear();
      return make_status(error_code::connection_unsafe, ex.what());
    }
    spdlog::debug("Left role '{}', back to '{}'", closing.role,
                  closing.previous);
  }
  return make_status(error_code::ok);
}

template <typename Library>
bool manager<Library>::holds(const uint64_t id) const {
  return std::ranges::any_of(frames_,
                             [&](const frame& open) { return open.id == id; });
}

template <typename Library>
const std::string& manager<Library>::default_role() {
  if (!default_role_) {
    default_role_ = session_.session_role();
  }
  return *default_role_;
}

}  // namespace warden::privilege
