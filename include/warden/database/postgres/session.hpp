#pragma once
#include <pqxx/pqxx>
#include <spdlog/spdlog.h>
#include <warden/database/session.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace warden::database {

struct postgres_session_tag {};

template <>
struct session<postgres_session_tag> final {
  std::unique_ptr<pqxx::connection> connection;

  std::optional<warden::schema::database_role_t> find_role(
      std::string_view name);
  std::optional<warden::schema::database_role_t> find_role_by_marker(
      std::string_view marker);
  std::vector<warden::schema::database_role_t> list_managed_roles();
  std::vector<std::string> members_of(std::string_view name);

  void create_role(std::string_view name,
                   bool can_login,
                   std::string_view marker);
  void rename_role(std::string_view from, std::string_view to);
  void set_login(std::string_view name, bool can_login);
  void drop_role(std::string_view name);
  void grant_membership(std::string_view group, std::string_view member);
  void revoke_membership(std::string_view group, std::string_view member);
  bool owns_objects(std::string_view name);
  uint64_t active_sessions(std::string_view name);

  std::string session_role();
  std::string current_role();
  bool can_assume(std::string_view name);
  void set_role(std::string_view name);
  void reset_role();

  void execute(std::string_view statement);
  bool ledger_contains(std::string_view entity, std::string_view digest);
  void ledger_record(std::string_view entity, std::string_view digest);

  std::vector<text_row_t> fetch_rows(std::string_view query);

  template <typename Fn>
  void transaction(Fn&& fn);

  bool healthy() const { return healthy_ && connection && connection->is_open(); }
  void mark_unsafe() { healthy_ = false; }

 private:
  template <typename... Args>
  pqxx::result run(const std::string& sql, Args&&... args);

  template <typename Fn>
  decltype(auto) guarded(Fn&& fn);

  std::vector<warden::schema::database_role_t> read_roles(
      const pqxx::result& rows);
  std::string quote_name(std::string_view name) const;

  pqxx::transaction_base* work_{nullptr};
  bool healthy_{true};
};

template <>
session<postgres_session_tag> make_session<postgres_session_tag>(
    const std::string_view& locator);

namespace detail {

/// Runs `fn` and rethrows libpqxx failures as session_error. SQL errors keep
/// their SQLSTATE; broken connections and misuse of the connection leave the
/// session unusable; conversion and range errors on results do not.
template <typename Fn>
decltype(auto) translate_errors(bool& healthy, Fn&& fn) {
  try {
    return std::forward<Fn>(fn)();
  } catch (const pqxx::sql_error& ex) {
    throw session_error{ex.what(), false, ex.sqlstate()};
  } catch (const pqxx::failure& ex) {
    healthy = false;
    throw session_error{ex.what(), true};
  } catch (const pqxx::usage_error& ex) {
    healthy = false;
    throw session_error{ex.what(), true};
  } catch (const pqxx::conversion_error& ex) {
    throw session_error{ex.what(), false};
  } catch (const pqxx::range_error& ex) {
    throw session_error{ex.what(), false};
  } catch (const pqxx::argument_error& ex) {
    throw session_error{ex.what(), false};
  }
}

/// Binds the session to an open transaction for the lifetime of the scope.
struct work_binding final {
  pqxx::transaction_base*& slot;

  work_binding(pqxx::transaction_base*& target, pqxx::transaction_base& work)
      : slot{target} {
    slot = &work;
  }
  ~work_binding() { slot = nullptr; }

  work_binding(const work_binding&) = delete;
  work_binding& operator=(const work_binding&) = delete;
};

}  // namespace detail

template <typename Fn>
decltype(auto) session<postgres_session_tag>::guarded(Fn&& fn) {
  return detail::translate_errors(healthy_, std::forward<Fn>(fn));
}

template <typename... Args>
pqxx::result session<postgres_session_tag>::run(const std::string& sql,
                                                Args&&... args) {
  if (!healthy()) {
    throw session_error{"session is not usable", true};
  }
  return guarded([&] {
    if (work_ != nullptr) {
      return work_->exec_params(sql, std::forward<Args>(args)...);
    }
    auto statement = pqxx::nontransaction{*connection};
    return statement.exec_params(sql, std::forward<Args>(args)...);
  });
}

template <typename Fn>
void session<postgres_session_tag>::transaction(Fn&& fn) {
  if (work_ != nullptr) {
    std::forward<Fn>(fn)();
    return;
  }
  if (!healthy()) {
    throw session_error{"session is not usable", true};
  }
  guarded([&] {
    auto work = pqxx::work{*connection};
    {
      auto binding = detail::work_binding{work_, work};
      std::forward<Fn>(fn)();
    }
    work.commit();
  });
}

}  // namespace warden::database
