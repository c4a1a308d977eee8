#pragma once

#include <warden/schema/identity.hpp>
#include <warden/schema/identity_event.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace warden::testing {

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

inline warden::schema::identity_ref_t user_ref(std::string id) {
  return {.kind = warden::schema::identity_kind_t::user, .id = std::move(id)};
}

inline warden::schema::identity_ref_t group_ref(std::string id) {
  return {.kind = warden::schema::identity_kind_t::group, .id = std::move(id)};
}

inline warden::schema::identity_event_t make_event(
    const warden::schema::event_type_t type,
    warden::schema::identity_ref_t identity,
    std::string name = {}) {
  auto event = warden::schema::identity_event_t{};
  event.type = type;
  event.identity = std::move(identity);
  event.name = std::move(name);
  return event;
}

inline warden::schema::identity_event_t user_created(std::string id,
                                                     std::string username) {
  return make_event(warden::schema::event_type_t::created,
                    user_ref(std::move(id)), std::move(username));
}

inline warden::schema::identity_event_t group_created(std::string id,
                                                      std::string name) {
  return make_event(warden::schema::event_type_t::created,
                    group_ref(std::move(id)), std::move(name));
}

inline warden::schema::identity_event_t renamed(
    warden::schema::identity_ref_t identity,
    std::string previous,
    std::string name) {
  auto event = make_event(warden::schema::event_type_t::renamed,
                          std::move(identity), std::move(name));
  event.previous_name = std::move(previous);
  return event;
}

inline warden::schema::identity_event_t membership_changed(
    std::string group_id,
    std::vector<std::string> added,
    std::vector<std::string> removed = {}) {
  auto event = make_event(warden::schema::event_type_t::membership_changed,
                          group_ref(std::move(group_id)));
  event.added = std::move(added);
  event.removed = std::move(removed);
  return event;
}

}  // namespace warden::testing
