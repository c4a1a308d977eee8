#include <warden/schema/identity_event.hpp>

#include <algorithm>
#include <spdlog/fmt/fmt.h>

namespace warden::schema {

std::optional<std::string> validate_event(const identity_event_t& event) {
  if (event.version != 1) {
    return fmt::format("unsupported event version {}", event.version);
  }
  if (event.identity.id.empty()) {
    return std::string{"event has no identity id"};
  }
  const auto is_user = event.identity.kind == identity_kind_t::user;
  switch (event.type) {
    case event_type_t::created:
      if (event.name.empty()) {
        return std::string{"created event requires a name"};
      }
      break;
    case event_type_t::renamed:
      if (event.name.empty()) {
        return std::string{"renamed event requires the new name"};
      }
      break;
    case event_type_t::deactivated:
    case event_type_t::reactivated:
      if (!is_user) {
        return fmt::format("{} applies to users only", to_string(event.type));
      }
      break;
    case event_type_t::deleted:
      break;
    case event_type_t::membership_changed: {
      if (is_user) {
        return std::string{"membership_changed applies to groups only"};
      }
      const auto has_empty = [](const std::vector<std::string>& ids) {
        return std::ranges::any_of(
            ids, [](const std::string& id) { return id.empty(); });
      };
      if (has_empty(event.added) || has_empty(event.removed)) {
        return std::string{"membership_changed lists an empty user id"};
      }
      break;
    }
  }
  return std::nullopt;
}

}  // namespace warden::schema
