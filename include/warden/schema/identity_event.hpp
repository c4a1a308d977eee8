#pragma once

#include <warden/schema/event_type.hpp>
#include <warden/schema/identity.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: identity event.
// One lifecycle notification from the identity store. Delivered at-least-once,
// so every consumer must treat it as an upsert.
namespace warden::schema {

template <uint16_t Version>
struct identity_event;

template <>
struct identity_event<1> final {
  uint16_t version{1};
  event_type_t type{event_type_t::created};
  identity_ref_t identity;
  std::string name;           // current name; the new name for `renamed`
  std::string previous_name;  // `renamed` only
  std::vector<std::string> added;    // `membership_changed`: user ids
  std::vector<std::string> removed;  // `membership_changed`: user ids

  friend bool operator==(const identity_event&,
                         const identity_event&) = default;
};

using identity_event_t = identity_event<1>;

}  // namespace warden::schema

namespace warden::schema {

/// Structural checks an event must pass before it reaches the database.
/// Returns a human-readable reason, or std::nullopt when the event is valid.
std::optional<std::string> validate_event(const identity_event_t& event);

}  // namespace warden::schema
