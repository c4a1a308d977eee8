#pragma once

#include <warden/schema/error_code.hpp>
#include <warden/schema/identity_event.hpp>

#include <cstdint>
#include <string>

// Schema type: pending entry.
// A journaled identity event waiting for the next reconciliation pass.
namespace warden::schema {

template <uint16_t Version>
struct pending_entry;

template <>
struct pending_entry<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  identity_event_t event;
  uint32_t attempts{};
  error_code last_code{error_code::ok};
  std::string last_error;
};

using pending_entry_t = pending_entry<1>;

template <uint16_t Version>
struct flagged_identity;

/// Identity left unsynchronized until an operator resolves the conflict.
template <>
struct flagged_identity<1> final {
  uint16_t version{1};
  identity_ref_t identity;
  std::string name;
  error_code code{error_code::naming_conflict};
  std::string message;
};

using flagged_identity_t = flagged_identity<1>;

}  // namespace warden::schema
