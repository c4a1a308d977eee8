#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace warden::schema {

enum class error_code : uint32_t {
  ok = 0,
  naming_conflict = 1,
  role_removal_pending = 2,
  unknown_role = 3,
  privilege_denied = 4,
  already_in_context = 5,
  connection_unsafe = 6,
  invalid_event = 7,
  database_error = 8,
  identity_missing = 9,
  statement_failed = 10,
  unmanaged_role = 11,
  queued = 12,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"ok", error_code::ok},
    std::pair<std::string_view, error_code>{"naming_conflict",
                                            error_code::naming_conflict},
    std::pair<std::string_view, error_code>{"role_removal_pending",
                                            error_code::role_removal_pending},
    std::pair<std::string_view, error_code>{"unknown_role",
                                            error_code::unknown_role},
    std::pair<std::string_view, error_code>{"privilege_denied",
                                            error_code::privilege_denied},
    std::pair<std::string_view, error_code>{"already_in_context",
                                            error_code::already_in_context},
    std::pair<std::string_view, error_code>{"connection_unsafe",
                                            error_code::connection_unsafe},
    std::pair<std::string_view, error_code>{"invalid_event",
                                            error_code::invalid_event},
    std::pair<std::string_view, error_code>{"database_error",
                                            error_code::database_error},
    std::pair<std::string_view, error_code>{"identity_missing",
                                            error_code::identity_missing},
    std::pair<std::string_view, error_code>{"statement_failed",
                                            error_code::statement_failed},
    std::pair<std::string_view, error_code>{"unmanaged_role",
                                            error_code::unmanaged_role},
    std::pair<std::string_view, error_code>{"queued", error_code::queued},
};

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

/// Codes the synchronizer journals and retries on the next pass.
inline constexpr bool is_retryable(const error_code value) {
  return value == error_code::role_removal_pending ||
         value == error_code::identity_missing ||
         value == error_code::database_error ||
         value == error_code::connection_unsafe ||
         value == error_code::queued;
}

}  // namespace warden::schema
