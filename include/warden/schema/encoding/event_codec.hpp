#pragma once

#include <warden/schema/identity_event.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace warden::schema::encoding {

/// Text wire format carried by NOTIFY payloads and event files:
///
///   <type>|<kind>|<id>|<name>|<previous_name>|<added>|<removed>
///
/// `added` and `removed` are comma-separated user ids. `|`, `,` and `%` inside
/// a field are percent-escaped (`%7c`, `%2c`, `%25`). Trailing empty fields may
/// be omitted.
std::string encode_event(const warden::schema::identity_event_t& event);

/// Parse one line; on failure returns std::nullopt and fills `error`.
std::optional<warden::schema::identity_event_t> decode_event(
    std::string_view line,
    std::string& error);

}  // namespace warden::schema::encoding
