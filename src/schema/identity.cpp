#include <warden/schema/identity.hpp>

#include <string_view>

namespace warden::schema {

namespace {

constexpr auto kMarkerPrefix = std::string_view{"warden:"};

}  // namespace

std::string identity_key(const identity_ref_t& identity) {
  auto key = std::string{to_string(identity.kind)};
  key.push_back(':');
  key.append(identity.id);
  return key;
}

std::string make_role_marker(const identity_ref_t& identity) {
  auto marker = std::string{kMarkerPrefix};
  marker.append(identity_key(identity));
  return marker;
}

std::optional<identity_ref_t> parse_role_marker(std::string_view marker) {
  if (!marker.starts_with(kMarkerPrefix)) {
    return std::nullopt;
  }
  marker.remove_prefix(kMarkerPrefix.size());
  auto separator = marker.find(':');
  if (separator == std::string_view::npos || separator + 1 >= marker.size()) {
    return std::nullopt;
  }
  auto kind = try_from_string<identity_kind_t>(marker.substr(0, separator));
  if (!kind) {
    return std::nullopt;
  }
  return identity_ref_t{.kind = *kind,
                        .id = std::string{marker.substr(separator + 1)}};
}

}  // namespace warden::schema
