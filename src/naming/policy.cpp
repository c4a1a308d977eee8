#include <warden/blake3/hash.hpp>
#include <warden/naming/policy.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

using warden::schema::error_code;
using warden::schema::identity_kind_t;

namespace warden::naming {

namespace {

constexpr auto kHex = std::string_view{"0123456789abcdef"};

bool is_plain(const char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

bool is_valid_prefix(const std::string_view prefix) {
  return !prefix.empty() && std::ranges::all_of(prefix, [](const char c) {
    return is_plain(c) || c == '_';
  });
}

name_result conflict(std::string log) {
  return name_result{.code = error_code::naming_conflict, .log = std::move(log)};
}

}  // namespace

std::string escape_identifier(const std::string_view identifier) {
  auto out = std::string{};
  out.reserve(identifier.size());
  for (const auto c : identifier) {
    if (is_plain(c)) {
      out.push_back(c);
      continue;
    }
    const auto uc = static_cast<unsigned char>(c);
    out.push_back('_');
    out.push_back(kHex[(uc >> 4u) & 0x0Fu]);
    out.push_back(kHex[uc & 0x0Fu]);
  }
  return out;
}

policy::policy(policy_options options) : options_{std::move(options)} {}

warden::schema::operation_result_t policy::validate() const {
  auto result = warden::schema::operation_result_t{};
  result.codespace = "warden.naming";
  const auto& user = options_.user_prefix;
  const auto& group = options_.group_prefix;
  if (!is_valid_prefix(user) || !is_valid_prefix(group)) {
    result.code = error_code::naming_conflict;
    result.log = "role prefixes must be non-empty and use only [a-z0-9_]";
    return result;
  }
  if (user.starts_with(group) || group.starts_with(user)) {
    result.code = error_code::naming_conflict;
    result.log = fmt::format("prefixes '{}' and '{}' overlap", user, group);
    return result;
  }
  for (const auto& reserved : options_.reserved_prefixes) {
    if (user.starts_with(reserved) || group.starts_with(reserved)) {
      result.code = error_code::naming_conflict;
      result.log = fmt::format("prefix falls under reserved prefix '{}'",
                               reserved);
      return result;
    }
  }
  const auto minimum =
      std::max(user.size(), group.size()) + kHashMarker.size() + kHashNibbles + 1;
  if (options_.max_length < minimum) {
    result.code = error_code::naming_conflict;
    result.log = fmt::format("max_length {} is below the minimum {}",
                             options_.max_length, minimum);
  }
  return result;
}

const std::string& policy::prefix(const identity_kind_t kind) const {
  return kind == identity_kind_t::user ? options_.user_prefix
                                       : options_.group_prefix;
}

name_result policy::role_name(const identity_kind_t kind,
                              const std::string_view identifier) const {
  if (identifier.empty()) {
    return conflict(fmt::format("empty {} identifier", to_string(kind)));
  }

  const auto& role_prefix = prefix(kind);
  auto name = role_prefix + escape_identifier(identifier);
  if (name.size() > options_.max_length) {
    auto material = std::string{to_string(kind)};
    material.push_back(':');
    material.append(identifier);
    auto keep = options_.max_length - kHashMarker.size() - kHashNibbles;
    name.resize(keep);
    name.append(kHashMarker);
    name.append(warden::blake3::hex_digest(material, kHashNibbles));
    spdlog::debug("Role name for {} '{}' truncated to '{}'", to_string(kind),
                  identifier, name);
  }

  if (is_reserved(name)) {
    return conflict(fmt::format("role name '{}' for {} '{}' is reserved", name,
                                to_string(kind), identifier));
  }
  return name_result{.name = std::move(name)};
}

std::optional<identity_kind_t> policy::classify(
    const std::string_view role_name) const {
  if (role_name.size() > options_.user_prefix.size() &&
      role_name.starts_with(options_.user_prefix)) {
    return identity_kind_t::user;
  }
  if (role_name.size() > options_.group_prefix.size() &&
      role_name.starts_with(options_.group_prefix)) {
    return identity_kind_t::group;
  }
  return std::nullopt;
}

bool policy::is_reserved(const std::string_view role_name) const {
  if (options_.reserved_names.contains(std::string{role_name})) {
    return true;
  }
  return std::ranges::any_of(
      options_.reserved_prefixes,
      [&](const std::string& reserved) { return role_name.starts_with(reserved); });
}

}  // namespace warden::naming
