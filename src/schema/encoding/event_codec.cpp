#include <warden/schema/encoding/event_codec.hpp>
#include <warden/schema/primitives.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <vector>

using namespace warden::schema;

namespace warden::schema::encoding {

namespace {

constexpr auto kFieldSeparator = '|';
constexpr auto kListSeparator = ',';
constexpr std::size_t kFieldCount = 7;

std::string escape_field(const std::string_view value) {
  auto out = std::string{};
  out.reserve(value.size());
  for (const auto c : value) {
    switch (c) {
      case '%':
        out.append("%25");
        break;
      case '|':
        out.append("%7c");
        break;
      case ',':
        out.append("%2c");
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}

std::optional<std::string> unescape_field(const std::string_view value) {
  auto out = std::string{};
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] != '%') {
      out.push_back(value[i]);
      continue;
    }
    if (i + 2 >= value.size()) {
      return std::nullopt;
    }
    auto decoded = try_from_hex(value.substr(i + 1, 2));
    if (!decoded || decoded->size() != 1) {
      return std::nullopt;
    }
    out.push_back(static_cast<char>(decoded->front()));
    i += 2;
  }
  return out;
}

std::string join_ids(const std::vector<std::string>& ids) {
  auto out = std::string{};
  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i > 0) {
      out.push_back(kListSeparator);
    }
    out.append(escape_field(ids[i]));
  }
  return out;
}

std::optional<std::vector<std::string>> split_ids(const std::string_view raw) {
  auto ids = std::vector<std::string>{};
  for (const auto& part : split(raw, kListSeparator)) {
    auto id = unescape_field(part);
    if (!id) {
      return std::nullopt;
    }
    ids.push_back(std::move(*id));
  }
  return ids;
}

}  // namespace

std::string encode_event(const identity_event_t& event) {
  auto fields = std::vector<std::string>{
      std::string{to_string(event.type)},
      std::string{to_string(event.identity.kind)},
      escape_field(event.identity.id),
      escape_field(event.name),
      escape_field(event.previous_name),
      join_ids(event.added),
      join_ids(event.removed)};
  while (fields.size() > 4 && fields.back().empty()) {
    fields.pop_back();
  }
  auto line = std::string{};
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      line.push_back(kFieldSeparator);
    }
    line.append(fields[i]);
  }
  return line;
}

std::optional<identity_event_t> decode_event(std::string_view line,
                                             std::string& error) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.remove_suffix(1);
  }
  auto fields = split(line, kFieldSeparator);
  if (fields.size() < 3 || fields.size() > kFieldCount) {
    error = fmt::format("expected 3 to {} fields, got {}", kFieldCount,
                        fields.size());
    return std::nullopt;
  }
  fields.resize(kFieldCount);

  auto type = try_from_string<event_type_t>(fields[0]);
  if (!type) {
    error = fmt::format("unknown event type '{}'", fields[0]);
    return std::nullopt;
  }
  auto kind = try_from_string<identity_kind_t>(fields[1]);
  if (!kind) {
    error = fmt::format("unknown identity kind '{}'", fields[1]);
    return std::nullopt;
  }
  auto id = unescape_field(fields[2]);
  auto name = unescape_field(fields[3]);
  auto previous_name = unescape_field(fields[4]);
  auto added = split_ids(fields[5]);
  auto removed = split_ids(fields[6]);
  if (!id || !name || !previous_name || !added || !removed) {
    error = "malformed percent escape";
    return std::nullopt;
  }

  auto event = identity_event_t{
      .type = *type,
      .identity = identity_ref_t{.kind = *kind, .id = std::move(*id)},
      .name = std::move(*name),
      .previous_name = std::move(*previous_name),
      .added = std::move(*added),
      .removed = std::move(*removed)};
  if (auto invalid = validate_event(event)) {
    error = std::move(*invalid);
    return std::nullopt;
  }
  return event;
}

}  // namespace warden::schema::encoding
