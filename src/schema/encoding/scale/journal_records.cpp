#include <warden/schema/encoding/scale/journal_records.hpp>

using namespace warden::schema;

namespace warden::schema::encoding::scale {

namespace {

std::optional<identity_kind_t> to_kind(const uint8_t value) {
  if (value > static_cast<uint8_t>(identity_kind_t::group)) {
    return std::nullopt;
  }
  return static_cast<identity_kind_t>(value);
}

std::optional<event_type_t> to_event_type(const uint8_t value) {
  if (value > static_cast<uint8_t>(event_type_t::membership_changed)) {
    return std::nullopt;
  }
  return static_cast<event_type_t>(value);
}

std::optional<error_code> to_error_code(const uint32_t value) {
  if (value > static_cast<uint32_t>(error_code::queued)) {
    return std::nullopt;
  }
  return static_cast<error_code>(value);
}

}  // namespace

event_record_t to_record(const identity_event_t& event) {
  return event_record_t{event.version,
                        static_cast<uint8_t>(event.type),
                        static_cast<uint8_t>(event.identity.kind),
                        event.identity.id,
                        event.name,
                        event.previous_name,
                        event.added,
                        event.removed};
}

std::optional<identity_event_t> from_record(const event_record_t& record) {
  const auto& [version, type, kind, id, name, previous_name, added, removed] =
      record;
  auto decoded_type = to_event_type(type);
  auto decoded_kind = to_kind(kind);
  if (version != 1 || !decoded_type || !decoded_kind) {
    return std::nullopt;
  }
  return identity_event_t{
      .version = version,
      .type = *decoded_type,
      .identity = identity_ref_t{.kind = *decoded_kind, .id = id},
      .name = name,
      .previous_name = previous_name,
      .added = added,
      .removed = removed};
}

pending_record_t to_record(const pending_entry_t& entry) {
  return pending_record_t{entry.sequence, to_record(entry.event),
                          entry.attempts,
                          static_cast<uint32_t>(entry.last_code),
                          entry.last_error};
}

std::optional<pending_entry_t> from_record(const pending_record_t& record) {
  const auto& [sequence, event, attempts, code, last_error] = record;
  auto decoded_event = from_record(event);
  auto decoded_code = to_error_code(code);
  if (!decoded_event || !decoded_code) {
    return std::nullopt;
  }
  return pending_entry_t{.sequence = sequence,
                         .event = std::move(*decoded_event),
                         .attempts = attempts,
                         .last_code = *decoded_code,
                         .last_error = last_error};
}

flagged_record_t to_record(const flagged_identity_t& flagged) {
  return flagged_record_t{flagged.version,
                          static_cast<uint8_t>(flagged.identity.kind),
                          flagged.identity.id,
                          flagged.name,
                          static_cast<uint32_t>(flagged.code),
                          flagged.message};
}

std::optional<flagged_identity_t> from_record(const flagged_record_t& record) {
  const auto& [version, kind, id, name, code, message] = record;
  auto decoded_kind = to_kind(kind);
  auto decoded_code = to_error_code(code);
  if (version != 1 || !decoded_kind || !decoded_code) {
    return std::nullopt;
  }
  return flagged_identity_t{
      .version = version,
      .identity = identity_ref_t{.kind = *decoded_kind, .id = id},
      .name = name,
      .code = *decoded_code,
      .message = message};
}

}  // namespace warden::schema::encoding::scale
