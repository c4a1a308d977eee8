#pragma once

#include <warden/schema/identity_event.hpp>
#include <warden/schema/pending_entry.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

// Journal records travel through the SCALE codec as tuples of plain values.
namespace warden::schema::encoding::scale {

using event_record_t = std::tuple<uint16_t,
                                  uint8_t,
                                  uint8_t,
                                  std::string,
                                  std::string,
                                  std::string,
                                  std::vector<std::string>,
                                  std::vector<std::string>>;

using pending_record_t =
    std::tuple<uint64_t, event_record_t, uint32_t, uint32_t, std::string>;

using flagged_record_t =
    std::tuple<uint16_t, uint8_t, std::string, std::string, uint32_t, std::string>;

event_record_t to_record(const identity_event_t& event);
std::optional<identity_event_t> from_record(const event_record_t& record);

pending_record_t to_record(const pending_entry_t& entry);
std::optional<pending_entry_t> from_record(const pending_record_t& record);

flagged_record_t to_record(const flagged_identity_t& flagged);
std::optional<flagged_identity_t> from_record(const flagged_record_t& record);

}  // namespace warden::schema::encoding::scale
