#pragma once

#include <warden/schema/error_code.hpp>
#include <warden/schema/event_type.hpp>
#include <warden/schema/identity.hpp>

#include <cstdint>
#include <string>
#include <vector>

// Schema type: sync result.
// Outcome of applying one identity event (or one reconciliation step) to the
// database.
namespace warden::schema {

template <uint16_t Version>
struct sync_result;

template <>
struct sync_result<1> final {
  uint16_t version{1};
  error_code code{error_code::ok};
  identity_ref_t identity;
  event_type_t type{event_type_t::created};
  std::string role;  // role name the result refers to, if any
  std::vector<std::string> missing;  // member ids that have no role yet
  std::string log;
  std::string codespace{"warden.sync"};

  bool ok() const { return code == error_code::ok; }
};

using sync_result_t = sync_result<1>;

template <uint16_t Version>
struct reconcile_report;

template <>
struct reconcile_report<1> final {
  uint16_t version{1};
  uint64_t users{};
  uint64_t groups{};
  uint64_t orphans{};
  uint64_t failures{};
  std::vector<sync_result_t> results;
};

using reconcile_report_t = reconcile_report<1>;

}  // namespace warden::schema
