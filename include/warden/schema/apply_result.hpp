#pragma once

#include <warden/schema/error_code.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: apply result.
// Outcome of applying one entity's permission declarations.
namespace warden::schema {

template <uint16_t Version>
struct apply_result;

template <>
struct apply_result<1> final {
  uint16_t version{1};
  error_code code{error_code::ok};
  std::string entity;
  std::size_t applied{};
  std::size_t skipped{};
  std::optional<std::size_t> failed_index;
  std::string log;
  std::string codespace{"warden.migration"};

  bool ok() const { return code == error_code::ok; }
};

using apply_result_t = apply_result<1>;

}  // namespace warden::schema
