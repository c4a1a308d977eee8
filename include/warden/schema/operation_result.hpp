#pragma once

#include <warden/schema/error_code.hpp>

#include <cstdint>
#include <string>

namespace warden::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  error_code code{error_code::ok};
  std::string log;
  std::string codespace;

  bool ok() const { return code == error_code::ok; }
};

using operation_result_t = operation_result<1>;

}  // namespace warden::schema
