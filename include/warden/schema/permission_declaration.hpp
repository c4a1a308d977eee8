#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Schema type: permission declaration.
// Ordered raw statements attached to one schema entity.
namespace warden::schema {

template <uint16_t Version>
struct permission_declaration;

template <>
struct permission_declaration<1> final {
  uint16_t version{1};
  std::string entity;
  std::vector<std::string> statements;
};

using permission_declaration_t = permission_declaration<1>;

}  // namespace warden::schema
