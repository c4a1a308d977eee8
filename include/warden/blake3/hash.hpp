#pragma once
#include <warden/schema/primitives.hpp>
#include <cstddef>
#include <string>
#include <string_view>

namespace warden::blake3 {

warden::schema::hash32_t hash(const std::string_view& str);
warden::schema::hash32_t hash(const warden::schema::bytes_view_t& bytes);

/// Lowercase hex of the digest, truncated to `nibbles` characters.
std::string hex_digest(const std::string_view& str, std::size_t nibbles = 64);

}  // namespace warden::blake3
