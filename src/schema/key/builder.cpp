#include <warden/blake3/hash.hpp>
#include <warden/schema/key/builder.hpp>
#include <algorithm>
#include <iterator>

using namespace warden::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const warden::schema::identity_ref_t& identity) {
  write(static_cast<uint8_t>(identity.kind));
  return hash(identity.id);
}

builder& builder::hash(const std::string_view& str) {
  auto digest = warden::blake3::hash(str);
  std::ranges::copy(digest, std::back_inserter(data));
  return *this;
}
