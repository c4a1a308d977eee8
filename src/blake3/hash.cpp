#include <blake3.h>
#include <warden/blake3/hash.hpp>

#include <algorithm>

namespace warden::blake3 {

namespace {

struct hasher final {
  blake3_hasher state{};

  hasher() { blake3_hasher_init(&state); }

  hasher& update(const void* data, const std::size_t size) {
    blake3_hasher_update(&state, data, size);
    return *this;
  }

  warden::schema::hash32_t finalize() {
    static_assert(BLAKE3_OUT_LEN == 32);
    auto output = warden::schema::hash32_t{};
    blake3_hasher_finalize(&state, output.data(), output.size());
    return output;
  }
};

}  // namespace

warden::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str.data(), str.size()).finalize();
}

warden::schema::hash32_t hash(const warden::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes.data(), bytes.size()).finalize();
}

std::string hex_digest(const std::string_view& str, const std::size_t nibbles) {
  auto digest = hash(str);
  auto hex = warden::schema::to_hex(
      warden::schema::bytes_view_t{digest.data(), digest.size()});
  hex.resize(std::min(nibbles, hex.size()));
  return hex;
}

}  // namespace warden::blake3
