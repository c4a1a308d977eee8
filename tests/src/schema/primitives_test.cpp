#include <gtest/gtest.h>
#include <warden/blake3/hash.hpp>
#include <warden/schema/database_role.hpp>
#include <warden/schema/primitives.hpp>

TEST(primitives, hex_round_trips_bytes) {
  auto payload = warden::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF};
  auto encoded = warden::schema::to_hex(payload);
  EXPECT_EQ(encoded, "010203feff");
  auto decoded = warden::schema::try_from_hex(encoded);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, payload);
}

TEST(primitives, try_from_hex_rejects_invalid_input) {
  EXPECT_FALSE(warden::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(warden::schema::try_from_hex("zz").has_value());
  EXPECT_TRUE(warden::schema::try_from_hex("0x0a").has_value());
}

TEST(primitives, split_keeps_empty_fields) {
  auto parts = warden::schema::split("a||b|", '|');
  EXPECT_EQ(parts, (std::vector<std::string>{"a", "", "b", ""}));
  EXPECT_TRUE(warden::schema::split("", '|').empty());
}

TEST(primitives, to_lower_ascii_leaves_other_bytes) {
  EXPECT_EQ(warden::schema::to_lower_ascii("SmItH"), "smith");
  EXPECT_EQ(warden::schema::to_lower_ascii("\xC3\x89"), "\xC3\x89");
}

TEST(primitives, blake3_hex_digest_is_stable_and_truncates) {
  auto full = warden::blake3::hex_digest("user:42");
  EXPECT_EQ(full.size(), 64u);
  EXPECT_EQ(full, warden::blake3::hex_digest("user:42"));
  EXPECT_NE(full, warden::blake3::hex_digest("user:43"));
  EXPECT_EQ(warden::blake3::hex_digest("user:42", 16), full.substr(0, 16));
}

TEST(primitives, role_markers_round_trip_and_reject_garbage) {
  auto identity = warden::schema::identity_ref_t{
      .kind = warden::schema::identity_kind_t::group, .id = "7"};
  auto marker = warden::schema::make_role_marker(identity);
  EXPECT_EQ(marker, "warden:group:7");
  EXPECT_EQ(warden::schema::parse_role_marker(marker), identity);

  EXPECT_FALSE(warden::schema::parse_role_marker("").has_value());
  EXPECT_FALSE(warden::schema::parse_role_marker("backup account").has_value());
  EXPECT_FALSE(warden::schema::parse_role_marker("warden:robot:1").has_value());
  EXPECT_FALSE(warden::schema::parse_role_marker("warden:user:").has_value());
  EXPECT_EQ(warden::schema::classify_marker("warden:user:1"),
            warden::schema::role_kind_t::user_role);
  EXPECT_EQ(warden::schema::classify_marker("something else"),
            warden::schema::role_kind_t::unmanaged);
}
