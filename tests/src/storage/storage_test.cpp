#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/storage/rocksdb/storage.hpp>
#include <warden/storage/storage.hpp>
#include <warden/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>

namespace {

using storage_t = warden::storage::storage<warden::storage::rocksdb_storage_tag>;
using encoder_t =
    warden::schema::encoding::encoder<warden::schema::encoding::scale_encoder_tag>;

warden::schema::bytes_t make_key(const std::string& text) {
  return warden::schema::make_bytes(text);
}

}  // namespace

TEST(storage, put_get_erase) {
  auto db = warden::testing::make_db_path("warden_storage_basic");
  {
    auto storage =
        warden::storage::make_storage<warden::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = make_key("SYS|TEST|one");

    EXPECT_FALSE(storage.get<uint64_t>(encoder, key).has_value());
    storage.put(encoder, key, uint64_t{42});
    auto loaded = storage.get<uint64_t>(encoder, key);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 42u);

    storage.erase(key);
    EXPECT_FALSE(storage.get<uint64_t>(encoder, key).has_value());
    storage.erase(key);
  }
  warden::testing::remove_path(db);
}

TEST(storage, list_by_prefix_is_ordered_and_bounded) {
  auto db = warden::testing::make_db_path("warden_storage_prefix");
  {
    auto storage =
        warden::storage::make_storage<warden::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    storage.put(encoder, make_key("A|2"), std::string{"two"});
    storage.put(encoder, make_key("A|1"), std::string{"one"});
    storage.put(encoder, make_key("B|1"), std::string{"other"});

    auto entries = storage.list_by_prefix(make_key("A|"));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(warden::schema::make_string(entries[0].first), "A|1");
    EXPECT_EQ(warden::schema::make_string(entries[1].first), "A|2");
    EXPECT_EQ(encoder.decode<std::string>(entries[1].second), "two");
  }
  warden::testing::remove_path(db);
}

TEST(storage, write_batch_applies_puts_and_erases_together) {
  auto db = warden::testing::make_db_path("warden_storage_batch");
  {
    auto storage =
        warden::storage::make_storage<warden::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    storage.put(encoder, make_key("K|old"), uint32_t{1});

    auto batch = warden::storage::write_batch_t{};
    batch.puts.push_back({make_key("K|new"), encoder.encode(uint32_t{2})});
    batch.erases.push_back(make_key("K|old"));
    storage.write_batch(batch);

    EXPECT_FALSE(storage.get<uint32_t>(encoder, make_key("K|old")).has_value());
    EXPECT_EQ(storage.get<uint32_t>(encoder, make_key("K|new")), 2u);
  }
  warden::testing::remove_path(db);
}

TEST(storage, values_survive_reopen) {
  auto db = warden::testing::make_db_path("warden_storage_reopen");
  {
    auto storage =
        warden::storage::make_storage<warden::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    storage.put(encoder, make_key("SYS|SYNC|SEQUENCE"), uint64_t{9});
  }
  {
    auto storage =
        warden::storage::make_storage<warden::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    EXPECT_EQ(storage.get<uint64_t>(encoder, make_key("SYS|SYNC|SEQUENCE")),
              9u);
  }
  warden::testing::remove_path(db);
}
