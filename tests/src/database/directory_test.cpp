#include <warden/database/directory.hpp>
#include <warden/testing/memory_session.hpp>
#include <gtest/gtest.h>

TEST(directory, loads_users_groups_and_memberships) {
  auto catalog = warden::testing::make_catalog();
  auto queries = warden::database::directory_queries{};
  catalog->query_rows[queries.users] = {{"1", "ann", "Ann Lee", "true"},
                                        {"2", "bob", "Bob", "false"},
                                        {"", "broken", "", "true"}};
  catalog->query_rows[queries.groups] = {{"9", "staff"}, {"10", "readers"}};
  catalog->query_rows[queries.members] = {
      {"9", "1"}, {"9", "2"}, {"10", "2"}, {"11", "1"}};

  auto session = warden::testing::memory_session_t{catalog, "warden_admin"};
  auto directory = warden::database::load_directory(session, queries);

  ASSERT_EQ(directory.users.size(), 2u);
  EXPECT_EQ(directory.users[0].username, "ann");
  EXPECT_EQ(directory.users[0].display_name, "Ann Lee");
  EXPECT_TRUE(directory.users[0].active);
  EXPECT_FALSE(directory.users[1].active);

  ASSERT_EQ(directory.groups.size(), 2u);
  EXPECT_EQ(directory.groups[0].members, (std::set<std::string>{"1", "2"}));
  EXPECT_EQ(directory.groups[1].members, (std::set<std::string>{"2"}));
}

TEST(directory, custom_queries_are_used_verbatim) {
  auto catalog = warden::testing::make_catalog();
  auto queries = warden::database::directory_queries{
      .users = "SELECT uid, login FROM accounts",
      .groups = "SELECT gid, title FROM teams",
      .members = "SELECT gid, uid FROM team_members"};
  catalog->query_rows[queries.users] = {{"u1", "ann"}};

  auto session = warden::testing::memory_session_t{catalog, "warden_admin"};
  auto directory = warden::database::load_directory(session, queries);
  ASSERT_EQ(directory.users.size(), 1u);
  EXPECT_TRUE(directory.users[0].active);
  EXPECT_EQ(directory.users[0].display_name, "ann");
  EXPECT_TRUE(directory.groups.empty());
}

TEST(directory, flags_accept_postgres_boolean_spellings) {
  EXPECT_TRUE(warden::database::parse_flag("t"));
  EXPECT_TRUE(warden::database::parse_flag("true"));
  EXPECT_FALSE(warden::database::parse_flag("f"));
  EXPECT_FALSE(warden::database::parse_flag(""));
}
