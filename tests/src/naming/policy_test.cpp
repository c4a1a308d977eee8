#include <warden/naming/policy.hpp>
#include <gtest/gtest.h>

#include <set>
#include <string>

namespace {

using warden::naming::policy;
using warden::naming::policy_options;
using warden::schema::error_code;
using warden::schema::identity_kind_t;

}  // namespace

TEST(naming_policy, maps_users_and_groups_to_prefixed_names) {
  auto naming = policy{};
  auto user = naming.role_name(identity_kind_t::user, "smith");
  ASSERT_TRUE(user.ok());
  EXPECT_EQ(user.name, "user_smith");

  auto group = naming.role_name(identity_kind_t::group, "librarians");
  ASSERT_TRUE(group.ok());
  EXPECT_EQ(group.name, "role_librarians");
}

TEST(naming_policy, is_deterministic_across_instances) {
  auto first = policy{}.role_name(identity_kind_t::user, "Jane.Doe@example.org");
  auto second = policy{}.role_name(identity_kind_t::user, "Jane.Doe@example.org");
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(first.name, second.name);
}

TEST(naming_policy, escapes_everything_outside_lowercase_alphanumerics) {
  EXPECT_EQ(warden::naming::escape_identifier("abc123"), "abc123");
  EXPECT_EQ(warden::naming::escape_identifier("Bob"), "_42ob");
  EXPECT_EQ(warden::naming::escape_identifier("a_b"), "a_5fb");
  EXPECT_EQ(warden::naming::escape_identifier("a.b"), "a_2eb");
  EXPECT_EQ(warden::naming::escape_identifier("a b"), "a_20b");
}

TEST(naming_policy, distinct_identifiers_get_distinct_names) {
  auto naming = policy{};
  auto identifiers = std::set<std::string>{
      "bob", "Bob", "BOB", "b_ob", "b_5fob", "b.ob", "b-ob", "b ob", "bob_"};
  auto names = std::set<std::string>{};
  for (const auto& identifier : identifiers) {
    auto result = naming.role_name(identity_kind_t::user, identifier);
    ASSERT_TRUE(result.ok()) << identifier;
    names.insert(result.name);
  }
  EXPECT_EQ(names.size(), identifiers.size());
}

TEST(naming_policy, same_identifier_differs_by_kind) {
  auto naming = policy{};
  auto user = naming.role_name(identity_kind_t::user, "staff");
  auto group = naming.role_name(identity_kind_t::group, "staff");
  ASSERT_TRUE(user.ok());
  ASSERT_TRUE(group.ok());
  EXPECT_NE(user.name, group.name);
}

TEST(naming_policy, long_identifiers_are_truncated_with_a_digest) {
  auto naming = policy{};
  auto long_a = std::string(100, 'a');
  auto long_b = long_a + "b";

  auto first = naming.role_name(identity_kind_t::user, long_a);
  auto second = naming.role_name(identity_kind_t::user, long_b);
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(first.name.size(), warden::naming::kMaxRoleNameLength);
  EXPECT_EQ(second.name.size(), warden::naming::kMaxRoleNameLength);
  EXPECT_NE(first.name, second.name);

  auto marker = first.name.substr(first.name.size() -
                                  warden::naming::kHashNibbles -
                                  warden::naming::kHashMarker.size(),
                                  warden::naming::kHashMarker.size());
  EXPECT_EQ(marker, warden::naming::kHashMarker);
}

TEST(naming_policy, untruncated_names_never_contain_the_digest_marker) {
  auto naming = policy{};
  auto result = naming.role_name(identity_kind_t::user, "h_h_h");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.name.find(warden::naming::kHashMarker,
                             naming.options().user_prefix.size()),
            std::string::npos);
}

TEST(naming_policy, prefix_boundary_may_read_as_the_digest_marker) {
  auto naming = policy{};
  auto hank = naming.role_name(identity_kind_t::user, "hank");
  ASSERT_TRUE(hank.ok());
  EXPECT_EQ(hank.name, "user_hank");
  EXPECT_NE(hank.name.find(warden::naming::kHashMarker), std::string::npos);
  EXPECT_EQ(hank.name.find(warden::naming::kHashMarker,
                           naming.options().user_prefix.size()),
            std::string::npos);
}

TEST(naming_policy, rejects_empty_identifiers) {
  auto result = policy{}.role_name(identity_kind_t::user, "");
  EXPECT_EQ(result.code, error_code::naming_conflict);
  EXPECT_TRUE(result.name.empty());
}

TEST(naming_policy, rejects_names_that_hit_reserved_patterns) {
  auto options = policy_options{};
  options.user_prefix = "app_";
  options.reserved_names.insert("app_backup");
  options.reserved_prefixes.push_back("app_sys");
  auto naming = policy{options};

  EXPECT_EQ(naming.role_name(identity_kind_t::user, "backup").code,
            error_code::naming_conflict);
  EXPECT_EQ(naming.role_name(identity_kind_t::user, "sysadmin").code,
            error_code::naming_conflict);
  EXPECT_TRUE(naming.role_name(identity_kind_t::user, "backups").ok());
}

TEST(naming_policy, validate_rejects_overlapping_or_reserved_prefixes) {
  EXPECT_TRUE(policy{}.validate().ok());

  auto overlapping = policy_options{};
  overlapping.user_prefix = "u_";
  overlapping.group_prefix = "u_g_";
  EXPECT_EQ(policy{overlapping}.validate().code, error_code::naming_conflict);

  auto reserved = policy_options{};
  reserved.user_prefix = "pg_user_";
  EXPECT_EQ(policy{reserved}.validate().code, error_code::naming_conflict);

  auto empty = policy_options{};
  empty.group_prefix.clear();
  EXPECT_EQ(policy{empty}.validate().code, error_code::naming_conflict);

  auto short_limit = policy_options{};
  short_limit.max_length = 10;
  EXPECT_EQ(policy{short_limit}.validate().code, error_code::naming_conflict);
}

TEST(naming_policy, classifies_names_by_prefix) {
  auto naming = policy{};
  EXPECT_EQ(naming.classify("user_smith"), identity_kind_t::user);
  EXPECT_EQ(naming.classify("role_librarians"), identity_kind_t::group);
  EXPECT_FALSE(naming.classify("postgres").has_value());
  EXPECT_FALSE(naming.classify("user_").has_value());
}

TEST(naming_policy, builtin_names_are_reserved) {
  auto naming = policy{};
  EXPECT_TRUE(naming.is_reserved("postgres"));
  EXPECT_TRUE(naming.is_reserved("public"));
  EXPECT_TRUE(naming.is_reserved("pg_read_all_data"));
  EXPECT_FALSE(naming.is_reserved("user_smith"));
}
