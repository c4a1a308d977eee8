#include <warden/migration/applier.hpp>
#include <warden/testing/memory_session.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

namespace {

using warden::database::memory_role;
using warden::schema::error_code;
using applier_t = warden::migration::applier<warden::database::memory_session_tag>;

class applier_test : public ::testing::Test {
 protected:
  applier_test()
      : catalog_{warden::testing::make_catalog()},
        session_{catalog_, "warden_admin"} {
    catalog_->add_role("user_smith", memory_role{.marker = "warden:user:42"});
  }

  std::vector<std::string> executed() {
    return catalog_->statements_as("warden_admin");
  }

  std::shared_ptr<warden::database::memory_catalog> catalog_;
  warden::testing::memory_session_t session_;
};

const auto kBookPolicies = std::vector<std::string>{
    "ALTER TABLE books ENABLE ROW LEVEL SECURITY;",
    "CREATE POLICY books_owner ON books USING (owner = current_user);",
    "GRANT SELECT ON books TO role_librarians;",
};

}  // namespace

TEST_F(applier_test, applies_statements_in_declared_order) {
  auto applier = applier_t{session_};
  auto result = applier.apply("books", kBookPolicies);
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(result.applied, 3u);
  EXPECT_EQ(result.skipped, 0u);
  EXPECT_EQ(executed(), kBookPolicies);
}

TEST_F(applier_test, reapplying_skips_recorded_statements) {
  auto applier = applier_t{session_};
  ASSERT_TRUE(applier.apply("books", kBookPolicies).ok());

  auto extended = kBookPolicies;
  extended.push_back("GRANT INSERT ON books TO role_librarians;");
  auto result = applier.apply("books", extended);
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(result.applied, 1u);
  EXPECT_EQ(result.skipped, 3u);
  EXPECT_EQ(executed().size(), 4u);
  EXPECT_EQ(executed().back(), extended.back());
}

TEST_F(applier_test, ledger_is_scoped_per_entity) {
  auto applier = applier_t{session_};
  auto grant = std::vector<std::string>{"GRANT SELECT ON audit TO role_auditors;"};
  ASSERT_TRUE(applier.apply("audit", grant).ok());
  auto result = applier.apply("audit_copy", grant);
  EXPECT_EQ(result.applied, 1u);
}

TEST_F(applier_test, a_failing_statement_rolls_back_the_batch) {
  catalog_->failing_statements.insert(kBookPolicies[1]);
  auto applier = applier_t{session_};

  auto result = applier.apply("books", kBookPolicies);
  EXPECT_EQ(result.code, error_code::statement_failed);
  ASSERT_TRUE(result.failed_index.has_value());
  EXPECT_EQ(*result.failed_index, 1u);
  EXPECT_EQ(result.applied, 0u);
  EXPECT_TRUE(executed().empty());
  EXPECT_TRUE(catalog_->ledger.empty());

  catalog_->failing_statements.clear();
  auto retried = applier.apply("books", kBookPolicies);
  ASSERT_TRUE(retried.ok()) << retried.log;
  EXPECT_EQ(retried.applied, 3u);
}

TEST_F(applier_test, refuses_to_run_inside_a_reduced_context) {
  session_.set_role("user_smith");
  auto applier = applier_t{session_};
  auto result = applier.apply("books", kBookPolicies);
  EXPECT_EQ(result.code, error_code::already_in_context);
  EXPECT_TRUE(catalog_->statements_as("user_smith").empty());
  session_.reset_role();
}

TEST_F(applier_test, apply_all_stops_at_the_first_failure) {
  catalog_->failing_statements.insert("broken;");
  auto applier = applier_t{session_};
  auto results = applier.apply_all({
      {.entity = "books", .statements = {"GRANT SELECT ON books TO role_a;"}},
      {.entity = "loans", .statements = {"broken;"}},
      {.entity = "fines", .statements = {"GRANT SELECT ON fines TO role_a;"}},
  });
  ASSERT_EQ(results.size(), 2u);
  EXPECT_TRUE(results[0].ok());
  EXPECT_EQ(results[1].code, error_code::statement_failed);
  EXPECT_EQ(executed().size(), 1u);
}

TEST_F(applier_test, unsafe_sessions_are_refused) {
  session_.mark_unsafe();
  auto applier = applier_t{session_};
  EXPECT_EQ(applier.apply("books", kBookPolicies).code,
            error_code::connection_unsafe);
}
