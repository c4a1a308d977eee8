#include <warden/privilege/context.hpp>
#include <warden/testing/memory_session.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

using warden::database::memory_role;
using warden::database::session_error;
using warden::schema::error_code;
using manager_t = warden::privilege::manager<warden::database::memory_session_tag>;

class context_test : public ::testing::Test {
 protected:
  context_test()
      : catalog_{warden::testing::make_catalog()},
        session_{catalog_, "app"} {
    catalog_->add_role("user_smith", memory_role{.can_login = true,
                                                 .marker = "warden:user:42"});
    catalog_->add_role("role_librarians",
                       memory_role{.marker = "warden:group:7"});
    catalog_->add_role("role_admins", memory_role{.marker = "warden:group:1"});
    catalog_->add_role(
        "app", memory_role{.can_login = true,
                           .member_of = {"user_smith", "role_librarians"}});
  }

  std::shared_ptr<warden::database::memory_catalog> catalog_;
  warden::testing::memory_session_t session_;
};

}  // namespace

TEST_F(context_test, enter_and_exit_restore_the_session_identity) {
  auto manager = manager_t{session_};
  auto entered = manager.enter("user_smith");
  ASSERT_TRUE(entered.ok()) << entered.status.log;
  ASSERT_TRUE(entered.handle.has_value());
  EXPECT_EQ(session_.current_role(), "user_smith");
  EXPECT_EQ(manager.depth(), 1u);

  session_.execute("SELECT * FROM books");
  EXPECT_EQ(catalog_->statements_as("user_smith").size(), 1u);

  auto restored = entered.handle->exit();
  EXPECT_TRUE(restored.ok());
  EXPECT_EQ(session_.current_role(), "app");
  EXPECT_EQ(manager.depth(), 0u);
}

TEST_F(context_test, leaving_scope_restores_even_on_exceptions) {
  auto manager = manager_t{session_};
  try {
    auto entered = manager.enter("user_smith");
    ASSERT_TRUE(entered.ok());
    throw std::runtime_error{"query failed"};
  } catch (const std::runtime_error&) {
  }
  EXPECT_EQ(session_.current_role(), "app");
  EXPECT_EQ(manager.depth(), 0u);
  EXPECT_TRUE(session_.healthy());
}

TEST_F(context_test, nested_contexts_unwind_in_order) {
  auto manager = manager_t{session_};
  auto outer = manager.enter("role_librarians");
  ASSERT_TRUE(outer.ok());
  {
    auto inner = manager.enter("user_smith");
    ASSERT_TRUE(inner.ok());
    EXPECT_EQ(session_.current_role(), "user_smith");
    EXPECT_EQ(manager.depth(), 2u);
  }
  EXPECT_EQ(session_.current_role(), "role_librarians");
  EXPECT_EQ(manager.active_role(), "role_librarians");
  EXPECT_TRUE(outer.handle->exit().ok());
  EXPECT_EQ(session_.current_role(), "app");
}

TEST_F(context_test, exiting_an_outer_context_unwinds_inner_ones) {
  auto manager = manager_t{session_};
  auto outer = manager.enter("role_librarians");
  auto inner = manager.enter("user_smith");
  ASSERT_TRUE(outer.ok());
  ASSERT_TRUE(inner.ok());

  EXPECT_TRUE(outer.handle->exit().ok());
  EXPECT_EQ(session_.current_role(), "app");
  EXPECT_EQ(manager.depth(), 0u);
  EXPECT_FALSE(inner.handle->active());
  EXPECT_TRUE(inner.handle->exit().ok());
  EXPECT_EQ(session_.current_role(), "app");
}

TEST_F(context_test, second_exit_is_a_no_op) {
  auto manager = manager_t{session_};
  auto entered = manager.enter("user_smith");
  ASSERT_TRUE(entered.ok());
  EXPECT_TRUE(entered.handle->exit().ok());
  EXPECT_TRUE(entered.handle->exit().ok());
  EXPECT_EQ(session_.current_role(), "app");
}

TEST_F(context_test, moved_contexts_exit_once) {
  auto manager = manager_t{session_};
  auto entered = manager.enter("user_smith");
  ASSERT_TRUE(entered.ok());
  {
    auto moved = std::move(*entered.handle);
    entered.handle.reset();
    EXPECT_TRUE(moved.active());
    EXPECT_EQ(session_.current_role(), "user_smith");
  }
  EXPECT_EQ(session_.current_role(), "app");
}

TEST_F(context_test, contexts_outliving_their_manager_are_detached) {
  auto kept = std::optional<warden::privilege::context<
      warden::database::memory_session_tag>>{};
  {
    auto manager = manager_t{session_};
    auto entered = manager.enter("user_smith");
    ASSERT_TRUE(entered.ok());
    kept.emplace(std::move(*entered.handle));
    EXPECT_TRUE(kept->active());
  }
  EXPECT_EQ(session_.current_role(), "app");
  EXPECT_FALSE(kept->active());
  EXPECT_TRUE(kept->exit().ok());
  kept.reset();
  EXPECT_EQ(session_.current_role(), "app");
  EXPECT_TRUE(session_.healthy());
}

TEST_F(context_test, unknown_role_leaves_state_unchanged) {
  auto manager = manager_t{session_};
  auto entered = manager.enter("user_nobody");
  EXPECT_EQ(entered.status.code, error_code::unknown_role);
  EXPECT_FALSE(entered.handle.has_value());
  EXPECT_EQ(session_.current_role(), "app");
  EXPECT_EQ(manager.depth(), 0u);
  EXPECT_TRUE(session_.healthy());
}

TEST_F(context_test, roles_the_session_may_not_assume_are_denied) {
  auto manager = manager_t{session_};
  auto entered = manager.enter("role_admins");
  EXPECT_EQ(entered.status.code, error_code::privilege_denied);
  EXPECT_FALSE(entered.handle.has_value());
  EXPECT_EQ(session_.current_role(), "app");
}

TEST_F(context_test, server_side_denial_maps_to_privilege_denied) {
  auto manager = manager_t{session_};
  session_.fail_next("set_role",
                     session_error{"permission denied", false, "42501"});
  auto entered = manager.enter("user_smith");
  EXPECT_EQ(entered.status.code, error_code::privilege_denied);
  EXPECT_EQ(session_.current_role(), "app");
  EXPECT_TRUE(session_.healthy());
}

TEST_F(context_test, nesting_can_be_disabled) {
  auto manager = manager_t{session_, warden::privilege::manager_options{
                                         .allow_nesting = false}};
  auto outer = manager.enter("role_librarians");
  ASSERT_TRUE(outer.ok());
  auto inner = manager.enter("user_smith");
  EXPECT_EQ(inner.status.code, error_code::already_in_context);
  EXPECT_EQ(session_.current_role(), "role_librarians");
}

TEST_F(context_test, run_fails_closed) {
  auto manager = manager_t{session_};
  auto called = false;
  auto status = manager.run("role_admins", [&] { called = true; });
  EXPECT_EQ(status.code, error_code::privilege_denied);
  EXPECT_FALSE(called);
  EXPECT_TRUE(catalog_->statements_as("role_admins").empty());
}

TEST_F(context_test, run_executes_under_the_role_and_restores) {
  auto manager = manager_t{session_};
  auto status = manager.run("user_smith", [&] {
    session_.execute("SELECT title FROM books");
  });
  EXPECT_TRUE(status.ok());
  EXPECT_EQ(catalog_->statements_as("user_smith"),
            (std::vector<std::string>{"SELECT title FROM books"}));
  EXPECT_EQ(session_.current_role(), "app");

  EXPECT_THROW(manager.run("user_smith",
                           [] { throw std::runtime_error{"boom"}; }),
               std::runtime_error);
  EXPECT_EQ(session_.current_role(), "app");
  EXPECT_EQ(manager.depth(), 0u);
}

TEST_F(context_test, failed_restore_marks_the_session_unsafe) {
  auto manager = manager_t{session_};
  auto entered = manager.enter("user_smith");
  ASSERT_TRUE(entered.ok());

  session_.fail_next("reset_role",
                     session_error{"could not reset role", false});
  auto restored = entered.handle->exit();
  EXPECT_EQ(restored.code, error_code::connection_unsafe);
  EXPECT_FALSE(session_.healthy());

  auto again = manager.enter("user_smith");
  EXPECT_EQ(again.status.code, error_code::connection_unsafe);
}

TEST_F(context_test, unconfirmed_restore_marks_the_session_unsafe) {
  auto manager = manager_t{session_};
  auto entered = manager.enter("user_smith");
  ASSERT_TRUE(entered.ok());

  session_.report_role("user_smith");
  auto restored = entered.handle->exit();
  EXPECT_EQ(restored.code, error_code::connection_unsafe);
  EXPECT_FALSE(session_.healthy());
}

TEST_F(context_test, rejected_switch_in_an_aborted_transaction_keeps_the_session) {
  auto manager = manager_t{session_};
  session_.fail_next(
      "set_role",
      session_error{"current transaction is aborted", false,
                    std::string{warden::database::kInFailedSqlTransaction}});
  auto entered = manager.enter("user_smith");
  EXPECT_EQ(entered.status.code, error_code::database_error);
  EXPECT_FALSE(entered.handle.has_value());
  EXPECT_TRUE(session_.healthy());
  EXPECT_EQ(session_.current_role(), "app");
  EXPECT_EQ(manager.depth(), 0u);

  auto retried = manager.enter("user_smith");
  ASSERT_TRUE(retried.ok()) << retried.status.log;
  EXPECT_EQ(session_.current_role(), "user_smith");
}

TEST_F(context_test, lost_connection_during_enter_is_unsafe) {
  auto manager = manager_t{session_};
  session_.fail_next("set_role", session_error{"connection reset", true});
  auto entered = manager.enter("user_smith");
  EXPECT_EQ(entered.status.code, error_code::connection_unsafe);
  EXPECT_FALSE(entered.handle.has_value());
  EXPECT_FALSE(session_.healthy());
}
