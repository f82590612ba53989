#include <gtest/gtest.h>
#include <strongbox/guard/reentrancy_guard.hpp>

#include <stdexcept>
#include <utility>

using strongbox::guard::latch_state_t;

TEST(reentrancy_guard, starts_not_entered) {
  auto guard = strongbox::guard::reentrancy_guard{};
  EXPECT_EQ(guard.state(), latch_state_t::not_entered);
  EXPECT_FALSE(guard.entered());
}

TEST(reentrancy_guard, second_enter_is_refused_until_exit) {
  auto guard = strongbox::guard::reentrancy_guard{};
  ASSERT_TRUE(guard.enter());
  EXPECT_EQ(guard.state(), latch_state_t::entered);
  EXPECT_FALSE(guard.enter());
  EXPECT_EQ(guard.state(), latch_state_t::entered);

  guard.exit();
  EXPECT_EQ(guard.state(), latch_state_t::not_entered);
  EXPECT_TRUE(guard.enter());
  guard.exit();
}

TEST(reentrancy_guard, exit_is_unconditional) {
  auto guard = strongbox::guard::reentrancy_guard{};
  guard.exit();
  EXPECT_EQ(guard.state(), latch_state_t::not_entered);
}

TEST(reentrancy_guard, scoped_entry_releases_on_scope_exit) {
  auto guard = strongbox::guard::reentrancy_guard{};
  {
    auto entry = guard.acquire();
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(guard.entered());
    EXPECT_FALSE(guard.acquire().has_value());
  }
  EXPECT_FALSE(guard.entered());
}

TEST(reentrancy_guard, scoped_entry_releases_on_exception) {
  auto guard = strongbox::guard::reentrancy_guard{};
  EXPECT_THROW(
      {
        auto entry = guard.acquire();
        EXPECT_TRUE(entry.has_value());
        throw std::runtime_error{"boom"};
      },
      std::runtime_error);
  EXPECT_EQ(guard.state(), latch_state_t::not_entered);
}

TEST(reentrancy_guard, moved_entry_releases_once) {
  auto guard = strongbox::guard::reentrancy_guard{};
  {
    auto first = guard.acquire();
    ASSERT_TRUE(first.has_value());
    auto second = std::move(*first);
    first.reset();
    EXPECT_TRUE(guard.entered());
  }
  EXPECT_FALSE(guard.entered());
}
