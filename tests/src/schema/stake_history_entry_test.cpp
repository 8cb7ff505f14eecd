#include <gtest/gtest.h>
#include <stakehist/schema/stake_history_entry.hpp>

TEST(stake_history_entry, defaults_are_zero) {
  auto entry = stakehist::schema::stake_history_entry{};
  EXPECT_EQ(entry.effective, 0u);
  EXPECT_EQ(entry.activating, 0u);
  EXPECT_EQ(entry.deactivating, 0u);
}

TEST(stake_history_entry, equality_compares_every_field) {
  auto entry = stakehist::schema::stake_history_entry{
      .effective = 1, .activating = 2, .deactivating = 3};
  auto same = entry;
  EXPECT_EQ(entry, same);

  auto other = entry;
  other.deactivating = 4;
  EXPECT_NE(entry, other);
}
