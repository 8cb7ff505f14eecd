#include <gtest/gtest.h>
#include <stakehist/sysvar/layout.hpp>

#include <cstdint>
#include <limits>

TEST(layout, constants_match_the_account_layout) {
  EXPECT_EQ(stakehist::sysvar::kMaxEntries, 512u);
  EXPECT_EQ(stakehist::sysvar::kRecordSize, 32u);
  EXPECT_EQ(stakehist::sysvar::kCountPrefixSize, 8u);
  EXPECT_EQ(stakehist::sysvar::total_size(), 8u + (512u * 32u));
}

TEST(layout, record_offset_skips_the_count_prefix) {
  EXPECT_EQ(stakehist::sysvar::record_offset(0), 8u);
  EXPECT_EQ(stakehist::sysvar::record_offset(1), 40u);
  EXPECT_EQ(stakehist::sysvar::record_offset(511),
            stakehist::sysvar::total_size() - stakehist::sysvar::kRecordSize);
}

TEST(layout, record_offset_refuses_to_wrap) {
  constexpr auto kMax = std::numeric_limits<uint64_t>::max();
  EXPECT_FALSE(stakehist::sysvar::record_offset(kMax).has_value());
  EXPECT_FALSE(stakehist::sysvar::record_offset((kMax / 32) + 1).has_value());
  EXPECT_EQ(stakehist::sysvar::record_offset(kMax / 32), kMax - 23);
}

TEST(layout, checked_helpers_detect_overflow) {
  constexpr auto kMax = std::numeric_limits<uint64_t>::max();
  EXPECT_EQ(stakehist::sysvar::checked_add(kMax - 1, 1), kMax);
  EXPECT_FALSE(stakehist::sysvar::checked_add(kMax, 1).has_value());
  EXPECT_EQ(stakehist::sysvar::checked_mul(0, kMax), 0u);
  EXPECT_FALSE(stakehist::sysvar::checked_mul(2, kMax).has_value());
  EXPECT_FALSE(stakehist::sysvar::checked_sub(0, 1).has_value());
  EXPECT_EQ(stakehist::sysvar::saturating_sub(10, 512), 0u);
  EXPECT_EQ(stakehist::sysvar::saturating_sub(600, 512), 88u);
}
