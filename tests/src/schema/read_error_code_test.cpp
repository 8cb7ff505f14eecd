#include <gtest/gtest.h>
#include <stakehist/schema/read_error_code.hpp>

TEST(read_error_code, names_are_stable) {
  EXPECT_EQ(stakehist::schema::to_string(stakehist::schema::read_error_code::ok),
            "ok");
  EXPECT_EQ(stakehist::schema::to_string(
                stakehist::schema::read_error_code::unsupported),
            "unsupported");
  EXPECT_EQ(stakehist::schema::to_string(
                stakehist::schema::read_error_code::out_of_bounds),
            "out_of_bounds");
  EXPECT_EQ(stakehist::schema::to_string(
                static_cast<stakehist::schema::read_error_code>(99)),
            "unknown");
}
