// Environment configuration tests

#include <gtest/gtest.h>

#include <cstdlib>

#include "soundscan/config.hpp"

namespace soundscan {
namespace {

constexpr const char *VAR = "SOUNDSCAN_TEST_INT";

/// Sets VAR for one test and clears it afterwards
class EnvIntTest : public ::testing::Test {
protected:
  void TearDown() override { unsetenv(VAR); }

  int read(const char *value, int default_val, int min_val) {
    setenv(VAR, value, 1);
    return Config::get_env_int(VAR, default_val, min_val);
  }
};

TEST_F(EnvIntTest, UnsetUsesDefault) {
  unsetenv(VAR);
  EXPECT_EQ(Config::get_env_int(VAR, 42), 42);
}

TEST_F(EnvIntTest, ParsesInteger) {
  EXPECT_EQ(read("4096", 960000, 1), 4096);
  EXPECT_EQ(read("0", 3, 0), 0);
}

TEST_F(EnvIntTest, NonNumericFallsBack) {
  EXPECT_EQ(read("lots", 960000, 1), 960000);
  EXPECT_EQ(read("12abc", 960000, 1), 960000);
  EXPECT_EQ(read("", 7, 0), 7);
}

TEST_F(EnvIntTest, BelowMinimumFallsBack) {
  EXPECT_EQ(read("-5", 960000, 1), 960000);
  EXPECT_EQ(read("0", 960000, 1), 960000);
  EXPECT_EQ(read("-1", 0, 0), 0);
}

TEST_F(EnvIntTest, OutOfRangeFallsBack) {
  EXPECT_EQ(read("99999999999999999999", 5, 0), 5);
}

} // namespace
} // namespace soundscan
