#include <gtest/gtest.h>
#include "utils/game_utils.hpp"
#include <chrono>
#include <climits>

using utils::GameUtils;

TEST(GameUtilsTest, FormatWithCommas) {
    EXPECT_EQ(GameUtils::format_with_commas(0), "0");
    EXPECT_EQ(GameUtils::format_with_commas(999), "999");
    EXPECT_EQ(GameUtils::format_with_commas(1000), "1,000");
    EXPECT_EQ(GameUtils::format_with_commas(1234567), "1,234,567");
    EXPECT_EQ(GameUtils::format_with_commas(-1000), "-1,000");
}

TEST(GameUtilsTest, FormatWithCommasExtremes) {
    EXPECT_EQ(GameUtils::format_with_commas(LLONG_MAX), "9,223,372,036,854,775,807");
    EXPECT_EQ(GameUtils::format_with_commas(LLONG_MIN), "-9,223,372,036,854,775,808");
}

TEST(GameUtilsTest, FormatPercent) {
    EXPECT_EQ(GameUtils::format_percent(0.5), "50.0%");
    EXPECT_EQ(GameUtils::format_percent(0.0), "0.0%");
}

TEST(GameUtilsTest, FormatElapsed) {
    EXPECT_EQ(GameUtils::format_elapsed(std::chrono::milliseconds(65042)), "1 min 5.042 sec");
}
