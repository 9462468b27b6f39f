#include <gtest/gtest.h>

#include "gstree/config.h"

using namespace gstree;

// Test: auto mode follows the terminal
TEST(ConfigTest, AutoColorNeedsTerminal) {
    EXPECT_TRUE(Config::color_wanted(Config::ColorMode::Auto, true, false));
    EXPECT_FALSE(Config::color_wanted(Config::ColorMode::Auto, false, false));
}

// Test: NO_COLOR switches auto mode off
TEST(ConfigTest, AutoColorRespectsNoColor) {
    EXPECT_FALSE(Config::color_wanted(Config::ColorMode::Auto, true, true));
}

// Test: Explicit modes ignore the environment
TEST(ConfigTest, ExplicitModesWin) {
    EXPECT_TRUE(Config::color_wanted(Config::ColorMode::Always, false, true));
    EXPECT_FALSE(Config::color_wanted(Config::ColorMode::Never, true, false));
}

// Test: Singleton keeps the resolved color decision
TEST(ConfigTest, StoresColorDecision) {
    auto& config = Config::instance();
    config.set_color_enabled(true);
    EXPECT_TRUE(Config::instance().color_enabled());

    config.set_color_enabled(false);
    EXPECT_FALSE(Config::instance().color_enabled());
}
