#include <gtest/gtest.h>

#include <string>

#include "gstree/theme.h"

using namespace gstree;

namespace {
constexpr const char* kRed = "\033[31m";
constexpr const char* kGreen = "\033[32m";
constexpr const char* kReset = "\033[0m";
} // namespace

// Test: Untracked, ignored and conflict codes use the alert style
TEST(ThemeTest, AlertCodes) {
    for (const char* code : {"??", "!!", "DD", "AU", "UD", "UA", "DU", "AA", "UU"}) {
        EXPECT_EQ(Theme::classify(code), Theme::StatusStyle::Alert) << code;
    }
}

// Test: Every other XY pair is split into index and worktree colors
TEST(ThemeTest, SplitCodes) {
    for (const char* code : {"M.", ".M", "MM", "A.", "AM", "D.", ".D", "R.", "RM", "C.", ".T", "T.", "U."}) {
        EXPECT_EQ(Theme::classify(code), Theme::StatusStyle::Split) << code;
    }
}

// Test: Classification covers every XY combination exactly once
TEST(ThemeTest, ClassificationIsExhaustive) {
    const std::string letters = "MTADRCU.";
    int alert = 0;
    int split = 0;
    for (char x : letters) {
        for (char y : letters) {
            const std::string code{x, y};
            const auto style = Theme::classify(code);
            EXPECT_TRUE(style == Theme::StatusStyle::Alert || style == Theme::StatusStyle::Split);
            (style == Theme::StatusStyle::Alert ? alert : split)++;
        }
    }
    EXPECT_EQ(alert, 7);
    EXPECT_EQ(alert + split, 64);
}

// Test: Staged letter green, worktree dot left alone
TEST(ThemeTest, StagedOnly) {
    Theme theme{true};
    EXPECT_EQ(theme.status("M."), std::string{kGreen} + "M" + kReset + ".");
}

// Test: Worktree letter red, index dot left alone
TEST(ThemeTest, UnstagedOnly) {
    Theme theme{true};
    EXPECT_EQ(theme.status(".M"), std::string{"."} + kRed + "M" + kReset);
}

// Test: Both letters colored independently
TEST(ThemeTest, StagedAndUnstaged) {
    Theme theme{true};
    EXPECT_EQ(theme.status("AM"), std::string{kGreen} + "A" + kReset + kRed + "M" + kReset);
}

// Test: Alert codes are wrapped once as a pair
TEST(ThemeTest, AlertPairColoredTogether) {
    Theme theme{true};
    EXPECT_EQ(theme.status("UU"), std::string{kRed} + "UU" + kReset);
    EXPECT_EQ(theme.status("??"), std::string{kRed} + "??" + kReset);
}

// Test: Disabled color produces plain text
TEST(ThemeTest, NoColorIsPlain) {
    Theme theme{false};
    EXPECT_FALSE(theme.color_enabled());
    EXPECT_EQ(theme.status("AM"), "AM");
    EXPECT_EQ(theme.status("!!"), "!!");
    EXPECT_EQ(theme.paint("alert", "x"), "x");
    EXPECT_EQ(theme.reset(), "");
}
