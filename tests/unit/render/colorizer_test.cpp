#include "etabar/render/colorizer.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

using namespace etabar::render;

namespace {
const std::string kReset = "\033[0m";
}

TEST(AnsiColorizerTest, WrapsTextInEscapeAndReset) {
    AnsiColorizer colorizer;
    EXPECT_EQ(colorizer.colorize("red", "="), "\033[0;31m=" + kReset);
    EXPECT_EQ(colorizer.colorize("light-green", "#"), "\033[1;32m#" + kReset);
    EXPECT_EQ(colorizer.colorize("dark-gray", "."), "\033[1;30m." + kReset);
}

TEST(AnsiColorizerTest, OrangeSharesBrownCode) {
    EXPECT_EQ(AnsiColorizer::escapeCode("orange"), AnsiColorizer::escapeCode("brown"));
    EXPECT_EQ(AnsiColorizer::escapeCode("orange"), "\033[0;33m");
}

TEST(AnsiColorizerTest, UnknownColorFallsBackToDefault) {
    AnsiColorizer colorizer;
    EXPECT_EQ(colorizer.colorize("magenta", "x"), kReset + "x" + kReset);
    EXPECT_EQ(colorizer.colorize("", "x"), kReset + "x" + kReset);
    EXPECT_EQ(AnsiColorizer::escapeCode("RED"), kReset);
}

TEST(AnsiColorizerTest, DefaultColorStillAppendsReset) {
    AnsiColorizer colorizer;
    EXPECT_EQ(colorizer.colorize("default", " "), kReset + " " + kReset);
}

TEST(AnsiColorizerTest, KnowsEveryNamedColor) {
    auto names = AnsiColorizer::names();
    EXPECT_EQ(names.size(), 18u);
    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));

    for (const auto& name : names) {
        EXPECT_TRUE(AnsiColorizer::isKnownColor(name)) << name;
    }
    EXPECT_NE(std::find(names.begin(), names.end(), "light-purple"), names.end());
    EXPECT_FALSE(AnsiColorizer::isKnownColor("magenta"));
}

TEST(PlainColorizerTest, ReturnsTextUnchanged) {
    PlainColorizer colorizer;
    EXPECT_EQ(colorizer.colorize("red", "="), "=");
    EXPECT_EQ(colorizer.colorize("nonsense", "abc"), "abc");
}
