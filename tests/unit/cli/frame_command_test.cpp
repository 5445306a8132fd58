#include "cli/frame_command.hpp"
#include "etabar/common/config.hpp"

#include <CLI/CLI.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <sstream>
#include <string>

using etabar::cli::FrameCommand;
using ::testing::HasSubstr;
using ::testing::StartsWith;

class FrameCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        etabar::common::Config::instance().reset();
    }

    void TearDown() override {
        etabar::common::Config::instance().reset();
    }

    int Run(const std::string& args) {
        CLI::App app{"test"};
        command_.setup(app.add_subcommand("frame"));
        app.parse("frame --width 80 --color never " + args);
        return command_.renderTo(out_, err_);
    }

    FrameCommand command_;
    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(FrameCommandTest, RendersSingleRow) {
    EXPECT_EQ(Run("--total 10 --current 5 --elapsed 10"), 0);
    EXPECT_EQ(out_.str(), "\r[" + std::string(27, '=') + std::string(26, ' ') + "] 50.00% (ETA: 10 seconds)");
    EXPECT_EQ(err_.str(), "");
}

TEST_F(FrameCommandTest, NewlineFlagTerminatesRow) {
    EXPECT_EQ(Run("--total 10 --current 5 --elapsed 10 --newline"), 0);
    EXPECT_EQ(out_.str().back(), '\n');
}

TEST_F(FrameCommandTest, ZeroProgress_HasNoEta) {
    EXPECT_EQ(Run("--total 10 --current 0 --elapsed 30"), 0);
    EXPECT_EQ(out_.str(), "\r[" + std::string(71, ' ') + "] 0.00% ");
}

TEST_F(FrameCommandTest, ConfigStyleAppliesWhenNoFlagGiven) {
    auto& config = etabar::common::Config::instance();
    ASSERT_TRUE(config.setValue("bar.fill_char", "#"));
    ASSERT_TRUE(config.setValue("bar.track_char", "."));

    EXPECT_EQ(Run("--total 4 --current 2 --elapsed 4"), 0);
    // inner = 80 - 1 - len("(ETA: 4 seconds)") - 1 - len("50.00%") - 2 = 54
    EXPECT_EQ(out_.str(), "\r[" + std::string(27, '#') + std::string(27, '.') + "] 50.00% (ETA: 4 seconds)");
}

TEST_F(FrameCommandTest, FlagsOverrideConfigStyle) {
    ASSERT_TRUE(etabar::common::Config::instance().setValue("bar.fill_char", "#"));

    EXPECT_EQ(Run("--total 4 --current 4 --fill *"), 0);
    EXPECT_THAT(out_.str(), HasSubstr("[***"));
}

TEST_F(FrameCommandTest, JsonOutput) {
    EXPECT_EQ(Run("--total 10 --current 5 --elapsed 10 --json"), 0);

    auto frame = nlohmann::json::parse(out_.str());
    EXPECT_EQ(frame["row"].get<std::string>(),
              "\r[" + std::string(27, '=') + std::string(26, ' ') + "] 50.00% (ETA: 10 seconds)");
    EXPECT_DOUBLE_EQ(frame["percentage"].get<double>(), 50.0);
    EXPECT_EQ(frame["percentage_text"].get<std::string>(), "50.00%");
    EXPECT_EQ(frame["eta"].get<std::string>(), "10 seconds");
    EXPECT_EQ(frame["eta_seconds"].get<long long>(), 10);
    EXPECT_EQ(frame["width"].get<int>(), 80);
}

TEST_F(FrameCommandTest, JsonOutput_NoEstimateIsNull) {
    EXPECT_EQ(Run("--total 10 --current 0 --json"), 0);

    auto frame = nlohmann::json::parse(out_.str());
    EXPECT_TRUE(frame["eta_seconds"].is_null());
    EXPECT_EQ(frame["eta"].get<std::string>(), "");
}

TEST_F(FrameCommandTest, InvalidCurrent_Fails) {
    EXPECT_EQ(Run("--total 10 --current abc"), 1);
    EXPECT_EQ(out_.str(), "");
    EXPECT_THAT(err_.str(), StartsWith("Error: Progress value must be a non-negative number"));
}

TEST_F(FrameCommandTest, InvalidTotal_Fails) {
    EXPECT_EQ(Run("--total 0 --current 0"), 1);
    EXPECT_THAT(err_.str(), StartsWith("Error: Total must be"));
}

TEST_F(FrameCommandTest, NegativeElapsedRejectedByParser) {
    CLI::App app{"test"};
    command_.setup(app.add_subcommand("frame"));
    EXPECT_THROW(app.parse("frame --total 10 --current 1 --elapsed -5"), CLI::ParseError);
}

TEST_F(FrameCommandTest, ElapsedBeyondClockRangeRejectedByParser) {
    CLI::App app{"test"};
    command_.setup(app.add_subcommand("frame"));
    EXPECT_THROW(app.parse("frame --total 10 --current 5 --elapsed 1e300"), CLI::ValidationError);
}

TEST_F(FrameCommandTest, ElapsedAtUpperBoundStillRenders) {
    EXPECT_EQ(Run("--total 10 --current 5 --elapsed 3153600000 --json"), 0);

    auto frame = nlohmann::json::parse(out_.str());
    EXPECT_EQ(frame["eta_seconds"].get<long long>(), 3153600000LL);
    EXPECT_EQ(frame["eta"].get<std::string>(), "100 years");
}
