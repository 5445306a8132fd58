#include "cli/config_command.hpp"
#include "etabar/common/config.hpp"

#include <CLI/CLI.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

using etabar::cli::ConfigCommand;
using etabar::common::Config;
using ::testing::HasSubstr;

namespace fs = std::filesystem;

class ConfigCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("etabar_config_command_test_" + std::to_string(getpid()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        path_ = (dir_ / "etabar.toml").string();

        Config::instance().reset();
        ASSERT_TRUE(Config::instance().load(path_));
    }

    void TearDown() override {
        Config::instance().reset();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    int Run(const std::string& args) {
        ConfigCommand command;
        CLI::App app{"test"};
        command.setup(app.add_subcommand("config"));
        app.parse("config " + args);

        out_.str("");
        err_.str("");
        return command.run(out_, err_);
    }

    std::string path_;
    std::ostringstream out_;
    std::ostringstream err_;

private:
    fs::path dir_;
};

TEST_F(ConfigCommandTest, InitWritesDefaults) {
    EXPECT_EQ(Run("init"), 0);
    EXPECT_TRUE(fs::exists(path_));
    EXPECT_THAT(out_.str(), HasSubstr(path_));
}

TEST_F(ConfigCommandTest, InitRefusesToOverwriteWithoutForce) {
    ASSERT_EQ(Run("init"), 0);

    EXPECT_EQ(Run("init"), 1);
    EXPECT_THAT(err_.str(), HasSubstr("already exists"));

    EXPECT_EQ(Run("init --force"), 0);
}

TEST_F(ConfigCommandTest, SetSavesValidValue) {
    EXPECT_EQ(Run("set bar.width 72"), 0);
    EXPECT_EQ(out_.str(), "Configuration updated: bar.width = 72\n");

    Config::instance().reset();
    ASSERT_TRUE(Config::instance().load(path_));
    EXPECT_EQ(Config::instance().global().bar.width, 72);
}

TEST_F(ConfigCommandTest, SetRejectsValueThatFailsValidation) {
    EXPECT_EQ(Run("set bar.width 99999"), 1);

    EXPECT_THAT(err_.str(), HasSubstr("bar.width"));
    EXPECT_THAT(err_.str(), HasSubstr("Configuration not saved."));
    EXPECT_FALSE(fs::exists(path_));
    EXPECT_EQ(Config::instance().global().bar.width, 0);
}

TEST_F(ConfigCommandTest, SetRejectsMalformedValue) {
    EXPECT_EQ(Run("set bar.width 80abc"), 1);
    EXPECT_EQ(err_.str(), "Invalid value for bar.width: 80abc\n");
    EXPECT_FALSE(fs::exists(path_));
}

TEST_F(ConfigCommandTest, SetRejectsUnknownKey) {
    EXPECT_EQ(Run("set bar.shape round"), 1);
    EXPECT_THAT(err_.str(), HasSubstr("Unknown configuration key: bar.shape"));
    EXPECT_THAT(err_.str(), HasSubstr("  bar.fill_color\n"));
}

TEST_F(ConfigCommandTest, GetSingleKey) {
    EXPECT_EQ(Run("get run.total"), 0);
    EXPECT_EQ(out_.str(), "100\n");

    EXPECT_EQ(Run("get run.nothing"), 1);
}

TEST_F(ConfigCommandTest, GetAllKeys) {
    EXPECT_EQ(Run("get"), 0);
    EXPECT_THAT(out_.str(), HasSubstr("  bar.color = auto\n"));
    EXPECT_THAT(out_.str(), HasSubstr("  logging.format = text\n"));
}

TEST_F(ConfigCommandTest, ShowRequiresFile) {
    EXPECT_EQ(Run("show"), 1);
    EXPECT_THAT(err_.str(), HasSubstr("does not exist"));

    ASSERT_EQ(Run("init"), 0);
    EXPECT_EQ(Run("show"), 0);
    EXPECT_THAT(out_.str(), HasSubstr("[bar]"));
}

TEST_F(ConfigCommandTest, ValidateReportsErrors) {
    {
        std::ofstream file(path_);
        file << "[bar]\nfill_char = \"\"\nfill_color = \"magenta\"\n";
    }

    EXPECT_EQ(Run("validate"), 1);
    EXPECT_THAT(out_.str(), HasSubstr("ERROR: bar.fill_char"));
    EXPECT_THAT(out_.str(), HasSubstr("WARNING: bar.fill_color"));
    EXPECT_THAT(out_.str(), HasSubstr("Errors: 1  Warnings: 1"));
}

TEST_F(ConfigCommandTest, ValidateAcceptsDefaults) {
    ASSERT_EQ(Run("init"), 0);
    EXPECT_EQ(Run("validate"), 0);
    EXPECT_THAT(out_.str(), HasSubstr("Configuration is valid."));
}
