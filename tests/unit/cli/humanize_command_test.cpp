#include "cli/humanize_command.hpp"

#include <CLI/CLI.hpp>
#include <gtest/gtest.h>

#include <sstream>
#include <string>

using etabar::cli::HumanizeCommand;

namespace {

std::string Humanize(const std::string& args) {
    HumanizeCommand command;
    CLI::App app{"test"};
    command.setup(app.add_subcommand("humanize"));
    app.parse("humanize " + args);

    std::ostringstream out;
    EXPECT_EQ(command.run(out), 0);
    return out.str();
}

}  // namespace

TEST(HumanizeCommandTest, PrintsBreakdown) {
    EXPECT_EQ(Humanize("3661"), "1 hour 1 minute 1 second\n");
    EXPECT_EQ(Humanize("0"), "0 seconds\n");
    EXPECT_EQ(Humanize("31536000"), "1 year\n");
}

TEST(HumanizeCommandTest, RequiresNonNegativeInteger) {
    for (const char* args : {"", "abc", "1.5"}) {
        HumanizeCommand command;
        CLI::App app{"test"};
        command.setup(app.add_subcommand("humanize"));
        EXPECT_THROW(app.parse(std::string("humanize ") + args), CLI::ParseError) << args;
    }
}
