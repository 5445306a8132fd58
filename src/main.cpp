#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "etabar/common/config.hpp"
#include "etabar/common/constants.hpp"
#include "etabar/common/logger.hpp"
#include "cli/main_command.hpp"
#include "cli/colors_command.hpp"
#include "cli/config_command.hpp"
#include "cli/frame_command.hpp"
#include "cli/humanize_command.hpp"
#include "cli/lines_command.hpp"
#include "cli/run_command.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{"Single-line progress bar with ETA for shell loops", "etabar"};
        app.set_version_flag("--version,-v", etabar::constants::version::getFullVersion());
        app.require_subcommand(0, 1);

        std::string config_file;
        std::string log_level_name;
        std::string log_file;

        app.add_option("-c,--config", config_file, "Configuration file path");
        app.add_option("--log-level", log_level_name, "Log level: DEBUG, INFO, WARN or ERROR")
           ->check(CLI::IsMember({"DEBUG", "INFO", "WARN", "ERROR"}));
        app.add_option("--log-file", log_file, "Write logs to this file instead of stderr");

        auto run_cmd = std::make_unique<etabar::cli::RunCommand>();
        auto lines_cmd = std::make_unique<etabar::cli::LinesCommand>();
        auto frame_cmd = std::make_unique<etabar::cli::FrameCommand>();
        auto humanize_cmd = std::make_unique<etabar::cli::HumanizeCommand>();
        auto colors_cmd = std::make_unique<etabar::cli::ColorsCommand>();
        auto config_cmd = std::make_unique<etabar::cli::ConfigCommand>();

        run_cmd->setup(app.add_subcommand("run", "Draw a bar for a simulated loop"));
        lines_cmd->setup(app.add_subcommand("lines", "Advance a bar once per line read from stdin"));
        frame_cmd->setup(app.add_subcommand("frame", "Render a single frame"));
        humanize_cmd->setup(app.add_subcommand("humanize", "Format a number of seconds"));
        colors_cmd->setup(app.add_subcommand("colors", "List available color names"));
        config_cmd->setup(app.add_subcommand("config", "Manage configuration"));

        CLI11_PARSE(app, argc, argv);

        auto& config = etabar::common::Config::instance();
        if (!config.load(config_file)) {
            std::cerr << "Warning: failed to load configuration, using defaults\n";
        }

        auto& global = config.global();
        if (!log_level_name.empty()) {
            global.log_level = etabar::common::parseLogLevel(log_level_name).value_or(global.log_level);
        }

        if (log_file.empty()) {
            log_file = global.log_file;
        }

        if (log_file.empty()) {
            etabar::common::Logger::instance().initialize(
                etabar::common::LogMode::CONSOLE_ONLY,
                "",
                global.log_level,
                global.logging
            );
        } else {
            etabar::common::Logger::instance().initialize(
                etabar::common::LogMode::FILE_ONLY,
                log_file,
                global.log_level,
                global.logging
            );
        }

        std::vector<etabar::cli::MainCommand*> commands = {
            run_cmd.get(), lines_cmd.get(), frame_cmd.get(),
            humanize_cmd.get(), colors_cmd.get(), config_cmd.get()
        };

        int exit_code = -1;
        for (auto* command : commands) {
            if (command->wasCalled()) {
                exit_code = command->execute();
                break;
            }
        }

        etabar::common::Logger::instance().shutdown();

        if (exit_code < 0) {
            std::cout << app.help() << std::endl;
            return 0;
        }
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
