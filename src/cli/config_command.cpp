#include "config_command.hpp"
#include "etabar/common/config.hpp"
#include "etabar/common/logger.hpp"
#include "etabar/config/validator.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>

namespace etabar {
namespace cli {

ConfigCommand::ConfigCommand() = default;

void ConfigCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    init_cmd_ = subcommand->add_subcommand("init", "Write a configuration file with default values");
    init_cmd_->add_flag("-f,--force", init_force_, "Overwrite an existing configuration file");
    markCalledOnParse(init_cmd_);
    
    set_cmd_ = subcommand->add_subcommand("set", "Set configuration value");
    set_cmd_->add_option("key", set_key_, "Configuration key")->required();
    set_cmd_->add_option("value", set_value_, "Configuration value")->required();
    markCalledOnParse(set_cmd_);
    
    get_cmd_ = subcommand->add_subcommand("get", "Get configuration value");
    get_cmd_->add_option("key", get_key_, "Configuration key (optional)");
    markCalledOnParse(get_cmd_);
    
    show_cmd_ = subcommand->add_subcommand("show", "Show configuration file");
    markCalledOnParse(show_cmd_);
    
    validate_cmd_ = subcommand->add_subcommand("validate", "Validate configuration");
    markCalledOnParse(validate_cmd_);
    
    markCalledOnParse(subcommand);
}

int ConfigCommand::execute() {
    return run(std::cout, std::cerr);
}

int ConfigCommand::run(std::ostream& out, std::ostream& err) {
    if (init_cmd_->parsed()) {
        return executeInit(out, err);
    } else if (set_cmd_->parsed()) {
        return executeSet(out, err);
    } else if (get_cmd_->parsed()) {
        return executeGet(out, err);
    } else if (show_cmd_->parsed()) {
        return executeShow(out, err);
    } else if (validate_cmd_->parsed()) {
        return executeValidate(out);
    }
    
    out << subcommand_->help() << std::endl;
    return 0;
}

int ConfigCommand::executeInit(std::ostream& out, std::ostream& err) {
    auto& config = common::Config::instance();
    std::string config_path = config.getConfigPath();
    
    if (config.exists() && !init_force_) {
        err << "Configuration file already exists: " << config_path << "\n";
        err << "Use --force to overwrite it.\n";
        return 1;
    }
    
    config.reset();
    if (!config.save(config_path)) {
        err << "Failed to write configuration: " << config_path << "\n";
        return 1;
    }
    
    out << "Configuration written: " << config_path << "\n";
    return 0;
}

int ConfigCommand::executeSet(std::ostream& out, std::ostream& err) {
    auto& config = common::Config::instance();
    
    if (!config.getValue(set_key_)) {
        err << "Unknown configuration key: " << set_key_ << "\n";
        err << "Known keys:\n";
        for (const auto& key : common::Config::knownKeys()) {
            err << "  " << key << "\n";
        }
        return 1;
    }
    
    std::string previous = *config.getValue(set_key_);
    if (!config.setValue(set_key_, set_value_)) {
        err << "Invalid value for " << set_key_ << ": " << set_value_ << "\n";
        return 1;
    }
    
    config::ConfigValidator validator;
    auto result = validator.validate(config.global());
    if (!result.is_valid) {
        if (!config.setValue(set_key_, previous)) {
            common::Logger::instance().warn("[Config] Restore failed | key={} | value={}", set_key_, previous);
        }
        for (const auto& error : result.errors) {
            err << "  ERROR: " << error << "\n";
        }
        err << "Configuration not saved.\n";
        return 1;
    }
    
    if (config.save()) {
        out << "Configuration updated: " << set_key_ << " = " << set_value_ << "\n";
        return 0;
    }
    
    err << "Failed to save configuration.\n";
    return 1;
}

int ConfigCommand::executeGet(std::ostream& out, std::ostream& err) {
    auto& config = common::Config::instance();
    
    if (get_key_.empty()) {
        out << "Configuration:\n";
        for (const auto& key : common::Config::knownKeys()) {
            out << "  " << key << " = " << config.getValue(key).value_or("") << "\n";
        }
        return 0;
    }
    
    auto value = config.getValue(get_key_);
    if (!value) {
        err << "Unknown configuration key: " << get_key_ << "\n";
        return 1;
    }
    
    out << *value << "\n";
    return 0;
}

int ConfigCommand::executeShow(std::ostream& out, std::ostream& err) {
    auto& config = common::Config::instance();
    std::string config_path = config.getConfigPath();
    
    if (!std::filesystem::exists(config_path)) {
        err << "Configuration file does not exist.\n";
        err << "Expected: " << config_path << "\n";
        err << "Run: etabar config init\n";
        return 1;
    }
    
    out << "Configuration file: " << config_path << "\n\n";
    
    std::ifstream file(config_path);
    if (!file) {
        err << "Failed to read configuration file.\n";
        return 1;
    }
    
    std::string line;
    while (std::getline(file, line)) {
        out << line << "\n";
    }
    
    return 0;
}

int ConfigCommand::executeValidate(std::ostream& out) {
    auto& config = common::Config::instance();
    std::string config_path = config.getConfigPath();
    
    out << "Validating: " << config_path << "\n\n";
    
    config::ConfigValidator validator;
    auto result = validator.validateFile(config_path);
    
    for (const auto& error : result.errors) {
        out << "  ERROR: " << error << "\n";
    }
    
    for (const auto& warning : result.warnings) {
        out << "  WARNING: " << warning << "\n";
    }
    
    out << "\nErrors: " << result.errors.size() 
              << "  Warnings: " << result.warnings.size() << "\n";
    
    if (result.is_valid) {
        out << "\nConfiguration is valid.\n";
        return 0;
    }
    
    out << "\nConfiguration has errors.\n";
    return 1;
}

}}
