#include "etabar/config/validator.hpp"
#include "etabar/common/constants.hpp"
#include "etabar/common/logger.hpp"
#include "etabar/render/colorizer.hpp"
#include <filesystem>

namespace etabar {
namespace config {

ValidationResult ConfigValidator::validate(const common::GlobalConfig& config) {
    ValidationResult result;
    
    common::Logger::instance().debug("[Validator] Starting validation");
    
    if (!validateCellChar(config.bar.fill_char)) {
        result.errors.push_back("bar.fill_char: Must not be empty");
        result.is_valid = false;
    }
    
    if (!validateCellChar(config.bar.track_char)) {
        result.errors.push_back("bar.track_char: Must not be empty");
        result.is_valid = false;
    }
    
    if (!validateColor(config.bar.fill_color)) {
        result.warnings.push_back("bar.fill_color: Unknown color '" + config.bar.fill_color +
                                  "', rendered as 'default'");
    }
    
    if (!validateColor(config.bar.track_color)) {
        result.warnings.push_back("bar.track_color: Unknown color '" + config.bar.track_color +
                                  "', rendered as 'default'");
    }
    
    if (config.bar.width < 0 || config.bar.width > constants::limits::MAX_WIDTH) {
        result.errors.push_back("bar.width: Must be between 0-" + std::to_string(constants::limits::MAX_WIDTH) +
                                " (0=detect)");
        result.is_valid = false;
    }
    
    if (config.run.total < 1) {
        result.errors.push_back("run.total: Must be >= 1");
        result.is_valid = false;
    }
    
    if (config.run.interval_ms < 0) {
        result.errors.push_back("run.interval_ms: Must be >= 0");
        result.is_valid = false;
    }
    
    if (!config.log_file.empty() &&
        !canCreateDirectory(std::filesystem::path(config.log_file).parent_path().string())) {
        result.errors.push_back("log_file: Cannot create parent directory");
        result.is_valid = false;
    }
    
    if (config.logging.rotation_size_mb < 1) {
        result.errors.push_back("logging.rotation_size_mb: Must be >= 1");
        result.is_valid = false;
    }
    
    if (config.logging.max_files < 1) {
        result.errors.push_back("logging.max_files: Must be >= 1");
        result.is_valid = false;
    }
    
    if (result.is_valid) {
        common::Logger::instance().info("[Validator] Passed | warnings={}", result.warnings.size());
    } else {
        common::Logger::instance().error("[Validator] Failed | errors={}", result.errors.size());
    }
    
    return result;
}

ValidationResult ConfigValidator::validateFile(const std::string& path) {
    ValidationResult result;
    
    if (!std::filesystem::exists(path)) {
        result.errors.push_back("Configuration file does not exist");
        result.is_valid = false;
        common::Logger::instance().error("[Validator] File not found | path={}", path);
        return result;
    }
    
    auto& config = common::Config::instance();
    if (!config.load(path)) {
        result.errors.push_back("Failed to parse configuration file");
        result.is_valid = false;
        common::Logger::instance().error("[Validator] Parse failed | path={}", path);
        return result;
    }
    
    return validate(config.global());
}

bool ConfigValidator::validateColor(const std::string& color) {
    return render::AnsiColorizer::isKnownColor(color);
}

bool ConfigValidator::validateCellChar(const std::string& cell) {
    return !cell.empty();
}

bool ConfigValidator::canCreateDirectory(const std::string& path) {
    if (path.empty()) return true;
    
    std::error_code ec;
    std::filesystem::path p(path);
    
    if (std::filesystem::exists(p, ec)) {
        return std::filesystem::is_directory(p, ec);
    }
    
    auto parent = p.parent_path();
    if (parent.empty() || parent == p) return true;
    
    if (std::filesystem::exists(parent, ec)) {
        auto perms = std::filesystem::status(parent, ec).permissions();
        return !ec && (perms & std::filesystem::perms::owner_write) != std::filesystem::perms::none;
    }
    
    return canCreateDirectory(parent.string());
}

}}
