#pragma once

#include "../common/config.hpp"
#include <string>
#include <vector>

namespace etabar {
namespace config {

struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

class ConfigValidator {
public:
    ValidationResult validate(const common::GlobalConfig& config);
    ValidationResult validateFile(const std::string& path);
    
    static bool validateColor(const std::string& color);
    static bool validateCellChar(const std::string& cell);
    static bool canCreateDirectory(const std::string& path);
};

}}
