#pragma once

#include <string>
#include <vector>

namespace etabar {
namespace render {

class Colorizer {
public:
    virtual ~Colorizer() = default;
    
    virtual std::string colorize(const std::string& color, const std::string& text) const = 0;
};

// Wraps text in the named ANSI escape sequence and always appends the reset
// code. Unknown names resolve to "default".
class AnsiColorizer : public Colorizer {
public:
    static constexpr const char* DEFAULT_COLOR = "default";
    
    std::string colorize(const std::string& color, const std::string& text) const override;
    
    static const std::string& escapeCode(const std::string& color);
    static bool isKnownColor(const std::string& color);
    static std::vector<std::string> names();
};

class PlainColorizer : public Colorizer {
public:
    std::string colorize(const std::string& color, const std::string& text) const override;
};

}}
