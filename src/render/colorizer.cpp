#include "etabar/render/colorizer.hpp"
#include <map>

namespace etabar {
namespace render {

namespace {

const std::map<std::string, std::string>& colorTable() {
    static const std::map<std::string, std::string> table = {
        {"black",        "\033[0;30m"},
        {"red",          "\033[0;31m"},
        {"light-red",    "\033[1;31m"},
        {"green",        "\033[0;32m"},
        {"light-green",  "\033[1;32m"},
        {"brown",        "\033[0;33m"},
        {"orange",       "\033[0;33m"},
        {"blue",         "\033[0;34m"},
        {"light-blue",   "\033[1;34m"},
        {"purple",       "\033[0;35m"},
        {"light-purple", "\033[1;35m"},
        {"cyan",         "\033[0;36m"},
        {"light-cyan",   "\033[1;36m"},
        {"light-gray",   "\033[0;37m"},
        {"dark-gray",    "\033[1;30m"},
        {"yellow",       "\033[1;33m"},
        {"white",        "\033[1;37m"},
        {"default",      "\033[0m"}
    };
    return table;
}

}

const std::string& AnsiColorizer::escapeCode(const std::string& color) {
    const auto& table = colorTable();
    auto it = table.find(color);
    if (it == table.end()) {
        it = table.find(DEFAULT_COLOR);
    }
    return it->second;
}

bool AnsiColorizer::isKnownColor(const std::string& color) {
    return colorTable().count(color) > 0;
}

std::vector<std::string> AnsiColorizer::names() {
    std::vector<std::string> result;
    result.reserve(colorTable().size());
    for (const auto& entry : colorTable()) {
        result.push_back(entry.first);
    }
    return result;
}

std::string AnsiColorizer::colorize(const std::string& color, const std::string& text) const {
    return escapeCode(color) + text + escapeCode(DEFAULT_COLOR);
}

std::string PlainColorizer::colorize(const std::string&, const std::string& text) const {
    return text;
}

}}
