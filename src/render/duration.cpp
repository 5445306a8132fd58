#include "etabar/render/duration.hpp"

namespace etabar {
namespace render {

std::string humanize(std::int64_t seconds) {
    std::string result;
    std::int64_t remaining = seconds;
    
    for (const auto& unit : TIME_UNITS) {
        if (remaining < unit.seconds) continue;
        
        std::int64_t count = remaining / unit.seconds;
        
        if (!result.empty()) {
            result += ' ';
        }
        result += std::to_string(count);
        result += ' ';
        result += count == 1 ? unit.singular : unit.plural;
        
        remaining -= count * unit.seconds;
    }
    
    return result.empty() ? "0 seconds" : result;
}

}}
