#include "etabar/render/eta.hpp"
#include "etabar/render/duration.hpp"
#include "etabar/render/error_codes.hpp"
#include "etabar/common/logger.hpp"
#include <cmath>
#include <limits>

namespace etabar {
namespace render {

EtaEstimate estimateRemaining(double percentage, std::chrono::duration<double> elapsed) {
    EtaEstimate estimate;
    
    if (!(percentage > 0.0)) {
        estimate.status = EtaStatus::NO_PROGRESS;
        return estimate;
    }
    
    double remaining = (elapsed.count() / percentage) * (100.0 - percentage);
    double rounded = std::ceil(remaining);
    
    constexpr double max_seconds = static_cast<double>(std::numeric_limits<std::int64_t>::max());
    if (!std::isfinite(rounded) || rounded >= max_seconds) {
        estimate.status = EtaStatus::FAILED;
        return estimate;
    }
    
    estimate.status = EtaStatus::OK;
    estimate.remaining_seconds = rounded > 0.0 ? static_cast<std::int64_t>(rounded) : 0;
    return estimate;
}

std::optional<std::int64_t> estimateRemainingSeconds(double percentage, std::chrono::duration<double> elapsed) {
    return estimateRemaining(percentage, elapsed).remaining_seconds;
}

std::string formatEta(double percentage, std::chrono::duration<double> elapsed) {
    auto estimate = estimateRemaining(percentage, elapsed);
    
    if (estimate.status == EtaStatus::FAILED) {
        common::Logger::instance().debug("[Eta] {} | code={} | percentage={} | elapsed_s={}",
                                         RenderErrorCodeHelper::getMessage(RenderErrorCode::ESTIMATION_FAILED),
                                         RenderErrorCodeHelper::toString(RenderErrorCode::ESTIMATION_FAILED),
                                         percentage, elapsed.count());
        return "";
    }
    
    if (!estimate.remaining_seconds) {
        return "";
    }
    
    return humanize(*estimate.remaining_seconds);
}

}}
