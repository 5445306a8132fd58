#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace etabar {
namespace render {

enum class EtaStatus {
    OK,
    NO_PROGRESS,
    FAILED
};

struct EtaEstimate {
    EtaStatus status = EtaStatus::NO_PROGRESS;
    std::optional<std::int64_t> remaining_seconds;
};

// Linear extrapolation: (elapsed / percentage) * (100 - percentage),
// rounded up to whole seconds and clamped at zero.
EtaEstimate estimateRemaining(double percentage, std::chrono::duration<double> elapsed);

std::optional<std::int64_t> estimateRemainingSeconds(double percentage, std::chrono::duration<double> elapsed);

// Human-readable ETA, or an empty string when no estimate is available.
std::string formatEta(double percentage, std::chrono::duration<double> elapsed);

}}
