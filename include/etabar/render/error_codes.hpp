#pragma once

#include "../common/error_framework.hpp"
#include <stdexcept>
#include <unordered_map>

namespace etabar {
namespace render {

enum class RenderErrorCode {
    INVALID_TOTAL = 100,
    INVALID_PROGRESS = 101,
    PROGRESS_REGRESSION = 102,

    ESTIMATION_FAILED = 200
};

using RenderErrorCodeHelper = common::ErrorRegistry<RenderErrorCode>;

}
}

namespace etabar {
namespace common {

template<>
inline const std::unordered_map<render::RenderErrorCode, ErrorInfo<render::RenderErrorCode>>&
ErrorRegistry<render::RenderErrorCode>::getInfoMap() {
    static const std::unordered_map<render::RenderErrorCode, ErrorInfo<render::RenderErrorCode>> map = {
        {render::RenderErrorCode::INVALID_TOTAL, {
            render::RenderErrorCode::INVALID_TOTAL,
            "INVALID_TOTAL",
            "Total must be a number greater than or equal to 1"
        }},
        {render::RenderErrorCode::INVALID_PROGRESS, {
            render::RenderErrorCode::INVALID_PROGRESS,
            "INVALID_PROGRESS",
            "Progress value must be a non-negative number"
        }},
        {render::RenderErrorCode::PROGRESS_REGRESSION, {
            render::RenderErrorCode::PROGRESS_REGRESSION,
            "PROGRESS_REGRESSION",
            "Progress value is smaller than current progress"
        }},
        {render::RenderErrorCode::ESTIMATION_FAILED, {
            render::RenderErrorCode::ESTIMATION_FAILED,
            "ESTIMATION_FAILED",
            "Remaining time could not be estimated"
        }}
    };
    return map;
}

}
}

namespace etabar {
namespace render {

class InvalidArgument : public std::invalid_argument {
public:
    InvalidArgument(RenderErrorCode code, const common::ErrorContext& context)
        : std::invalid_argument(common::formatError(code, context)),
          code_(code),
          context_(context) {}

    RenderErrorCode code() const { return code_; }
    const common::ErrorContext& context() const { return context_; }

private:
    RenderErrorCode code_;
    common::ErrorContext context_;
};

}
}
