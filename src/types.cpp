/**
 * @file types.cpp
 * @brief 공용 타입 헬퍼 구현 (에러 코드 이름, 설정 검증)
 */

#include "backdrop_sdk/types.h"

#include <cmath>

namespace backdrop_sdk {

namespace {
    /// 큐브 축 샘플 수 상한 - 256^3 * 4 float = 256MB
    constexpr int MAX_CUBE_SIZE = 256;
}

const char* errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:                return "Success";
        case ErrorCode::NotInitialized:         return "NotInitialized";
        case ErrorCode::DepthFormatUnsupported: return "DepthFormatUnsupported";
        case ErrorCode::InvalidParameter:       return "InvalidParameter";
        case ErrorCode::FrameFormatUnsupported: return "FrameFormatUnsupported";
        case ErrorCode::FrameDropped:           return "FrameDropped";
        case ErrorCode::ProcessingFailed:       return "ProcessingFailed";
        case ErrorCode::ImageLoadFailed:        return "ImageLoadFailed";
        case ErrorCode::Unknown:
        default:
            return "Unknown";
    }
}

ErrorCode validateConfig(const PipelineConfig& config) noexcept {
    if (!std::isfinite(config.default_depth_cutoff) || config.default_depth_cutoff <= 0.0f) {
        return ErrorCode::InvalidParameter;
    }
    if (!std::isfinite(config.depth_margin) || config.depth_margin < 0.0f) {
        return ErrorCode::InvalidParameter;
    }

    // 매트
    if (!std::isfinite(config.matte.blur_radius) || config.matte.blur_radius < 0.0f) {
        return ErrorCode::InvalidParameter;
    }
    if (!std::isfinite(config.matte.gamma) || config.matte.gamma <= 0.0f) {
        return ErrorCode::InvalidParameter;
    }

    // 큐브 - 보간에 최소 2개 격자점 필요
    if (config.cube.size < 2 || config.cube.size > MAX_CUBE_SIZE) {
        return ErrorCode::InvalidParameter;
    }
    if (!std::isfinite(config.cube.reference_hue_deg)) {
        return ErrorCode::InvalidParameter;
    }
    if (!std::isfinite(config.cube.hue_range_deg) ||
        config.cube.hue_range_deg <= 0.0f || config.cube.hue_range_deg > 360.0f) {
        return ErrorCode::InvalidParameter;
    }

    return ErrorCode::Success;
}

} // namespace backdrop_sdk
