/**
 * @file pipeline_state.cpp
 * @brief 파이프라인 공유 상태 구현
 */

#include "backdrop_sdk/pipeline_state.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace backdrop_sdk {

namespace {
    constexpr float FALLBACK_DEPTH_CUTOFF = 1.0f;

    /// [0, 1) 범위로 순환
    float wrapUnit(float value) {
        float wrapped = value - std::floor(value);
        // float 반올림으로 1.0이 나올 수 있음
        if (wrapped >= 1.0f) {
            wrapped = 0.0f;
        }
        return wrapped;
    }
}

PipelineState::PipelineState(float default_depth_cutoff) {
    if (std::isfinite(default_depth_cutoff) && default_depth_cutoff > 0.0f) {
        state_.depth_cutoff = default_depth_cutoff;
    } else {
        state_.depth_cutoff = FALLBACK_DEPTH_CUTOFF;
    }
}

StateSnapshot PipelineState::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool PipelineState::setHue(float value) {
    if (!std::isfinite(value)) {
        return false;
    }

    const float wrapped = wrapUnit(value);
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.hue != wrapped) {
        state_.hue = wrapped;
        ++revision_;
    }
    return true;
}

float PipelineState::hue() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.hue;
}

bool PipelineState::toggleBackgroundVisible() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.background_visible = !state_.background_visible;
    ++revision_;
    return state_.background_visible;
}

void PipelineState::setBackgroundVisible(bool visible) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.background_visible != visible) {
        state_.background_visible = visible;
        ++revision_;
    }
}

bool PipelineState::isBackgroundVisible() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.background_visible;
}

bool PipelineState::setBackgroundSaturation(float value) {
    if (!std::isfinite(value)) {
        return false;
    }

    const float clamped = std::clamp(value, 0.0f, 1.0f);
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.background_saturation != clamped) {
        state_.background_saturation = clamped;
        ++revision_;
    }
    return true;
}

float PipelineState::backgroundSaturation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.background_saturation;
}

bool PipelineState::setDepthCutoff(float meters) {
    if (!std::isfinite(meters) || meters <= 0.0f) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.depth_cutoff != meters) {
        state_.depth_cutoff = meters;
        ++revision_;
    }
    return true;
}

float PipelineState::depthCutoff() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.depth_cutoff;
}

bool PipelineState::setBackgroundImage(std::shared_ptr<const cv::Mat> image) {
    if (!image || image->empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state_.background_image = std::move(image);
    ++revision_;
    return true;
}

void PipelineState::clearBackground() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.background_image) {
        state_.background_image.reset();
        ++revision_;
    }
}

std::shared_ptr<const cv::Mat> PipelineState::backgroundImage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.background_image;
}

bool PipelineState::hasBackgroundImage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(state_.background_image);
}

uint64_t PipelineState::revision() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return revision_;
}

} // namespace backdrop_sdk
