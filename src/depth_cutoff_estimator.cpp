/**
 * @file depth_cutoff_estimator.cpp
 * @brief 적응형 깊이 컷오프 추정기 구현
 */

#include "backdrop_sdk/depth_cutoff_estimator.h"

#include <algorithm>
#include <cmath>

#include <opencv2/core.hpp>

namespace backdrop_sdk {

DepthSamplePoint faceCenterToDepth(const Rect& face,
                                   int color_width, int color_height,
                                   int depth_width, int depth_height) noexcept {
    DepthSamplePoint point;
    if (color_width <= 0 || color_height <= 0 || depth_width <= 0 || depth_height <= 0) {
        return point;
    }

    const double center_x = static_cast<double>(face.x) + face.width / 2.0;
    const double center_y = static_cast<double>(face.y) + face.height / 2.0;

    const double scale_x = static_cast<double>(depth_width) / color_width;
    const double scale_y = static_cast<double>(depth_height) / color_height;

    double px = std::round(center_x * scale_x);
    double py = std::round(center_y * scale_y);

    // NaN 좌표는 원점으로
    if (std::isnan(px)) px = 0.0;
    if (std::isnan(py)) py = 0.0;

    // 범위 밖 얼굴 좌표는 가장자리 픽셀로 고정
    px = std::clamp(px, 0.0, static_cast<double>(depth_width - 1));
    py = std::clamp(py, 0.0, static_cast<double>(depth_height - 1));

    point.x = static_cast<int>(px);
    point.y = static_cast<int>(py);
    return point;
}

DepthCutoffEstimator::DepthCutoffEstimator(float margin)
    : margin_(0.25f) {
    setMargin(margin);
}

void DepthCutoffEstimator::setMargin(float margin) noexcept {
    if (std::isfinite(margin) && margin >= 0.0f) {
        margin_ = margin;
    }
}

CutoffEstimate DepthCutoffEstimator::estimate(const cv::Mat& depth,
                                              int color_width,
                                              int color_height,
                                              const Rect* face,
                                              float current_cutoff) const {
    CutoffEstimate result;
    result.cutoff = current_cutoff;

    // 얼굴 없음은 정상 상황 - 컷오프 유지
    if (face == nullptr) {
        return result;
    }

    if (depth.empty() || depth.type() != CV_32FC1) {
        return result;
    }

    result.sample = faceCenterToDepth(*face, color_width, color_height,
                                      depth.cols, depth.rows);

    const float sampled = depth.at<float>(result.sample.y, result.sample.x);
    result.sampled_depth = sampled;

    // 깊이 구멍(무효값)에서는 컷오프를 0 이하로 만들지 않도록 유지
    if (!std::isfinite(sampled) || sampled <= 0.0f) {
        return result;
    }

    result.cutoff = sampled + margin_;
    result.updated = true;
    return result;
}

} // namespace backdrop_sdk
