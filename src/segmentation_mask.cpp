/**
 * @file segmentation_mask.cpp
 * @brief 이진 전경 마스크 생성 구현
 */

#include "backdrop_sdk/segmentation_mask.h"

#include <opencv2/core.hpp>

namespace backdrop_sdk {

bool buildSegmentationMask(const cv::Mat& depth, float cutoff, cv::Mat& mask) {
    if (depth.empty() || depth.type() != CV_32FC1) {
        return false;
    }

    mask.create(depth.rows, depth.cols, CV_32FC1);
    const int width = depth.cols;

    cv::parallel_for_(cv::Range(0, depth.rows), [&](const cv::Range& rows) {
        for (int y = rows.start; y < rows.end; ++y) {
            const float* depth_row = depth.ptr<float>(y);
            float* mask_row = mask.ptr<float>(y);
            for (int x = 0; x < width; ++x) {
                mask_row[x] = isForegroundDepth(depth_row[x], cutoff) ? 1.0f : 0.0f;
            }
        }
    });

    return true;
}

} // namespace backdrop_sdk
