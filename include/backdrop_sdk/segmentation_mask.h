/**
 * @file segmentation_mask.h
 * @brief 깊이 임계값 기반 이진 전경 마스크 생성
 */

#pragma once

#include "backdrop_sdk/export.h"

// OpenCV 전방 선언
namespace cv { class Mat; }

namespace backdrop_sdk {

/**
 * @brief 단일 깊이값의 전경 판정
 *
 * 0 < depth <= cutoff 일 때만 전경. 0, 음수, NaN(측정 없음)과
 * 컷오프보다 먼 값은 모두 배경.
 */
inline bool isForegroundDepth(float depth, float cutoff) noexcept {
    return depth > 0.0f && depth <= cutoff;
}

/**
 * @brief 이진 전경 마스크 생성
 *
 * 행 단위로 병렬 처리 (공유 가변 상태 없음).
 *
 * @param depth CV_32FC1 깊이 프레임 (미터)
 * @param cutoff 깊이 컷오프 (미터)
 * @param mask 출력 마스크 (CV_32FC1, 깊이와 동일 해상도, 값은 0 또는 1)
 * @return 입력이 유효하면 true
 */
BACKDROP_SDK_EXPORT bool buildSegmentationMask(const cv::Mat& depth, float cutoff, cv::Mat& mask);

} // namespace backdrop_sdk
