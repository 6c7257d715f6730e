/**
 * @file depth_cutoff_estimator.h
 * @brief 얼굴 위치 기반 적응형 깊이 컷오프 추정기 선언
 */

#pragma once

#include "backdrop_sdk/export.h"
#include "types.h"

// OpenCV 전방 선언
namespace cv { class Mat; }

namespace backdrop_sdk {

/**
 * @brief 깊이 프레임 샘플 좌표
 */
struct DepthSamplePoint {
    int x = 0;
    int y = 0;
};

/**
 * @brief 컷오프 추정 결과
 */
struct CutoffEstimate {
    float cutoff = 1.0f;        ///< 다음 틱에 사용할 컷오프 (미터)
    bool updated = false;       ///< 얼굴 깊이로 갱신되었는지 여부
    float sampled_depth = 0.0f; ///< 얼굴 중심에서 읽은 깊이 (갱신 시에만 의미)
    DepthSamplePoint sample;    ///< 샘플 위치 (깊이 프레임 좌표)
};

/**
 * @brief 얼굴 중심을 깊이 프레임 좌표로 변환
 *
 * 얼굴 사각형 중심을 Wd/W, Hd/H 비율로 축소하고 가장 가까운 정수로 반올림한 뒤
 * 깊이 프레임 범위 [0, Wd-1] x [0, Hd-1]로 고정(clamp).
 *
 * @param face 컬러 프레임 좌표의 얼굴 사각형
 * @param color_width 컬러 프레임 너비 (> 0)
 * @param color_height 컬러 프레임 높이 (> 0)
 * @param depth_width 깊이 프레임 너비 (> 0)
 * @param depth_height 깊이 프레임 높이 (> 0)
 * @return 범위 내 샘플 좌표
 */
BACKDROP_SDK_EXPORT DepthSamplePoint faceCenterToDepth(const Rect& face,
                                                       int color_width, int color_height,
                                                       int depth_width, int depth_height) noexcept;

/**
 * @brief 적응형 깊이 컷오프 추정기
 *
 * 얼굴이 보이면 컷오프 = 얼굴 중심 깊이 + 여유(margin).
 * 얼굴이 없거나 해당 위치 깊이가 무효(0 이하/NaN)이면 기존 값을 유지(sticky).
 *
 * 사용 예시:
 * @code
 * DepthCutoffEstimator estimator(0.25f);
 * CutoffEstimate est = estimator.estimate(depth, 640, 480, &face, state.depthCutoff());
 * if (est.updated) state.setDepthCutoff(est.cutoff);
 * @endcode
 */
class BACKDROP_SDK_EXPORT DepthCutoffEstimator {
public:
    explicit DepthCutoffEstimator(float margin = 0.25f);

    /**
     * @brief 컷오프 추정
     *
     * @param depth CV_32FC1 깊이 프레임 (미터)
     * @param color_width 컬러 프레임 너비
     * @param color_height 컬러 프레임 높이
     * @param face 얼굴 사각형 (nullptr이면 얼굴 없음)
     * @param current_cutoff 현재 컷오프
     * @return 추정 결과 (갱신되지 않으면 cutoff == current_cutoff)
     */
    CutoffEstimate estimate(const cv::Mat& depth,
                            int color_width,
                            int color_height,
                            const Rect* face,
                            float current_cutoff) const;

    float margin() const noexcept { return margin_; }

    /**
     * @brief 여유값 설정
     * @param margin 0 이상 유한값 (아니면 무시)
     */
    void setMargin(float margin) noexcept;

private:
    float margin_;
};

} // namespace backdrop_sdk
