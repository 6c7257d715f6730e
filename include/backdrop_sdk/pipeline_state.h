/**
 * @file pipeline_state.h
 * @brief 파이프라인 공유 제어 상태 선언
 *
 * 제스처/입력 처리 경로, 비동기 배경 로더, 프레임 워커가 함께 접근하는
 * 상태(깊이 컷오프, 색상, 배경 표시/채도/이미지)를 한 객체로 모음.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include <opencv2/core.hpp>

#include "backdrop_sdk/export.h"
#include "types.h"

namespace backdrop_sdk {

/**
 * @brief 한 틱 동안 사용하는 상태 스냅샷
 *
 * PipelineState::snapshot()이 한 번의 임계 구역에서 복사하므로
 * 필드 간 일관성이 보장됨.
 */
struct BACKDROP_SDK_EXPORT StateSnapshot {
    float depth_cutoff = 1.0f;              ///< 깊이 컷오프 (미터, > 0)
    float hue = 0.0f;                       ///< 목표 색상 [0, 1)
    bool background_visible = false;        ///< 배경 합성 여부
    float background_saturation = 1.0f;     ///< 배경 채도 [0, 1]
    std::shared_ptr<const cv::Mat> background_image; ///< 준비 완료된 배경 (없으면 nullptr)
};

/**
 * @brief 파이프라인 공유 상태
 *
 * 모든 필드는 하나의 뮤텍스로 보호됨. 배경 이미지는 불변 cv::Mat을 가리키는
 * shared_ptr 교체로 원자적으로 갱신되므로, 리더는 준비 중인 이미지를 볼 수 없음.
 *
 * 파이프라인 자신은 depth_cutoff만 갱신하고, 나머지는 외부 제어 호출이 갱신.
 *
 * @note 스레드 안전
 */
class BACKDROP_SDK_EXPORT PipelineState {
public:
    /**
     * @brief 기본값으로 상태 생성
     * @param default_depth_cutoff 초기 깊이 컷오프 (0 이하/비유한 값이면 1.0 사용)
     */
    explicit PipelineState(float default_depth_cutoff = 1.0f);

    // 복사/이동 금지 (여러 경로가 참조로 공유)
    PipelineState(const PipelineState&) = delete;
    PipelineState& operator=(const PipelineState&) = delete;

    /**
     * @brief 현재 상태의 일관된 복사본
     */
    StateSnapshot snapshot() const;

    // ========================================
    // 제어 입력
    // ========================================

    /**
     * @brief 목표 색상 설정
     *
     * 값은 [0, 1)로 순환(wrap)됨. 1.0은 0으로 저장.
     *
     * @param value 목표 색상 (한 바퀴 = 1.0)
     * @return NaN/무한대이면 false (상태 변경 없음)
     */
    bool setHue(float value);

    /// 현재 목표 색상
    float hue() const;

    /**
     * @brief 배경 표시 토글
     * @return 토글 후 표시 여부
     */
    bool toggleBackgroundVisible();

    void setBackgroundVisible(bool visible);
    bool isBackgroundVisible() const;

    /**
     * @brief 배경 채도 설정
     *
     * 1.0 = 원본 색, 0.0 = 완전 회색조. 범위 밖 값은 [0, 1]로 고정(clamp).
     *
     * @param value 채도
     * @return NaN/무한대이면 false
     */
    bool setBackgroundSaturation(float value);

    float backgroundSaturation() const;

    /**
     * @brief 깊이 컷오프 설정
     * @param meters 새 컷오프 (> 0)
     * @return 0 이하/비유한 값이면 false (이전 값 유지)
     */
    bool setDepthCutoff(float meters);

    float depthCutoff() const;

    /**
     * @brief 준비 완료된 배경 이미지 교체
     *
     * 이미지는 컬러 프레임 해상도/채널 순서로 준비된 CV_8UC4여야 함.
     * 빈 포인터나 빈 이미지는 무시.
     *
     * @return 교체 여부
     */
    bool setBackgroundImage(std::shared_ptr<const cv::Mat> image);

    /// 배경 이미지 제거
    void clearBackground();

    std::shared_ptr<const cv::Mat> backgroundImage() const;
    bool hasBackgroundImage() const;

    /**
     * @brief 상태 변경 횟수
     *
     * 값이 실제로 바뀐 변경마다 1 증가. 관측/진단용.
     */
    uint64_t revision() const;

private:
    mutable std::mutex mutex_;
    StateSnapshot state_;
    uint64_t revision_ = 0;
};

} // namespace backdrop_sdk
