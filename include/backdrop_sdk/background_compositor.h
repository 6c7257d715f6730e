/**
 * @file background_compositor.h
 * @brief 라이브 프레임 / 배경 이미지 / 알파 매트 합성기 선언
 */

#pragma once

#include <cstddef>
#include <memory>

#include "backdrop_sdk/export.h"
#include "types.h"
#include "pipeline_state.h"

namespace backdrop_sdk {

/**
 * @brief 배경 합성기
 *
 * - 배경 숨김: 출력 = 입력 프레임 (매트/배경은 참조하지 않음)
 * - 배경 표시 + 이미지 없음: 검정 배경과 합성
 * - 배경 표시 + 이미지: 채도 조정한 배경과 합성
 *
 * 합성식: out = lerp(background, frame, alpha), alpha = 1이면 라이브 프레임.
 * 출력 알파 채널은 라이브 프레임의 알파를 그대로 사용.
 *
 * 채도 조정 결과는 (이미지, 채도, 해상도) 조합별로 캐시되어
 * 값이 바뀔 때만 다시 계산.
 *
 * @note 내부 캐시 때문에 스레드 안전하지 않음 - 워커 스레드 하나에서 사용
 */
class BACKDROP_SDK_EXPORT BackgroundCompositor {
public:
    BackgroundCompositor();
    ~BackgroundCompositor();

    // 복사 금지 (Pimpl 사용)
    BackgroundCompositor(const BackgroundCompositor&) = delete;
    BackgroundCompositor& operator=(const BackgroundCompositor&) = delete;

    // 이동 지원
    BackgroundCompositor(BackgroundCompositor&&) noexcept;
    BackgroundCompositor& operator=(BackgroundCompositor&&) noexcept;

    /**
     * @brief 합성 수행
     *
     * @param frame CV_8UC4 라이브 프레임
     * @param alpha CV_32FC1 알파 매트 (frame과 같은 해상도). 배경 숨김이면 무시되며 nullptr 허용
     * @param state 이번 틱의 상태 스냅샷
     * @param format 채널 순서
     * @param output 출력 프레임 (CV_8UC4, frame과 같은 해상도)
     * @return 입력이 유효하면 true
     */
    bool composite(const cv::Mat& frame,
                   const cv::Mat* alpha,
                   const StateSnapshot& state,
                   FrameFormat format,
                   cv::Mat& output);

    /**
     * @brief 채도 조정 재계산 횟수
     * 캐시 동작 확인용
     */
    std::size_t saturationAdjustCount() const noexcept;

    /// 캐시된 배경 해제
    void clearCache();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief 배경 채도 조정
 *
 * Rec.709 휘도로 회색조를 만들고 lerp(gray, color, saturation)로 보간.
 * 알파 채널은 유지.
 *
 * @param image CV_8UC4 이미지
 * @param saturation 채도 [0, 1] (범위 밖 값은 고정)
 * @param format 채널 순서
 * @param output 출력 이미지
 * @return 입력이 CV_8UC4가 아니면 false
 */
BACKDROP_SDK_EXPORT bool adjustSaturation(const cv::Mat& image,
                                          float saturation,
                                          FrameFormat format,
                                          cv::Mat& output);

} // namespace backdrop_sdk
