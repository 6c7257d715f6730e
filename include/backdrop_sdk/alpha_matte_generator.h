/**
 * @file alpha_matte_generator.h
 * @brief 이진 마스크 → 연속 알파 매트 변환기 선언
 *
 * 블러 → 감마 → 바이큐빅 업스케일 순서로 깊이 해상도 마스크를
 * 컬러 프레임 해상도의 부드러운 알파 매트로 변환.
 */

#pragma once

#include <memory>

#include "backdrop_sdk/export.h"
#include "types.h"

// OpenCV 전방 선언
namespace cv { class Mat; }

namespace backdrop_sdk {

/**
 * @brief 알파 매트 생성기
 *
 * 처리 순서:
 * 1. 가장자리 복제(clamp-to-edge) 경계로 프레임 밖 값이 스며들지 않게 함
 * 2. 가우시안 블러 (sigma = blur_radius)
 * 3. 감마 보정 value^gamma
 * 4. 원래 마스크 범위 유지 (블러로 인한 범위 확장 없음)
 * 5. 바이큐빅 보간으로 컬러 해상도까지 업스케일, [0, 1]로 고정
 *
 * @note 내부 버퍼를 재사용하므로 스레드 안전하지 않음 - 워커 스레드 하나에서 사용
 */
class BACKDROP_SDK_EXPORT AlphaMatteGenerator {
public:
    explicit AlphaMatteGenerator(const MatteConfig& config = MatteConfig{});
    ~AlphaMatteGenerator();

    // 복사 금지 (Pimpl 사용)
    AlphaMatteGenerator(const AlphaMatteGenerator&) = delete;
    AlphaMatteGenerator& operator=(const AlphaMatteGenerator&) = delete;

    // 이동 지원
    AlphaMatteGenerator(AlphaMatteGenerator&&) noexcept;
    AlphaMatteGenerator& operator=(AlphaMatteGenerator&&) noexcept;

    /**
     * @brief 알파 매트 생성
     *
     * @param mask CV_32FC1 이진 마스크 (0 또는 1)
     * @param target_width 출력 너비 (>= 마스크 너비)
     * @param target_height 출력 높이 (>= 마스크 높이)
     * @param matte 출력 매트 (CV_32FC1, target 해상도, [0, 1])
     * @return 입력이 유효하면 true
     */
    bool generate(const cv::Mat& mask,
                  int target_width,
                  int target_height,
                  cv::Mat& matte);

    const MatteConfig& config() const noexcept;

    /**
     * @brief 설정 변경
     * @return 블러 반경이 음수/비유한이거나 감마가 0 이하이면 false
     */
    bool setConfig(const MatteConfig& config);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace backdrop_sdk
