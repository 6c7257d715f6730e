/**
 * @file background_loader.h
 * @brief 배경 이미지 준비(크롭/스케일/채널 변환) 및 비동기 로더 선언
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "backdrop_sdk/export.h"
#include "types.h"

// OpenCV 전방 선언
namespace cv { class Mat; }

namespace backdrop_sdk {

class PipelineState;

/**
 * @brief 배경 이미지를 컬러 프레임 규격으로 준비
 *
 * 1. 대상 종횡비에 맞게 중앙 크롭 (scale = min(iw/W, ih/H))
 * 2. 대상 해상도로 리사이즈
 * 3. 대상 채널 순서의 CV_8UC4로 변환
 *
 * 입력 채널 해석: 1채널 = 회색조, 3채널 = BGR (OpenCV 기본),
 * 4채널 = 이미 대상 format 순서.
 *
 * @param image 8비트 입력 이미지 (임의 종횡비)
 * @param target_width 컬러 프레임 너비
 * @param target_height 컬러 프레임 높이
 * @param format 컬러 프레임 채널 순서
 * @param output 준비된 이미지 (CV_8UC4, target 해상도)
 * @return Success, InvalidParameter(빈 이미지/잘못된 크기), FrameFormatUnsupported(채널/깊이)
 */
BACKDROP_SDK_EXPORT ErrorCode prepareBackground(const cv::Mat& image,
                                                int target_width,
                                                int target_height,
                                                FrameFormat format,
                                                cv::Mat& output);

/**
 * @brief 배경 이미지 로더
 *
 * 이미지를 준비한 뒤 완성된 결과만 PipelineState에 원자적으로 게시.
 * 실패하면 이전 배경(또는 배경 없음)을 그대로 둠.
 *
 * 비동기 요청은 전용 스레드에서 처리되며, 처리 전에 새 요청이 오면
 * 이전 요청은 버려짐 (최신 요청 우선). 프레임 처리 경로를 막지 않음.
 *
 * 사용 예시:
 * @code
 * PipelineState state;
 * BackgroundLoader loader(state, 1280, 720, FrameFormat::BGRA);
 * loader.loadAsync("beach.jpg");
 * @endcode
 */
class BACKDROP_SDK_EXPORT BackgroundLoader {
public:
    /**
     * @param state 결과를 게시할 상태 (로더보다 오래 살아야 함)
     * @param target_width 컬러 프레임 너비
     * @param target_height 컬러 프레임 높이
     * @param format 컬러 프레임 채널 순서
     */
    BackgroundLoader(PipelineState& state,
                     int target_width,
                     int target_height,
                     FrameFormat format = FrameFormat::BGRA);

    /// 진행 중인 요청을 마치고 스레드 종료
    ~BackgroundLoader();

    // 복사/이동 금지 (스레드 소유)
    BackgroundLoader(const BackgroundLoader&) = delete;
    BackgroundLoader& operator=(const BackgroundLoader&) = delete;

    // ========================================
    // 동기 로드
    // ========================================

    /**
     * @brief 메모리 이미지 로드 (호출 스레드에서 처리)
     * @return 처리 결과 (실패 시 상태 변경 없음)
     */
    ErrorCode load(const cv::Mat& image);

    /**
     * @brief 파일 이미지 로드 (호출 스레드에서 처리)
     * @return ImageLoadFailed - 디코딩 실패
     */
    ErrorCode load(const std::string& path);

    // ========================================
    // 비동기 로드
    // ========================================

    /**
     * @brief 메모리 이미지 비동기 로드
     *
     * 이미지는 참조 카운트로 공유되므로 호출자는 요청 후 버퍼를 수정하지 말 것.
     *
     * @return 로더가 종료되었으면 false
     */
    bool loadAsync(const cv::Mat& image);

    /// 파일 이미지 비동기 로드
    bool loadAsync(const std::string& path);

    /**
     * @brief 대기 중/처리 중인 비동기 요청이 끝날 때까지 대기
     * @param timeout_ms 최대 대기 시간
     * @return 시간 안에 유휴 상태가 되면 true
     */
    bool waitIdle(int timeout_ms);

    /**
     * @brief 대상 해상도/포맷 변경 (이후 요청부터 적용)
     * @return 크기가 0 이하이면 false
     */
    bool setTarget(int target_width, int target_height, FrameFormat format);

    // ========================================
    // 통계
    // ========================================

    uint64_t loadedCount() const noexcept;      ///< 게시에 성공한 횟수
    uint64_t failedCount() const noexcept;      ///< 실패 횟수
    uint64_t supersededCount() const noexcept;  ///< 새 요청에 밀려 버려진 비동기 요청 수
    ErrorCode lastError() const noexcept;       ///< 마지막 처리 결과

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace backdrop_sdk
