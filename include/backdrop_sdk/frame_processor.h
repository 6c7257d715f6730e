/**
 * @file frame_processor.h
 * @brief 프레임 처리 파이프라인 선언
 *
 * 깊이 컷오프 추정, 분할 마스크, 알파 매트, 배경 합성, 색상 치환을
 * 하나의 틱 처리로 묶는 파이프라인.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include <opencv2/core.hpp>

#include "backdrop_sdk/export.h"
#include "types.h"

namespace backdrop_sdk {

class PipelineState;

/**
 * @brief 깊이 소스 능력 정보
 * initialize() 시점에 Float32 지원 여부를 확인하는 데 사용
 */
struct BACKDROP_SDK_EXPORT DepthSourceInfo {
    std::vector<DepthPixelFormat> formats;  ///< 소스가 제공할 수 있는 포맷 목록
};

/**
 * @brief 동기화 계층이 전달하는 한 틱의 입력
 *
 * color와 depth는 같은 시점에 캡처된 것으로 간주.
 * 어느 한쪽이라도 드롭되었으면 틱 전체를 건너뜀.
 */
struct BACKDROP_SDK_EXPORT FrameTick {
    cv::Mat color;                          ///< CV_8UC4 컬러 프레임
    FrameFormat format = FrameFormat::BGRA; ///< 컬러 채널 순서
    cv::Mat depth;                          ///< CV_32FC1 깊이 (미터). 비어 있으면 매트 생략
    bool has_face = false;                  ///< 얼굴 메타데이터 존재 여부
    Rect face{};                            ///< 얼굴 바운딩 박스 (컬러 프레임 좌표)
    bool color_dropped = false;             ///< 컬러 프레임 드롭 여부
    bool depth_dropped = false;             ///< 깊이 프레임 드롭 여부
    int64_t timestamp_ms = 0;               ///< 캡처 시각 (진단용)
};

/**
 * @brief 프레임 처리 결과
 */
struct BACKDROP_SDK_EXPORT ProcessResult {
    bool success = false;           ///< 처리 성공 여부
    bool produced = false;          ///< 출력 프레임 생성 여부
    ErrorCode error_code = ErrorCode::Success; ///< 에러 코드
    bool matte_applied = false;     ///< 깊이 매트로 합성했는지 여부
    bool cutoff_updated = false;    ///< 이번 틱에서 깊이 컷오프가 갱신되었는지 여부
    float depth_cutoff = 0.0f;      ///< 이번 틱에 사용한 컷오프 (미터)
    float processing_time_ms = 0.0f; ///< 총 처리 시간 (밀리초)
    float matte_time_ms = 0.0f;      ///< 마스크 + 매트 생성 시간 (밀리초)
    float composite_time_ms = 0.0f;  ///< 배경 합성 시간 (밀리초)
    float remap_time_ms = 0.0f;      ///< 색상 치환 시간 (밀리초)
};

/**
 * @brief 프레임 처리 콜백 타입
 * 출력 프레임은 콜백 안에서만 유효
 */
using ProcessCallback = std::function<void(const cv::Mat&, const ProcessResult&)>;

/**
 * @brief 프레임 처리 파이프라인
 *
 * 틱마다 상태 스냅샷을 한 번 찍고, 그 값으로 전 단계를 처리합니다.
 * 파이프라인이 상태에 쓰는 값은 얼굴 기반 깊이 컷오프뿐입니다.
 *
 * 처리 순서:
 * 1. 깊이 컷오프 추정 (얼굴이 있을 때)
 * 2. 분할 마스크 → 알파 매트 (배경 표시 중일 때)
 * 3. 배경 합성
 * 4. 색상 치환 (컬러 큐브)
 *
 * @note Pimpl 패턴으로 구현 세부사항 은닉
 * @note 스레드 안전하지 않음 - 워커 스레드 하나에서 사용
 *
 * 사용 예시:
 * @code
 * PipelineState state;
 * FrameProcessor processor;
 * processor.initialize(PipelineConfig{}, DepthSourceInfo{{DepthPixelFormat::Float32}});
 *
 * cv::Mat output;
 * ProcessResult result = processor.process(tick, state, output);
 * if (result.produced) {
 *     // output 표시
 * }
 * @endcode
 */
class BACKDROP_SDK_EXPORT FrameProcessor {
public:
    FrameProcessor();
    ~FrameProcessor();

    // 복사 금지 (Pimpl 사용)
    FrameProcessor(const FrameProcessor&) = delete;
    FrameProcessor& operator=(const FrameProcessor&) = delete;

    // 이동 지원
    FrameProcessor(FrameProcessor&&) noexcept;
    FrameProcessor& operator=(FrameProcessor&&) noexcept;

    // ========================================
    // 초기화 및 해제
    // ========================================

    /**
     * @brief 프로세서 초기화
     *
     * 설정을 검증하고 깊이 소스가 Float32를 제공하는지 확인합니다.
     *
     * @param config 파이프라인 설정
     * @param depth_source 깊이 소스 능력
     * @return Success, InvalidParameter(설정 범위 오류), DepthFormatUnsupported
     */
    ErrorCode initialize(const PipelineConfig& config,
                         const DepthSourceInfo& depth_source);

    /**
     * @brief 리소스 해제
     *
     * 캐시된 컬러 큐브와 배경을 해제합니다.
     */
    void release();

    /**
     * @brief 초기화 상태 확인
     * @return 초기화 완료 여부
     */
    bool isInitialized() const noexcept;

    // ========================================
    // 프레임 처리
    // ========================================

    /**
     * @brief 한 틱 처리
     *
     * 드롭된 틱은 출력 없이 FrameDropped를 반환하고 상태도 바꾸지 않습니다.
     * 깊이가 없거나 사용할 수 없으면 매트 없이 합성 단계를 통과합니다.
     *
     * @param tick 동기화된 입력
     * @param state 공유 상태 (깊이 컷오프 갱신 대상)
     * @param output 출력 프레임 (CV_8UC4, 컬러 프레임 해상도/채널 순서)
     * @return 처리 결과
     */
    ProcessResult process(const FrameTick& tick,
                          PipelineState& state,
                          cv::Mat& output);

    // ========================================
    // 조회
    // ========================================

    /// 현재 설정 (초기화 전에는 기본값)
    PipelineConfig config() const;

    /**
     * @brief 컬러 큐브 생성 횟수
     * 같은 색상이 유지되는 동안 증가하지 않아야 함
     */
    uint64_t colorCubeBuildCount() const noexcept;

    // ========================================
    // 통계
    // ========================================

    /**
     * @brief 마지막 처리 시간 조회
     * @return 마지막 처리 시간 (밀리초)
     */
    double getLastProcessingTimeMs() const noexcept;

    /**
     * @brief 평균 FPS 조회
     *
     * 최근 처리 기록 기반 평균 FPS를 반환합니다.
     *
     * @return 평균 FPS (처리 기록이 없으면 0.0)
     */
    double getAverageFPS() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace backdrop_sdk
