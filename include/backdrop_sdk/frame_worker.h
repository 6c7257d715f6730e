/**
 * @file frame_worker.h
 * @brief 전용 프레임 처리 스레드 선언
 *
 * 프레임 준비 이벤트마다 submit()으로 틱을 넘기면 전용 스레드 하나가
 * 순서대로 처리. 처리보다 빨리 들어오는 틱은 쌓지 않고 최신 것만 남김.
 */

#pragma once

#include <cstdint>
#include <memory>

#include "backdrop_sdk/export.h"
#include "frame_processor.h"

namespace backdrop_sdk {

class PipelineState;

/**
 * @brief 프레임 워커
 *
 * - 틱 N의 처리가 끝난 뒤에 틱 N+1을 시작 (겹침/역순 없음)
 * - 아직 시작하지 않은 틱은 새 틱이 오면 버림 (크기 1 우편함)
 * - 처리 중인 틱은 취소하지 않음
 *
 * 출력이 만들어진 틱마다 sink가 워커 스레드에서 호출됨.
 *
 * 사용 예시:
 * @code
 * FrameWorker worker(processor, state, [](const cv::Mat& frame, const ProcessResult&) {
 *     display(frame);
 * });
 * worker.start();
 * worker.submit(std::move(tick));
 * @endcode
 */
class BACKDROP_SDK_EXPORT FrameWorker {
public:
    /**
     * @param processor 초기화된 프로세서 (워커보다 오래 살아야 함)
     * @param state 공유 상태 (워커보다 오래 살아야 함)
     * @param sink 출력 콜백
     */
    FrameWorker(FrameProcessor& processor, PipelineState& state, ProcessCallback sink);

    /// stop() 호출
    ~FrameWorker();

    // 복사 금지 (스레드 소유)
    FrameWorker(const FrameWorker&) = delete;
    FrameWorker& operator=(const FrameWorker&) = delete;

    /**
     * @brief 워커 스레드 시작
     * @return 이미 실행 중이거나 프로세서가 초기화되지 않았으면 false
     */
    bool start();

    /**
     * @brief 워커 종료
     *
     * 대기 중인 틱은 버리고, 처리 중인 틱은 끝까지 마친 뒤 스레드를 합류.
     */
    void stop();

    bool isRunning() const noexcept;

    /**
     * @brief 틱 제출
     *
     * 아직 처리되지 않은 이전 틱이 있으면 교체됨.
     *
     * @return 워커가 실행 중이 아니거나 stop()과 겹쳐 버려졌으면 false
     */
    bool submit(FrameTick tick);

    /**
     * @brief 제출한 틱이 모두 처리(또는 폐기)될 때까지 대기
     * @return 시간 안에 유휴 상태가 되면 true
     */
    bool waitIdle(int timeout_ms);

    // ========================================
    // 통계
    // ========================================

    uint64_t submittedCount() const noexcept;    ///< submit() 성공 횟수
    uint64_t processedCount() const noexcept;    ///< 출력이 만들어진 틱 수
    uint64_t skippedCount() const noexcept;      ///< 처리했으나 출력이 없는 틱 수 (드롭/오류)
    uint64_t staleDroppedCount() const noexcept; ///< 시작 전에 새 틱에 밀려 버려진 틱 수

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace backdrop_sdk
