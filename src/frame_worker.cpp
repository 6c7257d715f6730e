/**
 * @file frame_worker.cpp
 * @brief 전용 프레임 처리 스레드 구현
 */

#include "backdrop_sdk/frame_worker.h"
#include "backdrop_sdk/latest_slot.h"
#include "backdrop_sdk/pipeline_state.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>

#include <opencv2/core.hpp>

namespace backdrop_sdk {

namespace {
    /// 우편함 대기 주기 (밀리초)
    constexpr int POLL_TIMEOUT_MS = 100;
}

// ============================================================
// Pimpl 구현 클래스
// ============================================================
class FrameWorker::Impl {
public:
    Impl(FrameProcessor& processor, PipelineState& state, ProcessCallback sink)
        : processor(processor), state(state), sink(std::move(sink)) {}

    FrameProcessor& processor;
    PipelineState& state;
    ProcessCallback sink;

    LatestSlot<FrameTick> slot;
    std::thread thread;
    std::atomic<bool> running{false};

    std::mutex idle_mutex;
    std::condition_variable idle_cv;
    int outstanding = 0;        ///< 제출했지만 아직 끝나지 않은 틱 수

    cv::Mat output;             ///< 출력 버퍼 (틱 간 재사용)

    // 통계
    std::atomic<uint64_t> submitted{0};
    std::atomic<uint64_t> processed{0};
    std::atomic<uint64_t> skipped{0};
    std::atomic<uint64_t> stale_dropped{0};

    void run() {
        while (true) {
            FrameTick tick;
            if (!slot.pop(tick, POLL_TIMEOUT_MS)) {
                if (slot.closed()) {
                    break;
                }
                continue;  // 시간 초과
            }

            processTick(tick);

            {
                std::lock_guard<std::mutex> lock(idle_mutex);
                --outstanding;
            }
            idle_cv.notify_all();
        }
    }

    void processTick(const FrameTick& tick) {
        const ProcessResult result = processor.process(tick, state, output);
        if (!result.produced) {
            skipped.fetch_add(1);
            return;
        }

        processed.fetch_add(1);
        if (!sink) {
            return;
        }

        try {
            sink(output, result);
        } catch (const std::exception& e) {
            std::fprintf(stderr, "[backdrop_sdk] frame sink threw: %s\n", e.what());
        }
    }

    void resetOutstanding() {
        {
            std::lock_guard<std::mutex> lock(idle_mutex);
            outstanding = 0;
        }
        idle_cv.notify_all();
    }
};

// ============================================================
// FrameWorker 공개 인터페이스 구현
// ============================================================

FrameWorker::FrameWorker(FrameProcessor& processor, PipelineState& state, ProcessCallback sink)
    : impl_(std::make_unique<Impl>(processor, state, std::move(sink))) {
}

FrameWorker::~FrameWorker() {
    stop();
}

bool FrameWorker::start() {
    if (impl_->running.load() || !impl_->processor.isInitialized()) {
        return false;
    }

    impl_->slot.reopen();
    impl_->running.store(true);
    impl_->thread = std::thread([this] { impl_->run(); });
    return true;
}

void FrameWorker::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }

    // 대기 중인 틱은 버려지고, 처리 중인 틱은 끝난 뒤 루프 종료
    impl_->slot.close();
    if (impl_->thread.joinable()) {
        impl_->thread.join();
    }
    impl_->resetOutstanding();
}

bool FrameWorker::isRunning() const noexcept {
    return impl_->running.load();
}

bool FrameWorker::submit(FrameTick tick) {
    if (!impl_->running.load()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(impl_->idle_mutex);
    switch (impl_->slot.put(std::move(tick))) {
        case SlotPutResult::Closed:
            // stop()과 경합 - 틱은 처리되지 않음
            return false;
        case SlotPutResult::Replaced:
            // 시작 전에 밀려난 틱 대신 새 틱이 대기 (대기 수 변화 없음)
            impl_->stale_dropped.fetch_add(1);
            break;
        case SlotPutResult::Stored:
            ++impl_->outstanding;
            break;
    }
    impl_->submitted.fetch_add(1);
    return true;
}

bool FrameWorker::waitIdle(int timeout_ms) {
    std::unique_lock<std::mutex> lock(impl_->idle_mutex);
    return impl_->idle_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                   [this] { return impl_->outstanding == 0; });
}

uint64_t FrameWorker::submittedCount() const noexcept {
    return impl_->submitted.load();
}

uint64_t FrameWorker::processedCount() const noexcept {
    return impl_->processed.load();
}

uint64_t FrameWorker::skippedCount() const noexcept {
    return impl_->skipped.load();
}

uint64_t FrameWorker::staleDroppedCount() const noexcept {
    return impl_->stale_dropped.load();
}

} // namespace backdrop_sdk
