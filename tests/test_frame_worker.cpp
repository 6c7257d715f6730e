/**
 * @file test_frame_worker.cpp
 * @brief FrameWorker Unit Tests
 *
 * 순서 보장, 최신 틱 우선 폐기, 드롭/오류 틱 처리, 종료 동작 검증.
 */

#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "backdrop_sdk/frame_worker.h"
#include "backdrop_sdk/pipeline_state.h"

namespace backdrop_sdk {
namespace testing {

// ============================================================
// 테스트 헬퍼 함수
// ============================================================

FrameTick createTick(int64_t timestamp_ms) {
    FrameTick tick;
    tick.color = cv::Mat(24, 32, CV_8UC4, cv::Scalar(200, 120, 60, 255));
    tick.format = FrameFormat::BGRA;
    tick.timestamp_ms = timestamp_ms;
    return tick;
}

/**
 * @brief 조건이 참이 될 때까지 대기 (최대 timeout_ms)
 */
template <typename Pred>
bool waitUntil(Pred pred, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

class FrameWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        PipelineConfig config;
        config.cube.size = 16;  // 테스트 속도
        DepthSourceInfo info;
        info.formats = {DepthPixelFormat::Float32};
        ASSERT_EQ(processor_.initialize(config, info), ErrorCode::Success);
    }

    FrameProcessor processor_;
    PipelineState state_;
};

// ============================================================
// 수명 주기 테스트
// ============================================================

TEST(FrameWorkerLifecycle, RequiresInitializedProcessor) {
    FrameProcessor processor;
    PipelineState state;
    FrameWorker worker(processor, state, nullptr);
    EXPECT_FALSE(worker.start());
    EXPECT_FALSE(worker.isRunning());
    EXPECT_FALSE(worker.submit(createTick(1)));
}

TEST_F(FrameWorkerTest, StartStop) {
    FrameWorker worker(processor_, state_, nullptr);
    EXPECT_TRUE(worker.start());
    EXPECT_TRUE(worker.isRunning());
    EXPECT_FALSE(worker.start());  // 이미 실행 중

    worker.stop();
    EXPECT_FALSE(worker.isRunning());
    EXPECT_FALSE(worker.submit(createTick(1)));

    // 재시작 가능
    EXPECT_TRUE(worker.start());
    EXPECT_TRUE(worker.submit(createTick(2)));
    EXPECT_TRUE(worker.waitIdle(5000));
    EXPECT_EQ(worker.processedCount(), 1u);
}

// ============================================================
// 처리 테스트
// ============================================================

TEST_F(FrameWorkerTest, ProcessesTicksInOrder) {
    std::mutex mutex;
    std::vector<int64_t> seen;
    FrameWorker worker(processor_, state_, [&](const cv::Mat& frame, const ProcessResult& result) {
        EXPECT_TRUE(result.success);
        EXPECT_EQ(frame.type(), CV_8UC4);
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(static_cast<int64_t>(seen.size()));
    });
    ASSERT_TRUE(worker.start());

    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(worker.submit(createTick(i)));
        ASSERT_TRUE(worker.waitIdle(5000));
    }

    EXPECT_EQ(worker.processedCount(), 5u);
    EXPECT_EQ(worker.staleDroppedCount(), 0u);
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(seen.size(), 5u);
}

TEST_F(FrameWorkerTest, LatestTickWinsWhileBusy) {
    // 첫 틱의 콜백을 붙잡아 두는 동안 들어온 틱은 마지막 것만 남음
    std::atomic<bool> in_sink{false};
    std::atomic<bool> release{false};
    std::atomic<int> calls{0};
    std::mutex mutex;
    std::vector<int64_t> timestamps;

    FrameWorker worker(processor_, state_, [&](const cv::Mat&, const ProcessResult&) {
        const int call = calls.fetch_add(1);
        if (call == 0) {
            in_sink = true;
            waitUntil([&] { return release.load(); }, 5000);
        }
    });
    ASSERT_TRUE(worker.start());

    ASSERT_TRUE(worker.submit(createTick(0)));
    ASSERT_TRUE(waitUntil([&] { return in_sink.load(); }, 5000));

    for (int i = 1; i <= 9; ++i) {
        ASSERT_TRUE(worker.submit(createTick(i)));
    }
    release = true;
    ASSERT_TRUE(worker.waitIdle(5000));

    EXPECT_EQ(worker.submittedCount(), 10u);
    EXPECT_EQ(worker.staleDroppedCount(), 8u);
    EXPECT_EQ(worker.processedCount(), 2u);
    EXPECT_EQ(calls.load(), 2);
}

TEST_F(FrameWorkerTest, DroppedTicksAreSkipped) {
    std::atomic<int> calls{0};
    FrameWorker worker(processor_, state_, [&](const cv::Mat&, const ProcessResult&) {
        ++calls;
    });
    ASSERT_TRUE(worker.start());

    FrameTick dropped = createTick(1);
    dropped.depth_dropped = true;
    ASSERT_TRUE(worker.submit(dropped));
    ASSERT_TRUE(worker.waitIdle(5000));

    EXPECT_EQ(worker.skippedCount(), 1u);
    EXPECT_EQ(worker.processedCount(), 0u);
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(FrameWorkerTest, ThrowingSinkDoesNotStopWorker) {
    std::atomic<int> calls{0};
    FrameWorker worker(processor_, state_, [&](const cv::Mat&, const ProcessResult&) {
        if (calls.fetch_add(1) == 0) {
            throw std::runtime_error("display unavailable");
        }
    });
    ASSERT_TRUE(worker.start());

    ASSERT_TRUE(worker.submit(createTick(1)));
    ASSERT_TRUE(worker.waitIdle(5000));
    ASSERT_TRUE(worker.submit(createTick(2)));
    ASSERT_TRUE(worker.waitIdle(5000));

    EXPECT_EQ(calls.load(), 2);
    EXPECT_EQ(worker.processedCount(), 2u);
}

TEST_F(FrameWorkerTest, StateChangesVisibleToNextTick) {
    // 다른 경로에서 바꾼 색상이 다음 틱에 반영
    std::mutex mutex;
    cv::Mat last;
    FrameWorker worker(processor_, state_, [&](const cv::Mat& frame, const ProcessResult&) {
        std::lock_guard<std::mutex> lock(mutex);
        frame.copyTo(last);
    });
    ASSERT_TRUE(worker.start());

    FrameTick red = createTick(1);
    red.color = cv::Mat(24, 32, CV_8UC4, cv::Scalar(0, 0, 128, 255));

    ASSERT_TRUE(state_.setHue(0.5f));
    ASSERT_TRUE(worker.submit(red));
    ASSERT_TRUE(worker.waitIdle(5000));

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_FALSE(last.empty());
    cv::Vec4b px = last.at<cv::Vec4b>(5, 5);
    EXPECT_GT(px[0], 100);  // 청록
    EXPECT_LT(px[2], 20);
}

TEST_F(FrameWorkerTest, StopWithPendingTick) {
    std::atomic<bool> release{false};
    FrameWorker worker(processor_, state_, [&](const cv::Mat&, const ProcessResult&) {
        waitUntil([&] { return release.load(); }, 200);
    });
    ASSERT_TRUE(worker.start());
    worker.submit(createTick(1));
    worker.submit(createTick(2));

    // 처리 중인 틱은 끝까지, 대기 중인 틱은 버림
    release = true;
    worker.stop();
    EXPECT_FALSE(worker.isRunning());
    EXPECT_LE(worker.processedCount(), 2u);
}

TEST_F(FrameWorkerTest, SubmitRacingStopLeavesWorkerIdle) {
    // stop()과 겹친 submit은 false를 반환하고 대기 틱으로 남지 않음
    for (int round = 0; round < 20; ++round) {
        FrameWorker worker(processor_, state_, nullptr);
        ASSERT_TRUE(worker.start());

        std::atomic<bool> go{false};
        std::atomic<uint64_t> accepted{0};
        std::thread submitter([&] {
            waitUntil([&] { return go.load(); }, 5000);
            int64_t ts = 0;
            while (worker.submit(createTick(ts++))) {
                ++accepted;
            }
        });

        go = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(round % 3));
        worker.stop();
        submitter.join();

        EXPECT_FALSE(worker.isRunning());
        EXPECT_EQ(worker.submittedCount(), accepted.load());
        EXPECT_TRUE(worker.waitIdle(0)) << "round " << round;
        EXPECT_FALSE(worker.submit(createTick(-1)));
    }
}

} // namespace testing
} // namespace backdrop_sdk
