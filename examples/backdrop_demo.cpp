/**
 * @file backdrop_demo.cpp
 * @brief 합성 카메라 입력으로 배경 교체 파이프라인을 돌려보는 데모
 *
 * 카메라 대신 합성된 컬러/깊이 프레임을 만들어 FrameWorker에 공급하고,
 * 마지막 출력 프레임을 PNG로 저장합니다.
 *
 * 사용법:
 *   backdrop_demo [background_image] [output.png] [hue]
 */

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "backdrop_sdk.h"

namespace backdrop_sdk {

/**
 * @brief 합성 입력 데모 클래스
 *
 * 가운데 원형 "사람"이 좌우로 움직이고 배경은 멀리 있는 장면을 흉내냅니다.
 */
class SyntheticDemo {
public:
    static constexpr int COLOR_WIDTH = 640;
    static constexpr int COLOR_HEIGHT = 480;
    static constexpr int DEPTH_WIDTH = 320;
    static constexpr int DEPTH_HEIGHT = 240;
    static constexpr float SUBJECT_DEPTH = 0.8f;     ///< 피사체 깊이 (미터)
    static constexpr float SCENE_DEPTH = 3.0f;       ///< 배경 깊이 (미터)

    SyntheticDemo()
        : state_(PipelineConfig().default_depth_cutoff) {}

    ~SyntheticDemo() { shutdown(); }

    // 복사/이동 금지
    SyntheticDemo(const SyntheticDemo&) = delete;
    SyntheticDemo& operator=(const SyntheticDemo&) = delete;

    /**
     * @brief 데모 초기화
     * @param background_path 배경 이미지 경로 (비어 있으면 검정 배경)
     * @param hue 목표 색상 [0, 1)
     * @return 초기화 성공 여부
     */
    bool initialize(const std::string& background_path, float hue) {
        std::cout << "[Demo] 초기화 시작...\n";

        PipelineConfig config;
        DepthSourceInfo depth_source;
        depth_source.formats = {DepthPixelFormat::Float16, DepthPixelFormat::Float32};

        ErrorCode result = processor_.initialize(config, depth_source);
        if (result != ErrorCode::Success) {
            std::cerr << "[Demo] FrameProcessor 초기화 실패: " << errorCodeToString(result) << "\n";
            return false;
        }

        if (!state_.setHue(hue)) {
            std::cerr << "[Demo] 잘못된 색상 값: " << hue << "\n";
            return false;
        }

        loader_ = std::make_unique<BackgroundLoader>(state_, COLOR_WIDTH, COLOR_HEIGHT, FrameFormat::BGRA);
        if (!background_path.empty()) {
            result = loader_->load(background_path);
            if (result != ErrorCode::Success) {
                std::cerr << "[Demo] 배경 로드 실패 (" << errorCodeToString(result)
                          << "), 검정 배경 사용\n";
            }
        }

        worker_ = std::make_unique<FrameWorker>(processor_, state_,
            [this](const cv::Mat& frame, const ProcessResult& result) {
                onFrame(frame, result);
            });
        if (!worker_->start()) {
            std::cerr << "[Demo] FrameWorker 시작 실패\n";
            return false;
        }

        std::cout << "[Demo] 초기화 완료\n";
        return true;
    }

    /**
     * @brief 지정한 틱 수만큼 합성 입력 공급
     * @param tick_count 공급할 틱 수
     */
    void run(int tick_count) {
        constexpr int TICK_INTERVAL_MS = 33;

        for (int i = 0; i < tick_count; ++i) {
            worker_->submit(createTick(i));
            std::this_thread::sleep_for(std::chrono::milliseconds(TICK_INTERVAL_MS));
        }
        worker_->waitIdle(2000);

        std::cout << "[Demo] 제출: " << worker_->submittedCount()
                  << ", 처리: " << worker_->processedCount()
                  << ", 건너뜀: " << worker_->skippedCount()
                  << ", 폐기: " << worker_->staleDroppedCount() << "\n";
        std::cout << "[Demo] 평균 FPS: " << processor_.getAverageFPS()
                  << ", 깊이 컷오프: " << state_.depthCutoff() << "m\n";
    }

    /**
     * @brief 마지막 출력 프레임 저장
     * @return 저장 성공 여부
     */
    bool saveLastFrame(const std::string& path) {
        cv::Mat frame;
        {
            std::lock_guard<std::mutex> lock(frame_mutex_);
            if (last_frame_.empty()) {
                return false;
            }
            last_frame_.copyTo(frame);
        }
        return cv::imwrite(path, frame);
    }

    void shutdown() {
        if (worker_) {
            worker_->stop();
        }
    }

private:
    /**
     * @brief 합성 틱 생성
     *
     * 원형 피사체가 프레임 폭의 1/4 범위를 좌우로 왕복합니다.
     * 30틱마다 한 번씩 깊이 프레임을 드롭시킵니다.
     */
    FrameTick createTick(int index) const {
        const float phase = static_cast<float>(index) * 0.1f;
        const int cx = COLOR_WIDTH / 2 + static_cast<int>(std::sin(phase) * COLOR_WIDTH / 8);
        const int cy = COLOR_HEIGHT / 2;
        const int radius = COLOR_HEIGHT / 4;

        FrameTick tick;
        tick.format = FrameFormat::BGRA;
        tick.timestamp_ms = static_cast<int64_t>(index) * 33;

        tick.color = cv::Mat(COLOR_HEIGHT, COLOR_WIDTH, CV_8UC4, cv::Scalar(90, 140, 40, 255));
        cv::circle(tick.color, cv::Point(cx, cy), radius, cv::Scalar(60, 80, 200, 255), cv::FILLED);

        tick.depth = cv::Mat(DEPTH_HEIGHT, DEPTH_WIDTH, CV_32FC1, cv::Scalar(SCENE_DEPTH));
        cv::circle(tick.depth, cv::Point(cx / 2, cy / 2), radius / 2,
                   cv::Scalar(SUBJECT_DEPTH), cv::FILLED);

        tick.has_face = true;
        tick.face = Rect{static_cast<float>(cx - radius / 2), static_cast<float>(cy - radius / 2),
                         static_cast<float>(radius), static_cast<float>(radius)};
        tick.depth_dropped = (index % 30 == 29);
        return tick;
    }

    void onFrame(const cv::Mat& frame, const ProcessResult& result) {
        if (result.cutoff_updated && verbose_ticks_ < 3) {
            std::cout << "[Demo] 컷오프 갱신: " << result.depth_cutoff << "m ("
                      << result.processing_time_ms << "ms)\n";
            ++verbose_ticks_;
        }
        std::lock_guard<std::mutex> lock(frame_mutex_);
        frame.copyTo(last_frame_);
    }

    FrameProcessor processor_;
    PipelineState state_;
    std::unique_ptr<BackgroundLoader> loader_;
    std::unique_ptr<FrameWorker> worker_;

    std::mutex frame_mutex_;
    cv::Mat last_frame_;
    std::atomic<int> verbose_ticks_{0};
};

} // namespace backdrop_sdk


/**
 * @brief 메인 함수
 */
int main(int argc, char* argv[]) {
    std::cout << "===================================\n";
    std::cout << "   BackdropSDK Synthetic Demo\n";
    std::cout << "===================================\n\n";

    const std::string background_path = argc > 1 ? argv[1] : "";
    const std::string output_path = argc > 2 ? argv[2] : "backdrop_demo.png";
    const float hue = argc > 3 ? static_cast<float>(std::atof(argv[3])) : 0.0f;

    backdrop_sdk::SyntheticDemo demo;
    if (!demo.initialize(background_path, hue)) {
        std::cerr << "[Error] 데모 초기화 실패\n";
        std::cerr << "사용법: " << argv[0] << " [background_image] [output.png] [hue]\n";
        return 1;
    }

    demo.run(90);
    demo.shutdown();

    if (!demo.saveLastFrame(output_path)) {
        std::cerr << "[Error] 출력 저장 실패: " << output_path << "\n";
        return 1;
    }
    std::cout << "[Main] 출력 저장: " << output_path << "\n";
    return 0;
}
