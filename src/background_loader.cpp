/**
 * @file background_loader.cpp
 * @brief 배경 이미지 준비 및 비동기 로더 구현
 */

#include "backdrop_sdk/background_loader.h"
#include "backdrop_sdk/latest_slot.h"
#include "backdrop_sdk/pipeline_state.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <mutex>
#include <thread>
#include <utility>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace backdrop_sdk {

namespace {
    /// 워커 우편함 대기 주기 (밀리초)
    constexpr int POLL_TIMEOUT_MS = 100;

    /// 최대 입력 이미지 변 길이 (픽셀) - 메모리 보호
    constexpr int MAX_IMAGE_SIZE = 16384;
}

// ============================================================
// 배경 준비
// ============================================================

ErrorCode prepareBackground(const cv::Mat& image,
                            int target_width,
                            int target_height,
                            FrameFormat format,
                            cv::Mat& output) {
    if (image.empty() || target_width <= 0 || target_height <= 0) {
        return ErrorCode::InvalidParameter;
    }
    if (image.cols > MAX_IMAGE_SIZE || image.rows > MAX_IMAGE_SIZE) {
        return ErrorCode::InvalidParameter;
    }
    if (image.depth() != CV_8U) {
        return ErrorCode::FrameFormatUnsupported;
    }

    // 1. 대상 종횡비로 중앙 크롭
    const double scale_x = static_cast<double>(image.cols) / target_width;
    const double scale_y = static_cast<double>(image.rows) / target_height;
    const double scale = std::min(scale_x, scale_y);

    const int crop_w = std::clamp(static_cast<int>(target_width * scale), 1, image.cols);
    const int crop_h = std::clamp(static_cast<int>(target_height * scale), 1, image.rows);
    const cv::Rect crop((image.cols - crop_w) / 2, (image.rows - crop_h) / 2, crop_w, crop_h);
    const cv::Mat cropped = image(crop);

    // 2. 대상 해상도로 스케일
    cv::Mat scaled;
    const cv::Size target(target_width, target_height);
    if (cropped.size() == target) {
        scaled = cropped;
    } else {
        const bool shrinking = crop_w > target_width;
        cv::resize(cropped, scaled, target, 0, 0,
                   shrinking ? cv::INTER_AREA : cv::INTER_LINEAR);
    }

    // 3. 채널 변환
    switch (scaled.channels()) {
        case 1:
            cv::cvtColor(scaled, output,
                         format == FrameFormat::BGRA ? cv::COLOR_GRAY2BGRA : cv::COLOR_GRAY2RGBA);
            break;
        case 3:
            cv::cvtColor(scaled, output,
                         format == FrameFormat::BGRA ? cv::COLOR_BGR2BGRA : cv::COLOR_BGR2RGBA);
            break;
        case 4:
            scaled.copyTo(output);
            break;
        default:
            return ErrorCode::FrameFormatUnsupported;
    }

    return ErrorCode::Success;
}

// ============================================================
// Pimpl 구현 클래스
// ============================================================
class BackgroundLoader::Impl {
public:
    /// 비동기 요청 (path가 비어 있으면 image 사용)
    struct Request {
        cv::Mat image;
        std::string path;
    };

    explicit Impl(PipelineState& state) : state(state) {}

    PipelineState& state;

    // 대상 규격
    mutable std::mutex target_mutex;
    int target_width = 0;
    int target_height = 0;
    FrameFormat format = FrameFormat::BGRA;

    // 비동기 처리
    LatestSlot<Request> slot;
    std::thread worker;
    std::mutex idle_mutex;
    std::condition_variable idle_cv;
    int outstanding = 0;        ///< 넣었지만 아직 끝나지 않은 요청 수

    // 통계
    std::atomic<uint64_t> loaded{0};
    std::atomic<uint64_t> failed{0};
    std::atomic<uint64_t> superseded{0};
    std::atomic<ErrorCode> last_error{ErrorCode::Success};

    void start() {
        worker = std::thread([this] { run(); });
    }

    void stop() {
        slot.close();
        if (worker.joinable()) {
            worker.join();
        }
    }

    void run() {
        while (true) {
            Request request;
            if (!slot.pop(request, POLL_TIMEOUT_MS)) {
                if (slot.closed()) {
                    break;
                }
                continue;  // 시간 초과
            }

            if (request.path.empty()) {
                loadImage(request.image);
            } else {
                loadPath(request.path);
            }

            {
                std::lock_guard<std::mutex> lock(idle_mutex);
                --outstanding;
            }
            idle_cv.notify_all();
        }
    }

    bool enqueue(Request request) {
        std::lock_guard<std::mutex> lock(idle_mutex);
        switch (slot.put(std::move(request))) {
            case SlotPutResult::Closed:
                return false;
            case SlotPutResult::Replaced:
                // 처리 전에 밀려난 요청
                superseded.fetch_add(1);
                break;
            case SlotPutResult::Stored:
                ++outstanding;
                break;
        }
        return true;
    }

    ErrorCode loadImage(const cv::Mat& image) {
        int width, height;
        FrameFormat fmt;
        {
            std::lock_guard<std::mutex> lock(target_mutex);
            width = target_width;
            height = target_height;
            fmt = format;
        }

        ErrorCode code;
        auto prepared = std::make_shared<cv::Mat>();
        try {
            code = prepareBackground(image, width, height, fmt, *prepared);
        } catch (const cv::Exception& e) {
            std::fprintf(stderr, "[backdrop_sdk] background preparation failed: %s\n", e.what());
            code = ErrorCode::ImageLoadFailed;
        }

        if (code == ErrorCode::Success) {
            // 완성된 이미지만 게시
            state.setBackgroundImage(std::shared_ptr<const cv::Mat>(std::move(prepared)));
            loaded.fetch_add(1);
        } else {
            std::fprintf(stderr, "[backdrop_sdk] background load failed (%s), keeping previous background\n",
                         errorCodeToString(code));
            failed.fetch_add(1);
        }

        last_error.store(code);
        return code;
    }

    ErrorCode loadPath(const std::string& path) {
        cv::Mat image;
        try {
            image = cv::imread(path, cv::IMREAD_COLOR);
        } catch (const cv::Exception& e) {
            std::fprintf(stderr, "[backdrop_sdk] imread failed: %s\n", e.what());
        }

        if (image.empty()) {
            std::fprintf(stderr, "[backdrop_sdk] cannot decode background image: %s\n", path.c_str());
            failed.fetch_add(1);
            last_error.store(ErrorCode::ImageLoadFailed);
            return ErrorCode::ImageLoadFailed;
        }

        return loadImage(image);
    }
};

// ============================================================
// BackgroundLoader 공개 인터페이스 구현
// ============================================================

BackgroundLoader::BackgroundLoader(PipelineState& state,
                                   int target_width,
                                   int target_height,
                                   FrameFormat format)
    : impl_(std::make_unique<Impl>(state)) {
    impl_->target_width = target_width;
    impl_->target_height = target_height;
    impl_->format = format;
    impl_->start();
}

BackgroundLoader::~BackgroundLoader() {
    impl_->stop();
}

ErrorCode BackgroundLoader::load(const cv::Mat& image) {
    return impl_->loadImage(image);
}

ErrorCode BackgroundLoader::load(const std::string& path) {
    return impl_->loadPath(path);
}

bool BackgroundLoader::loadAsync(const cv::Mat& image) {
    Impl::Request request;
    request.image = image;
    return impl_->enqueue(std::move(request));
}

bool BackgroundLoader::loadAsync(const std::string& path) {
    Impl::Request request;
    request.path = path;
    return impl_->enqueue(std::move(request));
}

bool BackgroundLoader::waitIdle(int timeout_ms) {
    std::unique_lock<std::mutex> lock(impl_->idle_mutex);
    return impl_->idle_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                   [this] { return impl_->outstanding == 0; });
}

bool BackgroundLoader::setTarget(int target_width, int target_height, FrameFormat format) {
    if (target_width <= 0 || target_height <= 0) {
        return false;
    }
    std::lock_guard<std::mutex> lock(impl_->target_mutex);
    impl_->target_width = target_width;
    impl_->target_height = target_height;
    impl_->format = format;
    return true;
}

uint64_t BackgroundLoader::loadedCount() const noexcept {
    return impl_->loaded.load();
}

uint64_t BackgroundLoader::failedCount() const noexcept {
    return impl_->failed.load();
}

uint64_t BackgroundLoader::supersededCount() const noexcept {
    return impl_->superseded.load();
}

ErrorCode BackgroundLoader::lastError() const noexcept {
    return impl_->last_error.load();
}

} // namespace backdrop_sdk
