/**
 * @file frame_processor.cpp
 * @brief 프레임 처리 파이프라인 구현
 *
 * 틱 단위로 컷오프 추정 → 마스크 → 매트 → 합성 → 색상 치환을 수행.
 * 매트/마스크 버퍼는 틱 간 재사용.
 */

#include "backdrop_sdk/frame_processor.h"
#include "backdrop_sdk/alpha_matte_generator.h"
#include "backdrop_sdk/background_compositor.h"
#include "backdrop_sdk/color_cube.h"
#include "backdrop_sdk/color_remap.h"
#include "backdrop_sdk/depth_cutoff_estimator.h"
#include "backdrop_sdk/pipeline_state.h"
#include "backdrop_sdk/segmentation_mask.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <deque>
#include <exception>
#include <numeric>

#include <opencv2/core.hpp>

namespace backdrop_sdk {

// ============================================================================
// Impl 클래스 정의
// ============================================================================

class FrameProcessor::Impl {
public:
    Impl() = default;
    ~Impl() { release(); }

    // 복사/이동
    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    // 초기화
    ErrorCode initialize(const PipelineConfig& config, const DepthSourceInfo& depth_source);
    void release();
    bool isInitialized() const noexcept { return initialized_; }

    // 처리
    ProcessResult process(const FrameTick& tick, PipelineState& state, cv::Mat& output);

    // 조회
    const PipelineConfig& config() const noexcept { return config_; }
    uint64_t colorCubeBuildCount() const noexcept {
        return cube_cache_ ? static_cast<uint64_t>(cube_cache_->buildCount()) : 0;
    }

    // 통계
    double getLastProcessingTimeMs() const noexcept { return last_processing_time_ms_; }
    double getAverageFPS() const noexcept;

private:
    /// 깊이 프레임을 매트 경로에 쓸 수 있는지 확인
    static bool isDepthUsable(const cv::Mat& depth, const cv::Mat& color);

    // FPS 계산
    void recordProcessingTime(double time_ms);

    // 멤버 변수
    bool initialized_ = false;
    PipelineConfig config_;

    DepthCutoffEstimator estimator_;
    AlphaMatteGenerator matte_generator_;
    BackgroundCompositor compositor_;
    std::unique_ptr<ColorCubeCache> cube_cache_;

    // 버퍼 재사용 (메모리 할당 최소화)
    cv::Mat mask_buffer_;
    cv::Mat matte_buffer_;

    // 통계
    double last_processing_time_ms_ = 0.0;
    std::deque<double> processing_times_;
    static constexpr size_t MAX_FPS_SAMPLES = 30;
};

// ============================================================================
// Impl 구현 - 초기화
// ============================================================================

ErrorCode FrameProcessor::Impl::initialize(const PipelineConfig& config,
                                           const DepthSourceInfo& depth_source) {
    if (initialized_) {
        release();
    }

    const ErrorCode config_error = validateConfig(config);
    if (config_error != ErrorCode::Success) {
        std::fprintf(stderr, "[backdrop_sdk] Invalid pipeline configuration\n");
        return config_error;
    }

    // 깊이 소스가 Float32 깊이를 제공해야 함
    const bool has_float32 = std::find(depth_source.formats.begin(),
                                       depth_source.formats.end(),
                                       DepthPixelFormat::Float32) != depth_source.formats.end();
    if (!has_float32) {
        std::fprintf(stderr, "[backdrop_sdk] Depth source does not provide Float32 depth\n");
        return ErrorCode::DepthFormatUnsupported;
    }

    config_ = config;
    estimator_.setMargin(config.depth_margin);
    if (!matte_generator_.setConfig(config.matte)) {
        return ErrorCode::InvalidParameter;
    }
    compositor_.clearCache();
    cube_cache_ = std::make_unique<ColorCubeCache>(config.cube);

    processing_times_.clear();
    last_processing_time_ms_ = 0.0;
    initialized_ = true;

    if (config_.verbose_logging) {
        std::fprintf(stderr, "[backdrop_sdk] FrameProcessor initialized: margin=%.2f blur=%.1f gamma=%.2f cube=%d\n",
                     config_.depth_margin, config_.matte.blur_radius,
                     config_.matte.gamma, config_.cube.size);
    }
    return ErrorCode::Success;
}

void FrameProcessor::Impl::release() {
    cube_cache_.reset();
    compositor_.clearCache();
    mask_buffer_.release();
    matte_buffer_.release();
    processing_times_.clear();
    initialized_ = false;
}

// ============================================================================
// Impl 구현 - 처리
// ============================================================================

bool FrameProcessor::Impl::isDepthUsable(const cv::Mat& depth, const cv::Mat& color) {
    return !depth.empty() &&
           depth.type() == CV_32FC1 &&
           depth.cols <= color.cols &&
           depth.rows <= color.rows;
}

ProcessResult FrameProcessor::Impl::process(const FrameTick& tick,
                                            PipelineState& state,
                                            cv::Mat& output) {
    ProcessResult result;
    result.success = false;

    if (!initialized_) {
        result.error_code = ErrorCode::NotInitialized;
        return result;
    }

    // 동기화 계층이 드롭한 틱은 짝이 맞지 않으므로 처리하지 않음
    if (tick.color_dropped || tick.depth_dropped) {
        result.error_code = ErrorCode::FrameDropped;
        if (config_.verbose_logging) {
            std::fprintf(stderr, "[backdrop_sdk] tick %lld dropped (color=%d depth=%d)\n",
                         static_cast<long long>(tick.timestamp_ms),
                         tick.color_dropped ? 1 : 0, tick.depth_dropped ? 1 : 0);
        }
        return result;
    }

    if (tick.color.empty() || tick.color.type() != CV_8UC4) {
        result.error_code = ErrorCode::InvalidParameter;
        return result;
    }

    auto total_start = std::chrono::high_resolution_clock::now();

    try {
        // 틱 시작 시 한 번만 상태를 읽음
        const StateSnapshot snapshot = state.snapshot();
        const bool depth_usable = isDepthUsable(tick.depth, tick.color);
        float cutoff = snapshot.depth_cutoff;

        // 1. 얼굴 기반 깊이 컷오프 (얼굴이 없으면 이전 값 유지)
        if (depth_usable && tick.has_face) {
            const CutoffEstimate estimate = estimator_.estimate(
                tick.depth, tick.color.cols, tick.color.rows, &tick.face, cutoff);
            if (estimate.updated && state.setDepthCutoff(estimate.cutoff)) {
                cutoff = estimate.cutoff;
                result.cutoff_updated = true;
            }
        }
        result.depth_cutoff = cutoff;

        // 2. 분할 마스크 → 알파 매트 (배경 표시 중일 때만)
        const cv::Mat* alpha = nullptr;
        if (snapshot.background_visible && depth_usable) {
            auto matte_start = std::chrono::high_resolution_clock::now();
            if (buildSegmentationMask(tick.depth, cutoff, mask_buffer_) &&
                matte_generator_.generate(mask_buffer_, tick.color.cols, tick.color.rows,
                                          matte_buffer_)) {
                alpha = &matte_buffer_;
                result.matte_applied = true;
            }
            auto matte_end = std::chrono::high_resolution_clock::now();
            result.matte_time_ms = std::chrono::duration<float, std::milli>(
                matte_end - matte_start).count();
        }

        // 3. 배경 합성 (매트가 없으면 원본 통과)
        auto composite_start = std::chrono::high_resolution_clock::now();
        if (alpha != nullptr) {
            if (!compositor_.composite(tick.color, alpha, snapshot, tick.format, output)) {
                result.error_code = ErrorCode::ProcessingFailed;
                return result;
            }
        } else {
            if (snapshot.background_visible && config_.verbose_logging) {
                std::fprintf(stderr, "[backdrop_sdk] tick %lld: depth unavailable, passthrough\n",
                             static_cast<long long>(tick.timestamp_ms));
            }
            tick.color.copyTo(output);
        }
        auto composite_end = std::chrono::high_resolution_clock::now();
        result.composite_time_ms = std::chrono::duration<float, std::milli>(
            composite_end - composite_start).count();

        // 4. 색상 치환 (통과 모드에서도 항상 수행)
        auto remap_start = std::chrono::high_resolution_clock::now();
        const std::shared_ptr<const ColorCube> cube = cube_cache_->acquire(snapshot.hue);
        if (!cube || !applyColorCube(*cube, output, tick.format)) {
            result.error_code = ErrorCode::ProcessingFailed;
            return result;
        }
        auto remap_end = std::chrono::high_resolution_clock::now();
        result.remap_time_ms = std::chrono::duration<float, std::milli>(
            remap_end - remap_start).count();
    } catch (const cv::Exception& e) {
        std::fprintf(stderr, "[backdrop_sdk] tick %lld failed: %s\n",
                     static_cast<long long>(tick.timestamp_ms), e.what());
        result.error_code = ErrorCode::ProcessingFailed;
        return result;
    } catch (const std::exception& e) {
        // 버퍼/큐브 할당 실패 등
        std::fprintf(stderr, "[backdrop_sdk] tick %lld failed: %s\n",
                     static_cast<long long>(tick.timestamp_ms), e.what());
        result.error_code = ErrorCode::ProcessingFailed;
        return result;
    }

    // 5. 결과 설정
    auto total_end = std::chrono::high_resolution_clock::now();
    result.processing_time_ms = std::chrono::duration<float, std::milli>(
        total_end - total_start).count();
    result.success = true;
    result.produced = true;
    result.error_code = ErrorCode::Success;

    // FPS 계산용 기록
    recordProcessingTime(result.processing_time_ms);
    last_processing_time_ms_ = result.processing_time_ms;

    if (config_.verbose_logging) {
        std::fprintf(stderr, "[backdrop_sdk] tick %lld: cutoff=%.3f matte=%d %.2fms\n",
                     static_cast<long long>(tick.timestamp_ms), result.depth_cutoff,
                     result.matte_applied ? 1 : 0, result.processing_time_ms);
    }

    return result;
}

// ============================================================================
// Impl 구현 - 통계
// ============================================================================

void FrameProcessor::Impl::recordProcessingTime(double time_ms) {
    processing_times_.push_back(time_ms);
    if (processing_times_.size() > MAX_FPS_SAMPLES) {
        processing_times_.pop_front();
    }
}

double FrameProcessor::Impl::getAverageFPS() const noexcept {
    if (processing_times_.empty()) {
        return 0.0;
    }

    double avg_time = std::accumulate(processing_times_.begin(),
                                      processing_times_.end(), 0.0)
                      / static_cast<double>(processing_times_.size());

    if (avg_time <= 0.0) {
        return 0.0;
    }

    return 1000.0 / avg_time;
}

// ============================================================================
// FrameProcessor 공개 인터페이스 구현
// ============================================================================

FrameProcessor::FrameProcessor()
    : impl_(std::make_unique<Impl>()) {
}

FrameProcessor::~FrameProcessor() = default;

FrameProcessor::FrameProcessor(FrameProcessor&&) noexcept = default;
FrameProcessor& FrameProcessor::operator=(FrameProcessor&&) noexcept = default;

ErrorCode FrameProcessor::initialize(const PipelineConfig& config,
                                     const DepthSourceInfo& depth_source) {
    return impl_ ? impl_->initialize(config, depth_source) : ErrorCode::NotInitialized;
}

void FrameProcessor::release() {
    if (impl_) impl_->release();
}

bool FrameProcessor::isInitialized() const noexcept {
    return impl_ ? impl_->isInitialized() : false;
}

ProcessResult FrameProcessor::process(const FrameTick& tick,
                                      PipelineState& state,
                                      cv::Mat& output) {
    if (!impl_) {
        ProcessResult result;
        result.error_code = ErrorCode::NotInitialized;
        return result;
    }
    return impl_->process(tick, state, output);
}

PipelineConfig FrameProcessor::config() const {
    return impl_ ? impl_->config() : PipelineConfig{};
}

uint64_t FrameProcessor::colorCubeBuildCount() const noexcept {
    return impl_ ? impl_->colorCubeBuildCount() : 0;
}

double FrameProcessor::getLastProcessingTimeMs() const noexcept {
    return impl_ ? impl_->getLastProcessingTimeMs() : 0.0;
}

double FrameProcessor::getAverageFPS() const noexcept {
    return impl_ ? impl_->getAverageFPS() : 0.0;
}

} // namespace backdrop_sdk
