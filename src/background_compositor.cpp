/**
 * @file background_compositor.cpp
 * @brief BackgroundCompositor 구현 - 채도 조정 캐시와 알파 합성
 */

#include "backdrop_sdk/background_compositor.h"

#include <algorithm>
#include <cmath>
#include <cstdint>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace backdrop_sdk {

namespace {
    // Rec.709 휘도 가중치
    constexpr float LUMA_R = 0.2126f;
    constexpr float LUMA_G = 0.7152f;
    constexpr float LUMA_B = 0.0722f;
}

bool adjustSaturation(const cv::Mat& image, float saturation, FrameFormat format,
                      cv::Mat& output) {
    if (image.empty() || image.type() != CV_8UC4) {
        return false;
    }

    const float s = std::isfinite(saturation) ? std::clamp(saturation, 0.0f, 1.0f) : 1.0f;
    if (s >= 1.0f) {
        image.copyTo(output);
        return true;
    }

    const int r_idx = (format == FrameFormat::BGRA) ? 2 : 0;
    const int b_idx = (format == FrameFormat::BGRA) ? 0 : 2;

    output.create(image.rows, image.cols, CV_8UC4);
    for (int y = 0; y < image.rows; ++y) {
        const uint8_t* src = image.ptr<uint8_t>(y);
        uint8_t* dst = output.ptr<uint8_t>(y);
        for (int x = 0; x < image.cols; ++x) {
            const int i = x * 4;
            const float r = src[i + r_idx];
            const float g = src[i + 1];
            const float b = src[i + b_idx];
            const float gray = LUMA_R * r + LUMA_G * g + LUMA_B * b;

            dst[i + r_idx] = cv::saturate_cast<uint8_t>(gray + (r - gray) * s);
            dst[i + 1] = cv::saturate_cast<uint8_t>(gray + (g - gray) * s);
            dst[i + b_idx] = cv::saturate_cast<uint8_t>(gray + (b - gray) * s);
            dst[i + 3] = src[i + 3];
        }
    }
    return true;
}

// ============================================================
// Pimpl 구현 클래스
// ============================================================
class BackgroundCompositor::Impl {
public:
    // 채도 조정 캐시 - 원본을 참조로 잡아 두어 주소 재사용을 막음
    std::shared_ptr<const cv::Mat> cached_source;
    float cached_saturation = -1.0f;
    cv::Size cached_size;
    FrameFormat cached_format = FrameFormat::BGRA;
    cv::Mat adjusted;               ///< 해상도 맞춤 + 채도 조정된 배경
    cv::Mat resized;                ///< 해상도 맞춤 버퍼
    std::size_t adjust_count = 0;

    /**
     * @brief 캐시된 배경 준비
     * @return 준비된 배경 (실패 시 nullptr)
     */
    const cv::Mat* prepareBackground(const std::shared_ptr<const cv::Mat>& source,
                                     float saturation, cv::Size size,
                                     FrameFormat format) {
        if (!source || source->empty() || source->type() != CV_8UC4) {
            return nullptr;
        }

        const bool cache_hit = cached_source == source &&
                               cached_saturation == saturation &&
                               cached_size == size &&
                               cached_format == format &&
                               !adjusted.empty();
        if (cache_hit) {
            return &adjusted;
        }

        // 로더를 거치지 않은 이미지도 출력 해상도에 맞춤
        const cv::Mat* fitted = source.get();
        if (source->size() != size) {
            const bool shrinking = source->cols > size.width || source->rows > size.height;
            cv::resize(*source, resized, size, 0, 0,
                       shrinking ? cv::INTER_AREA : cv::INTER_LINEAR);
            fitted = &resized;
        }

        if (!adjustSaturation(*fitted, saturation, format, adjusted)) {
            return nullptr;
        }

        cached_source = source;
        cached_saturation = saturation;
        cached_size = size;
        cached_format = format;
        ++adjust_count;
        return &adjusted;
    }

    bool composite(const cv::Mat& frame, const cv::Mat* alpha,
                   const StateSnapshot& state, FrameFormat format,
                   cv::Mat& output) {
        if (frame.empty() || frame.type() != CV_8UC4) {
            return false;
        }

        // 배경 숨김: 매트/배경을 보지 않고 그대로 통과
        if (!state.background_visible) {
            frame.copyTo(output);
            return true;
        }

        if (alpha == nullptr || alpha->empty() || alpha->type() != CV_32FC1 ||
            alpha->size() != frame.size()) {
            return false;
        }

        const cv::Mat* background = prepareBackground(state.background_image,
                                                      state.background_saturation,
                                                      frame.size(), format);

        output.create(frame.rows, frame.cols, CV_8UC4);
        const int width = frame.cols;

        for (int y = 0; y < frame.rows; ++y) {
            const uint8_t* fg = frame.ptr<uint8_t>(y);
            const float* a = alpha->ptr<float>(y);
            const uint8_t* bg = background ? background->ptr<uint8_t>(y) : nullptr;
            uint8_t* dst = output.ptr<uint8_t>(y);

            for (int x = 0; x < width; ++x) {
                const int i = x * 4;
                const float w = a[x];
                for (int c = 0; c < 3; ++c) {
                    // 배경 이미지가 없으면 검정
                    const float b = bg ? static_cast<float>(bg[i + c]) : 0.0f;
                    const float f = fg[i + c];
                    dst[i + c] = cv::saturate_cast<uint8_t>(b + (f - b) * w);
                }
                dst[i + 3] = fg[i + 3];
            }
        }

        return true;
    }

    void clear() {
        cached_source.reset();
        cached_saturation = -1.0f;
        cached_size = cv::Size();
        adjusted.release();
        resized.release();
    }
};

// ============================================================
// BackgroundCompositor 공개 인터페이스 구현
// ============================================================

BackgroundCompositor::BackgroundCompositor()
    : impl_(std::make_unique<Impl>()) {
}

BackgroundCompositor::~BackgroundCompositor() = default;

BackgroundCompositor::BackgroundCompositor(BackgroundCompositor&&) noexcept = default;
BackgroundCompositor& BackgroundCompositor::operator=(BackgroundCompositor&&) noexcept = default;

bool BackgroundCompositor::composite(const cv::Mat& frame,
                                     const cv::Mat* alpha,
                                     const StateSnapshot& state,
                                     FrameFormat format,
                                     cv::Mat& output) {
    return impl_ ? impl_->composite(frame, alpha, state, format, output) : false;
}

std::size_t BackgroundCompositor::saturationAdjustCount() const noexcept {
    return impl_ ? impl_->adjust_count : 0;
}

void BackgroundCompositor::clearCache() {
    if (impl_) impl_->clear();
}

} // namespace backdrop_sdk
