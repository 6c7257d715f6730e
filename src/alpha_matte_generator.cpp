/**
 * @file alpha_matte_generator.cpp
 * @brief AlphaMatteGenerator 구현 - 블러, 감마, 바이큐빅 업스케일
 */

#include "backdrop_sdk/alpha_matte_generator.h"

#include <cmath>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace backdrop_sdk {

namespace {
    /// 이보다 작은 블러 반경은 블러 생략
    constexpr float MIN_BLUR_RADIUS = 0.01f;

    bool isValidConfig(const MatteConfig& config) {
        return std::isfinite(config.blur_radius) && config.blur_radius >= 0.0f &&
               std::isfinite(config.gamma) && config.gamma > 0.0f;
    }
}

// ============================================================
// Pimpl 구현 클래스
// ============================================================
class AlphaMatteGenerator::Impl {
public:
    MatteConfig config;

    // 사전 할당 버퍼 (메모리 재사용)
    cv::Mat mask_float;     ///< 입력 변환용
    cv::Mat shaped;         ///< 블러 + 감마 결과 (마스크 해상도)

    bool generate(const cv::Mat& mask, int target_width, int target_height,
                  cv::Mat& matte) {
        if (mask.empty() || mask.channels() != 1) {
            return false;
        }
        if (target_width < mask.cols || target_height < mask.rows) {
            return false;
        }

        const cv::Mat* source = &mask;
        if (mask.type() != CV_32FC1) {
            mask.convertTo(mask_float, CV_32FC1);
            source = &mask_float;
        }

        // 1~2. 가장자리 복제 경계로 블러 (출력 크기 = 입력 크기이므로 4단계 크롭이 불필요)
        if (config.blur_radius >= MIN_BLUR_RADIUS) {
            const double sigma = config.blur_radius;
            cv::GaussianBlur(*source, shaped, cv::Size(0, 0), sigma, sigma,
                             cv::BORDER_REPLICATE);
        } else {
            source->copyTo(shaped);
        }

        // 3. 감마 보정
        if (config.gamma != 1.0f) {
            // pow 입력은 음수가 아니어야 함 (부동소수 오차 방어)
            cv::max(shaped, 0.0, shaped);
            cv::pow(shaped, config.gamma, shaped);
        }

        // 5. 컬러 해상도로 업스케일
        if (target_width == shaped.cols && target_height == shaped.rows) {
            shaped.copyTo(matte);
        } else {
            cv::resize(shaped, matte, cv::Size(target_width, target_height),
                       0, 0, cv::INTER_CUBIC);
        }

        // 바이큐빅 오버슈트 제거
        cv::min(matte, 1.0, matte);
        cv::max(matte, 0.0, matte);
        return true;
    }
};

// ============================================================
// AlphaMatteGenerator 공개 인터페이스 구현
// ============================================================

AlphaMatteGenerator::AlphaMatteGenerator(const MatteConfig& config)
    : impl_(std::make_unique<Impl>()) {
    if (isValidConfig(config)) {
        impl_->config = config;
    }
}

AlphaMatteGenerator::~AlphaMatteGenerator() = default;

AlphaMatteGenerator::AlphaMatteGenerator(AlphaMatteGenerator&&) noexcept = default;
AlphaMatteGenerator& AlphaMatteGenerator::operator=(AlphaMatteGenerator&&) noexcept = default;

bool AlphaMatteGenerator::generate(const cv::Mat& mask,
                                   int target_width,
                                   int target_height,
                                   cv::Mat& matte) {
    return impl_ ? impl_->generate(mask, target_width, target_height, matte) : false;
}

const MatteConfig& AlphaMatteGenerator::config() const noexcept {
    static const MatteConfig default_config{};
    return impl_ ? impl_->config : default_config;
}

bool AlphaMatteGenerator::setConfig(const MatteConfig& config) {
    if (!impl_ || !isValidConfig(config)) {
        return false;
    }
    impl_->config = config;
    return true;
}

} // namespace backdrop_sdk
