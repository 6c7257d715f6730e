/**
 * @file color_remap.cpp
 * @brief 컬러 큐브 적용 구현
 */

#include "backdrop_sdk/color_remap.h"
#include "backdrop_sdk/color_cube.h"

#include <cstdint>

#include <opencv2/core.hpp>

namespace backdrop_sdk {

bool applyColorCube(const ColorCube& cube, cv::Mat& frame, FrameFormat format) {
    if (frame.empty() || frame.type() != CV_8UC4) {
        return false;
    }

    // 채널 인덱스 (BGRA: B=0, R=2 / RGBA: R=0, B=2)
    const int r_idx = (format == FrameFormat::BGRA) ? 2 : 0;
    const int b_idx = (format == FrameFormat::BGRA) ? 0 : 2;
    constexpr float INV_255 = 1.0f / 255.0f;

    const int width = frame.cols;

    cv::parallel_for_(cv::Range(0, frame.rows), [&](const cv::Range& rows) {
        for (int y = rows.start; y < rows.end; ++y) {
            uint8_t* row = frame.ptr<uint8_t>(y);
            for (int x = 0; x < width; ++x) {
                uint8_t* px = row + x * 4;
                const Rgb mapped = cube.lookup(px[r_idx] * INV_255,
                                               px[1] * INV_255,
                                               px[b_idx] * INV_255);
                px[r_idx] = cv::saturate_cast<uint8_t>(mapped.r * 255.0f);
                px[1] = cv::saturate_cast<uint8_t>(mapped.g * 255.0f);
                px[b_idx] = cv::saturate_cast<uint8_t>(mapped.b * 255.0f);
                // px[3] (알파)는 유지
            }
        }
    });

    return true;
}

} // namespace backdrop_sdk
