/**
 * @file color_remap.h
 * @brief 컬러 큐브 적용 단계
 */

#pragma once

#include "backdrop_sdk/export.h"
#include "types.h"

// OpenCV 전방 선언
namespace cv { class Mat; }

namespace backdrop_sdk {

class ColorCube;

/**
 * @brief 프레임에 컬러 큐브 적용 (in-place)
 *
 * 픽셀마다 (r, g, b)를 큐브에서 삼선형 보간으로 조회해 교체.
 * 알파 채널은 그대로 유지. 행 단위 병렬 처리.
 *
 * @param cube 적용할 컬러 큐브
 * @param frame CV_8UC4 프레임 (in-place 수정)
 * @param format 채널 순서
 * @return 프레임이 CV_8UC4가 아니면 false
 */
BACKDROP_SDK_EXPORT bool applyColorCube(const ColorCube& cube, cv::Mat& frame, FrameFormat format);

} // namespace backdrop_sdk
