/**
 * @file types.h
 * @brief BackdropSDK 핵심 데이터 타입 정의
 *
 * 파이프라인 전 단계에서 공유하는 열거형, 사각형, 설정 구조체 정의.
 * 설정 구조체는 집합체(aggregate)로 기본값을 멤버 초기화로 제공.
 */

#ifndef BACKDROP_SDK_TYPES_H
#define BACKDROP_SDK_TYPES_H

#include <cstdint>

#include "backdrop_sdk/export.h"

namespace backdrop_sdk {

// ============================================================
// 열거형 정의
// ============================================================

/**
 * @brief 컬러 프레임 포맷 열거형
 * 4채널 8비트 컬러 프레임의 채널 순서
 */
enum class FrameFormat : int {
    RGBA = 0,       ///< 32비트 RGBA
    BGRA = 1        ///< 32비트 BGRA (iOS/macOS 카메라 기본)
};

/**
 * @brief 깊이 픽셀 포맷 열거형
 * 깊이 소스가 제공할 수 있는 포맷. 파이프라인은 Float32만 처리.
 */
enum class DepthPixelFormat : int {
    Float32 = 0,        ///< 32비트 float 깊이 (미터)
    Float16 = 1,        ///< 16비트 half 깊이
    Disparity32 = 2,    ///< 32비트 float 시차
    Disparity16 = 3     ///< 16비트 half 시차
};

/**
 * @brief 에러 코드 열거형
 * SDK 작업 결과 상태
 */
enum class ErrorCode : int {
    // 성공
    Success = 0,

    // 100번대: 초기화/설정 에러
    NotInitialized = 100,           ///< 프로세서 초기화되지 않음
    DepthFormatUnsupported = 101,   ///< 깊이 소스가 Float32 포맷 미지원

    // 200번대: 파라미터 에러
    InvalidParameter = 200,         ///< 잘못된 파라미터
    FrameFormatUnsupported = 201,   ///< 지원하지 않는 프레임 포맷

    // 300번대: 프레임 처리 상태
    FrameDropped = 300,             ///< 동기화 계층에서 프레임 드롭됨
    ProcessingFailed = 301,         ///< 처리 중 내부 오류

    // 400번대: 리소스 에러
    ImageLoadFailed = 400,          ///< 배경 이미지 로드 실패

    // 일반 에러
    Unknown = 999                   ///< 알 수 없는 에러
};

// ============================================================
// 기본 데이터 구조체
// ============================================================

/**
 * @brief 사각형 영역
 * 얼굴 바운딩 박스 표현용 (컬러 프레임 픽셀 좌표)
 * POD 타입
 */
struct Rect {
    float x;        ///< 좌상단 X 좌표
    float y;        ///< 좌상단 Y 좌표
    float width;    ///< 너비
    float height;   ///< 높이
};

// ============================================================
// 설정 구조체
// ============================================================

/**
 * @brief 알파 매트 생성 설정
 */
struct MatteConfig {
    float blur_radius = 5.0f;   ///< 가우시안 블러 반경 (깊이 프레임 픽셀, 0이면 블러 생략)
    float gamma = 0.5f;         ///< 감마 지수 (1 미만이면 전이 구간이 1쪽으로 넓어짐)
};

/**
 * @brief 컬러 큐브 설정
 * 기준 색상 주변 창(window)에 속한 색상만 목표 색상으로 치환
 */
struct ColorCubeConfig {
    int size = 64;                      ///< 축당 샘플 수 (총 size^3 항목)
    float reference_hue_deg = 0.0f;     ///< 치환 대상 기준 색상 (도, 0 = 빨강)
    float hue_range_deg = 60.0f;        ///< 창 전체 폭 (도, 기준 ±30도)
};

/**
 * @brief 파이프라인 전체 설정
 */
struct PipelineConfig {
    float default_depth_cutoff = 1.0f;  ///< 첫 얼굴 관측 전 깊이 컷오프 (미터)
    float depth_margin = 0.25f;         ///< 얼굴 깊이에 더하는 여유 (미터)
    MatteConfig matte;                  ///< 알파 매트 설정
    ColorCubeConfig cube;               ///< 컬러 큐브 설정
    bool verbose_logging = false;       ///< 프레임 단위 디버그 로그 출력 여부
};

/**
 * @brief 에러 코드 문자열 변환
 * @param code 에러 코드
 * @return 사람이 읽을 수 있는 이름 (정적 문자열)
 */
BACKDROP_SDK_EXPORT const char* errorCodeToString(ErrorCode code) noexcept;

/**
 * @brief 설정값 범위 검증
 *
 * 컷오프/여유/블러/감마/큐브 크기/색상 창 폭을 검사.
 *
 * @param config 검증할 설정
 * @return Success 또는 InvalidParameter
 */
BACKDROP_SDK_EXPORT ErrorCode validateConfig(const PipelineConfig& config) noexcept;

} // namespace backdrop_sdk

#endif // BACKDROP_SDK_TYPES_H
