/**
 * @file color_cube.h
 * @brief 색상 치환 3D 룩업 테이블(컬러 큐브)과 캐시 선언
 *
 * 기준 색상(빨강) 주변 ±30도 창에 속한 색상만 목표 색상으로 회전하고
 * 나머지 색상은 그대로 통과시키는 RGB → RGB 테이블.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "backdrop_sdk/export.h"
#include "types.h"

namespace backdrop_sdk {

// ============================================================
// 색 공간 변환
// ============================================================

/**
 * @brief HSV 색 (모든 성분 [0, 1])
 */
struct Hsv {
    float h;    ///< 색상 [0, 1)
    float s;    ///< 채도
    float v;    ///< 명도
};

/**
 * @brief RGB 색 (모든 성분 [0, 1])
 */
struct Rgb {
    float r;
    float g;
    float b;
};

/**
 * @brief RGB → HSV 변환
 * 무채색(채도 0)의 색상은 0.
 */
BACKDROP_SDK_EXPORT Hsv rgbToHsv(float r, float g, float b) noexcept;

/**
 * @brief HSV → RGB 변환
 *
 * 색상은 [0, 1)로 순환 후 6개 구간으로 나눔. 구간 경계(60도 배수)는
 * 아래 구간에 속함 (반열린 구간 [k, k+1)).
 */
BACKDROP_SDK_EXPORT Rgb hsvToRgb(float h, float s, float v) noexcept;

// ============================================================
// 색상 양자화
// ============================================================

/// 한 바퀴당 양자화 단계 수 (0.1도 단위)
constexpr int HUE_QUANTIZATION_STEPS = 3600;

/// 0은 아니지만 0 키로 반올림되는 색상의 키 (빨강 강제 키 0과 구분)
constexpr int HUE_KEY_NEAR_ZERO = HUE_QUANTIZATION_STEPS;

/**
 * @brief 색상을 캐시 키로 양자화
 *
 * 키 0은 순환 후 정확히 0인 색상 전용.
 *
 * @param hue 색상 (한 바퀴 = 1.0, 범위 밖 값은 순환)
 * @return [1, HUE_QUANTIZATION_STEPS) 키 또는 HUE_KEY_NEAR_ZERO, 정확히 0이거나 NaN이면 0
 */
BACKDROP_SDK_EXPORT int quantizeHue(float hue) noexcept;

/// 양자화 키 → 색상 [0, 1) (HUE_KEY_NEAR_ZERO는 0이 아닌 가장 작은 대표값)
BACKDROP_SDK_EXPORT float dequantizeHue(int key) noexcept;

// ============================================================
// ColorCube
// ============================================================

/**
 * @brief 색상 치환 컬러 큐브
 *
 * size^3개 항목, 항목당 RGBA float 4개. 샘플 (i/N, j/N, k/N)을
 * r이 가장 빠르게, 그다음 g, b 순서로 저장.
 *
 * 조회용으로 성분 1.0(인덱스 N) 윗면 샘플을 따로 보관.
 *
 * 목표 색상 t에 대한 순수 함수 - 같은 t는 항상 같은 테이블.
 * 생성 후 불변이므로 여러 스레드에서 동시에 읽어도 안전.
 */
class BACKDROP_SDK_EXPORT ColorCube {
private:
    /// build() 밖에서 생성하지 못하게 막는 키
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    ColorCube(ConstructionKey, int size, float target_hue);

    /**
     * @brief 컬러 큐브 생성 (O(N^3))
     *
     * 창 안의 색상 h에 대해:
     * - effective = (t == 0) ? 1 : t
     * - effective == 1 이면 기준 색상으로 고정 (t = 0은 빨강 강제)
     * - 아니면 h' = h - (기준 - effective)
     *
     * @param target_hue 목표 색상 t [0, 1)
     * @param config 큐브 설정
     * @return 생성된 큐브 (설정이 잘못되면 nullptr)
     */
    static std::shared_ptr<const ColorCube> build(float target_hue,
                                                  const ColorCubeConfig& config = ColorCubeConfig{});

    int size() const noexcept { return size_; }
    float targetHue() const noexcept { return target_hue_; }

    /// 항목 수 (size^3)
    std::size_t entryCount() const noexcept;

    /// 원시 데이터 (entryCount() * 4 floats)
    const float* data() const noexcept { return data_.data(); }

    /**
     * @brief 격자점 항목 조회
     * @return RGBA 4개 float의 시작 포인터
     */
    const float* entry(int r, int g, int b) const noexcept;

    /**
     * @brief 삼선형 보간 조회
     *
     * 입력 성분 c ∈ [0, 1]는 격자 좌표 c*N으로 변환 후 [0, N]로 고정.
     * 마지막 칸은 윗면 샘플과 보간하므로 창 밖 색상은 1.0까지 그대로 통과.
     */
    Rgb lookup(float r, float g, float b) const noexcept;

private:
    /// 인덱스 [0, N] 격자점 (N이면 윗면 샘플)
    const float* sample(int r, int g, int b) const noexcept;

    int size_;
    float target_hue_;
    std::vector<float> data_;
    std::vector<float> face_r_;     ///< r = 1.0 면, (b, g) 순서
    std::vector<float> face_g_;     ///< g = 1.0 면, (b, r) 순서
    std::vector<float> face_b_;     ///< b = 1.0 면, (g, r) 순서
};

// ============================================================
// ColorCubeCache
// ============================================================

/**
 * @brief 양자화된 색상 키로 최신 큐브 하나를 보관하는 캐시
 *
 * 키가 바뀔 때만 재생성하고, 완성된 큐브를 shared_ptr 교체로 게시.
 * 리더는 자신의 참조를 들고 있으므로 생성 중인 테이블을 볼 수 없음.
 *
 * @note 스레드 안전
 */
class BACKDROP_SDK_EXPORT ColorCubeCache {
public:
    explicit ColorCubeCache(const ColorCubeConfig& config = ColorCubeConfig{});

    ColorCubeCache(const ColorCubeCache&) = delete;
    ColorCubeCache& operator=(const ColorCubeCache&) = delete;

    /**
     * @brief 색상에 맞는 큐브 획득
     *
     * 현재 캐시 키와 같으면 그대로 반환, 다르면 새로 생성해 교체.
     *
     * @param hue 목표 색상
     * @return 큐브 (설정이 잘못되면 nullptr)
     */
    std::shared_ptr<const ColorCube> acquire(float hue);

    /// 캐시된 큐브 제거 (다음 acquire에서 재생성)
    void invalidate();

    /// 지금까지 생성한 큐브 수
    std::size_t buildCount() const noexcept { return build_count_.load(); }

    const ColorCubeConfig& config() const noexcept { return config_; }

private:
    const ColorCubeConfig config_;
    mutable std::mutex mutex_;
    std::shared_ptr<const ColorCube> current_;
    int current_key_ = -1;
    std::atomic<std::size_t> build_count_{0};
};

} // namespace backdrop_sdk
