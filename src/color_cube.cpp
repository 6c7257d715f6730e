/**
 * @file color_cube.cpp
 * @brief 컬러 큐브 생성, 삼선형 조회, 색상 키 캐시 구현
 */

#include "backdrop_sdk/color_cube.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

#include <opencv2/core.hpp>

namespace backdrop_sdk {

namespace {
    constexpr float DEGREES_PER_TURN = 360.0f;

    /// [0, 1) 범위로 순환
    inline float wrapHue(float h) {
        float wrapped = h - std::floor(h);
        if (wrapped >= 1.0f) {
            wrapped = 0.0f;
        }
        return wrapped;
    }

    /**
     * @brief 격자 좌표 계산
     * @param c 입력 성분 [0, 1]
     * @param n 큐브 크기
     * @param index 아래 격자 인덱스 [0, n-1]
     * @param frac 보간 비율 [0, 1]
     */
    inline void latticeCoord(float c, int n, int& index, float& frac) {
        float x = c * static_cast<float>(n);
        x = std::clamp(x, 0.0f, static_cast<float>(n));
        index = std::min(static_cast<int>(x), n - 1);
        frac = x - static_cast<float>(index);
    }

    inline float lerp(float a, float b, float t) {
        return a + (b - a) * t;
    }

    /**
     * @brief 기준 색상 창 안의 색만 회전하는 매핑
     */
    struct HueRotation {
        float min_hue;          ///< 창 하한 (미포함)
        float max_hue;          ///< 창 상한 (미포함)
        float reference;        ///< 기준 색상
        float adjustment;       ///< 기준 - 유효 목표
        bool force_reference;   ///< 창 안 색상을 기준 색상으로 고정

        void apply(float r, float g, float b, float* out) const noexcept {
            const Hsv hsv = rgbToHsv(r, g, b);
            if (hsv.h > min_hue && hsv.h < max_hue) {
                const float new_hue = force_reference ? reference : hsv.h - adjustment;
                const Rgb mapped = hsvToRgb(new_hue, hsv.s, hsv.v);
                out[0] = mapped.r;
                out[1] = mapped.g;
                out[2] = mapped.b;
            } else {
                out[0] = r;
                out[1] = g;
                out[2] = b;
            }
            out[3] = 1.0f;
        }
    };
}

// ============================================================
// 색 공간 변환
// ============================================================

Hsv rgbToHsv(float r, float g, float b) noexcept {
    Hsv hsv{0.0f, 0.0f, 0.0f};

    const float max_c = std::max({r, g, b});
    const float min_c = std::min({r, g, b});
    const float delta = max_c - min_c;

    hsv.v = max_c;
    hsv.s = (max_c > 0.0f) ? delta / max_c : 0.0f;

    if (delta <= 0.0f) {
        return hsv;  // 무채색
    }

    float h;
    if (max_c == r) {
        h = (g - b) / delta;
    } else if (max_c == g) {
        h = (b - r) / delta + 2.0f;
    } else {
        h = (r - g) / delta + 4.0f;
    }

    h /= 6.0f;
    if (h < 0.0f) {
        h += 1.0f;
    }
    hsv.h = wrapHue(h);
    return hsv;
}

Rgb hsvToRgb(float h, float s, float v) noexcept {
    const float c = s * v;
    const float hs = wrapHue(h) * 6.0f;
    const float x = c * (1.0f - std::fabs(std::fmod(hs, 2.0f) - 1.0f));

    Rgb rgb{0.0f, 0.0f, 0.0f};
    if (hs < 1.0f) {
        rgb = {c, x, 0.0f};
    } else if (hs < 2.0f) {
        rgb = {x, c, 0.0f};
    } else if (hs < 3.0f) {
        rgb = {0.0f, c, x};
    } else if (hs < 4.0f) {
        rgb = {0.0f, x, c};
    } else if (hs < 5.0f) {
        rgb = {x, 0.0f, c};
    } else {
        rgb = {c, 0.0f, x};
    }

    const float m = v - c;
    rgb.r += m;
    rgb.g += m;
    rgb.b += m;
    return rgb;
}

// ============================================================
// 색상 양자화
// ============================================================

int quantizeHue(float hue) noexcept {
    if (!std::isfinite(hue)) {
        return 0;
    }
    const float wrapped = wrapHue(hue);
    if (wrapped == 0.0f) {
        return 0;
    }
    // 0이 아닌데 0 키로 반올림되는 색상은 빨강 강제 키와 분리
    const long key = std::lround(wrapped * HUE_QUANTIZATION_STEPS);
    if (key == 0 || key == HUE_QUANTIZATION_STEPS) {
        return HUE_KEY_NEAR_ZERO;
    }
    return static_cast<int>(key);
}

float dequantizeHue(int key) noexcept {
    if (key == HUE_KEY_NEAR_ZERO) {
        return 1.0f / (4.0f * HUE_QUANTIZATION_STEPS);
    }
    const int wrapped = ((key % HUE_QUANTIZATION_STEPS) + HUE_QUANTIZATION_STEPS) %
                        HUE_QUANTIZATION_STEPS;
    return static_cast<float>(wrapped) / HUE_QUANTIZATION_STEPS;
}

// ============================================================
// ColorCube
// ============================================================

ColorCube::ColorCube(ConstructionKey, int size, float target_hue)
    : size_(size),
      target_hue_(target_hue),
      data_(static_cast<std::size_t>(size) * size * size * 4, 0.0f),
      face_r_(static_cast<std::size_t>(size + 1) * (size + 1) * 4, 0.0f),
      face_g_(face_r_.size(), 0.0f),
      face_b_(face_r_.size(), 0.0f) {
}

std::size_t ColorCube::entryCount() const noexcept {
    return static_cast<std::size_t>(size_) * size_ * size_;
}

std::shared_ptr<const ColorCube> ColorCube::build(float target_hue,
                                                  const ColorCubeConfig& config) {
    if (config.size < 2 || !std::isfinite(target_hue) ||
        !std::isfinite(config.reference_hue_deg) || !std::isfinite(config.hue_range_deg)) {
        return nullptr;
    }

    const int n = config.size;
    const float target = wrapHue(target_hue);
    auto cube = std::make_shared<ColorCube>(ConstructionKey{}, n, target);

    // 창 경계 (순환하지 않음 - 한 바퀴 단위 비교)
    const float half_range = config.hue_range_deg / 2.0f;
    HueRotation rotation;
    rotation.reference = config.reference_hue_deg / DEGREES_PER_TURN;
    rotation.min_hue = (config.reference_hue_deg - half_range) / DEGREES_PER_TURN;
    rotation.max_hue = (config.reference_hue_deg + half_range) / DEGREES_PER_TURN;

    // t == 0은 "빨강 강제"로 취급 (슬라이더 끝값)
    const float effective_target = (target == 0.0f) ? 1.0f : target;
    rotation.force_reference = (effective_target == 1.0f);
    rotation.adjustment = rotation.reference - effective_target;

    float* data = cube->data_.data();
    const float inv_n = 1.0f / static_cast<float>(n);

    // b 평면 단위로 병렬 생성 (평면끼리 겹치지 않음)
    cv::parallel_for_(cv::Range(0, n), [&](const cv::Range& planes) {
        for (int bi = planes.start; bi < planes.end; ++bi) {
            const float b = static_cast<float>(bi) * inv_n;
            for (int gi = 0; gi < n; ++gi) {
                const float g = static_cast<float>(gi) * inv_n;
                std::size_t offset = (static_cast<std::size_t>(bi) * n + gi) * n * 4;
                for (int ri = 0; ri < n; ++ri) {
                    rotation.apply(static_cast<float>(ri) * inv_n, g, b, data + offset);
                    offset += 4;
                }
            }
        }
    });

    // 성분 1.0 윗면 (마지막 칸 보간용)
    const int edge = n + 1;
    for (int v = 0; v < edge; ++v) {
        const float fv = static_cast<float>(v) * inv_n;
        for (int u = 0; u < edge; ++u) {
            const float fu = static_cast<float>(u) * inv_n;
            const std::size_t offset = (static_cast<std::size_t>(v) * edge + u) * 4;
            rotation.apply(1.0f, fu, fv, cube->face_r_.data() + offset);
            rotation.apply(fu, 1.0f, fv, cube->face_g_.data() + offset);
            rotation.apply(fu, fv, 1.0f, cube->face_b_.data() + offset);
        }
    }

    return cube;
}

const float* ColorCube::entry(int r, int g, int b) const noexcept {
    r = std::clamp(r, 0, size_ - 1);
    g = std::clamp(g, 0, size_ - 1);
    b = std::clamp(b, 0, size_ - 1);
    const std::size_t index = (static_cast<std::size_t>(b) * size_ + g) * size_ + r;
    return data_.data() + index * 4;
}

const float* ColorCube::sample(int r, int g, int b) const noexcept {
    const std::size_t edge = static_cast<std::size_t>(size_) + 1;
    if (r >= size_) {
        return face_r_.data() + (std::min(b, size_) * edge + std::min(g, size_)) * 4;
    }
    if (g >= size_) {
        return face_g_.data() + (std::min(b, size_) * edge + r) * 4;
    }
    if (b >= size_) {
        return face_b_.data() + (static_cast<std::size_t>(g) * edge + r) * 4;
    }
    return entry(r, g, b);
}

Rgb ColorCube::lookup(float r, float g, float b) const noexcept {
    int ri, gi, bi;
    float rf, gf, bf;
    latticeCoord(r, size_, ri, rf);
    latticeCoord(g, size_, gi, gf);
    latticeCoord(b, size_, bi, bf);

    // 8개 꼭짓점
    const float* c000 = sample(ri,     gi,     bi);
    const float* c100 = sample(ri + 1, gi,     bi);
    const float* c010 = sample(ri,     gi + 1, bi);
    const float* c110 = sample(ri + 1, gi + 1, bi);
    const float* c001 = sample(ri,     gi,     bi + 1);
    const float* c101 = sample(ri + 1, gi,     bi + 1);
    const float* c011 = sample(ri,     gi + 1, bi + 1);
    const float* c111 = sample(ri + 1, gi + 1, bi + 1);

    float out[3];
    for (int ch = 0; ch < 3; ++ch) {
        const float x00 = lerp(c000[ch], c100[ch], rf);
        const float x10 = lerp(c010[ch], c110[ch], rf);
        const float x01 = lerp(c001[ch], c101[ch], rf);
        const float x11 = lerp(c011[ch], c111[ch], rf);
        const float y0 = lerp(x00, x10, gf);
        const float y1 = lerp(x01, x11, gf);
        out[ch] = lerp(y0, y1, bf);
    }

    return Rgb{out[0], out[1], out[2]};
}

// ============================================================
// ColorCubeCache
// ============================================================

ColorCubeCache::ColorCubeCache(const ColorCubeConfig& config)
    : config_(config) {
}

std::shared_ptr<const ColorCube> ColorCubeCache::acquire(float hue) {
    const int key = quantizeHue(hue);

    std::lock_guard<std::mutex> lock(mutex_);
    if (current_ && current_key_ == key) {
        return current_;
    }

    // 잠금 안에서 생성 - 동시 호출자가 같은 큐브를 두 번 만들지 않음
    std::shared_ptr<const ColorCube> cube = ColorCube::build(dequantizeHue(key), config_);
    if (!cube) {
        std::fprintf(stderr, "[backdrop_sdk] color cube build failed (size=%d)\n",
                     config_.size);
        return nullptr;
    }

    current_ = std::move(cube);
    current_key_ = key;
    build_count_.fetch_add(1);
    return current_;
}

void ColorCubeCache::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_.reset();
    current_key_ = -1;
}

} // namespace backdrop_sdk
