/**
 * @file test_types.cpp
 * @brief types.h 데이터 구조체 및 설정 검증 테스트
 */

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <string>
#include <type_traits>

#include "backdrop_sdk/types.h"

namespace backdrop_sdk {
namespace testing {

// ============================================================
// Rect 테스트
// ============================================================

class RectTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(RectTest, DefaultConstruction) {
    // 값 초기화 시 모든 값 0
    Rect rect{};
    EXPECT_FLOAT_EQ(rect.x, 0.0f);
    EXPECT_FLOAT_EQ(rect.y, 0.0f);
    EXPECT_FLOAT_EQ(rect.width, 0.0f);
    EXPECT_FLOAT_EQ(rect.height, 0.0f);
}

TEST_F(RectTest, AggregateInitialization) {
    Rect rect = {10.0f, 20.0f, 100.0f, 50.0f};
    EXPECT_FLOAT_EQ(rect.x, 10.0f);
    EXPECT_FLOAT_EQ(rect.y, 20.0f);
    EXPECT_FLOAT_EQ(rect.width, 100.0f);
    EXPECT_FLOAT_EQ(rect.height, 50.0f);
}

TEST_F(RectTest, TriviallyCopyable) {
    // POD 타입 - 메타데이터 경로에서 memcpy 가능해야 함
    EXPECT_TRUE(std::is_trivially_copyable<Rect>::value);
}

// ============================================================
// 열거형 테스트
// ============================================================

TEST(EnumTest, FrameFormatValues) {
    EXPECT_EQ(static_cast<int>(FrameFormat::RGBA), 0);
    EXPECT_EQ(static_cast<int>(FrameFormat::BGRA), 1);
}

TEST(EnumTest, ErrorCodeGroups) {
    // 에러 코드 대역 유지
    EXPECT_EQ(static_cast<int>(ErrorCode::Success), 0);
    EXPECT_EQ(static_cast<int>(ErrorCode::NotInitialized), 100);
    EXPECT_EQ(static_cast<int>(ErrorCode::DepthFormatUnsupported), 101);
    EXPECT_EQ(static_cast<int>(ErrorCode::InvalidParameter), 200);
    EXPECT_EQ(static_cast<int>(ErrorCode::FrameDropped), 300);
    EXPECT_EQ(static_cast<int>(ErrorCode::ImageLoadFailed), 400);
    EXPECT_EQ(static_cast<int>(ErrorCode::Unknown), 999);
}

TEST(EnumTest, ErrorCodeToString) {
    EXPECT_EQ(std::string(errorCodeToString(ErrorCode::Success)), "Success");
    EXPECT_EQ(std::string(errorCodeToString(ErrorCode::FrameDropped)), "FrameDropped");
    EXPECT_EQ(std::string(errorCodeToString(ErrorCode::DepthFormatUnsupported)),
              "DepthFormatUnsupported");
    EXPECT_EQ(std::string(errorCodeToString(static_cast<ErrorCode>(12345))), "Unknown");
}

// ============================================================
// 설정 구조체 테스트
// ============================================================

class PipelineConfigTest : public ::testing::Test {
protected:
    PipelineConfig config_;
};

TEST_F(PipelineConfigTest, Defaults) {
    // 기본값
    EXPECT_FLOAT_EQ(config_.default_depth_cutoff, 1.0f);
    EXPECT_FLOAT_EQ(config_.depth_margin, 0.25f);
    EXPECT_FLOAT_EQ(config_.matte.blur_radius, 5.0f);
    EXPECT_FLOAT_EQ(config_.matte.gamma, 0.5f);
    EXPECT_EQ(config_.cube.size, 64);
    EXPECT_FLOAT_EQ(config_.cube.reference_hue_deg, 0.0f);
    EXPECT_FLOAT_EQ(config_.cube.hue_range_deg, 60.0f);
    EXPECT_FALSE(config_.verbose_logging);
}

TEST_F(PipelineConfigTest, DefaultsAreValid) {
    EXPECT_EQ(validateConfig(config_), ErrorCode::Success);
}

TEST_F(PipelineConfigTest, RejectsNonPositiveCutoff) {
    config_.default_depth_cutoff = 0.0f;
    EXPECT_EQ(validateConfig(config_), ErrorCode::InvalidParameter);

    config_.default_depth_cutoff = std::numeric_limits<float>::quiet_NaN();
    EXPECT_EQ(validateConfig(config_), ErrorCode::InvalidParameter);
}

TEST_F(PipelineConfigTest, RejectsNegativeMargin) {
    config_.depth_margin = -0.1f;
    EXPECT_EQ(validateConfig(config_), ErrorCode::InvalidParameter);

    // 여유 0은 허용
    config_.depth_margin = 0.0f;
    EXPECT_EQ(validateConfig(config_), ErrorCode::Success);
}

TEST_F(PipelineConfigTest, MatteBounds) {
    config_.matte.blur_radius = 0.0f;  // 블러 생략은 허용
    EXPECT_EQ(validateConfig(config_), ErrorCode::Success);

    config_.matte.blur_radius = -1.0f;
    EXPECT_EQ(validateConfig(config_), ErrorCode::InvalidParameter);

    config_.matte.blur_radius = 5.0f;
    config_.matte.gamma = 0.0f;
    EXPECT_EQ(validateConfig(config_), ErrorCode::InvalidParameter);
}

TEST_F(PipelineConfigTest, CubeBounds) {
    config_.cube.size = 1;
    EXPECT_EQ(validateConfig(config_), ErrorCode::InvalidParameter);

    config_.cube.size = 2;
    EXPECT_EQ(validateConfig(config_), ErrorCode::Success);

    config_.cube.size = 257;
    EXPECT_EQ(validateConfig(config_), ErrorCode::InvalidParameter);

    config_.cube.size = 64;
    config_.cube.hue_range_deg = 0.0f;
    EXPECT_EQ(validateConfig(config_), ErrorCode::InvalidParameter);

    config_.cube.hue_range_deg = 361.0f;
    EXPECT_EQ(validateConfig(config_), ErrorCode::InvalidParameter);

    config_.cube.hue_range_deg = 360.0f;
    EXPECT_EQ(validateConfig(config_), ErrorCode::Success);
}

} // namespace testing
} // namespace backdrop_sdk
