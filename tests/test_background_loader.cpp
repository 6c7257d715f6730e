/**
 * @file test_background_loader.cpp
 * @brief prepareBackground / BackgroundLoader Unit Tests
 *
 * 종횡비 크롭, 해상도/채널 변환, 실패 시 이전 배경 유지,
 * 비동기 로드의 최신 요청 우선 동작 검증.
 */

#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <filesystem>
#include <string>
#include <vector>

#include "backdrop_sdk/background_loader.h"
#include "backdrop_sdk/pipeline_state.h"

namespace backdrop_sdk {
namespace testing {

// ============================================================
// 테스트 헬퍼 함수
// ============================================================

/**
 * @brief 왼쪽 red_width 열은 빨강, 나머지는 초록인 BGR 이미지
 */
cv::Mat createSplitImage(int width, int height, int red_width) {
    cv::Mat image(height, width, CV_8UC3, cv::Scalar(0, 255, 0));
    image(cv::Rect(0, 0, red_width, height)).setTo(cv::Scalar(0, 0, 255));
    return image;
}

cv::Mat createSolidBGR(int width, int height, const cv::Scalar& color) {
    return cv::Mat(height, width, CV_8UC3, color);
}

// ============================================================
// prepareBackground 테스트
// ============================================================

TEST(PrepareBackgroundTest, OutputMatchesTarget) {
    cv::Mat image = createSolidBGR(200, 100, cv::Scalar(10, 20, 30));
    cv::Mat out;
    ASSERT_EQ(prepareBackground(image, 64, 48, FrameFormat::BGRA, out), ErrorCode::Success);
    EXPECT_EQ(out.cols, 64);
    EXPECT_EQ(out.rows, 48);
    EXPECT_EQ(out.type(), CV_8UC4);

    cv::Vec4b px = out.at<cv::Vec4b>(24, 32);
    EXPECT_EQ(px[0], 10);
    EXPECT_EQ(px[1], 20);
    EXPECT_EQ(px[2], 30);
    EXPECT_EQ(px[3], 255);
}

TEST(PrepareBackgroundTest, AnyAspectRatioMatchesColorResolution) {
    const std::vector<cv::Size> inputs = {
        {1920, 1080}, {1080, 1920}, {50, 50}, {7, 300}, {640, 480}
    };
    for (const cv::Size& size : inputs) {
        cv::Mat image = createSolidBGR(size.width, size.height, cv::Scalar(1, 2, 3));
        cv::Mat out;
        ASSERT_EQ(prepareBackground(image, 128, 72, FrameFormat::BGRA, out), ErrorCode::Success)
            << size.width << "x" << size.height;
        EXPECT_EQ(out.cols, 128);
        EXPECT_EQ(out.rows, 72);
    }
}

TEST(PrepareBackgroundTest, CropsCenterInsteadOfStretching) {
    // 200x100 → 4:3 크롭은 가운데 약 133열만 사용
    // 늘리기였다면 출력 12열은 원본 37열(빨강)에 해당
    cv::Mat image = createSplitImage(200, 100, 50);
    cv::Mat out;
    ASSERT_EQ(prepareBackground(image, 64, 48, FrameFormat::BGRA, out), ErrorCode::Success);

    cv::Vec4b left = out.at<cv::Vec4b>(24, 1);
    EXPECT_GT(left[2], 200);   // 가장자리는 빨강
    cv::Vec4b inner = out.at<cv::Vec4b>(24, 12);
    EXPECT_GT(inner[1], 200);  // 크롭으로 빨강 영역이 좁아짐
    EXPECT_LT(inner[2], 50);
}

TEST(PrepareBackgroundTest, RGBAOrder) {
    cv::Mat image = createSolidBGR(16, 16, cv::Scalar(0, 0, 255));  // 빨강
    cv::Mat out;
    ASSERT_EQ(prepareBackground(image, 8, 8, FrameFormat::RGBA, out), ErrorCode::Success);
    cv::Vec4b px = out.at<cv::Vec4b>(0, 0);
    EXPECT_EQ(px[0], 255);
    EXPECT_EQ(px[2], 0);
}

TEST(PrepareBackgroundTest, GrayAndFourChannelInputs) {
    cv::Mat gray(30, 40, CV_8UC1, cv::Scalar(77));
    cv::Mat out;
    ASSERT_EQ(prepareBackground(gray, 40, 30, FrameFormat::BGRA, out), ErrorCode::Success);
    EXPECT_EQ(out.type(), CV_8UC4);
    EXPECT_EQ(out.at<cv::Vec4b>(3, 3)[1], 77);

    cv::Mat four(30, 40, CV_8UC4, cv::Scalar(1, 2, 3, 4));
    ASSERT_EQ(prepareBackground(four, 40, 30, FrameFormat::BGRA, out), ErrorCode::Success);
    EXPECT_EQ(out.at<cv::Vec4b>(3, 3), cv::Vec4b(1, 2, 3, 4));
}

TEST(PrepareBackgroundTest, InvalidInputs) {
    cv::Mat out;
    EXPECT_EQ(prepareBackground(cv::Mat(), 64, 48, FrameFormat::BGRA, out),
              ErrorCode::InvalidParameter);

    cv::Mat image = createSolidBGR(10, 10, cv::Scalar::all(0));
    EXPECT_EQ(prepareBackground(image, 0, 48, FrameFormat::BGRA, out),
              ErrorCode::InvalidParameter);

    cv::Mat deep(10, 10, CV_16UC3, cv::Scalar::all(0));
    EXPECT_EQ(prepareBackground(deep, 8, 8, FrameFormat::BGRA, out),
              ErrorCode::FrameFormatUnsupported);

    cv::Mat two(10, 10, CV_8UC2, cv::Scalar::all(0));
    EXPECT_EQ(prepareBackground(two, 8, 8, FrameFormat::BGRA, out),
              ErrorCode::FrameFormatUnsupported);
}

// ============================================================
// BackgroundLoader 테스트
// ============================================================

class BackgroundLoaderTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!temp_path_.empty()) {
            std::error_code ec;
            std::filesystem::remove(temp_path_, ec);
        }
    }

    /// 임시 PNG 파일 작성
    std::string writeTempImage(const cv::Mat& image) {
        temp_path_ = (std::filesystem::temp_directory_path() /
                      ("backdrop_sdk_test_bg_" +
                       std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
                       ".png")).string();
        EXPECT_TRUE(cv::imwrite(temp_path_, image));
        return temp_path_;
    }

    PipelineState state_;
    std::string temp_path_;
};

TEST_F(BackgroundLoaderTest, SyncLoadPublishes) {
    BackgroundLoader loader(state_, 64, 48);
    EXPECT_EQ(loader.load(createSolidBGR(320, 240, cv::Scalar(0, 255, 0))), ErrorCode::Success);

    auto image = state_.backgroundImage();
    ASSERT_NE(image, nullptr);
    EXPECT_EQ(image->cols, 64);
    EXPECT_EQ(image->rows, 48);
    EXPECT_EQ(image->type(), CV_8UC4);
    EXPECT_EQ(loader.loadedCount(), 1u);
    EXPECT_EQ(loader.lastError(), ErrorCode::Success);
}

TEST_F(BackgroundLoaderTest, FailureKeepsPreviousBackground) {
    BackgroundLoader loader(state_, 64, 48);
    ASSERT_EQ(loader.load(createSolidBGR(64, 48, cv::Scalar(255, 0, 0))), ErrorCode::Success);
    auto before = state_.backgroundImage();

    EXPECT_EQ(loader.load(cv::Mat()), ErrorCode::InvalidParameter);
    EXPECT_EQ(loader.load(std::string("/nonexistent/backdrop_missing.png")),
              ErrorCode::ImageLoadFailed);

    EXPECT_EQ(state_.backgroundImage(), before);
    EXPECT_EQ(loader.failedCount(), 2u);
    EXPECT_EQ(loader.lastError(), ErrorCode::ImageLoadFailed);
}

TEST_F(BackgroundLoaderTest, LoadFromFile) {
    const std::string path = writeTempImage(createSolidBGR(100, 100, cv::Scalar(0, 0, 255)));
    BackgroundLoader loader(state_, 32, 24);
    ASSERT_EQ(loader.load(path), ErrorCode::Success);

    auto image = state_.backgroundImage();
    ASSERT_NE(image, nullptr);
    EXPECT_EQ(image->size(), cv::Size(32, 24));
    EXPECT_EQ(image->at<cv::Vec4b>(10, 10)[2], 255);
}

TEST_F(BackgroundLoaderTest, AsyncLoadPublishesWhenReady) {
    BackgroundLoader loader(state_, 64, 48);
    ASSERT_TRUE(loader.loadAsync(createSolidBGR(640, 480, cv::Scalar(0, 255, 0))));
    ASSERT_TRUE(loader.waitIdle(5000));

    auto image = state_.backgroundImage();
    ASSERT_NE(image, nullptr);
    EXPECT_EQ(image->size(), cv::Size(64, 48));
    EXPECT_EQ(image->at<cv::Vec4b>(0, 0)[1], 255);
}

TEST_F(BackgroundLoaderTest, AsyncFileLoad) {
    const std::string path = writeTempImage(createSolidBGR(50, 40, cv::Scalar(255, 0, 0)));
    BackgroundLoader loader(state_, 16, 16);
    ASSERT_TRUE(loader.loadAsync(path));
    ASSERT_TRUE(loader.waitIdle(5000));
    ASSERT_TRUE(state_.hasBackgroundImage());
    EXPECT_EQ(state_.backgroundImage()->at<cv::Vec4b>(8, 8)[0], 255);
}

TEST_F(BackgroundLoaderTest, LatestAsyncRequestWins) {
    BackgroundLoader loader(state_, 64, 48);
    const int kRequests = 10;
    for (int i = 0; i < kRequests; ++i) {
        const uchar value = static_cast<uchar>(i * 20);
        ASSERT_TRUE(loader.loadAsync(createSolidBGR(1280, 720, cv::Scalar(value, value, value))));
    }
    ASSERT_TRUE(loader.waitIdle(10000));

    // 마지막 요청은 항상 처리됨
    auto image = state_.backgroundImage();
    ASSERT_NE(image, nullptr);
    EXPECT_EQ(image->at<cv::Vec4b>(0, 0)[0], static_cast<uchar>((kRequests - 1) * 20));

    // 모든 요청은 처리되거나 밀려남
    EXPECT_EQ(loader.loadedCount() + loader.supersededCount(),
              static_cast<uint64_t>(kRequests));
}

TEST_F(BackgroundLoaderTest, AsyncFailureKeepsPrevious) {
    BackgroundLoader loader(state_, 64, 48);
    ASSERT_EQ(loader.load(createSolidBGR(64, 48, cv::Scalar(9, 9, 9))), ErrorCode::Success);
    auto before = state_.backgroundImage();

    ASSERT_TRUE(loader.loadAsync(std::string("/nonexistent/backdrop_missing.jpg")));
    ASSERT_TRUE(loader.waitIdle(5000));
    EXPECT_EQ(state_.backgroundImage(), before);
    EXPECT_EQ(loader.lastError(), ErrorCode::ImageLoadFailed);
}

TEST_F(BackgroundLoaderTest, SetTarget) {
    BackgroundLoader loader(state_, 64, 48);
    EXPECT_FALSE(loader.setTarget(0, 10, FrameFormat::BGRA));
    ASSERT_TRUE(loader.setTarget(20, 10, FrameFormat::RGBA));

    ASSERT_EQ(loader.load(createSolidBGR(40, 20, cv::Scalar(0, 0, 255))), ErrorCode::Success);
    auto image = state_.backgroundImage();
    ASSERT_NE(image, nullptr);
    EXPECT_EQ(image->size(), cv::Size(20, 10));
    EXPECT_EQ(image->at<cv::Vec4b>(0, 0)[0], 255);  // RGBA의 R
}

TEST_F(BackgroundLoaderTest, DestroyWithPendingRequest) {
    // 대기 중인 요청이 있어도 소멸자가 정상 종료
    {
        BackgroundLoader loader(state_, 64, 48);
        loader.loadAsync(createSolidBGR(1920, 1080, cv::Scalar::all(1)));
        loader.loadAsync(createSolidBGR(1920, 1080, cv::Scalar::all(2)));
    }
    SUCCEED();
}

} // namespace testing
} // namespace backdrop_sdk
