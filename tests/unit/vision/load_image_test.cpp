#include <markscan/vision/load_image.hpp>
#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <cstdint>
#include <filesystem>

namespace mc = markscan::core;
namespace mv = markscan::vision;

TEST(FuseChannels, GreyStoredAsColourMatchesPlainGrayscale) {
  cv::Mat gray(20, 20, CV_8UC1, cv::Scalar(255));
  cv::rectangle(gray, cv::Rect(5, 5, 10, 10), cv::Scalar(40), cv::FILLED);
  cv::Mat bgr;
  cv::cvtColor(gray, bgr, cv::COLOR_GRAY2BGR);
  const cv::Mat fused = mv::fuse_channels(bgr, true);
  ASSERT_EQ(fused.type(), CV_8UC1);
  EXPECT_EQ(cv::countNonZero(fused != gray), 0);
}

TEST(FuseChannels, InkWithLowBlueStaysDark) {
  cv::Mat bgr(20, 20, CV_8UC3, cv::Scalar(255, 255, 255));
  bgr(cv::Rect(10, 0, 10, 20)).setTo(cv::Scalar(30, 60, 200));
  cv::Mat gray;
  cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);

  const cv::Mat fused = mv::fuse_channels(bgr, true);
  EXPECT_EQ(fused.at<std::uint8_t>(5, 15), 30);
  EXPECT_LT(fused.at<std::uint8_t>(5, 15), gray.at<std::uint8_t>(5, 15));
  EXPECT_EQ(fused.at<std::uint8_t>(5, 2), 255);

  const cv::Mat plain = mv::fuse_channels(bgr, false);
  EXPECT_EQ(plain.at<std::uint8_t>(5, 15), gray.at<std::uint8_t>(5, 15));
}

TEST(FuseChannels, SingleChannelPassesThrough) {
  const cv::Mat gray(8, 8, CV_8UC1, cv::Scalar(77));
  const cv::Mat out = mv::fuse_channels(gray, true);
  EXPECT_EQ(out.at<std::uint8_t>(3, 3), 77);
}

TEST(LoadPageImage, MissingFileFailsToLoad) {
  auto r = mv::load_page_image("/nonexistent/markscan/page.png", 300.0);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), mc::PipelineError::LoadFailed);
}

TEST(LoadPageImage, NonPositiveDpiIsInvalidConfig) {
  auto r = mv::load_page_image("/nonexistent/markscan/page.png", 0.0);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), mc::PipelineError::InvalidConfig);
}

TEST(LoadPageImage, ReadsPngAsGrayscalePage) {
  cv::Mat img(30, 40, CV_8UC1, cv::Scalar(255));
  img.at<std::uint8_t>(10, 20) = 0;
  const auto path = std::filesystem::temp_directory_path() / "markscan_load_image_test.png";
  ASSERT_TRUE(cv::imwrite(path.string(), img));

  auto page = mv::load_page_image(path.string(), 200.0);
  std::filesystem::remove(path);
  ASSERT_TRUE(page.has_value());
  EXPECT_TRUE(page->valid());
  EXPECT_EQ(page->width(), 40u);
  EXPECT_EQ(page->height(), 30u);
  EXPECT_DOUBLE_EQ(page->dpi(), 200.0);
  EXPECT_EQ(page->at(20, 10), 0);
  EXPECT_EQ(page->at(0, 0), 255);
}
