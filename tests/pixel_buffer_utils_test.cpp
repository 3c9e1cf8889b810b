/**
 * @file pixel_buffer_utils_test.cpp
 *
 * Tests for the pixel buffer resize and conversion helpers.
 *
 * This file is part of VirtualBackdrop, a real-time virtual background
 * compositor.
 *
 * VirtualBackdrop is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * VirtualBackdrop is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with VirtualBackdrop. If not, see <http://www.gnu.org/licenses/>.
 */

// External includes
#include <gtest/gtest.h>
#include <opencv2/core.hpp>

// Local includes
#include "PixelBufferUtils.hpp"
#include "test_utils.hpp"

using test_utils::makeSolid;

TEST(PixelBufferUtilsTest, ResizeProducesTheRequestedSize) {
  const cv::Mat src = makeSolid(1280, 720, cv::Vec4b(10, 20, 30, 255));
  const cv::Size sizes[] = {{513, 513}, {1, 1}, {2000, 3}, {720, 1280}};

  for (const auto &size : sizes) {
    cv::Mat dst = resizePixelBuffer(src, size.width, size.height);
    ASSERT_FALSE(dst.empty());
    EXPECT_EQ(dst.cols, size.width);
    EXPECT_EQ(dst.rows, size.height);
    EXPECT_EQ(dst.type(), CV_8UC4);
  }
}

TEST(PixelBufferUtilsTest, ResizeIsAStretch) {
  // A solid image stays solid however the aspect ratio changes
  const cv::Mat src = makeSolid(64, 16, cv::Vec4b(1, 2, 3, 4));
  cv::Mat dst = resizePixelBuffer(src, 9, 40);
  ASSERT_FALSE(dst.empty());
  EXPECT_EQ(test_utils::maxAbsDiff(dst, makeSolid(9, 40, cv::Vec4b(1, 2, 3, 4))),
            0.0);
}

TEST(PixelBufferUtilsTest, NonPositiveSizesFail) {
  const cv::Mat src = makeSolid(8, 8, cv::Vec4b(0, 0, 0, 255));
  EXPECT_TRUE(resizePixelBuffer(src, 0, 8).empty());
  EXPECT_TRUE(resizePixelBuffer(src, 8, -1).empty());
  EXPECT_TRUE(resizePixelBuffer(cv::Mat(), 8, 8).empty());
}

TEST(PixelBufferUtilsTest, OutOfBoundsCropFails) {
  const cv::Mat src = makeSolid(100, 50, cv::Vec4b(0, 0, 0, 255));
  EXPECT_TRUE(resizePixelBuffer(src, 60, 0, 50, 50, 10, 10).empty());
  EXPECT_TRUE(resizePixelBuffer(src, -1, 0, 10, 10, 10, 10).empty());
  EXPECT_TRUE(resizePixelBuffer(src, 0, 10, 100, 41, 10, 10).empty());
}

TEST(PixelBufferUtilsTest, CropSelectsTheRegion) {
  cv::Mat src = makeSolid(100, 50, cv::Vec4b(0, 0, 255, 255));
  src(cv::Rect(50, 0, 50, 50)).setTo(cv::Scalar(255, 0, 0, 255));

  cv::Mat right = resizePixelBuffer(src, 50, 0, 50, 50, 20, 30);
  ASSERT_FALSE(right.empty());
  EXPECT_EQ(right.size(), cv::Size(20, 30));
  EXPECT_EQ(test_utils::maxAbsDiff(right,
                                   makeSolid(20, 30, cv::Vec4b(255, 0, 0, 255))),
            0.0);
}

TEST(PixelBufferUtilsTest, ResizeToFillHitsTheTargetExactly) {
  const cv::Mat src = makeSolid(400, 300, cv::Vec4b(5, 6, 7, 255));
  cv::Mat filled = resizeToFill(src, 720, 1280);
  ASSERT_FALSE(filled.empty());
  EXPECT_EQ(filled.cols, 720);
  EXPECT_EQ(filled.rows, 1280);

  // Awkward ratios must not leave the result a pixel short
  cv::Mat odd = resizeToFill(makeSolid(333, 777, cv::Vec4b(1, 1, 1, 1)), 101,
                             59);
  EXPECT_EQ(odd.size(), cv::Size(101, 59));
}

TEST(PixelBufferUtilsTest, ResizeToFillCropsAroundTheCentre) {
  // Three vertical bands, the target only has room for the middle one
  cv::Mat src(100, 300, CV_8UC4, cv::Scalar(0, 0, 255, 255));
  src(cv::Rect(100, 0, 100, 100)).setTo(cv::Scalar(0, 255, 0, 255));
  src(cv::Rect(200, 0, 100, 100)).setTo(cv::Scalar(255, 0, 0, 255));

  cv::Mat filled = resizeToFill(src, 100, 100);
  ASSERT_EQ(filled.size(), cv::Size(100, 100));
  EXPECT_EQ(test_utils::maxAbsDiff(
                filled, makeSolid(100, 100, cv::Vec4b(0, 255, 0, 255))),
            0.0);
}

TEST(PixelBufferUtilsTest, ToBgraConvertsSupportedLayouts) {
  cv::Mat gray(4, 4, CV_8UC1, cv::Scalar(77));
  cv::Mat bgr(4, 4, CV_8UC3, cv::Scalar(1, 2, 3));

  cv::Mat fromGray = toBgra(gray);
  ASSERT_EQ(fromGray.type(), CV_8UC4);
  EXPECT_EQ(fromGray.at<cv::Vec4b>(0, 0), cv::Vec4b(77, 77, 77, 255));

  cv::Mat fromBgr = toBgra(bgr);
  ASSERT_EQ(fromBgr.type(), CV_8UC4);
  EXPECT_EQ(fromBgr.at<cv::Vec4b>(3, 3), cv::Vec4b(1, 2, 3, 255));

  cv::Mat bgra = makeSolid(4, 4, cv::Vec4b(9, 8, 7, 6));
  EXPECT_EQ(toBgra(bgra).data, bgra.data);
}

TEST(PixelBufferUtilsTest, ToBgraRejectsOtherDepths) {
  EXPECT_TRUE(toBgra(cv::Mat(4, 4, CV_32FC3, cv::Scalar(0))).empty());
  EXPECT_TRUE(toBgra(cv::Mat(4, 4, CV_8UC2, cv::Scalar(0))).empty());
  EXPECT_TRUE(toBgra(cv::Mat()).empty());
}
