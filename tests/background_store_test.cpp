/**
 * @file background_store_test.cpp
 *
 * Tests for the background store.
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

// Standard includes
#include <memory>

// External includes
#include <gtest/gtest.h>

// Local includes
#include "background_store.hpp"
#include "test_utils.hpp"

using test_utils::makeSolid;

class BackgroundStoreTest : public ::testing::Test {
protected:
  std::shared_ptr<const GpuContext> gpu_ =
      std::make_shared<const GpuContext>(true);
  BackgroundStore store_{gpu_, cv::Size(720, 1280)};
};

TEST_F(BackgroundStoreTest, StartsEmpty) {
  EXPECT_FALSE(store_.hasBackground());
  EXPECT_EQ(store_.current(), nullptr);
}

TEST_F(BackgroundStoreTest, ScalesToTheTargetSize) {
  ASSERT_TRUE(store_.setBackground(makeSolid(400, 300, cv::Vec4b(1, 2, 3, 255))));

  auto bg = store_.current();
  ASSERT_NE(bg, nullptr);
  EXPECT_EQ(bg->width(), 720);
  EXPECT_EQ(bg->height(), 1280);
  EXPECT_EQ(bg->pixels.type(), CV_8UC4);

  ASSERT_TRUE(bg->texture.defined());
  EXPECT_EQ(bg->texture.sizes().vec(),
            (std::vector<int64_t>{1, 4, 1280, 720}));
  EXPECT_EQ(bg->texture.scalar_type(), torch::kFloat32);
}

TEST_F(BackgroundStoreTest, AcceptsGrayAndBgrImages) {
  EXPECT_TRUE(store_.setBackground(cv::Mat(50, 50, CV_8UC1, cv::Scalar(9))));
  EXPECT_EQ(store_.current()->pixels.at<cv::Vec4b>(0, 0),
            cv::Vec4b(9, 9, 9, 255));

  EXPECT_TRUE(
      store_.setBackground(cv::Mat(30, 10, CV_8UC3, cv::Scalar(4, 5, 6))));
  EXPECT_EQ(store_.current()->pixels.at<cv::Vec4b>(640, 360),
            cv::Vec4b(4, 5, 6, 255));
}

TEST_F(BackgroundStoreTest, TextureMatchesThePixels) {
  ASSERT_TRUE(store_.setBackground(makeSolid(30, 40, cv::Vec4b(10, 20, 30, 40))));
  auto bg = store_.current();

  auto channelMeans = bg->texture.mean({0, 2, 3});
  EXPECT_FLOAT_EQ(channelMeans[0].item<float>(), 10.f);
  EXPECT_FLOAT_EQ(channelMeans[1].item<float>(), 20.f);
  EXPECT_FLOAT_EQ(channelMeans[2].item<float>(), 30.f);
  EXPECT_FLOAT_EQ(channelMeans[3].item<float>(), 40.f);
}

TEST_F(BackgroundStoreTest, FailureKeepsThePreviousBackground) {
  ASSERT_TRUE(store_.setBackground(makeSolid(64, 64, cv::Vec4b(7, 7, 7, 255))));
  auto before = store_.current();

  EXPECT_FALSE(store_.setBackground(cv::Mat()));
  EXPECT_FALSE(store_.setBackground(cv::Mat(8, 8, CV_32FC3, cv::Scalar(0))));

  EXPECT_EQ(store_.current(), before);
}

TEST_F(BackgroundStoreTest, FailureWithoutABackgroundStaysEmpty) {
  EXPECT_FALSE(store_.setBackground(cv::Mat()));
  EXPECT_FALSE(store_.hasBackground());
}

TEST_F(BackgroundStoreTest, ReplacementLeavesHeldSnapshotsIntact) {
  ASSERT_TRUE(store_.setBackground(makeSolid(64, 64, cv::Vec4b(1, 1, 1, 255))));
  auto held = store_.current();

  ASSERT_TRUE(store_.setBackground(makeSolid(64, 64, cv::Vec4b(2, 2, 2, 255))));
  auto latest = store_.current();

  EXPECT_NE(held, latest);
  EXPECT_EQ(held->pixels.at<cv::Vec4b>(100, 100), cv::Vec4b(1, 1, 1, 255));
  EXPECT_EQ(latest->pixels.at<cv::Vec4b>(100, 100), cv::Vec4b(2, 2, 2, 255));
  EXPECT_FLOAT_EQ(held->texture.max().item<float>(), 255.f);
  EXPECT_FLOAT_EQ(held->texture.narrow(1, 0, 3).max().item<float>(), 1.f);
}

TEST_F(BackgroundStoreTest, ClearReturnsToPassThrough) {
  ASSERT_TRUE(store_.setBackground(makeSolid(8, 8, cv::Vec4b(0, 0, 0, 255))));
  store_.clear();
  EXPECT_FALSE(store_.hasBackground());
}
