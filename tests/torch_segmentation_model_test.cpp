/**
 * @file torch_segmentation_model_test.cpp
 *
 * Tests for the TorchScript segmentation model wrapper, using small scripted
 * modules in place of DeepLabV3.
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
#include <stdexcept>
#include <string>

// Qt includes
#include <QTemporaryDir>

// External includes
#include <gtest/gtest.h>

// Local includes
#include "torch_segmentation_model.hpp"

namespace {

constexpr int kSize = 5;

// Scores class 3 where the red channel is bright and class 7 where it is
// dark, so the expected labels follow the input image
const char *kScores = R"(
    out = torch.zeros([1, 21, x.size(2), x.size(3)])
    out[0, 3] = x[0, 0]
    out[0, 7] = -x[0, 0]
)";

// Left two columns bright red, the rest black
cv::Mat makeInput() {
  cv::Mat input(kSize, kSize, CV_8UC4, cv::Scalar(0, 0, 0, 255));
  input.colRange(0, 2).setTo(cv::Scalar(0, 0, 255, 255));
  return input;
}

void expectLabels(const cv::Mat &labels) {
  ASSERT_EQ(labels.type(), CV_32SC1);
  ASSERT_EQ(labels.cols, kSize);
  ASSERT_EQ(labels.rows, kSize);
  for (int y = 0; y < kSize; ++y)
    for (int x = 0; x < kSize; ++x)
      EXPECT_EQ(labels.at<int>(y, x), x < 2 ? 3 : 7) << x << "," << y;
}

} // namespace

class TorchSegmentationModelTest : public ::testing::Test {
protected:
  void SetUp() override { ASSERT_TRUE(dir_.isValid()); }

  // Script a module whose forward runs the scoring body then returns ret
  std::string scriptModule(const std::string &name, const std::string &ret) {
    torch::jit::Module module("m");
    module.define("def forward(self, x):" + std::string(kScores) +
                  "    return " + ret + "\n");
    const std::string path =
        dir_.filePath(QString::fromStdString(name + ".pt")).toStdString();
    module.save(path);
    return path;
  }

  std::unique_ptr<TorchSegmentationModel> load(const std::string &path) {
    return std::make_unique<TorchSegmentationModel>(path, gpu_, kSize, 21, 1);
  }

  QTemporaryDir dir_;
  std::shared_ptr<const GpuContext> gpu_ =
      std::make_shared<const GpuContext>(true);
};

TEST_F(TorchSegmentationModelTest, ReportsItsGeometry) {
  auto model = load(scriptModule("tensor", "out"));
  EXPECT_EQ(model->inputSize(), cv::Size(kSize, kSize));
  EXPECT_EQ(model->numClasses(), 21);
}

TEST_F(TorchSegmentationModelTest, TensorOutputGivesPerPixelArgmax) {
  auto model = load(scriptModule("tensor", "out"));
  expectLabels(model->predict(makeInput()));
}

TEST_F(TorchSegmentationModelTest, TupleOutputUsesTheFirstElement) {
  auto model = load(scriptModule("tuple", "(out, -out)"));
  expectLabels(model->predict(makeInput()));
}

TEST_F(TorchSegmentationModelTest, DictOutputUsesTheOutEntry) {
  auto model = load(scriptModule("dict", R"({"aux": -out, "out": out})"));
  expectLabels(model->predict(makeInput()));
}

TEST_F(TorchSegmentationModelTest, WrongShapeOutputThrows) {
  auto model = load(scriptModule("cropped", "out[:, :, 0:2, :]"));
  EXPECT_THROW(model->predict(makeInput()), std::runtime_error);
}

TEST_F(TorchSegmentationModelTest, UnsupportedOutputTypeThrows) {
  auto model = load(scriptModule("list", "[out]"));
  EXPECT_THROW(model->predict(makeInput()), std::runtime_error);
}

TEST_F(TorchSegmentationModelTest, RejectsInputOfTheWrongSize) {
  auto model = load(scriptModule("tensor", "out"));
  cv::Mat small(kSize - 1, kSize, CV_8UC4, cv::Scalar::all(0));
  EXPECT_THROW(model->predict(small), std::invalid_argument);
  cv::Mat bgr(kSize, kSize, CV_8UC3, cv::Scalar::all(0));
  EXPECT_THROW(model->predict(bgr), std::invalid_argument);
}

TEST_F(TorchSegmentationModelTest, MissingModelFileThrows) {
  EXPECT_THROW(
      { TorchSegmentationModel model("no/such/model.pt", gpu_, 65); },
      std::runtime_error);
}
