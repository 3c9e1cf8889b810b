/**
 * @file torch_segmentation_model.hpp
 *
 * A TorchScript DeepLabV3 segmentation model run with libtorch.
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

#pragma once

// Standard includes
#include <memory>
#include <string>

// Local includes
#include "gpu_context.hpp"
#include "segmentation_model.hpp"

/**
 * @brief TorchSegmentationModel class
 *
 * Loads a scripted DeepLabV3 (21 Pascal VOC classes, "person" is 15) and
 * turns its logits into per-pixel class ids. The constructor throws
 * std::runtime_error if the model cannot be loaded.
 */
class TorchSegmentationModel : public SegmentationModel {
public:
  TorchSegmentationModel(const std::string &modelPath,
                         std::shared_ptr<const GpuContext> gpu,
                         int modelSize = 513, int numClasses = 21,
                         int nthreads = 1);

  cv::Size inputSize() const override { return cv::Size(modelW_, modelH_); }

  int numClasses() const override { return numClasses_; }

  cv::Mat predict(const cv::Mat &input) override;

private:
  // Fill inputCpuTensor_ with the normalised RGB planes of a BGRA image
  void fillInputTensor(const cv::Mat &input);

  // Path to the segmentation model
  std::string modelPath_;

  // The shared compute device
  std::shared_ptr<const GpuContext> gpu_;

  // Internal state for segmentation
  torch::jit::script::Module segmentModel_;

  // pre-allocated Tensor for inference on the CPU and the device
  torch::Tensor inputCpuTensor_;
  torch::Tensor inputTensor_;

  // Dimensions for the model
  int modelW_, modelH_;

  // Size of the label space
  int numClasses_;

  // The number of threads used to fill the input tensor
  int nthreads_;
};
