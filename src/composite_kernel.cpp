/**
 * @file composite_kernel.cpp
 *
 * The per-pixel compositing kernel. It runs as a libtorch tensor program on
 * the shared compute device and writes one output texture per frame.
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
#include <algorithm>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <vector>

// Local includes
#include "composite_kernel.hpp"

namespace F = torch::nn::functional;

/**
 * @brief Constructor for the CompositeKernel class.
 *
 * Allocates the persistent output texture, the mask buffer and the lookup
 * tables that only depend on the fixed sizes.
 *
 * @param gpu The shared compute device.
 * @param targetSize The size of the composited output.
 * @param maskSize The size of the label grid produced by the model.
 * @param personClass The label id that selects the camera pixel.
 */
CompositeKernel::CompositeKernel(std::shared_ptr<const GpuContext> gpu,
                                 cv::Size targetSize, cv::Size maskSize,
                                 int personClass)
    : gpu_(std::move(gpu)), targetSize_(targetSize), maskSize_(maskSize),
      personClass_(personClass) {

  if (targetSize_.width <= 0 || targetSize_.height <= 0 ||
      maskSize_.width <= 0 || maskSize_.height <= 0) {
    throw std::invalid_argument("CompositeKernel sizes must be positive");
  }

  const int W = targetSize_.width;
  const int H = targetSize_.height;
  const auto device = gpu_->device();

  output_ = torch::zeros(
      {H, W, 4}, torch::TensorOptions().dtype(torch::kUInt8).device(device));
  maskBuffer_ = torch::zeros(
      {maskSize_.height, maskSize_.width},
      torch::TensorOptions().dtype(torch::kInt32).device(device));

  maskRows_ = nearestIndices(maskSize_.height, H);
  maskCols_ = nearestIndices(maskSize_.width, W);

  // Pixel centres in grid_sample coordinates (align_corners = false)
  auto fopts = torch::TensorOptions().dtype(torch::kFloat32).device(device);
  torch::Tensor gx = torch::arange(W, fopts).mul(2).add(1).div(W).sub(1);
  torch::Tensor gy = torch::arange(H, fopts).mul(2).add(1).div(H).sub(1);
  sampleGrid_ = torch::stack({gx.view({1, W}).expand({H, W}),
                              gy.view({H, 1}).expand({H, W})},
                             2)
                    .unsqueeze(0)
                    .contiguous();

  std::cout << "[CompositeKernel] Target size: " << W << "x" << H << "\n";
  std::cout << "[CompositeKernel] Mask size: " << maskSize_.width << "x"
            << maskSize_.height << "\n";
}

/**
 * @brief Build the nearest sample lookup for one axis.
 *
 * Output index i has its centre at (i + 0.5) / out in normalised
 * coordinates, which lands on source index floor((i + 0.5) * src / out),
 * clamped to the last valid index. Integer arithmetic keeps this exact.
 *
 * @param src The source axis length.
 * @param out The output axis length.
 *
 * @return int64 tensor of length out on the compute device.
 */
torch::Tensor CompositeKernel::nearestIndices(int src, int out) const {
  std::vector<std::int64_t> idx(out);
  for (int i = 0; i < out; ++i) {
    const std::int64_t s =
        ((2 * static_cast<std::int64_t>(i) + 1) * src) / (2 * out);
    idx[i] = std::min<std::int64_t>(s, src - 1);
  }
  return torch::tensor(idx, torch::dtype(torch::kInt64)).to(gpu_->device());
}

/**
 * @brief Copy the label grid verbatim into the mask buffer.
 *
 * @param mask CV_32SC1 label grid of the mask size.
 */
void CompositeKernel::uploadMask(const cv::Mat &mask) {
  if (mask.type() != CV_32SC1 || mask.size() != maskSize_) {
    throw std::invalid_argument("Mask must be a CV_32SC1 grid of " +
                                std::to_string(maskSize_.width) + "x" +
                                std::to_string(maskSize_.height));
  }

  torch::Tensor host = torch::from_blob(
      mask.data, {mask.rows, mask.cols},
      {static_cast<std::int64_t>(mask.step[0] / sizeof(std::int32_t)), 1},
      torch::kInt32);
  maskBuffer_.copy_(host);
}

/**
 * @brief Queue the composite of one frame.
 *
 * @param camera The BGRA camera frame, any size.
 * @param mask The CV_32SC1 label grid produced for this frame.
 * @param background The current background texture.
 */
void CompositeKernel::dispatch(const cv::Mat &camera, const cv::Mat &mask,
                               const BackgroundTexture &background) {
  if (camera.type() != CV_8UC4 || camera.empty()) {
    throw std::invalid_argument("Camera frame must be a non-empty BGRA image");
  }
  if (!background.texture.defined()) {
    throw std::invalid_argument("Background has no device texture");
  }

  torch::NoGradGuard no_grad;
  const auto device = gpu_->device();

  uploadMask(mask);

  if (camera.size() != cameraSize_) {
    cameraRows_ = nearestIndices(camera.rows, targetSize_.height);
    cameraCols_ = nearestIndices(camera.cols, targetSize_.width);
    cameraSize_ = camera.size();
  }

  // Camera pixels at the target resolution, uint8 [H, W, 4]
  torch::Tensor cam =
      torch::from_blob(camera.data, {camera.rows, camera.cols, 4},
                       {static_cast<std::int64_t>(camera.step[0]), 4, 1},
                       torch::kUInt8)
          .to(device);
  torch::Tensor camNearest =
      cam.index_select(0, cameraRows_).index_select(1, cameraCols_);

  // Background sampled bilinearly at the same positions
  torch::Tensor bg =
      F::grid_sample(background.texture, sampleGrid_,
                     F::GridSampleFuncOptions()
                         .mode(torch::kBilinear)
                         .padding_mode(torch::kBorder)
                         .align_corners(false));
  torch::Tensor bgSampled = bg.squeeze(0)
                                .permute({1, 2, 0})
                                .round()
                                .clamp(0, 255)
                                .to(torch::kUInt8);

  // Person where the nearest mask label matches, [H, W, 1]
  torch::Tensor person = maskBuffer_.index_select(0, maskRows_)
                             .index_select(1, maskCols_)
                             .eq(personClass_)
                             .unsqueeze(2);

  output_.copy_(torch::where(person, camNearest, bgSampled));
}

/**
 * @brief Read the output texture back to the CPU.
 *
 * Blocks until all queued device work has completed.
 *
 * @return A newly allocated CV_8UC4 image of the target size.
 */
cv::Mat CompositeKernel::readback() {
  gpu_->synchronize();

  torch::Tensor host = output_.to(torch::kCPU).contiguous();

  cv::Mat result(targetSize_.height, targetSize_.width, CV_8UC4);
  std::memcpy(result.data, host.data_ptr<std::uint8_t>(),
              static_cast<std::size_t>(host.numel()));
  return result;
}
