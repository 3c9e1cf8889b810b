/**
 * @file composite_kernel.hpp
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

#pragma once

// Standard includes
#include <memory>

// External includes
#include <opencv2/core.hpp>

// Local includes
#include "background_store.hpp"
#include "gpu_context.hpp"

/**
 * @brief CompositeKernel class
 *
 * For every pixel of the target grid the kernel maps the pixel centre to a
 * normalised position, looks up the class id in the mask (nearest sample) and
 * writes either the camera pixel (nearest sample) or the background
 * (bilinear sample) at that position.
 *
 * The output texture and the mask buffer are allocated once and reused for
 * every frame. dispatch() only queues work; readback() waits for it and copies
 * the result to the CPU.
 */
class CompositeKernel {
public:
  CompositeKernel(std::shared_ptr<const GpuContext> gpu, cv::Size targetSize,
                  cv::Size maskSize, int personClass);

  CompositeKernel(const CompositeKernel &) = delete;
  CompositeKernel &operator=(const CompositeKernel &) = delete;

  /// Queue the composite of one frame. Throws on invalid input or device
  /// errors.
  void dispatch(const cv::Mat &camera, const cv::Mat &mask,
                const BackgroundTexture &background);

  /// Wait for the last dispatch and copy the output texture into a new
  /// CV_8UC4 image
  cv::Mat readback();

  const cv::Size &targetSize() const noexcept { return targetSize_; }
  const cv::Size &maskSize() const noexcept { return maskSize_; }

private:
  // Nearest sample indices for an output axis of length out over a source
  // axis of length src
  torch::Tensor nearestIndices(int src, int out) const;

  // Copy the label grid into the persistent mask buffer
  void uploadMask(const cv::Mat &mask);

  std::shared_ptr<const GpuContext> gpu_;

  const cv::Size targetSize_;
  const cv::Size maskSize_;

  // The class id that selects the camera pixel
  const int personClass_;

  // uint8 [H, W, 4] in the target size
  torch::Tensor output_;

  // int32 [maskH, maskW]
  torch::Tensor maskBuffer_;

  // Mask lookup tables, fixed for the lifetime of the kernel
  torch::Tensor maskRows_, maskCols_;

  // Camera lookup tables, rebuilt when the camera size changes
  cv::Size cameraSize_;
  torch::Tensor cameraRows_, cameraCols_;

  // Bilinear sampling grid over the target pixel centres, [1, H, W, 2]
  torch::Tensor sampleGrid_;
};
