/**
 * @file background_store.hpp
 *
 * Holds the one GPU-resident background image used by the compositor.
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
#include <mutex>

// External includes
#include <opencv2/core.hpp>

// Local includes
#include "gpu_context.hpp"

/**
 * @brief An immutable background, already scaled to the target size.
 *
 * Once published a texture is never written again; replacing the background
 * publishes a new instance.
 */
struct BackgroundTexture {
  // The scaled BGRA image on the CPU
  cv::Mat pixels;

  // The same image on the compute device, float [1, 4, H, W] in [0, 255]
  torch::Tensor texture;

  int width() const noexcept { return pixels.cols; }
  int height() const noexcept { return pixels.rows; }
};

/**
 * @brief BackgroundStore class
 *
 * Scales incoming still images to fill the target resolution and keeps the
 * most recent one. Readers take a shared_ptr snapshot, so a replacement never
 * changes a texture somebody is still sampling.
 */
class BackgroundStore {
public:
  BackgroundStore(std::shared_ptr<const GpuContext> gpu, cv::Size targetSize);

  BackgroundStore(const BackgroundStore &) = delete;
  BackgroundStore &operator=(const BackgroundStore &) = delete;

  /// Replace the background. Returns false (keeping the old one) on failure.
  bool setBackground(const cv::Mat &image);

  /// Drop the current background, returning the processor to pass-through
  void clear();

  /// The current background, or nullptr if none has been set
  std::shared_ptr<const BackgroundTexture> current() const;

  bool hasBackground() const { return current() != nullptr; }

  const cv::Size &targetSize() const noexcept { return targetSize_; }

private:
  // Build a texture from an arbitrary image, nullptr on failure
  std::shared_ptr<const BackgroundTexture> makeTexture(const cv::Mat &image);

  std::shared_ptr<const GpuContext> gpu_;

  // The size every texture is scaled to
  const cv::Size targetSize_;

  mutable std::mutex mutex_;
  std::shared_ptr<const BackgroundTexture> current_;
};
