/**
 * @file background_store.cpp
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

// Standard includes
#include <iostream>

// Qt includes
#include <QDebug>

// Local includes
#include "PixelBufferUtils.hpp"
#include "background_store.hpp"

/**
 * @brief Constructor for the BackgroundStore class.
 *
 * @param gpu The shared compute device.
 * @param targetSize The composited output size every background is scaled to.
 */
BackgroundStore::BackgroundStore(std::shared_ptr<const GpuContext> gpu,
                                 cv::Size targetSize)
    : gpu_(std::move(gpu)), targetSize_(targetSize) {
  std::cout << "[BackgroundStore] Target size: " << targetSize_.width << "x"
            << targetSize_.height << "\n";
}

/**
 * @brief Scale and upload a background image.
 *
 * @param image The source image (grayscale, BGR or BGRA, any size).
 *
 * @return The new texture, or nullptr if scaling or uploading failed.
 */
std::shared_ptr<const BackgroundTexture>
BackgroundStore::makeTexture(const cv::Mat &image) {
  cv::Mat bgra = toBgra(image);
  if (bgra.empty()) {
    qWarning() << "[BackgroundStore] Unsupported background image type"
               << image.type();
    return nullptr;
  }

  cv::Mat filled = resizeToFill(bgra, targetSize_.width, targetSize_.height);
  if (filled.empty()) {
    return nullptr;
  }

  auto texture = std::make_shared<BackgroundTexture>();
  texture->pixels = filled;

  try {
    // HWC uint8 -> NCHW float on the device, one copy to the GPU
    torch::Tensor host = torch::from_blob(
        filled.data, {filled.rows, filled.cols, 4}, torch::kUInt8);
    texture->texture = host.to(gpu_->device())
                           .permute({2, 0, 1})
                           .unsqueeze(0)
                           .to(torch::kFloat32)
                           .contiguous();
  } catch (const std::exception &e) {
    qWarning() << "[BackgroundStore] Failed to create background texture:"
               << e.what();
    return nullptr;
  }

  return texture;
}

/**
 * @brief Replace the background with a new image.
 *
 * The new texture is built completely before it is published, and
 * publishing is a pointer swap, so the compositor sees either the whole old
 * background or the whole new one.
 *
 * @param image The new background image.
 *
 * @return true if the background was replaced, false otherwise.
 */
bool BackgroundStore::setBackground(const cv::Mat &image) {
  std::shared_ptr<const BackgroundTexture> texture = makeTexture(image);
  if (!texture) {
    qWarning() << "[BackgroundStore] Keeping the previous background";
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    current_.swap(texture);
  }

  qInfo() << "[BackgroundStore] Background replaced with a" << image.cols
          << "x" << image.rows << "image";
  return true;
}

/**
 * @brief Remove the background.
 */
void BackgroundStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  current_.reset();
}

/**
 * @brief Get the current background.
 *
 * @return The current texture, or nullptr if no background is set.
 */
std::shared_ptr<const BackgroundTexture> BackgroundStore::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}
