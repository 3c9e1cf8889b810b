/**
 * @file PixelBufferUtils.hpp
 *
 * Helpers for resizing and converting packed 32-bit pixel buffers.
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

#include <opencv2/core.hpp>

/// Stretch a pixel buffer to width x height (no aspect preservation).
/// Returns an empty cv::Mat on failure.
cv::Mat resizePixelBuffer(const cv::Mat &src, int width, int height);

/// Crop src to the given rectangle, then stretch it to scaleWidth x
/// scaleHeight. Returns an empty cv::Mat on failure.
cv::Mat resizePixelBuffer(const cv::Mat &src, int cropX, int cropY,
                          int cropWidth, int cropHeight, int scaleWidth,
                          int scaleHeight);

/// Scale src to exactly fill targetWidth x targetHeight, preserving the
/// aspect ratio and cropping the overflow around the centre.
cv::Mat resizeToFill(const cv::Mat &src, int targetWidth, int targetHeight);

/// Convert a 1, 3 or 4 channel 8-bit image into packed BGRA (CV_8UC4).
cv::Mat toBgra(const cv::Mat &src);
