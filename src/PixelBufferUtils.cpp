/**
 * @file PixelBufferUtils.cpp
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

// Standard includes
#include <algorithm>
#include <cmath>

// Qt includes
#include <QDebug>

// External includes
#include <opencv2/imgproc.hpp>

// Local includes
#include "PixelBufferUtils.hpp"

/**
 * @brief Resize a pixel buffer to a new width and height.
 *
 * @param src The source buffer.
 * @param width The width of the result.
 * @param height The height of the result.
 *
 * @return The resized buffer, or an empty cv::Mat on failure.
 */
cv::Mat resizePixelBuffer(const cv::Mat &src, int width, int height) {
  return resizePixelBuffer(src, 0, 0, src.cols, src.rows, width, height);
}

/**
 * @brief First crop the pixel buffer, then resize it.
 *
 * The crop is a view onto src, so the only pixel copy is the one cv::resize
 * performs while writing the destination.
 *
 * @param src The source buffer.
 * @param cropX Left edge of the crop.
 * @param cropY Top edge of the crop.
 * @param cropWidth Width of the crop.
 * @param cropHeight Height of the crop.
 * @param scaleWidth Width of the result.
 * @param scaleHeight Height of the result.
 *
 * @return The resized buffer, or an empty cv::Mat on failure.
 */
cv::Mat resizePixelBuffer(const cv::Mat &src, int cropX, int cropY,
                          int cropWidth, int cropHeight, int scaleWidth,
                          int scaleHeight) {
  if (src.empty()) {
    qWarning() << "[PixelBufferUtils] Cannot resize an empty buffer";
    return cv::Mat();
  }

  if (scaleWidth <= 0 || scaleHeight <= 0 || cropWidth <= 0 ||
      cropHeight <= 0) {
    qWarning() << "[PixelBufferUtils] Invalid resize" << cropWidth << "x"
               << cropHeight << "->" << scaleWidth << "x" << scaleHeight;
    return cv::Mat();
  }

  const cv::Rect crop(cropX, cropY, cropWidth, cropHeight);
  if ((crop & cv::Rect(0, 0, src.cols, src.rows)) != crop) {
    qWarning() << "[PixelBufferUtils] Crop" << cropX << cropY << cropWidth
               << cropHeight << "is outside the" << src.cols << "x"
               << src.rows << "buffer";
    return cv::Mat();
  }

  cv::Mat dst;
  try {
    cv::resize(src(crop), dst, cv::Size(scaleWidth, scaleHeight), 0, 0,
               cv::INTER_LINEAR);
  } catch (const cv::Exception &e) {
    qWarning() << "[PixelBufferUtils] Resize failed:" << e.what();
    return cv::Mat();
  }

  return dst;
}

/**
 * @brief Scale an image so it fills the target, cropping the overflow.
 *
 * The scale factor is the larger of the width and height ratios, so one axis
 * matches the target exactly and the other overflows. The overflow is split
 * evenly on both sides.
 *
 * @param src The source image.
 * @param targetWidth The width of the result.
 * @param targetHeight The height of the result.
 *
 * @return A targetWidth x targetHeight image, or an empty cv::Mat on failure.
 */
cv::Mat resizeToFill(const cv::Mat &src, int targetWidth, int targetHeight) {
  if (src.empty() || targetWidth <= 0 || targetHeight <= 0) {
    qWarning() << "[PixelBufferUtils] Nothing to fill" << targetWidth << "x"
               << targetHeight << "with";
    return cv::Mat();
  }

  const double widthScale = static_cast<double>(targetWidth) / src.cols;
  const double heightScale = static_cast<double>(targetHeight) / src.rows;
  const double scale = std::max(widthScale, heightScale);

  // Rounding can leave us a pixel short of the target, never allow that
  const int newWidth =
      std::max(targetWidth, static_cast<int>(std::lround(src.cols * scale)));
  const int newHeight =
      std::max(targetHeight, static_cast<int>(std::lround(src.rows * scale)));

  cv::Mat scaled;
  try {
    cv::resize(src, scaled, cv::Size(newWidth, newHeight), 0, 0,
               scale < 1.0 ? cv::INTER_AREA : cv::INTER_LINEAR);
  } catch (const cv::Exception &e) {
    qWarning() << "[PixelBufferUtils] Scale to fill failed:" << e.what();
    return cv::Mat();
  }

  // Centre the crop
  const int xOffset = (newWidth - targetWidth) / 2;
  const int yOffset = (newHeight - targetHeight) / 2;

  return scaled(cv::Rect(xOffset, yOffset, targetWidth, targetHeight)).clone();
}

/**
 * @brief Convert an 8-bit image into packed BGRA.
 *
 * @param src Grayscale, BGR or BGRA image.
 *
 * @return The BGRA image (sharing src when it already is BGRA), or an empty
 *   cv::Mat for unsupported input.
 */
cv::Mat toBgra(const cv::Mat &src) {
  if (src.empty() || src.depth() != CV_8U) {
    return cv::Mat();
  }

  cv::Mat bgra;
  switch (src.channels()) {
  case 1:
    cv::cvtColor(src, bgra, cv::COLOR_GRAY2BGRA);
    break;
  case 3:
    cv::cvtColor(src, bgra, cv::COLOR_BGR2BGRA);
    break;
  case 4:
    bgra = src;
    break;
  default:
    return cv::Mat();
  }

  return bgra;
}
