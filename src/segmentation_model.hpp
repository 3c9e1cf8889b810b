/**
 * @file segmentation_model.hpp
 *
 * The interface to the person segmentation model.
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

// External includes
#include <opencv2/core.hpp>

/**
 * @brief SegmentationModel class
 *
 * A synchronous semantic segmentation model. predict() takes a BGRA image of
 * exactly inputSize() and returns a CV_32SC1 grid of the same size holding one
 * class id per pixel. It throws on failure.
 */
class SegmentationModel {
public:
  virtual ~SegmentationModel() = default;

  /// The fixed input (and output) resolution
  virtual cv::Size inputSize() const = 0;

  /// Number of labels the model can produce
  virtual int numClasses() const = 0;

  /// Run the model on one image
  virtual cv::Mat predict(const cv::Mat &input) = 0;
};
