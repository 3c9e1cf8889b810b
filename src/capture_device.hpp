/**
 * @file capture_device.hpp
 *
 * The camera device seam and its OpenCV implementation.
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
#include <string>

// External includes
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

/**
 * @brief CaptureDevice class
 *
 * A source of raw camera images. Calls are serialised by the owner; an
 * implementation does not need to be thread safe.
 */
class CaptureDevice {
public:
  virtual ~CaptureDevice() = default;

  /// Acquire the device. Returns false if it is absent or unusable.
  virtual bool open() = 0;

  virtual bool isOpened() const = 0;

  /// Block for the next image. Returns false if the device failed.
  virtual bool read(cv::Mat &frame) = 0;

  /// Release the device
  virtual void close() = 0;

  /// Human readable name for log messages
  virtual std::string description() const = 0;
};

/**
 * @brief OpenCvCaptureDevice class
 *
 * Captures from a local camera with cv::VideoCapture at a fixed preset.
 */
class OpenCvCaptureDevice : public CaptureDevice {
public:
  OpenCvCaptureDevice(int deviceIndex, cv::Size preset);
  ~OpenCvCaptureDevice() override;

  bool open() override;
  bool isOpened() const override { return cap_.isOpened(); }
  bool read(cv::Mat &frame) override;
  void close() override;
  std::string description() const override;

private:
  // The device index for the camera (0 for default camera)
  int deviceIndex_;

  // The requested capture resolution
  cv::Size preset_;

  // OpenCV video capture object
  cv::VideoCapture cap_;
};
