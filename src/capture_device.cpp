/**
 * @file capture_device.cpp
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

// Standard includes
#include <iostream>

// Local includes
#include "capture_device.hpp"

/**
 * @brief Constructor for the OpenCvCaptureDevice class.
 *
 * @param deviceIndex The index of the camera device.
 * @param preset The resolution requested from the camera.
 */
OpenCvCaptureDevice::OpenCvCaptureDevice(int deviceIndex, cv::Size preset)
    : deviceIndex_(deviceIndex), preset_(preset) {}

/**
 * @brief Destructor for the OpenCvCaptureDevice class.
 *
 * Releases the camera if it is opened.
 */
OpenCvCaptureDevice::~OpenCvCaptureDevice() {
  if (cap_.isOpened())
    cap_.release();
}

/**
 * @brief Open the camera and check that it produces frames.
 *
 * The preset is requested and one frame is probed; a camera that opens but
 * cannot deliver is treated as unusable.
 *
 * @return true if the camera is ready, false otherwise.
 */
bool OpenCvCaptureDevice::open() {

  // Check if the camera is already opened
  if (cap_.isOpened())
    cap_.release();

  // Open the camera device
  if (!cap_.open(deviceIndex_) || !cap_.isOpened())
    return false;

  cap_.set(cv::CAP_PROP_FRAME_WIDTH, preset_.width);
  cap_.set(cv::CAP_PROP_FRAME_HEIGHT, preset_.height);

  // Probe a frame
  cv::Mat probe;
  if (!cap_.read(probe) || probe.empty()) {
    cap_.release();
    return false;
  }

  std::cout << "[OpenCvCaptureDevice] Camera " << deviceIndex_
            << " opened successfully.\n";
  std::cout << "[OpenCvCaptureDevice] Camera resolution: " << probe.cols
            << "x" << probe.rows << "\n";
  std::cout << "[OpenCvCaptureDevice] Camera FPS: "
            << cap_.get(cv::CAP_PROP_FPS) << "\n";
  std::cout << "[OpenCvCaptureDevice] Camera backend: "
            << cap_.getBackendName() << "\n";

  return true;
}

bool OpenCvCaptureDevice::read(cv::Mat &frame) {
  if (!cap_.isOpened())
    return false;
  return cap_.grab() && cap_.retrieve(frame) && !frame.empty();
}

void OpenCvCaptureDevice::close() {
  if (cap_.isOpened())
    cap_.release();
}

std::string OpenCvCaptureDevice::description() const {
  return "camera " + std::to_string(deviceIndex_);
}
