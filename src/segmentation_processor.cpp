/**
 * @file segmentation_processor.cpp
 *
 * This file defines the processor that replaces the background behind a
 * person: resize, segment, composite on the compute device and read back.
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
#include <stdexcept>

// Qt includes
#include <QDebug>

// Local includes
#include "PixelBufferUtils.hpp"
#include "segmentation_processor.hpp"

/**
 * @brief Constructor for the SegmentationProcessor class.
 *
 * The mask grid of the kernel is the model's input size.
 *
 * @param gpu The shared compute device.
 * @param model The segmentation model, owned by the processor.
 * @param targetSize The size of every composited frame.
 * @param personClass The label id treated as "person".
 */
SegmentationProcessor::SegmentationProcessor(
    std::shared_ptr<const GpuContext> gpu,
    std::unique_ptr<SegmentationModel> model, cv::Size targetSize,
    int personClass)
    : gpu_(gpu), model_(std::move(model)),
      kernel_(gpu, targetSize,
              model_ ? model_->inputSize() : cv::Size(), personClass) {
  if (!model_) {
    throw std::invalid_argument("SegmentationProcessor needs a model");
  }
}

/**
 * @brief Process one camera frame.
 *
 * Without a background the frame is returned as is. Otherwise the frame is
 * stretched to the model input, segmented, composited at the target size and
 * read back into a new buffer. Any failure drops the frame.
 *
 * @param frame The camera frame (BGRA).
 * @param background The current background, may be null.
 *
 * @return The output frame, or std::nullopt if the frame was dropped.
 */
std::optional<Frame> SegmentationProcessor::process(
    const Frame &frame,
    const std::shared_ptr<const BackgroundTexture> &background) {

  // Nothing to composite against
  if (!background) {
    return frame;
  }

  const cv::Size in = model_->inputSize();
  cv::Mat small = resizePixelBuffer(frame.pixels, in.width, in.height);
  if (small.empty()) {
    qWarning() << "[SegmentationProcessor] Failed to resize frame"
               << frame.id << "to" << in.width << "x" << in.height;
    return std::nullopt;
  }

  try {
    cv::Mat mask = model_->predict(small);
    kernel_.dispatch(frame.pixels, mask, *background);

    Frame out;
    out.pixels = kernel_.readback();
    out.timestamp = frame.timestamp;
    out.id = nextFrameId();
    return out;
  } catch (const std::exception &e) {
    qWarning() << "[SegmentationProcessor] Dropping frame" << frame.id << ":"
               << e.what();
    return std::nullopt;
  }
}
