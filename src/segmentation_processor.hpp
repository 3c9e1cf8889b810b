/**
 * @file segmentation_processor.hpp
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

#pragma once

// Standard includes
#include <memory>

// Local includes
#include "composite_kernel.hpp"
#include "frame_processor.hpp"
#include "gpu_context.hpp"
#include "segmentation_model.hpp"

class SegmentationProcessor : public FrameProcessor {
public:
  // ================== Member Function Prototypes ==================

  // Constructor
  SegmentationProcessor(std::shared_ptr<const GpuContext> gpu,
                        std::unique_ptr<SegmentationModel> model,
                        cv::Size targetSize, int personClass = 15);

  // Composite a frame over the background (or pass it through)
  std::optional<Frame>
  process(const Frame &frame,
          const std::shared_ptr<const BackgroundTexture> &background) override;

  const cv::Size &targetSize() const noexcept {
    return kernel_.targetSize();
  }

private:
  // ================== Private Member Variable Declarations ==================

  // The shared compute device
  std::shared_ptr<const GpuContext> gpu_;

  // The segmentation model
  std::unique_ptr<SegmentationModel> model_;

  // The compositing kernel with its persistent buffers
  CompositeKernel kernel_;
};
