/**
 * @file frame_processor.hpp
 *
 * The per-frame transform invoked on the capture delivery thread.
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
#include <optional>

// Local includes
#include "background_store.hpp"
#include "frame.hpp"

/**
 * @brief FrameProcessor class
 *
 * Turns one camera frame into one output frame. An empty optional means the
 * frame was dropped; implementations never throw out of process().
 */
class FrameProcessor {
public:
  virtual ~FrameProcessor() = default;

  virtual std::optional<Frame>
  process(const Frame &frame,
          const std::shared_ptr<const BackgroundTexture> &background) = 0;
};

/**
 * @brief Pass every frame through untouched.
 *
 * Used when no segmentation model could be loaded.
 */
class IdentityFrameProcessor : public FrameProcessor {
public:
  std::optional<Frame>
  process(const Frame &frame,
          const std::shared_ptr<const BackgroundTexture> &) override {
    return frame;
  }
};
