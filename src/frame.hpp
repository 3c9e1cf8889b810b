/**
 * @file frame.hpp
 *
 * The frame type passed between the capture source, the processors and the
 * preview renderer.
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
#include <atomic>
#include <chrono>
#include <cstdint>

// External includes
#include <opencv2/core.hpp>

/**
 * @brief One packed 32-bit BGRA image travelling through the pipeline.
 *
 * Camera frames and composited frames share this type. The id identifies the
 * underlying pixel buffer: a pass-through keeps it, anything that allocates a
 * new buffer takes a fresh one from nextFrameId().
 */
struct Frame {
  using Clock = std::chrono::steady_clock;

  // CV_8UC4, BGRA byte order
  cv::Mat pixels;

  // When the frame was captured
  Clock::time_point timestamp;

  // Buffer identity, 0 means "not assigned"
  std::uint64_t id = 0;

  int width() const noexcept { return pixels.cols; }
  int height() const noexcept { return pixels.rows; }
  bool empty() const noexcept { return pixels.empty(); }
};

/**
 * @brief Hand out a process-unique, increasing buffer id.
 */
inline std::uint64_t nextFrameId() {
  static std::atomic<std::uint64_t> counter{0};
  return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}
