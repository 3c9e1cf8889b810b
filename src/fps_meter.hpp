/**
 * @file fps_meter.hpp
 *
 * A window-based frame rate meter.
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
#include <chrono>
#include <optional>

/**
 * @brief FpsMeter class
 *
 * Counts ticks and, whenever at least one second has passed since the start
 * of the current window, reports count / elapsed and starts a new window. The
 * first tick only opens the window. Not thread safe; ticked from one thread.
 */
class FpsMeter {
public:
  using Clock = std::chrono::steady_clock;

  /// Count one frame at time now. Returns the rate when a window closes.
  std::optional<double> tick(Clock::time_point now = Clock::now());

  void reset();

private:
  bool started_ = false;
  Clock::time_point windowStart_;
  int count_ = 0;
};
