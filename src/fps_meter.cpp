/**
 * @file fps_meter.cpp
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

// Local includes
#include "fps_meter.hpp"

std::optional<double> FpsMeter::tick(Clock::time_point now) {
  if (!started_) {
    started_ = true;
    windowStart_ = now;
    count_ = 0;
    return std::nullopt;
  }

  ++count_;

  const double elapsed =
      std::chrono::duration<double>(now - windowStart_).count();
  if (elapsed < 1.0) {
    return std::nullopt;
  }

  const double fps = count_ / elapsed;
  count_ = 0;
  windowStart_ = now;
  return fps;
}

void FpsMeter::reset() {
  started_ = false;
  count_ = 0;
}
