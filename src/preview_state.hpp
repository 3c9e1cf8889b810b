/**
 * @file preview_state.hpp
 *
 * The state shared between the controller and the preview renderer.
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
#include <optional>

// Local includes
#include "frame.hpp"
#include "latest_value_slot.hpp"
#include "render_transform.hpp"

/**
 * @brief What the preview should draw next.
 */
struct PreviewState {
  // The latest composited frame, empty until the first one arrives
  std::optional<Frame> frame;

  bool mirrored = false;
  Rotation rotation = Rotation::Deg0;
};

using PreviewSlot = LatestValueSlot<PreviewState>;
