/**
 * @file render_transform.hpp
 *
 * Geometry that maps the frame texture onto the preview quad.
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
#include <array>
#include <optional>

// Qt includes
#include <QSize>

/// Clockwise preview rotation in 90 degree steps
enum class Rotation { Deg0 = 0, Deg90 = 90, Deg180 = 180, Deg270 = 270 };

/// Parse 0, 90, 180 or 270. Anything else gives std::nullopt.
std::optional<Rotation> rotationFromDegrees(int degrees);

/**
 * @brief RenderTransform class
 *
 * Holds the quad vertices and texture coordinates for the current texture
 * size, view bounds, mirroring and rotation. update() recomputes them only
 * when one of those inputs changed since the last call.
 */
class RenderTransform {
public:
  RenderTransform();

  /// Returns true if the geometry was recomputed
  bool update(const QSize &textureSize, const QSize &viewBounds, bool mirrored,
              Rotation rotation);

  /// 4 x (x, y, z, w) in triangle strip order
  const std::array<float, 16> &vertices() const { return vertices_; }

  /// 4 x (s, t) matching vertices()
  const std::array<float, 8> &texCoords() const { return texCoords_; }

  float scaleX() const { return scaleX_; }
  float scaleY() const { return scaleY_; }

  /// How many times the geometry has been recomputed
  int recomputeCount() const { return recomputeCount_; }

  /// The fixed texture coordinate ordering for a rotation
  static const std::array<float, 8> &texCoordsFor(Rotation rotation);

private:
  void recompute();

  // Inputs of the last recompute
  bool valid_ = false;
  QSize textureSize_;
  QSize viewBounds_;
  bool mirrored_ = false;
  Rotation rotation_ = Rotation::Deg0;

  float scaleX_ = 1.f;
  float scaleY_ = 1.f;
  std::array<float, 16> vertices_;
  std::array<float, 8> texCoords_;

  int recomputeCount_ = 0;
};
