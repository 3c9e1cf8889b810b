/**
 * @file render_transform.cpp
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

// Local includes
#include "render_transform.hpp"

std::optional<Rotation> rotationFromDegrees(int degrees) {
  switch (degrees) {
  case 0:
    return Rotation::Deg0;
  case 90:
    return Rotation::Deg90;
  case 180:
    return Rotation::Deg180;
  case 270:
    return Rotation::Deg270;
  default:
    return std::nullopt;
  }
}

const std::array<float, 8> &RenderTransform::texCoordsFor(Rotation rotation) {
  static const std::array<float, 8> kDeg0 = {0, 1, 1, 1, 0, 0, 1, 0};
  static const std::array<float, 8> kDeg90 = {1, 1, 1, 0, 0, 1, 0, 0};
  static const std::array<float, 8> kDeg180 = {1, 0, 0, 0, 1, 1, 0, 1};
  static const std::array<float, 8> kDeg270 = {0, 0, 0, 1, 1, 0, 1, 1};

  switch (rotation) {
  case Rotation::Deg90:
    return kDeg90;
  case Rotation::Deg180:
    return kDeg180;
  case Rotation::Deg270:
    return kDeg270;
  case Rotation::Deg0:
  default:
    return kDeg0;
  }
}

RenderTransform::RenderTransform() {
  vertices_.fill(0.f);
  texCoords_ = texCoordsFor(Rotation::Deg0);
}

bool RenderTransform::update(const QSize &textureSize, const QSize &viewBounds,
                             bool mirrored, Rotation rotation) {
  if (valid_ && textureSize == textureSize_ && viewBounds == viewBounds_ &&
      mirrored == mirrored_ && rotation == rotation_) {
    return false;
  }

  textureSize_ = textureSize;
  viewBounds_ = viewBounds;
  mirrored_ = mirrored;
  rotation_ = rotation;
  valid_ = true;

  recompute();
  return true;
}

/**
 * @brief Recompute the quad for the stored inputs.
 *
 * The content fills the view and keeps its aspect ratio: the axis that needs
 * the larger scale is normalised to 1 and the other axis grows past the view
 * edge by the ratio of the two. A quarter turn swaps the texture's width and
 * height as seen on screen.
 */
void RenderTransform::recompute() {
  const bool quarterTurn =
      rotation_ == Rotation::Deg90 || rotation_ == Rotation::Deg270;
  const int texW = quarterTurn ? textureSize_.height() : textureSize_.width();
  const int texH = quarterTurn ? textureSize_.width() : textureSize_.height();

  float sx = 1.f;
  float sy = 1.f;
  if (texW > 0 && texH > 0 && viewBounds_.width() > 0 &&
      viewBounds_.height() > 0) {
    sx = static_cast<float>(viewBounds_.width()) / texW;
    sy = static_cast<float>(viewBounds_.height()) / texH;
    if (sx > sy) {
      sy = sx / sy;
      sx = 1.f;
    } else {
      sx = sy / sx;
      sy = 1.f;
    }
  }

  if (mirrored_) {
    sx = -sx;
  }

  scaleX_ = sx;
  scaleY_ = sy;
  vertices_ = {-sx, -sy, 0.f, 1.f, sx, -sy, 0.f, 1.f,
               -sx, sy,  0.f, 1.f, sx, sy,  0.f, 1.f};
  texCoords_ = texCoordsFor(rotation_);

  ++recomputeCount_;
}
