/**
 * @file texture_cache.hpp
 *
 * A cache mapping frame buffers to OpenGL textures.
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
#include <cstdint>
#include <memory>

// Qt includes
#include <QOpenGLTexture>
#include <QSize>

// Local includes
#include "frame.hpp"

/**
 * @brief PreviewTextureCache class
 *
 * Keyed by Frame::id. Drawing the same buffer again does not upload anything;
 * a new buffer of the same size is uploaded into the existing texture; a new
 * size allocates a new texture. Must be used with the owning GL context
 * current.
 */
class PreviewTextureCache {
public:
  /// The texture holding frame, or nullptr (and an empty cache) on failure
  QOpenGLTexture *textureFor(const Frame &frame);

  /// Drop the texture and forget the cached buffer
  void flush();

  /// Number of pixel uploads so far
  int uploadCount() const { return uploads_; }

private:
  std::unique_ptr<QOpenGLTexture> texture_;
  QSize size_;
  std::uint64_t cachedId_ = 0;
  int uploads_ = 0;
};
