/**
 * @file texture_cache.cpp
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

// Qt includes
#include <QDebug>
#include <QOpenGLPixelTransferOptions>

// Local includes
#include "texture_cache.hpp"

/**
 * @brief Get the texture for a frame, uploading only when needed.
 *
 * @param frame A BGRA frame.
 *
 * @return The texture, or nullptr on failure. A failure leaves the cache
 * empty.
 */
QOpenGLTexture *PreviewTextureCache::textureFor(const Frame &frame) {
  if (frame.empty() || frame.pixels.type() != CV_8UC4) {
    qWarning() << "[PreviewTextureCache] Cannot upload a frame of type"
               << frame.pixels.type();
    flush();
    return nullptr;
  }

  // Same buffer as last time
  if (texture_ && frame.id != 0 && frame.id == cachedId_) {
    return texture_.get();
  }

  const QSize size(frame.width(), frame.height());
  if (!texture_ || size != size_) {
    texture_ = std::make_unique<QOpenGLTexture>(QOpenGLTexture::Target2D);
    texture_->setFormat(QOpenGLTexture::RGBA8_UNorm);
    texture_->setSize(size.width(), size.height());
    texture_->setMipLevels(1);
    texture_->allocateStorage(QOpenGLTexture::BGRA, QOpenGLTexture::UInt8);
    if (!texture_->isCreated() || !texture_->isStorageAllocated()) {
      qWarning() << "[PreviewTextureCache] Failed to allocate a" << size
                 << "texture";
      flush();
      return nullptr;
    }
    texture_->setMinMagFilters(QOpenGLTexture::Linear, QOpenGLTexture::Linear);
    texture_->setWrapMode(QOpenGLTexture::ClampToEdge);
    size_ = size;
  }

  QOpenGLPixelTransferOptions opts;
  opts.setAlignment(4);
  opts.setRowLength(static_cast<int>(frame.pixels.step[0] / 4));
  texture_->setData(QOpenGLTexture::BGRA, QOpenGLTexture::UInt8,
                    frame.pixels.data, &opts);

  cachedId_ = frame.id;
  ++uploads_;
  return texture_.get();
}

void PreviewTextureCache::flush() {
  texture_.reset();
  size_ = QSize();
  cachedId_ = 0;
}
