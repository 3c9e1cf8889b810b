/**
 * @file preview_renderer.hpp
 *
 * The OpenGL widget that draws the latest composited frame each refresh.
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

// Qt includes
#include <QOpenGLBuffer>
#include <QOpenGLFunctions>
#include <QOpenGLShaderProgram>
#include <QOpenGLVertexArrayObject>
#include <QOpenGLWidget>

// Local includes
#include "preview_state.hpp"
#include "render_transform.hpp"
#include "texture_cache.hpp"

/**
 * @brief PreviewRenderer class
 *
 * Draws whatever the preview slot holds at the time of each paint. Painting
 * is driven by the display: every swap schedules the next update, so the
 * widget runs at the refresh rate independently of the camera.
 */
class PreviewRenderer : public QOpenGLWidget, protected QOpenGLFunctions {
  Q_OBJECT

public:
  explicit PreviewRenderer(std::shared_ptr<PreviewSlot> slot,
                           QWidget *parent = nullptr);
  ~PreviewRenderer() override;

  /// Geometry of the last draw
  const RenderTransform &transform() const { return transform_; }

protected:
  void initializeGL() override;
  void paintGL() override;

private:
  // Release GL resources while the context is still current
  void cleanupGL();

  // Push the transform into the vertex buffer
  void uploadGeometry();

  // The mailbox written by the controller
  std::shared_ptr<PreviewSlot> slot_;

  QOpenGLShaderProgram program_;
  QOpenGLVertexArrayObject vao_;
  QOpenGLBuffer vbo_{QOpenGLBuffer::VertexBuffer};

  PreviewTextureCache cache_;
  RenderTransform transform_;

  // Set once the GL objects exist
  bool glReady_ = false;
};
