/**
 * @file preview_renderer.cpp
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

// Standard includes
#include <iostream>

// Qt includes
#include <QDebug>
#include <QOpenGLContext>

// Local includes
#include "preview_renderer.hpp"

namespace {

const char *kVertexShader = R"(#version 330 core
layout(location = 0) in vec4 position;
layout(location = 1) in vec2 texCoord;
out vec2 vTexCoord;
void main() {
  gl_Position = position;
  vTexCoord = texCoord;
}
)";

const char *kFragmentShader = R"(#version 330 core
in vec2 vTexCoord;
uniform sampler2D frameTexture;
out vec4 fragColor;
void main() {
  fragColor = texture(frameTexture, vTexCoord);
}
)";

// 4 x vec4 positions followed by 4 x vec2 texture coordinates
constexpr int kVertexFloats = 16;
constexpr int kTexCoordFloats = 8;

} // namespace

/**
 * @brief PreviewRenderer constructor.
 *
 * @param slot The mailbox holding the latest frame and view settings.
 * @param parent The parent widget (default is nullptr).
 */
PreviewRenderer::PreviewRenderer(std::shared_ptr<PreviewSlot> slot,
                                 QWidget *parent)
    : QOpenGLWidget(parent), slot_(std::move(slot)) {
  setUpdateBehavior(QOpenGLWidget::NoPartialUpdate);
}

/**
 * @brief PreviewRenderer destructor.
 *
 * Makes the context current so the GL objects can be released.
 */
PreviewRenderer::~PreviewRenderer() {
  if (context()) {
    makeCurrent();
    cleanupGL();
    doneCurrent();
  }
}

/**
 * @brief Create the shader program, the vertex buffer and the VAO.
 */
void PreviewRenderer::initializeGL() {
  initializeOpenGLFunctions();

  if (!program_.addShaderFromSourceCode(QOpenGLShader::Vertex,
                                        kVertexShader) ||
      !program_.addShaderFromSourceCode(QOpenGLShader::Fragment,
                                        kFragmentShader) ||
      !program_.link()) {
    qCritical() << "[PreviewRenderer] Failed to build the shader program:"
                << program_.log();
    return;
  }

  vao_.create();
  QOpenGLVertexArrayObject::Binder vaoBinder(&vao_);

  vbo_.create();
  vbo_.setUsagePattern(QOpenGLBuffer::DynamicDraw);
  vbo_.bind();
  vbo_.allocate((kVertexFloats + kTexCoordFloats) * sizeof(float));

  program_.bind();
  program_.enableAttributeArray(0);
  program_.setAttributeBuffer(0, GL_FLOAT, 0, 4);
  program_.enableAttributeArray(1);
  program_.setAttributeBuffer(1, GL_FLOAT, kVertexFloats * sizeof(float), 2);
  program_.setUniformValue("frameTexture", 0);
  program_.release();
  vbo_.release();

  uploadGeometry();

  connect(context(), &QOpenGLContext::aboutToBeDestroyed, this,
          &PreviewRenderer::cleanupGL);

  // Redraw on every display refresh
  connect(this, &QOpenGLWidget::frameSwapped, this,
          QOverload<>::of(&QWidget::update));

  glReady_ = true;
  std::cout << "[PreviewRenderer] Initialised OpenGL "
            << context()->format().majorVersion() << "."
            << context()->format().minorVersion() << "\n";
}

/**
 * @brief Write the current vertices and texture coordinates to the VBO.
 */
void PreviewRenderer::uploadGeometry() {
  vbo_.bind();
  vbo_.write(0, transform_.vertices().data(), kVertexFloats * sizeof(float));
  vbo_.write(kVertexFloats * sizeof(float), transform_.texCoords().data(),
             kTexCoordFloats * sizeof(float));
  vbo_.release();
}

/**
 * @brief Draw the latest frame.
 *
 * Takes one snapshot of the slot, resolves the frame to a texture, updates
 * the geometry if any of its inputs changed and draws one opaque quad.
 */
void PreviewRenderer::paintGL() {
  glClearColor(0.f, 0.f, 0.f, 1.f);
  glClear(GL_COLOR_BUFFER_BIT);

  if (!glReady_) {
    return;
  }

  std::shared_ptr<const PreviewState> state = slot_->snapshot();
  if (!state->frame) {
    return;
  }

  QOpenGLTexture *texture = cache_.textureFor(*state->frame);
  if (!texture) {
    // The cache has flushed itself; the next frame starts from scratch
    qWarning() << "[PreviewRenderer] Skipping draw of frame"
               << state->frame->id;
    return;
  }

  const qreal dpr = devicePixelRatioF();
  const QSize bounds(qRound(width() * dpr), qRound(height() * dpr));
  const QSize textureSize(state->frame->width(), state->frame->height());
  if (transform_.update(textureSize, bounds, state->mirrored,
                        state->rotation)) {
    uploadGeometry();
  }

  glDisable(GL_BLEND);

  program_.bind();
  texture->bind(0);
  {
    QOpenGLVertexArrayObject::Binder vaoBinder(&vao_);
    glDrawArrays(GL_TRIANGLE_STRIP, 0, 4);
  }
  texture->release(0);
  program_.release();
}

/**
 * @brief Release every GL object.
 */
void PreviewRenderer::cleanupGL() {
  if (!glReady_) {
    return;
  }
  cache_.flush();
  vbo_.destroy();
  vao_.destroy();
  program_.removeAllShaders();
  glReady_ = false;
}
