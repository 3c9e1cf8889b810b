/**
 * @file controller.cpp
 *
 * This file defines the controller that connects capture, processing and
 * the preview slot, and reacts to session and application events.
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

// Local includes
#include "controller.hpp"

/**
 * @brief Constructor for the Controller class.
 *
 * Installs the frame handler on the capture source and connects its
 * session signals.
 *
 * @param capture The capture source.
 * @param processor The frame processor (identity or segmentation).
 * @param backgrounds The background store shared with the app layer.
 * @param preview The slot read by the preview renderer.
 * @param parent The parent object (default is nullptr).
 */
Controller::Controller(std::unique_ptr<CaptureSource> capture,
                       std::unique_ptr<FrameProcessor> processor,
                       std::shared_ptr<BackgroundStore> backgrounds,
                       std::shared_ptr<PreviewSlot> preview, QObject *parent)
    : QObject(parent), capture_(std::move(capture)),
      processor_(std::move(processor)), backgrounds_(std::move(backgrounds)),
      preview_(std::move(preview)) {

  capture_->setFrameHandler([this](const Frame &frame) { handleFrame(frame); });

  connect(capture_.get(), &CaptureSource::fpsUpdated, this,
          &Controller::fpsUpdated);
  connect(capture_.get(), &CaptureSource::configurationFailed, this,
          &Controller::sessionFailed);
  connect(capture_.get(), &CaptureSource::runtimeError, this,
          &Controller::onRuntimeError);
  connect(capture_.get(), &CaptureSource::interrupted, this,
          &Controller::onInterrupted);
  connect(capture_.get(), &CaptureSource::interruptionEnded, this,
          &Controller::onInterruptionEnded);
}

/**
 * @brief Destructor for the Controller class.
 *
 * The capture source goes first so no frame is delivered into a half
 * destroyed controller.
 */
Controller::~Controller() { capture_.reset(); }

void Controller::start() {
  capture_->configure();
  capture_->start();
}

/**
 * @brief Process one delivered frame and publish the result.
 *
 * @param frame The oriented camera frame.
 */
void Controller::handleFrame(const Frame &frame) {
  std::shared_ptr<const BackgroundTexture> background =
      backgrounds_ ? backgrounds_->current() : nullptr;

  std::optional<Frame> result = processor_->process(frame, background);
  if (!result) {
    ++dropped_;
    return;
  }

  preview_->update([&result](PreviewState &state) {
    state.frame = std::move(result);
  });
  ++published_;
}

bool Controller::applyBackgroundImage(const cv::Mat &image) {
  if (!backgrounds_) {
    return false;
  }
  return backgrounds_->setBackground(image);
}

void Controller::setMirroring(bool mirrored) {
  preview_->update([mirrored](PreviewState &state) {
    state.mirrored = mirrored;
  });
}

void Controller::setRotation(Rotation rotation) {
  preview_->update([rotation](PreviewState &state) {
    state.rotation = rotation;
  });
}

void Controller::enableRendering() { capture_->setDeliveryEnabled(true); }

void Controller::disableRendering() { capture_->setDeliveryEnabled(false); }

void Controller::onApplicationStateChanged(Qt::ApplicationState state) {
  if (state == Qt::ApplicationActive) {
    enableRendering();
  } else {
    disableRendering();
  }
}

void Controller::resumeAfterInterruption() { capture_->restart(); }

/**
 * @brief React to a session runtime error.
 *
 * A media services reset restarts the session; anything else is reported.
 */
void Controller::onRuntimeError(CaptureSource::RuntimeErrorCode code,
                                const QString &message) {
  if (code == CaptureSource::RuntimeErrorCode::MediaServicesReset) {
    qInfo() << "[Controller] Media services reset, restarting capture";
    capture_->restart();
    return;
  }

  qWarning() << "[Controller] Capture error:" << message;
  emit errorReported(message);
}

void Controller::onInterrupted(CaptureSource::InterruptionReason reason) {
  qWarning() << "[Controller] Capture interrupted:" << reason;
  emit cameraAvailabilityChanged(false);
}

void Controller::onInterruptionEnded() {
  qInfo() << "[Controller] Capture interruption ended";
  emit cameraAvailabilityChanged(true);
}
