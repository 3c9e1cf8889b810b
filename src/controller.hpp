/**
 * @file controller.hpp
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

#pragma once

// Standard includes
#include <atomic>
#include <cstdint>
#include <memory>

// Qt includes
#include <QObject>
#include <QString>

// External includes
#include <opencv2/core.hpp>

// Local includes
#include "background_store.hpp"
#include "capture_source.hpp"
#include "frame_processor.hpp"
#include "preview_state.hpp"

/**
 * @brief Controller class
 *
 * Feeds every delivered camera frame through the frame processor, together
 * with the current background, and publishes the result to the preview slot.
 * Rendering can be switched off, in which case the capture source drops
 * frames before they reach the processor.
 */
class Controller : public QObject {
  Q_OBJECT

public:
  Controller(std::unique_ptr<CaptureSource> capture,
             std::unique_ptr<FrameProcessor> processor,
             std::shared_ptr<BackgroundStore> backgrounds,
             std::shared_ptr<PreviewSlot> preview, QObject *parent = nullptr);
  ~Controller() override;

  /// Configure and start the capture session
  void start();

  /// Replace the background. Returns false if the image was unusable.
  bool applyBackgroundImage(const cv::Mat &image);

  void setMirroring(bool mirrored);
  void setRotation(Rotation rotation);

  CaptureSource &capture() { return *capture_; }

  /// Frames published to the preview so far
  std::uint64_t framesPublished() const { return published_.load(); }

  /// Frames the processor gave no result for
  std::uint64_t framesDropped() const { return dropped_.load(); }

public Q_SLOTS:
  void enableRendering();
  void disableRendering();

  /// Active enables rendering, every other state disables it
  void onApplicationStateChanged(Qt::ApplicationState state);

  /// Ask the session to reopen the camera after an interruption
  void resumeAfterInterruption();

signals:
  void fpsUpdated(double fps);

  /// A runtime error the controller does not recover from
  void errorReported(const QString &message);

  /// The capture session could not be configured
  void sessionFailed(const QString &reason);

  void cameraAvailabilityChanged(bool available);

private Q_SLOTS:
  void onRuntimeError(CaptureSource::RuntimeErrorCode code,
                      const QString &message);
  void onInterrupted(CaptureSource::InterruptionReason reason);
  void onInterruptionEnded();

private:
  // Runs on the capture delivery thread
  void handleFrame(const Frame &frame);

  std::unique_ptr<CaptureSource> capture_;
  std::unique_ptr<FrameProcessor> processor_;
  std::shared_ptr<BackgroundStore> backgrounds_;
  std::shared_ptr<PreviewSlot> preview_;

  std::atomic<std::uint64_t> published_{0};
  std::atomic<std::uint64_t> dropped_{0};
};
