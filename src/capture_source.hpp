/**
 * @file capture_source.hpp
 *
 * This file defines the capture source: the camera session, its state
 * machine and the delivery of oriented frames to the processing chain.
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
#include <functional>
#include <memory>
#include <mutex>

// Qt includes
#include <QObject>
#include <QString>
#include <QThread>

// External includes
#include <opencv2/core.hpp>

// Local includes
#include "capture_device.hpp"
#include "fps_meter.hpp"
#include "frame.hpp"

/**
 * @brief CaptureSource class
 *
 * Owns the camera device and runs two threads. Session requests (configure,
 * start, stop, restart) are queued to a session thread and handled in order.
 * Frames are read, oriented and handed to the frame handler on a delivery
 * thread, one at a time.
 *
 * Delivered frames are converted to BGRA, rotated 90 degrees clockwise and
 * mirrored horizontally.
 */
class CaptureSource : public QObject {
  Q_OBJECT

public:
  enum class State { Idle, Configuring, Running, Stopped, Failed };
  Q_ENUM(State)

  enum class RuntimeErrorCode { MediaServicesReset, UnsupportedFrameFormat };
  Q_ENUM(RuntimeErrorCode)

  enum class InterruptionReason { VideoDeviceNotAvailable };
  Q_ENUM(InterruptionReason)

  // Called on the delivery thread for every forwarded frame
  using FrameHandler = std::function<void(const Frame &)>;

  explicit CaptureSource(std::unique_ptr<CaptureDevice> device,
                         QObject *parent = nullptr);
  ~CaptureSource() override;

  /// Set before configure(); not changed while frames flow
  void setFrameHandler(FrameHandler handler);

  /// Open the device without starting delivery
  void configure();

  void start();
  void stop();

  /// Reopen the device and resume delivery. Does nothing unless running.
  void restart();

  /// Forward (true) or drop (false) frames from the next delivery on
  void setDeliveryEnabled(bool enabled);

  State state() const { return state_.load(); }

signals:
  /// The session could not be set up. Terminal.
  void configurationFailed(const QString &reason);

  void runtimeError(CaptureSource::RuntimeErrorCode code,
                    const QString &message);

  void interrupted(CaptureSource::InterruptionReason reason);

  void interruptionEnded();

  /// Frames forwarded per second, at most once a second
  void fpsUpdated(double fps);

  void stateChanged(CaptureSource::State state);

private:
  // ================== Session thread ==================

  void doConfigure();
  void doStart();
  void doStop();
  void doRestart();

  // Open the device under the lock
  bool openDevice();

  // Close the device under the lock
  void closeDevice();

  // Begin a new pump chain, retiring any previous one
  void beginPumping();

  void setState(State state);

  // ================== Delivery thread ==================

  // Read and deliver one frame, then queue the next read
  void pumpFrame(std::uint64_t generation);

  // Convert, orient and forward one raw image
  void deliver(const cv::Mat &raw);

  // Queue a call onto the session thread
  template <typename Fn> void onSession(Fn &&fn);

  std::unique_ptr<CaptureDevice> device_;

  // Serialises device access between the two threads
  std::mutex deviceMutex_;

  std::atomic<State> state_{State::Idle};

  // The live pump chain; older chains stop at their next iteration
  std::atomic<std::uint64_t> generation_{0};

  // Set while the device is lost and a restart could not reopen it
  bool interrupted_ = false;

  QThread sessionThread_;
  QThread deliveryThread_;
  std::unique_ptr<QObject> sessionContext_;
  std::unique_ptr<QObject> deliveryContext_;

  // Owned by the delivery thread
  FrameHandler handler_;
  bool deliveryEnabled_ = true;
  FpsMeter fpsMeter_;
};
