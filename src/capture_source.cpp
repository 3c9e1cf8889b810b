/**
 * @file capture_source.cpp
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

// Standard includes
#include <iostream>

// Qt includes
#include <QDebug>
#include <QMetaObject>

// External includes
#include <opencv2/core.hpp>

// Local includes
#include "PixelBufferUtils.hpp"
#include "capture_source.hpp"

/**
 * @brief Constructor for the CaptureSource class.
 *
 * Starts the session and delivery threads. Nothing touches the device until
 * configure() is called.
 *
 * @param device The camera device, owned by the capture source.
 * @param parent The parent object (default is nullptr).
 */
CaptureSource::CaptureSource(std::unique_ptr<CaptureDevice> device,
                             QObject *parent)
    : QObject(parent), device_(std::move(device)),
      sessionContext_(std::make_unique<QObject>()),
      deliveryContext_(std::make_unique<QObject>()) {

  qRegisterMetaType<CaptureSource::State>();
  qRegisterMetaType<CaptureSource::RuntimeErrorCode>();
  qRegisterMetaType<CaptureSource::InterruptionReason>();

  sessionThread_.setObjectName("CaptureSession");
  deliveryThread_.setObjectName("CaptureDelivery");

  sessionContext_->moveToThread(&sessionThread_);
  deliveryContext_->moveToThread(&deliveryThread_);

  sessionThread_.start();
  deliveryThread_.start();
}

/**
 * @brief Destructor for the CaptureSource class.
 *
 * Retires the pump chain, joins both threads and releases the device.
 */
CaptureSource::~CaptureSource() {
  state_ = State::Stopped;
  ++generation_;

  sessionThread_.quit();
  deliveryThread_.quit();
  sessionThread_.wait();
  deliveryThread_.wait();

  // The threads are finished, so their context objects can go
  sessionContext_.reset();
  deliveryContext_.reset();

  std::lock_guard<std::mutex> lock(deviceMutex_);
  device_->close();
}

void CaptureSource::setFrameHandler(FrameHandler handler) {
  handler_ = std::move(handler);
}

template <typename Fn> void CaptureSource::onSession(Fn &&fn) {
  QMetaObject::invokeMethod(sessionContext_.get(), std::forward<Fn>(fn),
                            Qt::QueuedConnection);
}

void CaptureSource::configure() {
  onSession([this] { doConfigure(); });
}

void CaptureSource::start() {
  onSession([this] { doStart(); });
}

void CaptureSource::stop() {
  onSession([this] { doStop(); });
}

void CaptureSource::restart() {
  onSession([this] { doRestart(); });
}

void CaptureSource::setDeliveryEnabled(bool enabled) {
  QMetaObject::invokeMethod(
      deliveryContext_.get(),
      [this, enabled] {
        // Measure from the moment frames flow again, not across the gap
        if (enabled && !deliveryEnabled_) {
          fpsMeter_.reset();
        }
        deliveryEnabled_ = enabled;
      },
      Qt::QueuedConnection);
}

void CaptureSource::setState(State state) {
  if (state_.exchange(state) != state) {
    emit stateChanged(state);
  }
}

bool CaptureSource::openDevice() {
  std::lock_guard<std::mutex> lock(deviceMutex_);
  return device_->isOpened() || device_->open();
}

void CaptureSource::closeDevice() {
  std::lock_guard<std::mutex> lock(deviceMutex_);
  device_->close();
}

/**
 * @brief Prepare the session.
 *
 * Only valid from Idle. Failure to open the device is terminal: the state
 * becomes Failed and nothing is retried.
 */
void CaptureSource::doConfigure() {
  if (state_ != State::Idle) {
    qInfo() << "[CaptureSource] Ignoring configure in state" << state_.load();
    return;
  }

  setState(State::Configuring);

  if (!openDevice()) {
    const QString reason = QString("Failed to open %1")
                               .arg(QString::fromStdString(
                                   device_->description()));
    qCritical() << "[CaptureSource]" << reason;
    setState(State::Failed);
    emit configurationFailed(reason);
    return;
  }

  std::cout << "[CaptureSource] Configured "
            << device_->description() << "\n";
}

/**
 * @brief Start delivering frames.
 *
 * Valid once configured (Configuring) or after a stop. Anything else,
 * including a second start, is ignored.
 */
void CaptureSource::doStart() {
  const State current = state_;
  if (current != State::Configuring && current != State::Stopped) {
    return;
  }

  setState(State::Running);
  beginPumping();
}

void CaptureSource::doStop() {
  if (state_ != State::Running) {
    return;
  }

  // The pump chain sees the state and ends; the device stays open
  setState(State::Stopped);
}

/**
 * @brief Reopen the device and restart delivery.
 *
 * Ignored unless the session is running. A device that cannot be reopened
 * is reported as an interruption; a later successful restart ends it.
 */
void CaptureSource::doRestart() {
  if (state_ != State::Running) {
    return;
  }

  qInfo() << "[CaptureSource] Restarting" << device_->description().c_str();

  // Retire the current chain before touching the device
  ++generation_;
  closeDevice();

  if (!openDevice()) {
    qWarning() << "[CaptureSource]" << device_->description().c_str()
               << "is not available";
    if (!interrupted_) {
      interrupted_ = true;
      emit interrupted(InterruptionReason::VideoDeviceNotAvailable);
    }
    return;
  }

  if (interrupted_) {
    interrupted_ = false;
    emit interruptionEnded();
  }

  beginPumping();
}

void CaptureSource::beginPumping() {
  const std::uint64_t generation = ++generation_;
  QMetaObject::invokeMethod(
      deliveryContext_.get(),
      [this, generation] {
        fpsMeter_.reset();
        pumpFrame(generation);
      },
      Qt::QueuedConnection);
}

/**
 * @brief Read one frame and queue the next read.
 *
 * Requeuing through the event loop lets delivery gate changes land between
 * frames. A read failure releases the device and ends the chain.
 *
 * @param generation The chain this call belongs to.
 */
void CaptureSource::pumpFrame(std::uint64_t generation) {
  if (generation != generation_ || state_ != State::Running) {
    return;
  }

  cv::Mat raw;
  bool ok = false;
  {
    std::lock_guard<std::mutex> lock(deviceMutex_);

    // A restart may have reopened the device since the check above; the
    // device then belongs to the newer chain
    if (generation != generation_) {
      return;
    }

    ok = device_->isOpened() && device_->read(raw);
    if (!ok) {
      if (generation != generation_) {
        return;
      }
      device_->close();
    }
  }

  if (!ok) {
    qWarning() << "[CaptureSource] Frame capture failed on"
               << device_->description().c_str();
    emit runtimeError(RuntimeErrorCode::MediaServicesReset,
                      QStringLiteral("Frame capture failed"));
    return;
  }

  deliver(raw);

  QMetaObject::invokeMethod(
      deliveryContext_.get(), [this, generation] { pumpFrame(generation); },
      Qt::QueuedConnection);
}

/**
 * @brief Convert, orient and forward one image.
 *
 * @param raw The image as read from the device.
 */
void CaptureSource::deliver(const cv::Mat &raw) {
  // Drop, never buffer
  if (!deliveryEnabled_) {
    return;
  }

  cv::Mat bgra = toBgra(raw);
  if (bgra.empty()) {
    qWarning() << "[CaptureSource] Dropping frame with unsupported type"
               << raw.type();
    emit runtimeError(RuntimeErrorCode::UnsupportedFrameFormat,
                      QString("Unsupported frame type %1").arg(raw.type()));
    return;
  }

  Frame frame;
  cv::Mat rotated;
  cv::rotate(bgra, rotated, cv::ROTATE_90_CLOCKWISE);
  cv::flip(rotated, frame.pixels, 1);
  frame.timestamp = Frame::Clock::now();
  frame.id = nextFrameId();

  if (handler_) {
    handler_(frame);
  }

  if (auto fps = fpsMeter_.tick()) {
    emit fpsUpdated(*fps);
  }
}
