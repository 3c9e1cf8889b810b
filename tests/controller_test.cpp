/**
 * @file controller_test.cpp
 *
 * Tests for the controller: gating, publishing and session recovery.
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
#include <atomic>
#include <memory>
#include <optional>

// External includes
#include <gtest/gtest.h>

// Local includes
#include "controller.hpp"
#include "test_utils.hpp"

using namespace std::chrono_literals;
using test_utils::FakeCaptureDevice;
using test_utils::settle;
using test_utils::waitUntil;

namespace {

/**
 * @brief Counts calls and passes frames through, or drops them on request.
 */
class CountingProcessor : public FrameProcessor {
public:
  std::optional<Frame>
  process(const Frame &frame,
          const std::shared_ptr<const BackgroundTexture> &background) override {
    ++calls;
    if (background)
      ++withBackground;
    if (dropAll)
      return std::nullopt;
    return frame;
  }

  std::atomic<int> calls{0};
  std::atomic<int> withBackground{0};
  std::atomic<bool> dropAll{false};
};

} // namespace

class ControllerTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto device = std::make_unique<FakeCaptureDevice>(
        cv::Mat(8, 16, CV_8UC4, cv::Scalar(1, 2, 3, 255)));
    device_ = device.get();

    auto processor = std::make_unique<CountingProcessor>();
    processor_ = processor.get();

    gpu_ = std::make_shared<const GpuContext>(true);
    store_ = std::make_shared<BackgroundStore>(gpu_, cv::Size(16, 8));
    preview_ = std::make_shared<PreviewSlot>();

    controller_ = std::make_unique<Controller>(
        std::make_unique<CaptureSource>(std::move(device)),
        std::move(processor), store_, preview_);

    QObject::connect(controller_.get(), &Controller::cameraAvailabilityChanged,
                     [this](bool available) {
                       availability_.push_back(available);
                     });
    QObject::connect(controller_.get(), &Controller::errorReported,
                     [this](const QString &) { ++errors_; });
    QObject::connect(controller_.get(), &Controller::sessionFailed,
                     [this](const QString &) { ++sessionFailures_; });
  }

  void TearDown() override { controller_.reset(); }

  FakeCaptureDevice *device_ = nullptr;
  CountingProcessor *processor_ = nullptr;
  std::shared_ptr<const GpuContext> gpu_;
  std::shared_ptr<BackgroundStore> store_;
  std::shared_ptr<PreviewSlot> preview_;
  std::unique_ptr<Controller> controller_;

  // Only touched on the test thread (queued from the capture threads)
  std::vector<bool> availability_;
  int errors_ = 0;
  int sessionFailures_ = 0;
};

TEST_F(ControllerTest, PublishesProcessedFrames) {
  controller_->start();
  ASSERT_TRUE(waitUntil([this] { return controller_->framesPublished() > 0; }));

  auto state = preview_->snapshot();
  ASSERT_TRUE(state->frame.has_value());
  EXPECT_EQ(state->frame->width(), 8);
  EXPECT_EQ(state->frame->height(), 16);
}

TEST_F(ControllerTest, DisabledRenderingKeepsFramesFromTheProcessor) {
  controller_->disableRendering();
  controller_->start();

  ASSERT_TRUE(waitUntil([this] { return device_->reads > 10; }));
  settle(50ms);
  EXPECT_EQ(processor_->calls.load(), 0);
  EXPECT_FALSE(preview_->snapshot()->frame.has_value());

  controller_->enableRendering();
  EXPECT_TRUE(waitUntil([this] { return processor_->calls > 0; }));

  // No session restart was needed
  EXPECT_EQ(device_->opens.load(), 1);
  EXPECT_EQ(controller_->capture().state(), CaptureSource::State::Running);
}

TEST_F(ControllerTest, ApplicationStateGatesRendering) {
  controller_->start();
  ASSERT_TRUE(waitUntil([this] { return processor_->calls > 0; }));

  controller_->onApplicationStateChanged(Qt::ApplicationInactive);
  settle(50ms);
  const int before = processor_->calls;
  settle(100ms);
  EXPECT_EQ(processor_->calls.load(), before);

  controller_->onApplicationStateChanged(Qt::ApplicationActive);
  EXPECT_TRUE(waitUntil([&] { return processor_->calls > before; }));
}

TEST_F(ControllerTest, DroppedFramesLeaveTheSlotAlone) {
  processor_->dropAll = true;
  controller_->start();

  ASSERT_TRUE(waitUntil([this] { return controller_->framesDropped() > 3; }));
  EXPECT_EQ(controller_->framesPublished(), 0u);
  EXPECT_FALSE(preview_->snapshot()->frame.has_value());
}

TEST_F(ControllerTest, BackgroundReachesTheProcessor) {
  controller_->start();
  ASSERT_TRUE(waitUntil([this] { return processor_->calls > 0; }));
  EXPECT_EQ(processor_->withBackground.load(), 0);

  EXPECT_TRUE(controller_->applyBackgroundImage(
      cv::Mat(30, 40, CV_8UC3, cv::Scalar(0, 0, 0))));
  EXPECT_TRUE(waitUntil([this] { return processor_->withBackground > 0; }));

  EXPECT_FALSE(controller_->applyBackgroundImage(cv::Mat()));
  EXPECT_TRUE(store_->hasBackground());
}

TEST_F(ControllerTest, ViewSettingsKeepTheLatestFrame) {
  controller_->start();
  ASSERT_TRUE(waitUntil([this] { return controller_->framesPublished() > 0; }));

  controller_->setMirroring(true);
  controller_->setRotation(Rotation::Deg180);

  auto state = preview_->snapshot();
  EXPECT_TRUE(state->mirrored);
  EXPECT_EQ(state->rotation, Rotation::Deg180);
  EXPECT_TRUE(state->frame.has_value());
}

TEST_F(ControllerTest, MediaServicesResetRestartsTheSession) {
  controller_->start();
  ASSERT_TRUE(waitUntil([this] { return processor_->calls > 0; }));

  device_->failNextRead = true;
  ASSERT_TRUE(waitUntil([this] { return device_->opens >= 2; }));

  const int before = processor_->calls;
  EXPECT_TRUE(waitUntil([&] { return processor_->calls > before; }));
  EXPECT_EQ(errors_, 0);
}

TEST_F(ControllerTest, InterruptionTogglesCameraAvailability) {
  controller_->start();
  ASSERT_TRUE(waitUntil([this] { return processor_->calls > 0; }));

  device_->openSucceeds = false;
  device_->failNextRead = true;
  ASSERT_TRUE(waitUntil([this] { return !availability_.empty(); }));
  EXPECT_FALSE(availability_.back());

  device_->openSucceeds = true;
  controller_->resumeAfterInterruption();
  ASSERT_TRUE(waitUntil([this] { return availability_.size() == 2; }));
  EXPECT_TRUE(availability_.back());

  const int before = processor_->calls;
  EXPECT_TRUE(waitUntil([&] { return processor_->calls > before; }));
}

TEST_F(ControllerTest, OtherRuntimeErrorsAreReported) {
  device_->setImage(cv::Mat(4, 4, CV_32FC1, cv::Scalar(0)));
  controller_->start();

  ASSERT_TRUE(waitUntil([this] { return errors_ > 0; }));
  EXPECT_EQ(processor_->calls.load(), 0);
  EXPECT_EQ(device_->opens.load(), 1);
}

TEST_F(ControllerTest, ConfigurationFailureIsForwarded) {
  device_->openSucceeds = false;
  controller_->start();

  ASSERT_TRUE(waitUntil([this] { return sessionFailures_ > 0; }));
  EXPECT_EQ(controller_->capture().state(), CaptureSource::State::Failed);
  settle(50ms);
  EXPECT_EQ(processor_->calls.load(), 0);
}
