/**
 * @file main.cpp
 *
 * The entry point of the VirtualBackdrop application.
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
#include <memory>
#include <stdexcept>
#include <string>

// Qt includes
#include <QApplication>
#include <QDebug>
#include <QGuiApplication>
#include <QMetaType>
#include <QSurfaceFormat>

// External includes
#include <opencv2/imgcodecs.hpp>

// Local includes
#include "background_store.hpp"
#include "backgrounds.hpp"
#include "capture_device.hpp"
#include "capture_source.hpp"
#include "cmd_parser.hpp"
#include "controller.hpp"
#include "gpu_context.hpp"
#include "preview_renderer.hpp"
#include "segmentation_processor.hpp"
#include "torch_segmentation_model.hpp"
#include "viewport.hpp"

// Register cv::Mat as a Qt metatype
Q_DECLARE_METATYPE(cv::Mat)

/**
 * @brief Build the frame processor.
 *
 * Falls back to the identity processor when the model cannot be loaded, so
 * the camera still shows up without background replacement.
 *
 * @param opts The parsed command line options.
 * @param gpu The shared compute device.
 *
 * @return The processor to hand to the controller.
 */
static std::unique_ptr<FrameProcessor>
makeProcessor(const CommandLineOptions &opts,
              const std::shared_ptr<const GpuContext> &gpu) {
  try {
    auto model = std::make_unique<TorchSegmentationModel>(
        opts.modelPath, gpu, opts.modelSize, 21, opts.nthreads);
    return std::make_unique<SegmentationProcessor>(
        gpu, std::move(model), cv::Size(opts.targetWidth, opts.targetHeight),
        opts.personClass);
  } catch (const std::exception &e) {
    qCritical() << "[main]" << e.what();
    qCritical() << "[main] Continuing without background replacement";
    return std::make_unique<IdentityFrameProcessor>();
  }
}

/*
 * @brief Main function for the VirtualBackdrop application.
 *
 * This function parses the command-line options, builds the pipeline
 * (capture, processor, background store, preview), connects it to the window
 * and the application lifecycle, and starts the event loop.
 *
 * @param argc The number of command-line arguments.
 * @param argv The command-line arguments.
 * @return int The exit code of the application.
 */
int main(int argc, char **argv) {

  // The preview needs a 3.3 core context
  QSurfaceFormat format;
  format.setVersion(3, 3);
  format.setProfile(QSurfaceFormat::CoreProfile);
  format.setSwapInterval(1);
  QSurfaceFormat::setDefaultFormat(format);

  QApplication app(argc, argv);
  qRegisterMetaType<cv::Mat>();

  // Parse options
  CommandLineOptions opts = CommandLineOptions::parse(app);

  // Shared GPU resources
  std::shared_ptr<const GpuContext> gpu;
  try {
    gpu = std::make_shared<const GpuContext>(opts.forceCpu);
  } catch (const std::exception &e) {
    std::cerr << "Error: failed to set up the compute device: " << e.what()
              << std::endl;
    return -1;
  }

  auto store = std::make_shared<BackgroundStore>(
      gpu, cv::Size(opts.targetWidth, opts.targetHeight));
  auto preview = std::make_shared<PreviewSlot>();

  auto capture = std::make_unique<CaptureSource>(
      std::make_unique<OpenCvCaptureDevice>(
          opts.deviceIndex, cv::Size(opts.captureWidth, opts.captureHeight)));

  auto controller = std::make_unique<Controller>(
      std::move(capture), makeProcessor(opts, gpu), store, preview);
  controller->setMirroring(opts.mirrorPreview);
  controller->setRotation(opts.rotation);

  // Load backgrounds from the specified directory (optional)
  Backgrounds *backgrounds = new Backgrounds(opts.backgroundDir, &app);
  if (!backgrounds->load()) {
    qWarning() << "[main] No backgrounds found in"
               << opts.backgroundDir.c_str();
  }
  QObject::connect(backgrounds, &Backgrounds::backgroundChanged,
                   controller.get(), [&controller](const cv::Mat &image) {
                     if (!controller->applyBackgroundImage(image)) {
                       qWarning() << "[main] Background image rejected";
                     }
                   });

  // Initial background from the command line
  if (!opts.background.empty() && !backgrounds->loadFile(opts.background)) {
    std::cerr << "Error: could not load background " << opts.background
              << std::endl;
  }

  // Create UI
  PreviewRenderer *renderer = new PreviewRenderer(preview);
  ViewPort *vp = initViewport(renderer, controller.get(), backgrounds);

  // Foreground / background transitions gate rendering
  QObject::connect(&app, &QGuiApplication::applicationStateChanged,
                   controller.get(), &Controller::onApplicationStateChanged);

  // Run!
  controller->start();
  int ret = app.exec();

  // The window (and its GL context) goes before the pipeline
  delete vp;
  controller.reset();

  return ret;
}
