/**
 * @file cmd_parser.hpp
 *
 * This file defines the command line options of the application.
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
#include <cstdlib>
#include <iostream>
#include <string>

// Qt includes
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QStringList>

// Local includes
#include "render_transform.hpp"

class CommandLineOptions {
public:
  // Command-line options
  int deviceIndex = 0;
  int captureWidth = 1280;
  int captureHeight = 720;
  int targetWidth = 720;
  int targetHeight = 1280;
  int modelSize = 513;
  std::string modelPath;
  int personClass = 15;
  int nthreads = 1;
  std::string background;
  std::string backgroundDir;
  bool forceCpu = false;
  bool mirrorPreview = false;
  Rotation rotation = Rotation::Deg0;

  // Parse the application's own arguments
  static CommandLineOptions parse(QCoreApplication &app) {
    return parse(app.arguments());
  }

  // Parse an argument list (the first entry is the program name)
  static CommandLineOptions parse(const QStringList &arguments) {
    QCommandLineParser parser;
    parser.setApplicationDescription(
        "VirtualBackdrop replaces the background behind the person in a "
        "camera feed with a still image, in real time.");
    parser.addHelpOption();

    // --deviceIndex <int> (default 0)
    QCommandLineOption deviceIndexOption(
        QStringList() << "d" << "deviceIndex",
        "Device index, i.e. which camera to use (int, default=0).",
        "deviceIndex", "0");
    parser.addOption(deviceIndexOption);

    // --captureWidth / --captureHeight <int> (default 1280x720)
    QCommandLineOption captureWidthOption(
        QStringList() << "captureWidth",
        "Width requested from the camera (int, default=1280).",
        "captureWidth", "1280");
    parser.addOption(captureWidthOption);
    QCommandLineOption captureHeightOption(
        QStringList() << "captureHeight",
        "Height requested from the camera (int, default=720).",
        "captureHeight", "720");
    parser.addOption(captureHeightOption);

    // --targetWidth / --targetHeight <int> (default 720x1280)
    QCommandLineOption targetWidthOption(
        QStringList() << "W" << "targetWidth",
        "Width of the composited output (int, default=720).", "targetWidth",
        "720");
    parser.addOption(targetWidthOption);
    QCommandLineOption targetHeightOption(
        QStringList() << "H" << "targetHeight",
        "Height of the composited output (int, default=1280).",
        "targetHeight", "1280");
    parser.addOption(targetHeightOption);

    // --modelSize <int> (default 513)
    QCommandLineOption modelSizeOption(
        QStringList() << "m" << "modelSize",
        "Segmentation model input size, bigger means more accurate people but "
        "at the expense of frame rate (int, default=513).",
        "modelSize", "513");
    parser.addOption(modelSizeOption);

    // --modelPath <string>
    QCommandLineOption modelPathOption(
        QStringList() << "mp" << "modelPath",
        "Path to the TorchScript segmentation model (string).", "modelPath",
        "models/deeplabv3_scripted.pt");
    parser.addOption(modelPathOption);

    // --personClass <int> (default 15)
    QCommandLineOption personClassOption(
        QStringList() << "personClass",
        "Label id the model uses for people (int, default=15).",
        "personClass", "15");
    parser.addOption(personClassOption);

    // --nthreads <int> (default 1)
    QCommandLineOption nthreadsOption(
        QStringList() << "n" << "nthreads",
        "Number of CPU threads used to prepare the model input (int, "
        "default=1).",
        "nthreads", "1");
    parser.addOption(nthreadsOption);

    // --background <string>
    QCommandLineOption backgroundOption(
        QStringList() << "b" << "background",
        "Image to use as the background at start up (string).", "background");
    parser.addOption(backgroundOption);

    // --backgroundDir <string>
    QCommandLineOption backgroundDirOption(
        QStringList() << "bd" << "backgroundDir",
        "Directory of backgrounds selectable with the 0-9 keys (string).",
        "backgroundDir", "backgrounds/");
    parser.addOption(backgroundDirOption);

    // --cpu (flag only; no argument)
    QCommandLineOption cpuOption(
        QStringList() << "cpu",
        "Run inference and compositing on the CPU even if a GPU is present.");
    parser.addOption(cpuOption);

    // --mirrorPreview (flag only; no argument)
    QCommandLineOption mirrorOption(QStringList() << "mirrorPreview",
                                    "Mirror the preview horizontally.");
    parser.addOption(mirrorOption);

    // --rotation <int> (default 0)
    QCommandLineOption rotationOption(
        QStringList() << "rotation",
        "Preview rotation in degrees, one of 0, 90, 180, 270 (default=0).",
        "rotation", "0");
    parser.addOption(rotationOption);

    parser.process(arguments);

    bool ok;
    CommandLineOptions opts;

    // Parse a strictly positive integer option or exit
    auto positive = [&parser, &ok](const QCommandLineOption &option,
                                   const char *name) {
      int value = parser.value(option).toInt(&ok);
      if (!ok || value <= 0) {
        std::cerr << "Error: --" << name << " must be a positive integer.\n";
        std::exit(-1);
      }
      return value;
    };

    opts.deviceIndex = parser.value(deviceIndexOption).toInt(&ok);
    if (!ok || opts.deviceIndex < 0) {
      std::cerr << "Error: --deviceIndex must be a non-negative integer.\n";
      std::exit(-1);
    }

    opts.captureWidth = positive(captureWidthOption, "captureWidth");
    opts.captureHeight = positive(captureHeightOption, "captureHeight");
    opts.targetWidth = positive(targetWidthOption, "targetWidth");
    opts.targetHeight = positive(targetHeightOption, "targetHeight");
    opts.modelSize = positive(modelSizeOption, "modelSize");
    opts.nthreads = positive(nthreadsOption, "nthreads");

    opts.modelPath = parser.value(modelPathOption).toStdString();
    if (opts.modelPath.empty()) {
      std::cerr << "Error: --modelPath must be a non-empty string.\n";
      std::exit(-1);
    }

    opts.personClass = parser.value(personClassOption).toInt(&ok);
    if (!ok || opts.personClass < 0) {
      std::cerr << "Error: --personClass must be a non-negative integer.\n";
      std::exit(-1);
    }

    opts.background = parser.value(backgroundOption).toStdString();
    opts.backgroundDir = parser.value(backgroundDirOption).toStdString();
    opts.forceCpu = parser.isSet(cpuOption);
    opts.mirrorPreview = parser.isSet(mirrorOption);

    const int degrees = parser.value(rotationOption).toInt(&ok);
    const auto rotation = rotationFromDegrees(degrees);
    if (!ok || !rotation) {
      std::cerr << "Error: --rotation must be one of 0, 90, 180, 270.\n";
      std::exit(-1);
    }
    opts.rotation = *rotation;

    return opts;
  }
};
