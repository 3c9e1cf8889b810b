/**
 * @file viewport.hpp
 *
 * This file defines the main window: the live preview with its status
 * overlays and the keyboard controls.
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

// Qt includes
#include <QLabel>
#include <QMainWindow>

// Local includes
#include "backgrounds.hpp"
#include "controller.hpp"
#include "preview_renderer.hpp"

/**
 * @brief ViewPort class
 *
 * This class defines the UI for the VirtualBackdrop application.
 *
 * The preview fills the window. An FPS readout sits in the top left corner
 * and a "Camera Unavailable" banner is shown while the camera is
 * interrupted.
 */
class ViewPort : public QMainWindow {
  Q_OBJECT
public:
  ViewPort(PreviewRenderer *renderer, Controller *controller,
           Backgrounds *backgrounds, QWidget *parent = nullptr);
  ~ViewPort() override;

protected:
  // catch key presses
  void keyPressEvent(QKeyEvent *event) override;

public Q_SLOTS:
  void setFps(double fps);
  void setCameraAvailable(bool available);
  void showMessage(const QString &message);

private:
  // Ask the user for an image file and use it as the background
  void pickBackgroundFile();

  PreviewRenderer *renderer_;
  QLabel *fpsLabel_;
  QLabel *unavailableLabel_;
  QLabel *messageLabel_;

  // Not owned
  Controller *controller_{nullptr};
  Backgrounds *backgrounds_{nullptr};
};

// The getter called from main.cpp
ViewPort *initViewport(PreviewRenderer *renderer, Controller *controller,
                       Backgrounds *backgrounds);
