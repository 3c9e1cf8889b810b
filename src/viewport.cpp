/**
 * @file viewport.cpp
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

#include "viewport.hpp"

// Standard includes
#include <iostream>

// Qt includes
#include <QApplication>
#include <QFileDialog>
#include <QGridLayout>
#include <QKeyEvent>

/**
 * @brief ViewPort constructor.
 *
 * Stacks the status labels on top of the preview in a single grid cell.
 *
 * @param renderer The preview widget, reparented into the window.
 * @param controller The pipeline controller.
 * @param backgrounds The selectable background images.
 * @param parent The parent widget (default is nullptr).
 */
ViewPort::ViewPort(PreviewRenderer *renderer, Controller *controller,
                   Backgrounds *backgrounds, QWidget *parent)
    : QMainWindow(parent), renderer_(renderer), fpsLabel_(new QLabel),
      unavailableLabel_(new QLabel(tr("Camera Unavailable"))),
      messageLabel_(new QLabel), controller_(controller),
      backgrounds_(backgrounds) {

  QWidget *w = new QWidget(this);
  auto *grid = new QGridLayout(w);
  grid->setContentsMargins(0, 0, 0, 0);
  grid->setSpacing(0);

  grid->addWidget(renderer_, 0, 0);
  grid->addWidget(fpsLabel_, 0, 0, Qt::AlignTop | Qt::AlignLeft);
  grid->addWidget(unavailableLabel_, 0, 0, Qt::AlignCenter);
  grid->addWidget(messageLabel_, 0, 0, Qt::AlignBottom | Qt::AlignHCenter);

  for (auto lbl : {fpsLabel_, unavailableLabel_, messageLabel_}) {
    lbl->setStyleSheet(
        "QLabel { color: white; background-color: rgba(0, 0, 0, 128); "
        "padding: 4px; }");
    lbl->setAttribute(Qt::WA_TransparentForMouseEvents);
  }

  fpsLabel_->setText(QString::asprintf("FPS: %.2f", 0.0));
  unavailableLabel_->hide();
  messageLabel_->hide();

  setCentralWidget(w);
}

/**
 * @brief ViewPort destructor.
 */
ViewPort::~ViewPort() = default;

void ViewPort::setFps(double fps) {
  fpsLabel_->setText(QString::asprintf("FPS: %.2f", fps));
}

void ViewPort::setCameraAvailable(bool available) {
  unavailableLabel_->setVisible(!available);
}

void ViewPort::showMessage(const QString &message) {
  messageLabel_->setText(message);
  messageLabel_->show();
}

/**
 * @brief Let the user choose any image file as the background.
 */
void ViewPort::pickBackgroundFile() {
  const QString dir =
      backgrounds_ ? QString::fromStdString(backgrounds_->directory())
                   : QString();
  const QString path = QFileDialog::getOpenFileName(
      this, tr("Choose a background"), dir,
      tr("Images (*.png *.jpg *.jpeg *.bmp *.tiff *.tif *.webp)"));
  if (path.isEmpty() || !backgrounds_)
    return;

  if (!backgrounds_->loadFile(path.toStdString())) {
    showMessage(tr("Could not load %1").arg(path));
  }
}

/**
 * @brief Handle key press events in the viewport.
 *
 * Esc quits, 0-9 pick a background from the directory, the arrow keys step
 * through them, O opens a file picker and R resumes the camera after an
 * interruption.
 *
 * @param event The QKeyEvent object representing the key press event.
 */
void ViewPort::keyPressEvent(QKeyEvent *event) {
  int k = event->key();

  // Exit condition
  if (k == Qt::Key_Escape) {
    qApp->quit();
  }

  // Background swapping
  else if (k >= Qt::Key_0 && k <= Qt::Key_9) {
    // Map '0'..'9' → 0..9
    std::size_t idx = static_cast<std::size_t>(k - Qt::Key_0);

    if (!backgrounds_ || !backgrounds_->setIndex(idx)) {
      const std::size_t n = backgrounds_ ? backgrounds_->size() : 0;
      std::cerr << "[ViewPort] No background loaded at index " << idx
                << "; only have " << n << " images." << std::endl;
    }
  }

  else if (k == Qt::Key_Right && backgrounds_) {
    backgrounds_->next();
  }

  else if (k == Qt::Key_Left && backgrounds_) {
    backgrounds_->previous();
  }

  else if (k == Qt::Key_O) {
    pickBackgroundFile();
  }

  else if (k == Qt::Key_R && controller_) {
    controller_->resumeAfterInterruption();
  }

  // Let Qt handle anything else
  else {
    QMainWindow::keyPressEvent(event);
  }
}

/**
 * @brief Create the viewport and connect it to the pipeline.
 *
 * @param renderer The preview widget.
 * @param controller The pipeline controller.
 * @param backgrounds The selectable background images.
 *
 * @return The ViewPort object.
 */
ViewPort *initViewport(PreviewRenderer *renderer, Controller *controller,
                       Backgrounds *backgrounds) {

  // Create the viewport
  ViewPort *vp = new ViewPort(renderer, controller, backgrounds);

  // Set the view port title
  vp->setWindowTitle("VirtualBackdrop");

  QObject::connect(controller, &Controller::fpsUpdated, vp, &ViewPort::setFps);
  QObject::connect(controller, &Controller::cameraAvailabilityChanged, vp,
                   &ViewPort::setCameraAvailable);
  QObject::connect(controller, &Controller::sessionFailed, vp,
                   &ViewPort::showMessage);
  QObject::connect(controller, &Controller::errorReported, vp,
                   &ViewPort::showMessage);

  // Make the main window the size of the screen
  vp->showMaximized();

  return vp;
}
