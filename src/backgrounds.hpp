/**
 * @file backgrounds.hpp
 *
 * This file defines the library of selectable background images: a
 * directory of stills plus any image picked by hand.
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
#include <string>
#include <vector>

// Qt includes
#include <QObject>

// External includes
#include <opencv2/core.hpp>

/**
 * @brief Backgrounds class
 *
 * Loads the images of one directory (sorted by name, at most kMaxImages) and
 * lets the user step through them or pick one by index. Every selection is
 * announced with backgroundChanged().
 */
class Backgrounds : public QObject {
  Q_OBJECT

public:
  /// Number keys 0-9 address the images
  static constexpr std::size_t kMaxImages = 10;

  /// @param dir  path to folder containing your images
  explicit Backgrounds(const std::string &dir, QObject *parent = nullptr);

  /// Scan & load all images with known extensions.
  /// Returns false if directory doesn't exist or no images found.
  bool load();

  /// Get the currently-selected image (empty if none).
  cv::Mat current() const;

  /// Advance to the next image (wraps round); returns false if none loaded.
  bool next();

  /// Go back to the previous image (wraps round); returns false if none loaded.
  bool previous();

  /// Select image by zero-based index; returns false if idx out of range.
  bool setIndex(std::size_t idx);

  /// Load an arbitrary image file and select it without adding it to the list
  bool loadFile(const std::string &path);

  /// How many images did we actually load?
  std::size_t size() const noexcept { return images_.size(); }

  const std::string &directory() const noexcept { return dir_; }

  /// Is this a file extension we try to decode?
  static bool isImageFile(const std::string &path);

signals:
  void backgroundChanged(const cv::Mat &image);

private:
  std::string dir_;
  std::vector<std::string> paths_;
  std::vector<cv::Mat> images_;
  std::size_t currentIdx_{0};

  // supported extensions (lower-case)
  static const std::vector<std::string> kImageExts;

  /// helper to load a single image by path
  static bool loadImage(const std::string &path, cv::Mat &out);
};
