/**
 * @file backgrounds.cpp
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

// Standard includes
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <string>

// Qt includes
#include <QDebug>

// External includes
#include <opencv2/imgcodecs.hpp>

// Local includes
#include "backgrounds.hpp"

namespace fs = std::filesystem;

// The supported image file extensions (lower-case, upper-case is handled
// by lower-case conversion)
const std::vector<std::string> Backgrounds::kImageExts = {
    ".png", ".jpg", ".jpeg", ".bmp", ".tiff", ".tif", ".webp"};

/**
 * @brief Backgrounds constructor
 *
 * @param dir path to folder containing your images
 * @param parent The parent object (default is nullptr).
 */
Backgrounds::Backgrounds(const std::string &dir, QObject *parent)
    : QObject(parent), dir_(dir) {}

/**
 * @brief Check a path against the supported extensions.
 *
 * @param path The file path.
 *
 * @return true if the extension is one we try to decode.
 */
bool Backgrounds::isImageFile(const std::string &path) {
  auto ext = fs::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return std::find(kImageExts.begin(), kImageExts.end(), ext) !=
         kImageExts.end();
}

/**
 * @brief Scan & load all images with known extensions.
 *
 * Files that fail to decode are skipped. Only the first kMaxImages images
 * are kept.
 *
 * @return false if directory doesn't exist or no images found.
 */
bool Backgrounds::load() {
  std::error_code ec;
  if (!fs::is_directory(dir_, ec))
    return false;

  paths_.clear();
  images_.clear();
  currentIdx_ = 0;

  // collect all matching paths
  for (auto const &entry : fs::directory_iterator(dir_, ec)) {
    if (entry.is_regular_file() && isImageFile(entry.path().string())) {
      paths_.push_back(entry.path().string());
    }
  }

  // sort so numbering is stable
  std::sort(paths_.begin(), paths_.end());

  // load into memory
  for (auto const &p : paths_) {
    if (images_.size() == kMaxImages) {
      std::cerr << "[Backgrounds] More than " << kMaxImages
                << " images found, only the first " << kMaxImages
                << " are accessible." << std::endl;
      break;
    }
    cv::Mat img;
    if (loadImage(p, img)) {
      images_.push_back(std::move(img));
    } else {
      qWarning() << "[Backgrounds] Could not decode" << p.c_str();
    }
  }

  std::cout << "[Backgrounds] Loaded " << images_.size() << " images from "
            << dir_ << "\n";

  return !images_.empty();
}

/**
 * @brief Load a single image by path
 *
 * @param path path to the image
 * @param out output cv::Mat
 *
 * @return true if the image was loaded successfully, false otherwise
 */
bool Backgrounds::loadImage(const std::string &path, cv::Mat &out) {
  out = cv::imread(path, cv::IMREAD_COLOR);
  return !out.empty();
}

cv::Mat Backgrounds::current() const {
  if (images_.empty())
    return cv::Mat();
  return images_[currentIdx_];
}

bool Backgrounds::next() {
  if (images_.empty())
    return false;
  currentIdx_ = (currentIdx_ + 1) % images_.size();
  emit backgroundChanged(images_[currentIdx_]);
  return true;
}

bool Backgrounds::previous() {
  if (images_.empty())
    return false;
  currentIdx_ = (currentIdx_ + images_.size() - 1) % images_.size();
  emit backgroundChanged(images_[currentIdx_]);
  return true;
}

/**
 * @brief Select image by zero-based index; returns false if idx out of range.
 *
 * @param idx index of the image to set
 * @return true if the image was set successfully, false otherwise
 */
bool Backgrounds::setIndex(std::size_t idx) {
  if (idx >= images_.size())
    return false;
  currentIdx_ = idx;
  emit backgroundChanged(images_[currentIdx_]);
  return true;
}

/**
 * @brief Load an image picked outside the directory.
 *
 * @param path path to the image
 * @return true if the image decoded and was announced, false otherwise
 */
bool Backgrounds::loadFile(const std::string &path) {
  cv::Mat img;
  if (!loadImage(path, img)) {
    qWarning() << "[Backgrounds] Could not decode" << path.c_str();
    return false;
  }
  emit backgroundChanged(img);
  return true;
}
