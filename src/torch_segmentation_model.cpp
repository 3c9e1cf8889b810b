/**
 * @file torch_segmentation_model.cpp
 *
 * A TorchScript DeepLabV3 segmentation model run with libtorch.
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
#include <cstring>
#include <iostream>
#include <stdexcept>

// Local includes
#include "torch_segmentation_model.hpp"

/**
 * @brief Constructor for the TorchSegmentationModel class.
 *
 * @param modelPath The path to the scripted model.
 * @param gpu The shared compute device.
 * @param modelSize The square input size of the model (default is 513).
 * @param numClasses The number of labels the model produces (default is 21).
 * @param nthreads The number of threads used for preprocessing.
 */
TorchSegmentationModel::TorchSegmentationModel(
    const std::string &modelPath, std::shared_ptr<const GpuContext> gpu,
    int modelSize, int numClasses, int nthreads)
    : modelPath_(modelPath), gpu_(std::move(gpu)), modelW_(modelSize),
      modelH_(modelSize), numClasses_(numClasses), nthreads_(nthreads) {

  std::cout << "[TorchSegmentationModel] Loading " << modelPath_ << "\n";
  std::cout << "[TorchSegmentationModel] Using device: " << gpu_->device()
            << "\n";
  std::cout << "[TorchSegmentationModel] Model size: " << modelW_ << "x"
            << modelH_ << "\n";

  try {
    segmentModel_ = torch::jit::load(modelPath_, gpu_->device());
    segmentModel_.to(gpu_->device());
    segmentModel_.eval();
  } catch (const c10::Error &e) {
    throw std::runtime_error("Failed to load the segmentation model from " +
                             modelPath_ + ": " + e.what_without_backtrace());
  }

  // Allocate a CPU tensor for staging and the device tensor (shared on CPU)
  inputCpuTensor_ = torch::empty(
      {1, 3, modelH_, modelW_},
      torch::TensorOptions().dtype(torch::kFloat32).device(torch::kCPU));
  if (gpu_->isCpu()) {
    inputTensor_ = inputCpuTensor_;
  } else {
    inputTensor_ = torch::empty(
        {1, 3, modelH_, modelW_},
        torch::TensorOptions().dtype(torch::kFloat32).device(gpu_->device()));
  }

  std::cout << "[TorchSegmentationModel] Loaded model from " << modelPath_
            << "\n";
}

/**
 * @brief Copy a BGRA image into the staging tensor.
 *
 * The model expects RGB planes normalised with the ImageNet mean and
 * standard deviation, so the conversion, normalisation and the HWC -> CHW
 * transpose happen in a single pass.
 *
 * @param input BGRA image of the model size.
 */
void TorchSegmentationModel::fillInputTensor(const cv::Mat &input) {
  static constexpr float kMean[3] = {0.485f, 0.456f, 0.406f};
  static constexpr float kStd[3] = {0.229f, 0.224f, 0.225f};

  float *tptr = inputCpuTensor_.data_ptr<float>();
  const int HW = modelH_ * modelW_;

#pragma omp parallel for num_threads(nthreads_)
  for (int y = 0; y < modelH_; ++y) {
    const cv::Vec4b *row = input.ptr<cv::Vec4b>(y);
    for (int x = 0; x < modelW_; ++x) {
      const int idx = y * modelW_ + x;
      // BGRA -> R, G, B planes
      tptr[0 * HW + idx] = (row[x][2] / 255.f - kMean[0]) / kStd[0];
      tptr[1 * HW + idx] = (row[x][1] / 255.f - kMean[1]) / kStd[1];
      tptr[2 * HW + idx] = (row[x][0] / 255.f - kMean[2]) / kStd[2];
    }
  }
}

/**
 * @brief Segment one image.
 *
 * @param input BGRA image, exactly inputSize().
 *
 * @return CV_32SC1 class ids, same size as the input.
 */
cv::Mat TorchSegmentationModel::predict(const cv::Mat &input) {
  if (input.type() != CV_8UC4 || input.cols != modelW_ ||
      input.rows != modelH_) {
    throw std::invalid_argument("Segmentation input must be a " +
                                std::to_string(modelW_) + "x" +
                                std::to_string(modelH_) + " BGRA image");
  }

  fillInputTensor(input);

  torch::NoGradGuard no_grad;

  if (!gpu_->isCpu()) {
    inputTensor_.copy_(inputCpuTensor_);
  }

  // Run the model
  auto out_iv = segmentModel_.forward({inputTensor_});

  // Unwrap IValue -> logits tensor
  torch::Tensor logits;
  if (out_iv.isTensor())
    logits = out_iv.toTensor();
  else if (out_iv.isTuple())
    logits = out_iv.toTuple()->elements()[0].toTensor();
  else if (out_iv.isGenericDict())
    logits = out_iv.toGenericDict().at("out").toTensor();
  else
    throw std::runtime_error("Unexpected IValue from segmentation");

  // [1, C, H, W] logits -> [H, W] class ids
  torch::Tensor labels = logits.argmax(1)
                             .squeeze(0)
                             .to(torch::kInt32)
                             .to(torch::kCPU)
                             .contiguous();

  if (labels.dim() != 2 || labels.size(0) != modelH_ ||
      labels.size(1) != modelW_) {
    throw std::runtime_error("Segmentation output has an unexpected shape");
  }

  cv::Mat mask(modelH_, modelW_, CV_32SC1);
  std::memcpy(mask.data, labels.data_ptr<std::int32_t>(),
              sizeof(std::int32_t) * modelH_ * modelW_);
  return mask;
}
