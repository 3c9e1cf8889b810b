/**
 * @file gpu_context.cpp
 *
 * Process-wide GPU resources shared by the background store and the
 * segmentation processor.
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

// Local includes
#include "gpu_context.hpp"

#ifdef USE_CUDA
#include <torch/cuda.h>
#endif

#ifdef USE_MPS
#include <torch/mps.h>
#endif

/**
 * @brief Pick the device for torch operations.
 *
 * This function checks for MPS, then CUDA, availability and returns the
 * appropriate device.
 *
 * @returns torch::Device object representing the selected device.
 */
torch::Device pickDevice() {
#ifdef USE_MPS
  if (torch::mps::is_available()) {
    qInfo() << "[GpuContext] Using MPS backend";
    return torch::Device(torch::kMPS);
  }
#endif

#ifdef USE_CUDA
  if (torch::cuda::is_available()) {
    qInfo() << "[GpuContext] Using CUDA backend";
    return torch::Device(torch::kCUDA);
  }
#endif

  qInfo() << "[GpuContext] Using CPU backend";
  return torch::Device(torch::kCPU);
}

/**
 * @brief Constructor for the GpuContext class.
 *
 * @param forceCpu Skip device detection and run everything on the CPU.
 */
GpuContext::GpuContext(bool forceCpu)
    : device_(forceCpu ? torch::Device(torch::kCPU) : pickDevice()) {
  std::cout << "[GpuContext] Compute device: " << device_ << "\n";
}

/**
 * @brief Wait for the device to drain.
 *
 * CPU work is already complete when the call that queued it returns, so only
 * the asynchronous backends need an explicit wait.
 */
void GpuContext::synchronize() const {
#ifdef USE_CUDA
  if (device_.is_cuda()) {
    torch::cuda::synchronize();
    return;
  }
#endif

#ifdef USE_MPS
  if (device_.is_mps()) {
    torch::mps::synchronize();
    return;
  }
#endif
}
