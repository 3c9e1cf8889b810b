/**
 * @file gpu_context.hpp
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

#pragma once

// Torch includes (with slots override to avoid conflicts with Qt)
#if defined(slots)
#pragma push_macro("slots")
#undef slots
#endif
#include <torch/script.h>
#include <torch/torch.h>
#if defined(slots)
#pragma pop_macro("slots")
#endif

/**
 * @brief GpuContext class
 *
 * Owns the choice of torch device. It is created once in main and handed to
 * everything that uploads to or computes on the device; those only borrow it.
 */
class GpuContext {
public:
  /// Pick the best available device, or the CPU when forceCpu is set
  explicit GpuContext(bool forceCpu = false);

  GpuContext(const GpuContext &) = delete;
  GpuContext &operator=(const GpuContext &) = delete;

  const torch::Device &device() const noexcept { return device_; }

  bool isCpu() const noexcept { return device_.is_cpu(); }

  /// Block until all work queued on the device has completed
  void synchronize() const;

private:
  torch::Device device_;
};

// Pick the device for torch operations
torch::Device pickDevice();
