/**
 * @file gpu_context_test.cpp
 *
 * Tests for compute device selection.
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

// External includes
#include <gtest/gtest.h>

// Local includes
#include "gpu_context.hpp"

#ifdef USE_CUDA
#include <torch/cuda.h>
#endif

#ifdef USE_MPS
#include <torch/mps.h>
#endif

TEST(GpuContextTest, ForcedCpuIgnoresAccelerators) {
  GpuContext gpu(true);
  EXPECT_TRUE(gpu.isCpu());
  EXPECT_NO_THROW(gpu.synchronize());
}

TEST(GpuContextTest, PrefersMpsThenCudaThenCpu) {
  torch::DeviceType expected = torch::kCPU;
#ifdef USE_CUDA
  if (torch::cuda::is_available())
    expected = torch::kCUDA;
#endif
#ifdef USE_MPS
  if (torch::mps::is_available())
    expected = torch::kMPS;
#endif

  EXPECT_EQ(pickDevice().type(), expected);

  GpuContext gpu;
  EXPECT_EQ(gpu.device().type(), expected);
  EXPECT_NO_THROW(gpu.synchronize());
}
