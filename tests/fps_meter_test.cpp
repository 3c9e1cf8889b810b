/**
 * @file fps_meter_test.cpp
 *
 * Tests for the window-based frame rate meter.
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
#include "fps_meter.hpp"

using namespace std::chrono_literals;

namespace {

FpsMeter::Clock::time_point at(std::chrono::milliseconds offset) {
  static const FpsMeter::Clock::time_point origin = FpsMeter::Clock::now();
  return origin + offset;
}

} // namespace

TEST(FpsMeterTest, FirstTickOnlyOpensTheWindow) {
  FpsMeter meter;
  EXPECT_FALSE(meter.tick(at(0ms)).has_value());
  EXPECT_FALSE(meter.tick(at(999ms)).has_value());
}

TEST(FpsMeterTest, ReportsFramesOverElapsedSeconds) {
  FpsMeter meter;
  meter.tick(at(0ms));

  std::optional<double> fps;
  for (int i = 1; i <= 10; ++i) {
    fps = meter.tick(at(std::chrono::milliseconds(100 * i)));
    if (i < 10) {
      EXPECT_FALSE(fps.has_value()) << "tick " << i;
    }
  }

  ASSERT_TRUE(fps.has_value());
  EXPECT_DOUBLE_EQ(*fps, 10.0);
}

TEST(FpsMeterTest, UsesTheActualElapsedTime) {
  FpsMeter meter;
  meter.tick(at(0ms));
  for (int i = 1; i < 30; ++i) {
    EXPECT_FALSE(meter.tick(at(std::chrono::milliseconds(10 * i))));
  }
  // 30 frames over 1.5 s
  auto fps = meter.tick(at(1500ms));
  ASSERT_TRUE(fps.has_value());
  EXPECT_NEAR(*fps, 20.0, 1e-9);
}

TEST(FpsMeterTest, StartsANewWindowAfterReporting) {
  FpsMeter meter;
  meter.tick(at(0ms));
  ASSERT_TRUE(meter.tick(at(1000ms)).has_value());

  EXPECT_FALSE(meter.tick(at(1500ms)).has_value());
  auto fps = meter.tick(at(2000ms));
  ASSERT_TRUE(fps.has_value());
  EXPECT_DOUBLE_EQ(*fps, 2.0);
}

TEST(FpsMeterTest, ResetForgetsTheWindow) {
  FpsMeter meter;
  meter.tick(at(0ms));
  meter.reset();

  // After a reset the next tick opens a fresh window again
  EXPECT_FALSE(meter.tick(at(5000ms)).has_value());
  EXPECT_FALSE(meter.tick(at(5500ms)).has_value());
}
