/**
 * @file latest_value_slot.hpp
 *
 * A single-slot mailbox that always holds the most recent value.
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
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>

/**
 * @brief LatestValueSlot class
 *
 * Writers overwrite, readers take a snapshot. A value is immutable once
 * published, so the lock is only held for the pointer swap or copy and a
 * reader keeps its snapshot alive for as long as it needs it. Nothing is ever
 * queued: a value that is overwritten before anybody reads it is gone.
 */
template <typename T> class LatestValueSlot {
public:
  LatestValueSlot() : value_(std::make_shared<const T>()) {}
  explicit LatestValueSlot(T initial)
      : value_(std::make_shared<const T>(std::move(initial))) {}

  LatestValueSlot(const LatestValueSlot &) = delete;
  LatestValueSlot &operator=(const LatestValueSlot &) = delete;

  /// Replace the whole value
  void publish(T value) {
    auto next = std::make_shared<const T>(std::move(value));
    std::unique_lock<std::shared_mutex> lock(mutex_);
    value_ = std::move(next);
  }

  /// Replace the value with a modified copy of the current one
  template <typename Fn> void update(Fn &&fn) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    T next = *value_;
    fn(next);
    value_ = std::make_shared<const T>(std::move(next));
  }

  /// A consistent view of the latest value
  std::shared_ptr<const T> snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return value_;
  }

private:
  mutable std::shared_mutex mutex_;
  std::shared_ptr<const T> value_;
};
