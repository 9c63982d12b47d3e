// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Drtgw, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace drtgw
{
namespace core
{

/// \brief Cooperative cancellation flag shared between a caller and the
/// operations it starts. Operations check it at their suspension points and
/// sleep on it instead of the clock, so cancel() wakes them immediately.
class CancellationToken
{
public:
  CancellationToken() = default;

  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  static std::shared_ptr<CancellationToken> create() { return std::make_shared<CancellationToken>(); }

  /// \brief Cancel any operations using this token
  void cancel()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _cancelled.store(true);
    }
    _cv.notify_all();
  }

  bool isCancelled() const { return _cancelled.load(); }

  /// \brief Sleeps for \p duration or until cancelled.
  /// \return true if the token was cancelled.
  template <typename Rep, typename Period>
  bool waitFor(const std::chrono::duration<Rep, Period> &duration) const
  {
    std::unique_lock<std::mutex> lock(_mutex);
    return _cv.wait_for(lock, duration, [this] { return _cancelled.load(); });
  }

  /// \brief Sleeps until \p deadline or until cancelled.
  /// \return true if the token was cancelled.
  template <typename Clock, typename Duration>
  bool waitUntil(const std::chrono::time_point<Clock, Duration> &deadline) const
  {
    std::unique_lock<std::mutex> lock(_mutex);
    return _cv.wait_until(lock, deadline, [this] { return _cancelled.load(); });
  }

private:
  std::atomic<bool> _cancelled{false};
  mutable std::mutex _mutex;
  mutable std::condition_variable _cv;
};

} // namespace core
} // namespace drtgw
