// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Drtgw, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <drtgw/network/transport.hpp>
#include <drtgw/proxy/api_error.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <functional>
#include <optional>
#include <random>
#include <stdexcept>

namespace drtgw
{
namespace proxy
{

/// \brief Bounded exponential backoff schedule.
/// \details nextDelay(i) is the wait after attempt i (0-based) failed:
/// baseDelay * multiplier^i, perturbed by +/- jitterFraction, capped by
/// maxDelay and by the time left before the deadline. It returns nullopt
/// once maxAttempts attempts have been made or the deadline has passed.
/// The schedule is a pure function of its inputs and the random source.
class RetryPolicy
{
public:
  using Duration = std::chrono::milliseconds;
  /// Returns a value in [0, 1).
  using RandomSource = std::function<double()>;

  struct Config
  {
    std::size_t maxAttempts;
    Duration baseDelay;
    double multiplier;
    double jitterFraction;
    std::optional<Duration> maxDelay;
    std::optional<network::MonoTime> deadline;
    /// \brief Extra factor applied to the delay after a RateLimited error.
    double rateLimitMultiplier;

    Config()
        : maxAttempts(3), baseDelay(100), multiplier(2.0), jitterFraction(0.0),
          rateLimitMultiplier(2.0)
    {
    }
  };

  /// \throws std::invalid_argument when the configuration is inconsistent.
  explicit RetryPolicy(const Config &config = Config{}, RandomSource random = {})
      : _config(config), _random(std::move(random))
  {
    if (_config.maxAttempts == 0)
      throw std::invalid_argument("RetryPolicy: maxAttempts must be at least 1");
    if (_config.baseDelay.count() < 0)
      throw std::invalid_argument("RetryPolicy: baseDelay must not be negative");
    if (!(_config.multiplier >= 1.0))
      throw std::invalid_argument("RetryPolicy: multiplier must be >= 1");
    if (!(_config.jitterFraction >= 0.0 && _config.jitterFraction <= 1.0))
      throw std::invalid_argument("RetryPolicy: jitterFraction must be within [0, 1]");
    if (!(_config.rateLimitMultiplier >= 1.0))
      throw std::invalid_argument("RetryPolicy: rateLimitMultiplier must be >= 1");
    if (_config.maxDelay && _config.maxDelay->count() < 0)
      throw std::invalid_argument("RetryPolicy: maxDelay must not be negative");
    if (!_random)
    {
      _random = defaultRandom;
    }
  }

  /// \brief Policy allowing exactly one attempt.
  static RetryPolicy singleAttempt()
  {
    Config config;
    config.maxAttempts = 1;
    return RetryPolicy(config);
  }

  const Config &config() const { return _config; }
  std::size_t maxAttempts() const { return _config.maxAttempts; }
  const std::optional<network::MonoTime> &deadline() const { return _config.deadline; }

  bool deadlineExpired(network::MonoTime now = network::MonoClock::now()) const
  {
    return _config.deadline && now >= *_config.deadline;
  }

  /// \brief Copy whose deadline is the earlier of its own and \p deadline.
  RetryPolicy withDeadline(network::MonoTime deadline) const
  {
    RetryPolicy copy(*this);
    if (!copy._config.deadline || deadline < *copy._config.deadline)
    {
      copy._config.deadline = deadline;
    }
    return copy;
  }

  std::optional<Duration> nextDelay(std::size_t attemptIndex,
                                    network::MonoTime now = network::MonoClock::now()) const
  {
    return compute(attemptIndex, now, 1.0);
  }

  /// \brief nextDelay() stretched by rateLimitMultiplier for RateLimited.
  std::optional<Duration> delayFor(const ApiError &error, std::size_t attemptIndex,
                                   network::MonoTime now = network::MonoClock::now()) const
  {
    double factor = error.kind == ErrorKind::RateLimited ? _config.rateLimitMultiplier : 1.0;
    return compute(attemptIndex, now, factor);
  }

private:
  std::optional<Duration> compute(std::size_t attemptIndex, network::MonoTime now,
                                  double factor) const
  {
    if (attemptIndex + 1 >= _config.maxAttempts || deadlineExpired(now))
    {
      return std::nullopt;
    }

    // One day is far beyond any sensible retry delay and keeps the cast safe.
    constexpr double ceilingMs = 86400000.0;
    double ms = static_cast<double>(_config.baseDelay.count()) *
                std::pow(_config.multiplier, static_cast<double>(attemptIndex));
    if (_config.jitterFraction > 0.0)
    {
      double r = std::clamp(_random(), 0.0, 1.0);
      ms *= 1.0 + _config.jitterFraction * (2.0 * r - 1.0);
    }
    ms = std::min(ms, ceilingMs);
    if (_config.maxDelay)
    {
      ms = std::min(ms, static_cast<double>(_config.maxDelay->count()));
    }
    ms = std::min(ms * factor, ceilingMs);
    Duration delay(static_cast<Duration::rep>(std::max(ms, 0.0)));

    if (_config.deadline)
    {
      auto remaining = std::chrono::duration_cast<Duration>(*_config.deadline - now);
      delay = std::min(delay, remaining);
    }
    return delay;
  }

  static double defaultRandom()
  {
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(engine);
  }

  Config _config;
  RandomSource _random;
};

} // namespace proxy
} // namespace drtgw
