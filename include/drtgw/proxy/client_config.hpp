// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Drtgw, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <drtgw/core/config_loader.hpp>
#include <drtgw/proxy/endpoint_catalog.hpp>
#include <drtgw/proxy/error_classifier.hpp>
#include <drtgw/proxy/retry_policy.hpp>
#include <drtgw/proxy/types.hpp>

#include <chrono>
#include <stdexcept>
#include <string>

namespace drtgw
{
namespace proxy
{

/// \brief Default listen address of a locally started chain simulator.
constexpr const char *SIMULATOR_GATEWAY = "http://localhost:8085";

/// \brief Everything a GatewayProxy needs besides its transport.
struct ClientConfig
{
  /// \brief Gateway base URL, e.g. "https://gateway.example.org".
  std::string baseUrl;

  ApiVersion apiVersion{ApiVersion::V1};

  /// \brief Per-attempt transport timeout.
  std::chrono::milliseconds timeout{std::chrono::seconds(30)};

  /// \brief Retry schedule for idempotent reads.
  RetryPolicy::Config retry{};

  /// \brief Schedule between transaction status polls.
  RetryPolicy::Config polling = defaultPolling();

  /// \brief Enables the simulator-only control endpoints.
  bool simulatorMode{false};

  StatusTable statusTable{};

  ErrorClassifier::Config classifier{};

  static RetryPolicy::Config defaultPolling()
  {
    RetryPolicy::Config p;
    p.maxAttempts = 20;
    p.baseDelay = std::chrono::milliseconds(1400);
    p.multiplier = 1.5;
    p.maxDelay = std::chrono::milliseconds(6000);
    return p;
  }

  static ClientConfig forSimulator(const std::string &baseUrl = SIMULATOR_GATEWAY)
  {
    ClientConfig c;
    c.baseUrl = baseUrl;
    c.simulatorMode = true;
    return c;
  }

  /// \throws std::invalid_argument describing the first problem found.
  void validate() const
  {
    if (baseUrl.rfind("http://", 0) != 0 && baseUrl.rfind("https://", 0) != 0)
    {
      throw std::invalid_argument("ClientConfig: baseUrl must start with http:// or https://");
    }
    if (timeout.count() <= 0)
    {
      throw std::invalid_argument("ClientConfig: timeout must be positive");
    }
    // RetryPolicy checks its own invariants.
    RetryPolicy r(retry);
    RetryPolicy p(polling);
    (void)r;
    (void)p;
  }

  /// \brief Reads [section], [section.retry], [section.polling] and
  /// [section.status] from a TOML configuration.
  /// \code
  /// [gateway]
  /// base_url = "http://localhost:8085"
  /// api_version = "v1"
  /// timeout_ms = 10000
  /// simulator = true
  ///
  /// [gateway.retry]
  /// max_attempts = 4
  /// base_delay_ms = 200
  ///
  /// [gateway.status]
  /// "reward-reverted" = "failed"
  /// \endcode
  /// \throws std::invalid_argument for missing or invalid values.
  static ClientConfig fromConfig(const core::ConfigLoader &config,
                                 const std::string &section = "gateway")
  {
    ClientConfig c;
    auto baseUrl = config.getString(section + ".base_url");
    if (!baseUrl)
    {
      throw std::invalid_argument("ClientConfig: missing " + section + ".base_url");
    }
    c.baseUrl = *baseUrl;
    while (!c.baseUrl.empty() && c.baseUrl.back() == '/')
    {
      c.baseUrl.pop_back();
    }
    if (auto version = config.getString(section + ".api_version"))
    {
      auto parsed = parseApiVersion(*version);
      if (!parsed)
      {
        throw std::invalid_argument("ClientConfig: unknown api_version '" + *version + "'");
      }
      c.apiVersion = *parsed;
    }
    if (auto ms = config.getInt(section + ".timeout_ms"))
    {
      c.timeout = std::chrono::milliseconds(*ms);
    }
    c.simulatorMode = config.getBool(section + ".simulator").value_or(false);

    readPolicy(config, section + ".retry", c.retry);
    readPolicy(config, section + ".polling", c.polling);

    if (auto statuses = config.getStringMap(section + ".status"))
    {
      for (const auto &entry : *statuses)
      {
        auto status = StatusTable::parseStatus(entry.second);
        if (!status)
        {
          throw std::invalid_argument("ClientConfig: unknown status '" + entry.second +
                                      "' for node status '" + entry.first + "'");
        }
        c.statusTable.set(entry.first, *status);
      }
    }
    c.validate();
    return c;
  }

private:
  static void readPolicy(const core::ConfigLoader &config, const std::string &prefix,
                         RetryPolicy::Config &policy)
  {
    if (auto v = config.getInt(prefix + ".max_attempts"))
    {
      if (*v < 1)
        throw std::invalid_argument("ClientConfig: " + prefix + ".max_attempts must be >= 1");
      policy.maxAttempts = static_cast<std::size_t>(*v);
    }
    if (auto v = config.getInt(prefix + ".base_delay_ms"))
      policy.baseDelay = std::chrono::milliseconds(*v);
    if (auto v = config.getDouble(prefix + ".multiplier"))
      policy.multiplier = *v;
    if (auto v = config.getDouble(prefix + ".jitter"))
      policy.jitterFraction = *v;
    if (auto v = config.getInt(prefix + ".max_delay_ms"))
      policy.maxDelay = std::chrono::milliseconds(*v);
    if (auto v = config.getDouble(prefix + ".rate_limit_multiplier"))
      policy.rateLimitMultiplier = *v;
  }
};

} // namespace proxy
} // namespace drtgw
