// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Drtgw, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <drtgw/core/logger.hpp>
#include <drtgw/proxy/gateway_proxy.hpp>

#include <algorithm>
#include <cctype>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace drtgw
{
namespace proxy
{

enum class PollState
{
  Polling,
  Succeeded,
  Failed,
  TimedOut,
  Errored,
  Cancelled
};

inline const char *toString(PollState state)
{
  switch (state)
  {
  case PollState::Polling:
    return "Polling";
  case PollState::Succeeded:
    return "Succeeded";
  case PollState::Failed:
    return "Failed";
  case PollState::TimedOut:
    return "TimedOut";
  case PollState::Errored:
    return "Errored";
  case PollState::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

struct PollResult
{
  PollState state{PollState::Polling};
  /// \brief Final transaction for Succeeded and Failed.
  std::optional<TransactionOnNetwork> transaction;
  /// \brief Why polling stopped, for TimedOut, Errored and Cancelled.
  std::optional<ApiError> error;
  std::size_t attempts{0};

  bool succeeded() const { return state == PollState::Succeeded; }
};

/// \brief Polls a transaction until it reaches a terminal status.
/// \details Each tick is a single-attempt query; retry pacing comes only
/// from the polling policy, so retries never nest. "Not found" answers are
/// expected right after a broadcast and keep the poller waiting, as do
/// pending statuses and retryable errors. Fatal and Decode errors stop
/// polling at once.
class TransactionPoller
{
public:
  struct Config
  {
    /// \brief Ask for smart contract results and logs with the transaction.
    bool withResults;
    /// \brief Tick on the process-status endpoint and fetch the transaction
    /// once, when a terminal status is seen.
    bool useProcessStatus;
    /// \brief Error codes meaning "not visible on this node yet".
    std::vector<std::string> notFoundCodes;
    /// \brief Lower-case fragments of the node's own error message with the
    /// same meaning.
    std::vector<std::string> notFoundMessages;
    /// \brief Also treat a 404 without a recognised node error as "not
    /// visible yet". Off by default: a misrouted request answers 404 too.
    bool anyNotFoundStatus;

    Config()
        : withResults(true), useProcessStatus(false),
          notFoundCodes{"transaction_not_found", "not_found"}, notFoundMessages{"not found"},
          anyNotFoundStatus(false)
    {
    }
  };

  /// \throws std::invalid_argument if \p proxy is null.
  explicit TransactionPoller(std::shared_ptr<const GatewayProxy> proxy, Config config = Config{})
      : _proxy(std::move(proxy)), _config(std::move(config))
  {
    if (!_proxy)
    {
      throw std::invalid_argument("TransactionPoller: proxy must not be null");
    }
  }

  const Config &config() const { return _config; }

  /// \brief Polls \p hash until it is final.
  /// \param opts deadline, cancellation and per-query timeout; opts.retry,
  /// when set, replaces the proxy's polling policy.
  PollResult await(const std::string &hash, const CallOptions &opts = {}) const
  {
    RetryPolicy policy = opts.retry ? *opts.retry : RetryPolicy(_proxy->config().polling);
    if (opts.deadline)
    {
      policy = policy.withDeadline(*opts.deadline);
    }

    CallOptions tick;
    tick.cancel = opts.cancel;
    tick.timeout = opts.timeout;
    tick.retry = RetryPolicy::singleAttempt();
    tick.deadline = policy.deadline();

    PollResult result;
    std::optional<ApiError> lastError;
    for (std::size_t attempt = 0;; ++attempt)
    {
      if (opts.cancel && opts.cancel->isCancelled())
      {
        return finish(hash, result, PollState::Cancelled,
                      ApiError::make(ErrorKind::Cancelled, "polling cancelled"));
      }
      if (policy.deadlineExpired())
      {
        return finish(hash, result, PollState::TimedOut, exhausted(attempt, lastError));
      }

      result.attempts = attempt + 1;
      auto outcome = tickOnce(hash, tick);
      if (outcome.transaction)
      {
        result.transaction = std::move(outcome.transaction);
        PollState state = result.transaction->status == TransactionStatus::Success
                              ? PollState::Succeeded
                              : PollState::Failed;
        return finish(hash, result, state, std::nullopt);
      }

      std::optional<RetryPolicy::Duration> delay;
      if (outcome.error)
      {
        const ApiError &error = *outcome.error;
        if (error.kind == ErrorKind::Cancelled)
        {
          return finish(hash, result, PollState::Cancelled, error);
        }
        if (error.kind == ErrorKind::TimedOut)
        {
          return finish(hash, result, PollState::TimedOut, error);
        }
        if (isNotFound(error))
        {
          DRTGW_LOG_DEBUG("TransactionPoller: " << hash << " not visible yet (" << error.message
                                                << ")");
          delay = policy.nextDelay(attempt);
        }
        else if (error.retryable())
        {
          DRTGW_LOG_DEBUG("TransactionPoller: " << hash << " tick failed: " << error.toString());
          lastError = error;
          delay = policy.delayFor(error, attempt);
        }
        else
        {
          return finish(hash, result, PollState::Errored, error);
        }
      }
      else
      {
        delay = policy.nextDelay(attempt);
      }

      if (!delay)
      {
        return finish(hash, result, PollState::TimedOut, exhausted(attempt + 1, lastError));
      }
      if (opts.cancel)
      {
        if (opts.cancel->waitFor(*delay))
        {
          return finish(hash, result, PollState::Cancelled,
                        ApiError::make(ErrorKind::Cancelled, "polling cancelled"));
        }
      }
      else
      {
        std::this_thread::sleep_for(*delay);
      }
    }
  }

  /// \brief Runs await() on its own thread. Keep opts.cancel to stop it.
  std::future<PollResult> awaitCompletionAsync(const std::string &hash,
                                               const CallOptions &opts = {}) const
  {
    TransactionPoller poller(*this);
    return std::async(std::launch::async,
                      [poller, hash, opts]() { return poller.await(hash, opts); });
  }

  /// \brief True when \p error means the node does not know the hash yet:
  /// a Fatal error carrying a not-found code, or a node message containing a
  /// not-found fragment.
  bool isNotFound(const ApiError &error) const
  {
    if (error.kind != ErrorKind::Fatal)
    {
      return false;
    }
    if (error.code)
    {
      for (const auto &code : _config.notFoundCodes)
      {
        if (*error.code == code)
          return true;
      }
    }
    if (error.fromNode)
    {
      std::string message = error.message;
      std::transform(message.begin(), message.end(), message.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      for (const auto &fragment : _config.notFoundMessages)
      {
        if (!fragment.empty() && message.find(fragment) != std::string::npos)
          return true;
      }
    }
    return _config.anyNotFoundStatus && error.httpStatus == 404;
  }

private:
  struct TickOutcome
  {
    std::optional<TransactionOnNetwork> transaction; ///< set when terminal
    std::optional<ApiError> error;
  };

  TickOutcome tickOnce(const std::string &hash, const CallOptions &tick) const
  {
    TickOutcome outcome;
    if (_config.useProcessStatus)
    {
      auto status = _proxy->getTransactionProcessStatus(hash, tick);
      if (!status)
      {
        outcome.error = status.error();
        return outcome;
      }
      if (!isTerminal(status.value().status))
      {
        return outcome;
      }
    }

    auto tx = _proxy->getTransaction(hash, _config.withResults, tick);
    if (!tx)
    {
      outcome.error = tx.error();
    }
    else if (isTerminal(tx.value().status))
    {
      outcome.transaction = std::move(tx).value();
    }
    return outcome;
  }

  static ApiError exhausted(std::size_t attempts, const std::optional<ApiError> &lastError)
  {
    std::string message = "transaction not final after " + std::to_string(attempts) + " poll(s)";
    if (lastError)
    {
      message += "; last error: " + lastError->message;
    }
    return ApiError::make(ErrorKind::TimedOut, message);
  }

  static PollResult finish(const std::string &hash, PollResult &result, PollState state,
                           std::optional<ApiError> error)
  {
    result.state = state;
    result.error = std::move(error);
    if (state == PollState::Succeeded || state == PollState::Failed)
    {
      DRTGW_LOG_INFO("TransactionPoller: " << hash << " -> " << toString(state) << " ("
                                           << result.transaction->rawStatus << ") after "
                                           << result.attempts << " poll(s)");
    }
    else
    {
      DRTGW_LOG_INFO("TransactionPoller: " << hash << " -> " << toString(state) << " after "
                                           << result.attempts << " poll(s)"
                                           << (result.error ? ": " + result.error->message : ""));
    }
    return result;
  }

  std::shared_ptr<const GatewayProxy> _proxy;
  Config _config;
};

} // namespace proxy
} // namespace drtgw
