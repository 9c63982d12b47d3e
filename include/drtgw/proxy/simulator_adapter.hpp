// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Drtgw, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <drtgw/core/json.hpp>
#include <drtgw/core/logger.hpp>
#include <drtgw/proxy/gateway_proxy.hpp>
#include <drtgw/proxy/transaction_poller.hpp>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace drtgw
{
namespace proxy
{

/// \brief Chain simulator controls layered over a GatewayProxy.
/// \details Only constructible over a proxy whose configuration enables
/// simulator mode, so block production can never be requested from a
/// production gateway. Blocks are produced on demand, which lets
/// sendAndAwait() settle a transaction without wall-clock polling.
class SimulatorAdapter
{
public:
  struct Config
  {
    /// \brief Blocks generated after each sendTransaction(); 0 disables.
    std::uint32_t blocksAfterSend;
    /// \brief Upper bound on blocks produced by sendAndAwait().
    std::uint32_t maxBlocksToAwait;
    bool withResults;

    Config() : blocksAfterSend(0), maxBlocksToAwait(20), withResults(true) {}
  };

  /// \throws std::invalid_argument if \p proxy is null or not in
  /// simulator mode.
  explicit SimulatorAdapter(std::shared_ptr<const GatewayProxy> proxy, Config config = Config{})
      : _proxy(std::move(proxy)), _config(config)
  {
    if (!_proxy)
    {
      throw std::invalid_argument("SimulatorAdapter: proxy must not be null");
    }
    if (!_proxy->isSimulator())
    {
      throw std::invalid_argument("SimulatorAdapter: " + _proxy->config().baseUrl +
                                  " is not configured as a simulator");
    }
    if (_config.maxBlocksToAwait == 0)
    {
      throw std::invalid_argument("SimulatorAdapter: maxBlocksToAwait must be at least 1");
    }
  }

  const GatewayProxy &proxy() const { return *_proxy; }
  const Config &config() const { return _config; }

  Result<void> generateBlocks(std::uint32_t count, const CallOptions &opts = {}) const
  {
    if (count == 0)
    {
      return ApiError::make(ErrorKind::Fatal, "generateBlocks: count must be at least 1");
    }
    return control(Operation::SimulatorGenerateBlocks, {{"count", std::to_string(count)}},
                   std::nullopt, opts);
  }

  Result<void> generateBlocksUntilTransactionProcessed(const std::string &hash,
                                                       const CallOptions &opts = {}) const
  {
    return control(Operation::SimulatorGenerateBlocksUntilTransactionProcessed, {{"hash", hash}},
                   std::nullopt, opts);
  }

  Result<void> generateBlocksUntilEpochReached(std::uint32_t epoch,
                                               const CallOptions &opts = {}) const
  {
    return control(Operation::SimulatorGenerateBlocksUntilEpochReached,
                   {{"epoch", std::to_string(epoch)}}, std::nullopt, opts);
  }

  /// \brief Overwrites account state. \p accounts is a JSON array of
  /// account objects in the simulator's set-state format.
  Result<void> setState(const core::Json &accounts, const CallOptions &opts = {}) const
  {
    if (!accounts.is_array())
    {
      return ApiError::make(ErrorKind::Fatal, "setState: accounts must be a JSON array");
    }
    return control(Operation::SimulatorSetState, {}, accounts.dump(), opts);
  }

  /// \brief Credits \p receiver from the simulator's genesis funds.
  Result<void> sendUserFunds(const std::string &receiver, const CallOptions &opts = {}) const
  {
    return control(Operation::SimulatorSendUserFunds, {{"receiver", receiver}}, std::nullopt,
                   opts);
  }

  /// \brief Broadcasts \p payload, then produces Config::blocksAfterSend
  /// blocks. A failed block generation is returned as the error; its
  /// message names the already broadcast hash.
  Result<std::string> sendTransaction(const std::string &payload,
                                      const CallOptions &opts = {}) const
  {
    auto hash = _proxy->sendTransaction(payload, opts);
    if (!hash || _config.blocksAfterSend == 0)
    {
      return hash;
    }
    auto generated = generateBlocks(_config.blocksAfterSend, opts);
    if (!generated)
    {
      ApiError error = generated.error();
      error.message = "transaction " + hash.value() + " sent but " + error.message;
      return error;
    }
    return hash;
  }

  /// \brief Broadcasts \p payload and produces one block at a time until
  /// the transaction is final or Config::maxBlocksToAwait blocks were made.
  /// Nothing sleeps between blocks.
  PollResult sendAndAwait(const std::string &payload, const CallOptions &opts = {}) const
  {
    PollResult result;
    auto hash = _proxy->sendTransaction(payload, opts);
    if (!hash)
    {
      result.state = PollState::Errored;
      result.error = hash.error();
      return result;
    }
    return awaitByBlocks(hash.value(), opts);
  }

  /// \brief Block-driven wait for an already broadcast transaction.
  PollResult awaitByBlocks(const std::string &hash, const CallOptions &opts = {}) const
  {
    TransactionPoller poller(_proxy);
    CallOptions tick = opts;
    tick.retry = RetryPolicy::singleAttempt();

    PollResult result;
    for (std::uint32_t block = 0; block < _config.maxBlocksToAwait; ++block)
    {
      if (opts.cancel && opts.cancel->isCancelled())
      {
        result.state = PollState::Cancelled;
        result.error = ApiError::make(ErrorKind::Cancelled, "awaiting " + hash + " cancelled");
        return result;
      }
      auto generated = generateBlocks(1, tick);
      if (!generated)
      {
        return stop(result, hash, generated.error());
      }

      result.attempts = block + 1;
      auto tx = _proxy->getTransaction(hash, _config.withResults, tick);
      if (tx)
      {
        if (isTerminal(tx.value().status))
        {
          result.state = tx.value().status == TransactionStatus::Success ? PollState::Succeeded
                                                                         : PollState::Failed;
          result.transaction = std::move(tx).value();
          DRTGW_LOG_INFO("SimulatorAdapter: " << hash << " -> " << toString(result.state)
                                              << " after " << result.attempts << " block(s)");
          return result;
        }
      }
      else if (!poller.isNotFound(tx.error()))
      {
        return stop(result, hash, tx.error());
      }
    }
    result.state = PollState::TimedOut;
    result.error = ApiError::make(ErrorKind::TimedOut,
                                  "transaction " + hash + " not final after " +
                                      std::to_string(_config.maxBlocksToAwait) + " block(s)");
    DRTGW_LOG_INFO("SimulatorAdapter: " << hash << " -> TimedOut");
    return result;
  }

private:
  Result<void> control(Operation op, const EndpointParams &params,
                       const std::optional<std::string> &body, const CallOptions &opts) const
  {
    DRTGW_LOG_DEBUG("SimulatorAdapter: " << toString(op));
    auto reply = _proxy->call(op, params, body, opts, true);
    if (!reply)
    {
      return reply.error();
    }
    return Result<void>::success();
  }

  static PollResult stop(PollResult &result, const std::string &hash, const ApiError &error)
  {
    switch (error.kind)
    {
    case ErrorKind::Cancelled:
      result.state = PollState::Cancelled;
      break;
    case ErrorKind::TimedOut:
      result.state = PollState::TimedOut;
      break;
    default:
      result.state = PollState::Errored;
      break;
    }
    result.error = error;
    DRTGW_LOG_INFO("SimulatorAdapter: " << hash << " -> " << toString(result.state) << ": "
                                        << error.message);
    return result;
  }

  std::shared_ptr<const GatewayProxy> _proxy;
  Config _config;
};

} // namespace proxy
} // namespace drtgw
