// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Drtgw, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <drtgw/core/cancellation_token.hpp>
#include <drtgw/core/json.hpp>
#include <drtgw/core/logger.hpp>
#include <drtgw/network/http_transport.hpp>
#include <drtgw/network/transport.hpp>
#include <drtgw/proxy/api_error.hpp>
#include <drtgw/proxy/client_config.hpp>
#include <drtgw/proxy/decoders.hpp>
#include <drtgw/proxy/endpoint_catalog.hpp>
#include <drtgw/proxy/error_classifier.hpp>
#include <drtgw/proxy/result.hpp>
#include <drtgw/proxy/retry_policy.hpp>
#include <drtgw/proxy/types.hpp>

#include <chrono>
#include <cstdint>
#include <map>
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

/// \brief Per-call overrides. Everything is optional.
struct CallOptions
{
  /// \brief Absolute point after which no further attempt is started.
  std::optional<network::MonoTime> deadline;
  std::shared_ptr<core::CancellationToken> cancel;
  /// \brief Per-attempt timeout; defaults to ClientConfig::timeout.
  std::optional<std::chrono::milliseconds> timeout;
  /// \brief Replaces ClientConfig::retry for this call.
  std::optional<RetryPolicy> retry;
};

class SimulatorAdapter;

/// \brief Client for a gateway/observer node's HTTP API.
/// \details
///   - Each operation resolves its endpoint, performs the request and
///     decodes the envelope into a typed value or an ApiError
///   - Idempotent reads are retried on Transient, RateLimited and Timeout
///     errors following the configured RetryPolicy
///   - Broadcasts are never retried
///   - Simulator control endpoints are only reachable via SimulatorAdapter
///   - Immutable after construction and safe to share between threads
class GatewayProxy
{
public:
  /// \throws std::invalid_argument for an invalid configuration or a null
  /// transport.
  GatewayProxy(ClientConfig config, std::shared_ptr<network::Transport> transport)
      : _config(std::move(config)), _transport(std::move(transport)),
        _catalog(_config.apiVersion), _classifier(_config.classifier), _retry(_config.retry)
  {
    _config.validate();
    if (!_transport)
    {
      throw std::invalid_argument("GatewayProxy: transport must not be null");
    }
    while (!_config.baseUrl.empty() && _config.baseUrl.back() == '/')
    {
      _config.baseUrl.pop_back();
    }
  }

  /// \brief Uses a private HttpTransport.
  explicit GatewayProxy(ClientConfig config)
      : GatewayProxy(std::move(config), std::make_shared<network::HttpTransport>())
  {
  }

  const ClientConfig &config() const { return _config; }
  bool isSimulator() const { return _config.simulatorMode; }
  const EndpointCatalog &catalog() const { return _catalog; }
  const std::shared_ptr<network::Transport> &transport() const { return _transport; }

  Result<NetworkConfig> getNetworkConfig(const CallOptions &opts = {}) const
  {
    return fetch<NetworkConfig>(Operation::GetNetworkConfig, {}, std::nullopt, opts,
                                [](const core::Json &p) { return decode::networkConfig(p); });
  }

  Result<NetworkEconomics> getNetworkEconomics(const CallOptions &opts = {}) const
  {
    return fetch<NetworkEconomics>(Operation::GetNetworkEconomics, {}, std::nullopt, opts,
                                   [](const core::Json &p) { return decode::networkEconomics(p); });
  }

  Result<NetworkStatus> getNetworkStatus(std::uint32_t shard = METACHAIN_SHARD_ID,
                                         const CallOptions &opts = {}) const
  {
    return fetch<NetworkStatus>(Operation::GetNetworkStatus, {{"shard", std::to_string(shard)}},
                                std::nullopt, opts,
                                [](const core::Json &p) { return decode::networkStatus(p); });
  }

  /// \brief Nonce of the latest metachain block.
  Result<std::uint64_t> getLatestHyperBlockNonce(const CallOptions &opts = {}) const
  {
    auto status = getNetworkStatus(METACHAIN_SHARD_ID, opts);
    if (!status)
    {
      return status.error();
    }
    return Result<std::uint64_t>::success(status.value().nonce);
  }

  Result<HyperBlock> getHyperBlockByNonce(std::uint64_t nonce, const CallOptions &opts = {}) const
  {
    return fetch<HyperBlock>(Operation::GetHyperBlockByNonce, {{"nonce", std::to_string(nonce)}},
                             std::nullopt, opts, [this](const core::Json &p)
                             { return decode::hyperBlock(p, _config.statusTable); });
  }

  Result<HyperBlock> getHyperBlockByHash(const std::string &hash, const CallOptions &opts = {}) const
  {
    return fetch<HyperBlock>(Operation::GetHyperBlockByHash, {{"hash", hash}}, std::nullopt, opts,
                             [this](const core::Json &p)
                             { return decode::hyperBlock(p, _config.statusTable); });
  }

  /// \brief Latest hyper block: status lookup followed by a fetch by nonce.
  Result<HyperBlock> getLatestHyperBlock(const CallOptions &opts = {}) const
  {
    auto nonce = getLatestHyperBlockNonce(opts);
    if (!nonce)
    {
      return nonce.error();
    }
    return getHyperBlockByNonce(nonce.value(), opts);
  }

  Result<AccountInfo> getAccount(const std::string &address, const CallOptions &opts = {}) const
  {
    return fetch<AccountInfo>(Operation::GetAccount, {{"address", address}}, std::nullopt, opts,
                              [&address](const core::Json &p)
                              { return decode::account(p, address); });
  }

  Result<AccountStorage> getAccountStorage(const std::string &address,
                                           const CallOptions &opts = {}) const
  {
    return fetch<AccountStorage>(Operation::GetAccountStorage, {{"address", address}},
                                 std::nullopt, opts,
                                 [](const core::Json &p) { return decode::accountStorage(p); });
  }

  /// \brief Broadcasts one signed transaction; returns its hash. Never
  /// retried: a failure is returned to the caller as classified.
  Result<std::string> sendTransaction(const std::string &payload,
                                      const CallOptions &opts = {}) const
  {
    if (payload.empty())
    {
      return ApiError::make(ErrorKind::Fatal, "empty transaction payload");
    }
    return fetch<std::string>(Operation::SendTransaction, {}, payload, opts,
                              [](const core::Json &p) { return decode::txHash(p); });
  }

  /// \brief As above; stores the hash into \p request on success.
  Result<std::string> sendTransaction(TransactionRequest &request,
                                      const CallOptions &opts = {}) const
  {
    auto hash = sendTransaction(request.payload, opts);
    if (hash)
    {
      request.hash = hash.value();
    }
    return hash;
  }

  /// \brief Broadcasts a batch. The result maps batch position to hash; a
  /// position missing from the map was not accepted by the node.
  Result<std::map<std::size_t, std::string>>
  sendTransactions(const std::vector<std::string> &payloads, const CallOptions &opts = {}) const
  {
    if (payloads.empty())
    {
      return ApiError::make(ErrorKind::Fatal, "empty transaction batch");
    }
    std::string body = "[";
    for (std::size_t i = 0; i < payloads.size(); ++i)
    {
      if (payloads[i].empty())
      {
        return ApiError::make(ErrorKind::Fatal,
                              "empty transaction payload at index " + std::to_string(i));
      }
      if (i > 0)
      {
        body += ",";
      }
      body += payloads[i];
    }
    body += "]";
    return fetch<std::map<std::size_t, std::string>>(
        Operation::SendTransactions, {}, body, opts,
        [](const core::Json &p) { return decode::txHashes(p); });
  }

  Result<TransactionOnNetwork> getTransaction(const std::string &hash, bool withResults = false,
                                              const CallOptions &opts = {}) const
  {
    return fetch<TransactionOnNetwork>(
        Operation::GetTransaction,
        {{"hash", hash}, {"withResults", withResults ? "true" : "false"}}, std::nullopt, opts,
        [this, &hash](const core::Json &p)
        { return decode::transaction(p, _config.statusTable, hash); });
  }

  /// \brief Status only; reason is always empty.
  Result<TransactionProcessStatus> getTransactionStatus(const std::string &hash,
                                                        const CallOptions &opts = {}) const
  {
    return fetch<TransactionProcessStatus>(Operation::GetTransactionStatus, {{"hash", hash}},
                                           std::nullopt, opts,
                                           [this](const core::Json &p)
                                           {
                                             auto s = decode::transactionStatus(p, _config.statusTable);
                                             return TransactionProcessStatus{s.first, s.second, ""};
                                           });
  }

  Result<TransactionProcessStatus> getTransactionProcessStatus(const std::string &hash,
                                                               const CallOptions &opts = {}) const
  {
    return fetch<TransactionProcessStatus>(
        Operation::GetTransactionProcessStatus, {{"hash", hash}}, std::nullopt, opts,
        [this](const core::Json &p) { return decode::processStatus(p, _config.statusTable); });
  }

  /// \brief Simulates execution to estimate gas; safe to retry.
  Result<TransactionCost> estimateTransactionCost(const std::string &payload,
                                                  const CallOptions &opts = {}) const
  {
    if (payload.empty())
    {
      return ApiError::make(ErrorKind::Fatal, "empty transaction payload");
    }
    return fetch<TransactionCost>(Operation::EstimateTransactionCost, {}, payload, opts,
                                  [](const core::Json &p) { return decode::transactionCost(p); });
  }

  Result<TokenMetadata> getToken(const std::string &identifier, const CallOptions &opts = {}) const
  {
    return fetch<TokenMetadata>(Operation::GetToken, {{"identifier", identifier}}, std::nullopt,
                                opts, [](const core::Json &p) { return decode::token(p); });
  }

private:
  friend class SimulatorAdapter;

  template <typename T, typename DecodeFn>
  Result<T> fetch(Operation op, const EndpointParams &params,
                  const std::optional<std::string> &body, const CallOptions &opts,
                  DecodeFn decodeFn, bool viaSimulator = false) const
  {
    auto payload = call(op, params, body, opts, viaSimulator);
    if (!payload)
    {
      return payload.error();
    }
    try
    {
      return Result<T>::success(decodeFn(payload.value()));
    }
    catch (const decode::DecodeError &e)
    {
      return ApiError::make(ErrorKind::Decode, std::string(toString(op)) + ": " + e.what());
    }
    catch (const core::Json::exception &e)
    {
      return ApiError::make(ErrorKind::Decode, std::string(toString(op)) + ": " + e.what());
    }
  }

  /// \brief One logical call: resolve, then attempt until success, a
  /// non-retryable error, cancellation or the end of the retry budget.
  Result<core::Json> call(Operation op, const EndpointParams &params,
                          const std::optional<std::string> &body, const CallOptions &opts,
                          bool viaSimulator) const
  {
    auto resolved = _catalog.resolve(op, params);
    if (!resolved)
    {
      return resolved.error();
    }
    const ResolvedEndpoint &endpoint = resolved.value();
    if (endpoint.simulatorOnly && !(viaSimulator && _config.simulatorMode))
    {
      return ApiError::make(ErrorKind::Fatal, std::string(toString(op)) +
                                                  " is only available through a simulator adapter");
    }

    RetryPolicy policy = opts.retry ? *opts.retry : _retry;
    if (!endpoint.idempotent)
    {
      RetryPolicy single = RetryPolicy::singleAttempt();
      policy = policy.deadline() ? single.withDeadline(*policy.deadline()) : single;
    }
    if (opts.deadline)
    {
      policy = policy.withDeadline(*opts.deadline);
    }

    network::HttpRequest request;
    request.method = endpoint.method;
    request.url = _config.baseUrl + "/" + endpoint.path;
    request.body = body;
    request.cancel = opts.cancel;
    const auto timeout = opts.timeout.value_or(_config.timeout);

    std::optional<ApiError> last;
    for (std::size_t attempt = 0;; ++attempt)
    {
      if (opts.cancel && opts.cancel->isCancelled())
      {
        return ApiError::make(ErrorKind::Cancelled,
                              std::string(toString(op)) + " cancelled" +
                                  (last ? " after: " + last->message : std::string()));
      }
      auto now = network::MonoClock::now();
      if (policy.deadlineExpired(now))
      {
        return timedOut(op, attempt, last);
      }
      request.timeout = timeout;
      if (policy.deadline())
      {
        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(*policy.deadline() - now);
        request.timeout = std::max(std::chrono::milliseconds(1), std::min(timeout, remaining));
      }

      DRTGW_LOG_DEBUG("GatewayProxy: " << toString(op) << " " << network::toString(request.method)
                                       << " " << request.url << " attempt " << (attempt + 1));
      auto outcome = _transport->execute(request);
      std::optional<ApiError> failure =
          outcome.ok ? interpret(outcome.response) : _classifier.classify(outcome.failure);
      if (!failure)
      {
        try
        {
          return Result<core::Json>::success(decode::unwrapData(outcome.response.body));
        }
        catch (const decode::DecodeError &e)
        {
          return ApiError::make(ErrorKind::Decode, std::string(toString(op)) + ": " + e.what(),
                                std::nullopt, outcome.response.statusCode);
        }
      }
      const ApiError &error = *failure;

      if (!error.retryable())
      {
        if (error.kind != ErrorKind::Cancelled)
        {
          DRTGW_LOG_DEBUG("GatewayProxy: " << toString(op) << " failed: " << error.toString());
        }
        return error;
      }

      auto delay = policy.delayFor(error, attempt);
      if (!delay)
      {
        if (attempt == 0 && policy.maxAttempts() == 1 && !policy.deadlineExpired())
        {
          // No retry was ever allowed; report the failure as classified.
          return error;
        }
        return timedOut(op, attempt + 1, error);
      }
      DRTGW_LOG_WARN("GatewayProxy: " << toString(op) << " attempt " << (attempt + 1)
                                      << " failed (" << error.toString() << "), retrying in "
                                      << delay->count() << "ms");
      last = error;
      if (opts.cancel)
      {
        if (opts.cancel->waitFor(*delay))
        {
          return ApiError::make(ErrorKind::Cancelled,
                                std::string(toString(op)) + " cancelled after: " + error.message);
        }
      }
      else
      {
        std::this_thread::sleep_for(*delay);
      }
    }
  }

  /// \brief nullopt for a 2xx response without a node error.
  std::optional<ApiError> interpret(const network::RawResponse &response) const
  {
    if (!response.success())
    {
      return _classifier.classify(response);
    }
    ErrorEnvelope envelope = ErrorClassifier::parseEnvelope(response.body);
    if (envelope.isJsonObject && !envelope.error.empty())
    {
      return _classifier.classify(response);
    }
    return std::nullopt;
  }

  static ApiError timedOut(Operation op, std::size_t attempts, const std::optional<ApiError> &last)
  {
    std::string message = std::string(toString(op)) + " gave up after " +
                          std::to_string(attempts) + " attempt(s)";
    if (last)
    {
      message += ": " + last->message;
      return ApiError::make(ErrorKind::TimedOut, message, last->code, last->httpStatus);
    }
    return ApiError::make(ErrorKind::TimedOut, message);
  }

  ClientConfig _config;
  std::shared_ptr<network::Transport> _transport;
  EndpointCatalog _catalog;
  ErrorClassifier _classifier;
  RetryPolicy _retry;
};

} // namespace proxy
} // namespace drtgw
