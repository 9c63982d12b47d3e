// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Drtgw, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <drtgw/network/transport.hpp>
#include <drtgw/proxy/api_error.hpp>
#include <drtgw/proxy/result.hpp>

#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace drtgw
{
namespace proxy
{

/// \brief Shard id the gateway uses for the metachain.
constexpr std::uint32_t METACHAIN_SHARD_ID = 4294967295u;

enum class ApiVersion
{
  V1,
  V2
};

inline const char *toString(ApiVersion version) { return version == ApiVersion::V2 ? "v2" : "v1"; }

inline std::optional<ApiVersion> parseApiVersion(const std::string &tag)
{
  if (tag == "v1" || tag == "V1")
    return ApiVersion::V1;
  if (tag == "v2" || tag == "V2")
    return ApiVersion::V2;
  return std::nullopt;
}

enum class Operation
{
  GetNetworkConfig,
  GetNetworkEconomics,
  GetNetworkStatus,
  GetAccount,
  GetAccountStorage,
  SendTransaction,
  SendTransactions,
  GetTransaction,
  GetTransactionStatus,
  GetTransactionProcessStatus,
  EstimateTransactionCost,
  GetToken,
  GetHyperBlockByNonce,
  GetHyperBlockByHash,
  SimulatorGenerateBlocks,
  SimulatorGenerateBlocksUntilTransactionProcessed,
  SimulatorGenerateBlocksUntilEpochReached,
  SimulatorSetState,
  SimulatorSendUserFunds
};

inline const char *toString(Operation op)
{
  switch (op)
  {
  case Operation::GetNetworkConfig:
    return "GetNetworkConfig";
  case Operation::GetNetworkEconomics:
    return "GetNetworkEconomics";
  case Operation::GetNetworkStatus:
    return "GetNetworkStatus";
  case Operation::GetAccount:
    return "GetAccount";
  case Operation::GetAccountStorage:
    return "GetAccountStorage";
  case Operation::SendTransaction:
    return "SendTransaction";
  case Operation::SendTransactions:
    return "SendTransactions";
  case Operation::GetTransaction:
    return "GetTransaction";
  case Operation::GetTransactionStatus:
    return "GetTransactionStatus";
  case Operation::GetTransactionProcessStatus:
    return "GetTransactionProcessStatus";
  case Operation::EstimateTransactionCost:
    return "EstimateTransactionCost";
  case Operation::GetToken:
    return "GetToken";
  case Operation::GetHyperBlockByNonce:
    return "GetHyperBlockByNonce";
  case Operation::GetHyperBlockByHash:
    return "GetHyperBlockByHash";
  case Operation::SimulatorGenerateBlocks:
    return "SimulatorGenerateBlocks";
  case Operation::SimulatorGenerateBlocksUntilTransactionProcessed:
    return "SimulatorGenerateBlocksUntilTransactionProcessed";
  case Operation::SimulatorGenerateBlocksUntilEpochReached:
    return "SimulatorGenerateBlocksUntilEpochReached";
  case Operation::SimulatorSetState:
    return "SimulatorSetState";
  case Operation::SimulatorSendUserFunds:
    return "SimulatorSendUserFunds";
  }
  return "Unknown";
}

/// \brief One catalog row. Placeholders are written {name}.
struct EndpointSpec
{
  network::HttpMethod method;
  std::string pathTemplate;
  bool idempotent;
  bool simulatorOnly;
};

struct ResolvedEndpoint
{
  Operation operation;
  network::HttpMethod method;
  std::string path; ///< relative to the base URL, no leading slash
  bool idempotent;
  bool simulatorOnly;
};

using EndpointParams = std::map<std::string, std::string>;

/// \brief Maps logical operations to HTTP method and path for one API
/// version. Pure lookup; performs no I/O.
class EndpointCatalog
{
public:
  explicit EndpointCatalog(ApiVersion version = ApiVersion::V1) : _version(version) {}

  ApiVersion version() const { return _version; }

  const EndpointSpec *find(Operation op) const
  {
    const auto &rows = table(_version);
    auto it = rows.find(op);
    return it == rows.end() ? nullptr : &it->second;
  }

  /// \brief Resolve by name, e.g. "GetAccount". Unknown names are Fatal.
  Result<ResolvedEndpoint> resolve(const std::string &operationName,
                                   const EndpointParams &params) const
  {
    for (const auto &row : table(_version))
    {
      if (operationName == toString(row.first))
      {
        return resolve(row.first, params);
      }
    }
    return ApiError::make(ErrorKind::Fatal, "unknown operation '" + operationName + "'");
  }

  Result<ResolvedEndpoint> resolve(Operation op, const EndpointParams &params) const
  {
    const EndpointSpec *spec = find(op);
    if (!spec)
    {
      return ApiError::make(ErrorKind::Fatal, std::string("operation ") + toString(op) +
                                                  " is not available in API " +
                                                  toString(_version));
    }

    std::string path;
    const std::string &tpl = spec->pathTemplate;
    std::size_t pos = 0;
    while (pos < tpl.size())
    {
      std::size_t open = tpl.find('{', pos);
      if (open == std::string::npos)
      {
        path.append(tpl, pos, std::string::npos);
        break;
      }
      std::size_t close = tpl.find('}', open);
      path.append(tpl, pos, open - pos);
      std::string name = tpl.substr(open + 1, close - open - 1);
      auto it = params.find(name);
      if (it == params.end() || it->second.empty())
      {
        return ApiError::make(ErrorKind::Fatal, std::string("missing parameter '") + name +
                                                    "' for " + toString(op));
      }
      path += urlEncode(it->second);
      pos = close + 1;
    }
    return Result<ResolvedEndpoint>::success(
        ResolvedEndpoint{op, spec->method, path, spec->idempotent, spec->simulatorOnly});
  }

  /// \brief Percent-encodes everything except RFC 3986 unreserved characters.
  static std::string urlEncode(const std::string &value)
  {
    static const char *hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : value)
    {
      if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
      {
        out += static_cast<char>(c);
      }
      else
      {
        out += '%';
        out += hex[c >> 4];
        out += hex[c & 0x0F];
      }
    }
    return out;
  }

private:
  using Rows = std::map<Operation, EndpointSpec>;

  static const Rows &table(ApiVersion version)
  {
    using network::HttpMethod;
    static const Rows v1 = {
        {Operation::GetNetworkConfig, {HttpMethod::Get, "network/config", true, false}},
        {Operation::GetNetworkEconomics, {HttpMethod::Get, "network/economics", true, false}},
        {Operation::GetNetworkStatus, {HttpMethod::Get, "network/status/{shard}", true, false}},
        {Operation::GetAccount, {HttpMethod::Get, "address/{address}", true, false}},
        {Operation::GetAccountStorage, {HttpMethod::Get, "address/{address}/keys", true, false}},
        {Operation::SendTransaction, {HttpMethod::Post, "transaction/send", false, false}},
        {Operation::SendTransactions,
         {HttpMethod::Post, "transaction/send-multiple", false, false}},
        {Operation::GetTransaction,
         {HttpMethod::Get, "transaction/{hash}?withResults={withResults}", true, false}},
        {Operation::GetTransactionStatus,
         {HttpMethod::Get, "transaction/{hash}/status", true, false}},
        {Operation::GetTransactionProcessStatus,
         {HttpMethod::Get, "transaction/{hash}/process-status", true, false}},
        {Operation::EstimateTransactionCost, {HttpMethod::Post, "transaction/cost", true, false}},
        {Operation::GetToken, {HttpMethod::Get, "token/{identifier}", true, false}},
        {Operation::GetHyperBlockByNonce,
         {HttpMethod::Get, "hyperblock/by-nonce/{nonce}", true, false}},
        {Operation::GetHyperBlockByHash,
         {HttpMethod::Get, "hyperblock/by-hash/{hash}", true, false}},
        {Operation::SimulatorGenerateBlocks,
         {HttpMethod::Post, "simulator/generate-blocks/{count}", false, true}},
        {Operation::SimulatorGenerateBlocksUntilTransactionProcessed,
         {HttpMethod::Post, "simulator/generate-blocks-until-transaction-processed/{hash}", false,
          true}},
        {Operation::SimulatorGenerateBlocksUntilEpochReached,
         {HttpMethod::Post, "simulator/generate-blocks-until-epoch-reached/{epoch}", false, true}},
        {Operation::SimulatorSetState, {HttpMethod::Post, "simulator/set-state", false, true}},
        {Operation::SimulatorSendUserFunds,
         {HttpMethod::Post, "transaction/send-user-funds?receiver={receiver}", false, true}},
    };
    static const Rows v2 = [] {
      Rows rows = v1;
      rows[Operation::GetAccount].pathTemplate = "accounts/{address}";
      rows[Operation::GetAccountStorage].pathTemplate = "accounts/{address}/keys";
      rows[Operation::SendTransaction].pathTemplate = "transactions";
      rows[Operation::SendTransactions].pathTemplate = "transactions/batch";
      rows[Operation::GetTransaction].pathTemplate =
          "transactions/{hash}?withResults={withResults}";
      rows[Operation::GetTransactionStatus].pathTemplate = "transactions/{hash}/status";
      rows[Operation::GetTransactionProcessStatus].pathTemplate =
          "transactions/{hash}/process-status";
      rows[Operation::EstimateTransactionCost].pathTemplate = "transactions/cost";
      rows[Operation::GetToken].pathTemplate = "tokens/{identifier}";
      rows[Operation::GetHyperBlockByNonce].pathTemplate = "hyperblocks/by-nonce/{nonce}";
      rows[Operation::GetHyperBlockByHash].pathTemplate = "hyperblocks/by-hash/{hash}";
      return rows;
    }();
    return version == ApiVersion::V2 ? v2 : v1;
  }

  ApiVersion _version;
};

} // namespace proxy
} // namespace drtgw
