// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Drtgw, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <drtgw/core/json.hpp>
#include <drtgw/core/logger.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace drtgw
{
namespace proxy
{

/// \brief Chain parameters needed to build valid transactions.
struct NetworkConfig
{
  std::string chainId;
  std::uint64_t minGasPrice{0};
  std::uint64_t minGasLimit{0};
  std::uint64_t gasPerDataByte{0};
  std::uint64_t roundDuration{0}; ///< milliseconds
  std::uint32_t numShardsWithoutMeta{0};
  std::uint32_t minTransactionVersion{0};
  std::uint32_t denomination{0};
  std::uint64_t startTime{0};
  std::optional<std::uint64_t> currentEpoch;
  std::optional<std::uint64_t> currentRound;
};

struct NetworkStatus
{
  std::uint64_t currentRound{0};
  std::uint64_t epochNumber{0};
  std::uint64_t nonce{0};
  std::uint64_t highestFinalNonce{0};
  std::uint64_t roundsPassedInCurrentEpoch{0};
  std::uint64_t roundsPerEpoch{0};
};

/// \brief Economics metrics; amounts are decimal strings.
struct NetworkEconomics
{
  std::string totalSupply;
  std::string totalStakedValue;
  std::string totalTopUpValue;
  std::string totalFees;
  std::string devRewards;
  std::string inflation;
  std::uint64_t epochForEconomicsData{0};
};

/// \brief Account snapshot; balance is kept exactly as the node sent it.
struct AccountInfo
{
  std::string address;
  std::string balance;
  std::uint64_t nonce{0};
  std::optional<std::string> username;
  std::optional<std::string> code;
  std::optional<std::string> codeHash;
  std::optional<std::string> rootHash;
  std::optional<std::string> ownerAddress;
  std::optional<std::string> developerReward;
};

/// \brief Key/value pairs (hex encoded) of an account's storage.
using AccountStorage = std::map<std::string, std::string>;

/// \brief Signed transaction handed over by the upstream builder.
struct TransactionRequest
{
  std::string payload; ///< serialized signed transaction JSON
  std::string sender;
  std::optional<std::string> hash; ///< set once broadcast
};

enum class TransactionStatus
{
  Pending,
  Success,
  Failed,
  Invalid
};

inline const char *toString(TransactionStatus status)
{
  switch (status)
  {
  case TransactionStatus::Pending:
    return "pending";
  case TransactionStatus::Success:
    return "success";
  case TransactionStatus::Failed:
    return "failed";
  case TransactionStatus::Invalid:
    return "invalid";
  }
  return "unknown";
}

inline bool isTerminal(TransactionStatus status) { return status != TransactionStatus::Pending; }

/// \brief Maps node status strings onto TransactionStatus. The node's set of
/// strings is open-ended, so entries can be added or overridden.
class StatusTable
{
public:
  StatusTable()
  {
    set("pending", TransactionStatus::Pending);
    set("received", TransactionStatus::Pending);
    set("partially-executed", TransactionStatus::Pending);
    set("success", TransactionStatus::Success);
    set("executed", TransactionStatus::Success);
    set("fail", TransactionStatus::Failed);
    set("failed", TransactionStatus::Failed);
    set("reward-reverted", TransactionStatus::Failed);
    set("invalid", TransactionStatus::Invalid);
  }

  /// \brief Table with no entries: everything maps to Pending.
  static StatusTable empty()
  {
    StatusTable table;
    table._entries.clear();
    return table;
  }

  void set(const std::string &nodeStatus, TransactionStatus status)
  {
    _entries[normalize(nodeStatus)] = status;
  }

  bool erase(const std::string &nodeStatus) { return _entries.erase(normalize(nodeStatus)) > 0; }

  std::optional<TransactionStatus> lookup(const std::string &nodeStatus) const
  {
    auto it = _entries.find(normalize(nodeStatus));
    if (it == _entries.end())
    {
      return std::nullopt;
    }
    return it->second;
  }

  /// \brief Unmapped strings count as Pending and are logged.
  TransactionStatus map(const std::string &nodeStatus) const
  {
    if (auto status = lookup(nodeStatus))
    {
      return *status;
    }
    DRTGW_LOG_WARN("StatusTable: unmapped transaction status '" << nodeStatus
                                                                << "', treating as pending");
    return TransactionStatus::Pending;
  }

  std::size_t size() const { return _entries.size(); }

  /// \brief Parses "pending", "success", "failed" or "invalid".
  static std::optional<TransactionStatus> parseStatus(const std::string &name)
  {
    std::string n = normalize(name);
    if (n == "pending")
      return TransactionStatus::Pending;
    if (n == "success")
      return TransactionStatus::Success;
    if (n == "failed")
      return TransactionStatus::Failed;
    if (n == "invalid")
      return TransactionStatus::Invalid;
    return std::nullopt;
  }

private:
  static std::string normalize(std::string s)
  {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }

  std::map<std::string, TransactionStatus> _entries;
};

/// \brief A transaction as reported by the node.
struct TransactionOnNetwork
{
  std::string hash;
  std::string type;
  std::string sender;
  std::string receiver;
  std::uint64_t nonce{0};
  std::string value;
  std::uint64_t gasPrice{0};
  std::uint64_t gasLimit{0};
  std::string data;
  std::string signature;
  TransactionStatus status{TransactionStatus::Pending};
  std::string rawStatus;
  std::optional<std::uint64_t> blockNonce;
  std::optional<std::string> blockHash;
  std::optional<std::uint64_t> round;
  std::optional<std::uint64_t> epoch;
  std::optional<std::string> miniblockHash;
  std::optional<std::uint64_t> timestamp;
  core::Json logs;                 ///< passed through untouched
  core::Json smartContractResults; ///< passed through untouched
};

struct TransactionProcessStatus
{
  TransactionStatus status{TransactionStatus::Pending};
  std::string rawStatus;
  std::string reason;
};

struct TransactionCost
{
  std::uint64_t gasUnits{0};
  std::string returnMessage;
};

struct TokenMetadata
{
  std::string identifier;
  std::string name;
  std::string ticker;
  std::string owner;
  std::uint32_t decimals{0};
  std::string supply;
  std::string type;
  core::Json properties; ///< every other field the node returned
};

struct HyperBlock
{
  std::uint64_t nonce{0};
  std::uint64_t round{0};
  std::uint64_t epoch{0};
  std::string hash;
  std::string prevBlockHash;
  std::uint64_t timestamp{0};
  std::uint32_t numTxs{0};
  std::vector<TransactionOnNetwork> transactions;
};

} // namespace proxy
} // namespace drtgw
