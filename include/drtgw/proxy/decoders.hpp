// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Drtgw, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <drtgw/core/json.hpp>
#include <drtgw/proxy/types.hpp>

#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace drtgw
{
namespace proxy
{
/// \brief Turns gateway JSON payloads into typed values. Unknown fields are
/// ignored; a missing or mistyped required field raises DecodeError.
namespace decode
{

class DecodeError : public std::runtime_error
{
public:
  explicit DecodeError(const std::string &what) : std::runtime_error(what) {}
};

/// \brief Parses a response body and returns its "data" member, or the
/// whole document when there is none.
inline core::Json unwrapData(const std::string &body)
{
  core::Json json = core::Json::parse(body, nullptr, false);
  if (json.is_discarded())
  {
    throw DecodeError("response body is not valid JSON");
  }
  if (!json.is_object())
  {
    throw DecodeError("response body is not a JSON object");
  }
  auto data = json.find("data");
  if (data == json.end())
  {
    return json;
  }
  if (data->is_null())
  {
    // Control endpoints acknowledge with "data": null.
    return core::Json::object();
  }
  if (!data->is_object() && !data->is_array())
  {
    throw DecodeError("envelope \"data\" is not an object");
  }
  return *data;
}

/// \brief Returns payload[name] when it is an object, else payload itself.
inline const core::Json &section(const core::Json &payload, const char *name)
{
  if (payload.is_object())
  {
    auto it = payload.find(name);
    if (it != payload.end() && it->is_object())
    {
      return *it;
    }
  }
  if (!payload.is_object())
  {
    throw DecodeError(std::string("expected an object for \"") + name + "\"");
  }
  return payload;
}

inline const core::Json *member(const core::Json &obj, const char *key)
{
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null())
  {
    return nullptr;
  }
  return &*it;
}

inline std::optional<std::string> optString(const core::Json &obj, const char *key)
{
  const core::Json *v = member(obj, key);
  if (!v)
  {
    return std::nullopt;
  }
  if (v->is_string())
  {
    return v->get<std::string>();
  }
  if (v->is_number_integer() || v->is_number_unsigned())
  {
    // Numeric text keeps every digit.
    return v->dump();
  }
  throw DecodeError(std::string("field \"") + key + "\" is not a string");
}

inline std::string reqString(const core::Json &obj, const char *key)
{
  auto v = optString(obj, key);
  if (!v)
  {
    throw DecodeError(std::string("missing required field \"") + key + "\"");
  }
  return *v;
}

inline std::optional<std::uint64_t> optUint(const core::Json &obj, const char *key)
{
  const core::Json *v = member(obj, key);
  if (!v)
  {
    return std::nullopt;
  }
  if (v->is_number_unsigned())
  {
    return v->get<std::uint64_t>();
  }
  if (v->is_number_integer() && v->get<std::int64_t>() >= 0)
  {
    return static_cast<std::uint64_t>(v->get<std::int64_t>());
  }
  if (v->is_string())
  {
    const std::string &s = v->get_ref<const std::string &>();
    bool digits = !s.empty() && s.size() <= 20;
    for (char c : s)
    {
      digits = digits && std::isdigit(static_cast<unsigned char>(c));
    }
    if (digits)
    {
      try
      {
        return std::stoull(s);
      }
      catch (const std::out_of_range &)
      {
        throw DecodeError(std::string("field \"") + key + "\" is out of range");
      }
    }
  }
  throw DecodeError(std::string("field \"") + key + "\" is not an unsigned integer");
}

inline std::uint64_t reqUint(const core::Json &obj, const char *key)
{
  auto v = optUint(obj, key);
  if (!v)
  {
    throw DecodeError(std::string("missing required field \"") + key + "\"");
  }
  return *v;
}

inline std::uint32_t optUint32(const core::Json &obj, const char *key)
{
  std::uint64_t v = optUint(obj, key).value_or(0);
  if (v > 0xFFFFFFFFull)
  {
    throw DecodeError(std::string("field \"") + key + "\" is out of range");
  }
  return static_cast<std::uint32_t>(v);
}

/// \brief Numbers rendered as text, strings as-is (e.g. "inflation").
inline std::string optText(const core::Json &obj, const char *key)
{
  const core::Json *v = member(obj, key);
  if (!v)
  {
    return "";
  }
  return v->is_string() ? v->get<std::string>() : v->dump();
}

inline NetworkConfig networkConfig(const core::Json &payload)
{
  const core::Json &c = section(payload, "config");
  NetworkConfig cfg;
  cfg.chainId = reqString(c, "erd_chain_id");
  cfg.minGasPrice = reqUint(c, "erd_min_gas_price");
  cfg.minGasLimit = reqUint(c, "erd_min_gas_limit");
  cfg.gasPerDataByte = reqUint(c, "erd_gas_per_data_byte");
  cfg.roundDuration = reqUint(c, "erd_round_duration");
  cfg.numShardsWithoutMeta = optUint32(c, "erd_num_shards_without_meta");
  cfg.minTransactionVersion = optUint32(c, "erd_min_transaction_version");
  cfg.denomination = optUint32(c, "erd_denomination");
  cfg.startTime = optUint(c, "erd_start_time").value_or(0);
  cfg.currentEpoch = optUint(c, "erd_epoch_number");
  cfg.currentRound = optUint(c, "erd_current_round");
  return cfg;
}

inline NetworkStatus networkStatus(const core::Json &payload)
{
  const core::Json &s = section(payload, "status");
  NetworkStatus status;
  status.currentRound = reqUint(s, "erd_current_round");
  status.nonce = reqUint(s, "erd_nonce");
  status.epochNumber = optUint(s, "erd_epoch_number").value_or(0);
  status.highestFinalNonce = optUint(s, "erd_highest_final_nonce").value_or(0);
  status.roundsPassedInCurrentEpoch = optUint(s, "erd_rounds_passed_in_current_epoch").value_or(0);
  status.roundsPerEpoch = optUint(s, "erd_rounds_per_epoch").value_or(0);
  return status;
}

inline NetworkEconomics networkEconomics(const core::Json &payload)
{
  const core::Json &m = section(payload, "metrics");
  NetworkEconomics e;
  e.totalSupply = reqString(m, "erd_total_supply");
  e.totalStakedValue = optText(m, "erd_total_staked_value");
  e.totalTopUpValue = optText(m, "erd_total_top_up_value");
  e.totalFees = optText(m, "erd_total_fees");
  e.devRewards = optText(m, "erd_dev_rewards");
  e.inflation = optText(m, "erd_inflation");
  e.epochForEconomicsData = optUint(m, "erd_epoch_for_economics_data").value_or(0);
  return e;
}

/// \brief \p address fills AccountInfo::address when the node omits it.
inline AccountInfo account(const core::Json &payload, const std::string &address)
{
  const core::Json &a = section(payload, "account");
  AccountInfo info;
  info.address = optString(a, "address").value_or(address);
  info.balance = reqString(a, "balance");
  info.nonce = reqUint(a, "nonce");
  info.username = optString(a, "username");
  info.code = optString(a, "code");
  info.codeHash = optString(a, "codeHash");
  info.rootHash = optString(a, "rootHash");
  info.ownerAddress = optString(a, "ownerAddress");
  info.developerReward = optString(a, "developerReward");
  return info;
}

inline AccountStorage accountStorage(const core::Json &payload)
{
  const core::Json *pairs = payload.is_object() ? member(payload, "pairs") : nullptr;
  if (!pairs)
  {
    throw DecodeError("missing required field \"pairs\"");
  }
  if (!pairs->is_object())
  {
    throw DecodeError("field \"pairs\" is not an object");
  }
  AccountStorage storage;
  for (auto it = pairs->begin(); it != pairs->end(); ++it)
  {
    if (!it.value().is_string())
    {
      throw DecodeError("storage value for \"" + it.key() + "\" is not a string");
    }
    storage.emplace(it.key(), it.value().get<std::string>());
  }
  return storage;
}

/// \brief Decodes a bare transaction object (no "transaction" wrapper).
inline TransactionOnNetwork transactionObject(const core::Json &t, const StatusTable &statuses,
                                              const std::string &hash = "")
{
  if (!t.is_object())
  {
    throw DecodeError("transaction is not an object");
  }
  TransactionOnNetwork tx;
  tx.hash = optString(t, "hash").value_or(hash);
  tx.type = optString(t, "type").value_or("");
  tx.sender = reqString(t, "sender");
  tx.receiver = reqString(t, "receiver");
  tx.nonce = reqUint(t, "nonce");
  tx.rawStatus = reqString(t, "status");
  tx.status = statuses.map(tx.rawStatus);
  tx.value = optString(t, "value").value_or("0");
  tx.gasPrice = optUint(t, "gasPrice").value_or(0);
  tx.gasLimit = optUint(t, "gasLimit").value_or(0);
  tx.data = optString(t, "data").value_or("");
  tx.signature = optString(t, "signature").value_or("");
  tx.blockNonce = optUint(t, "blockNonce");
  tx.blockHash = optString(t, "blockHash");
  tx.round = optUint(t, "round");
  tx.epoch = optUint(t, "epoch");
  tx.miniblockHash = optString(t, "miniblockHash");
  tx.timestamp = optUint(t, "timestamp");
  if (const core::Json *logs = member(t, "logs"))
  {
    tx.logs = *logs;
  }
  if (const core::Json *results = member(t, "smartContractResults"))
  {
    tx.smartContractResults = *results;
  }
  return tx;
}

inline TransactionOnNetwork transaction(const core::Json &payload, const StatusTable &statuses,
                                        const std::string &hash)
{
  return transactionObject(section(payload, "transaction"), statuses, hash);
}

inline std::string txHash(const core::Json &payload)
{
  if (!payload.is_object())
  {
    throw DecodeError("send response is not an object");
  }
  return reqString(payload, "txHash");
}

/// \brief {"numOfSentTxs": n, "txsHashes": {"0": "...", ...}} keyed by
/// position in the submitted batch.
inline std::map<std::size_t, std::string> txHashes(const core::Json &payload)
{
  const core::Json *hashes = payload.is_object() ? member(payload, "txsHashes") : nullptr;
  if (!hashes || !hashes->is_object())
  {
    throw DecodeError("missing required field \"txsHashes\"");
  }
  std::map<std::size_t, std::string> out;
  for (auto it = hashes->begin(); it != hashes->end(); ++it)
  {
    std::size_t index = 0;
    try
    {
      std::size_t used = 0;
      index = std::stoul(it.key(), &used);
      if (used != it.key().size())
        throw std::invalid_argument(it.key());
    }
    catch (const std::logic_error &)
    {
      throw DecodeError("batch index \"" + it.key() + "\" is not a number");
    }
    if (!it.value().is_string())
    {
      throw DecodeError("hash at index " + it.key() + " is not a string");
    }
    out.emplace(index, it.value().get<std::string>());
  }
  return out;
}

inline std::pair<TransactionStatus, std::string> transactionStatus(const core::Json &payload,
                                                                   const StatusTable &statuses)
{
  if (!payload.is_object())
  {
    throw DecodeError("status response is not an object");
  }
  std::string raw = reqString(payload, "status");
  return {statuses.map(raw), raw};
}

inline TransactionProcessStatus processStatus(const core::Json &payload,
                                              const StatusTable &statuses)
{
  auto status = transactionStatus(payload, statuses);
  TransactionProcessStatus out;
  out.status = status.first;
  out.rawStatus = status.second;
  out.reason = optString(payload, "reason").value_or("");
  return out;
}

inline TransactionCost transactionCost(const core::Json &payload)
{
  if (!payload.is_object())
  {
    throw DecodeError("cost response is not an object");
  }
  TransactionCost cost;
  cost.gasUnits = reqUint(payload, "txGasUnits");
  cost.returnMessage = optString(payload, "returnMessage").value_or("");
  return cost;
}

inline TokenMetadata token(const core::Json &payload)
{
  const core::Json &t = section(payload, "token");
  TokenMetadata meta;
  auto identifier = optString(t, "identifier");
  if (!identifier)
  {
    identifier = optString(t, "tokenIdentifier");
  }
  if (!identifier)
  {
    throw DecodeError("missing required field \"identifier\"");
  }
  meta.identifier = *identifier;
  meta.name = optString(t, "name").value_or("");
  meta.ticker = optString(t, "ticker").value_or("");
  meta.owner = optString(t, "owner").value_or(optString(t, "ownerAddress").value_or(""));
  meta.decimals = optUint32(t, "decimals");
  meta.supply = optString(t, "supply").value_or("");
  meta.type = optString(t, "type").value_or("");
  meta.properties = core::Json::object();
  for (auto it = t.begin(); it != t.end(); ++it)
  {
    static const char *known[] = {"identifier", "tokenIdentifier", "name", "ticker", "owner",
                                  "ownerAddress", "decimals", "supply", "type"};
    bool isKnown = false;
    for (const char *k : known)
    {
      isKnown = isKnown || it.key() == k;
    }
    if (!isKnown)
    {
      meta.properties[it.key()] = it.value();
    }
  }
  return meta;
}

inline HyperBlock hyperBlock(const core::Json &payload, const StatusTable &statuses)
{
  const core::Json &h = section(payload, "hyperblock");
  HyperBlock block;
  block.nonce = reqUint(h, "nonce");
  block.hash = reqString(h, "hash");
  block.round = optUint(h, "round").value_or(0);
  block.epoch = optUint(h, "epoch").value_or(0);
  block.prevBlockHash = optString(h, "prevBlockHash").value_or("");
  block.timestamp = optUint(h, "timestamp").value_or(0);
  block.numTxs = optUint32(h, "numTxs");
  if (const core::Json *txs = member(h, "transactions"))
  {
    if (!txs->is_array())
    {
      throw DecodeError("field \"transactions\" is not an array");
    }
    for (const auto &t : *txs)
    {
      block.transactions.push_back(transactionObject(t, statuses));
    }
  }
  return block;
}

} // namespace decode
} // namespace proxy
} // namespace drtgw
