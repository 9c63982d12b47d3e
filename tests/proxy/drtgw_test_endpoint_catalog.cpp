// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Drtgw, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using namespace drtgw::proxy;
using drtgw::network::HttpMethod;

TEST_CASE("V1 catalog", "[catalog]")
{
  EndpointCatalog catalog(ApiVersion::V1);

  SECTION("Reads are idempotent GETs")
  {
    auto r = catalog.resolve(Operation::GetAccount, {{"address", "drt1abc"}});
    REQUIRE(r.ok());
    REQUIRE(r.value().method == HttpMethod::Get);
    REQUIRE(r.value().path == "address/drt1abc");
    REQUIRE(r.value().idempotent);
    REQUIRE_FALSE(r.value().simulatorOnly);

    REQUIRE(catalog.resolve(Operation::GetNetworkStatus, {{"shard", "4294967295"}}).value().path ==
            "network/status/4294967295");
    REQUIRE(catalog.resolve(Operation::GetTransaction, {{"hash", "ab"}, {"withResults", "true"}})
                .value()
                .path == "transaction/ab?withResults=true");
    REQUIRE(catalog.resolve(Operation::GetHyperBlockByNonce, {{"nonce", "7468"}}).value().path ==
            "hyperblock/by-nonce/7468");
  }

  SECTION("Broadcasts are non-idempotent POSTs")
  {
    auto send = catalog.resolve(Operation::SendTransaction, {}).value();
    REQUIRE(send.method == HttpMethod::Post);
    REQUIRE(send.path == "transaction/send");
    REQUIRE_FALSE(send.idempotent);
    REQUIRE_FALSE(catalog.resolve(Operation::SendTransactions, {}).value().idempotent);

    auto cost = catalog.resolve(Operation::EstimateTransactionCost, {}).value();
    REQUIRE(cost.method == HttpMethod::Post);
    REQUIRE(cost.idempotent);
  }

  SECTION("Simulator controls are flagged")
  {
    auto gen = catalog.resolve(Operation::SimulatorGenerateBlocks, {{"count", "3"}}).value();
    REQUIRE(gen.simulatorOnly);
    REQUIRE(gen.method == HttpMethod::Post);
    REQUIRE(gen.path == "simulator/generate-blocks/3");
    REQUIRE(catalog.find(Operation::SimulatorSetState)->simulatorOnly);
  }

  SECTION("Missing parameters are Fatal")
  {
    auto r = catalog.resolve(Operation::GetAccount, {});
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.error().kind == ErrorKind::Fatal);
    REQUIRE(r.error().message.find("address") != std::string::npos);
    REQUIRE_FALSE(catalog.resolve(Operation::GetAccount, {{"address", ""}}).ok());
  }

  SECTION("Parameters are percent-encoded")
  {
    auto r = catalog.resolve(Operation::GetToken, {{"identifier", "WEGLD-bd4d79/x y"}});
    REQUIRE(r.value().path == "token/WEGLD-bd4d79%2Fx%20y");
  }

  SECTION("Lookup by name")
  {
    REQUIRE(catalog.resolve("GetNetworkConfig", {}).value().path == "network/config");
    auto unknown = catalog.resolve("GetEverything", {});
    REQUIRE_FALSE(unknown.ok());
    REQUIRE(unknown.error().kind == ErrorKind::Fatal);
  }
}

TEST_CASE("V2 catalog overrides resource names", "[catalog][v2]")
{
  EndpointCatalog catalog(ApiVersion::V2);
  REQUIRE(catalog.version() == ApiVersion::V2);
  REQUIRE(catalog.resolve(Operation::GetAccount, {{"address", "drt1"}}).value().path ==
          "accounts/drt1");
  REQUIRE(catalog.resolve(Operation::SendTransaction, {}).value().path == "transactions");
  REQUIRE(catalog.resolve(Operation::GetNetworkConfig, {}).value().path == "network/config");
  REQUIRE_FALSE(catalog.resolve(Operation::SendTransaction, {}).value().idempotent);

  const EndpointParams token{{"identifier", "WEGLD-bd4d79"}};
  REQUIRE(catalog.resolve(Operation::GetToken, token).value().path == "tokens/WEGLD-bd4d79");
  REQUIRE(EndpointCatalog(ApiVersion::V1).resolve(Operation::GetToken, token).value().path ==
          "token/WEGLD-bd4d79");
}

TEST_CASE("API version tags", "[catalog]")
{
  REQUIRE(parseApiVersion("v1") == ApiVersion::V1);
  REQUIRE(parseApiVersion("V2") == ApiVersion::V2);
  REQUIRE_FALSE(parseApiVersion("v3").has_value());
  REQUIRE(std::string(toString(ApiVersion::V2)) == "v2");
}
