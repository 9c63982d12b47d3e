// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Drtgw, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <atomic>

using namespace drtgw::proxy;
using namespace drtgw::test;
using drtgw::network::HttpMethod;
using drtgw::network::TransportError;
using namespace std::chrono_literals;

namespace
{
struct Fixture
{
  std::shared_ptr<MockTransport> transport = std::make_shared<MockTransport>();

  GatewayProxy make(ClientConfig config = testConfig()) const
  {
    return GatewayProxy(std::move(config), transport);
  }
};

bool endsWith(const std::string &s, const std::string &suffix)
{
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
} // namespace

TEST_CASE("getAccount decodes a plain account body", "[proxy][account]")
{
  initializeTestLogging();
  Fixture f;
  auto proxy = f.make();
  f.transport->push(reply(200, R"({"account":{"balance":"100","nonce":5}})"));

  auto account = proxy.getAccount("drt1abc");
  REQUIRE(account.ok());
  REQUIRE(account.value().balance == "100");
  REQUIRE(account.value().nonce == 5);
  REQUIRE(account.value().address == "drt1abc");

  auto request = f.transport->lastRequest();
  REQUIRE(request.method == HttpMethod::Get);
  REQUIRE(request.url == "http://gateway.test/address/drt1abc");
  REQUIRE_FALSE(request.body.has_value());
  REQUIRE(request.timeout == 2000ms);
}

TEST_CASE("getAccount round-trips enveloped numeric strings", "[proxy][account]")
{
  Fixture f;
  auto proxy = f.make();
  const std::string balance = "9999999999999999999999999999999999999";
  f.transport->push(reply(200, envelope(R"({"account":{"address":"drt1z","balance":")" + balance +
                                        R"(","nonce":42,"username":""}})")));
  auto account = proxy.getAccount("drt1z");
  REQUIRE(account.ok());
  REQUIRE(account.value().balance == balance);
  REQUIRE(account.value().nonce == 42);
}

TEST_CASE("sendTransaction is never retried", "[proxy][send]")
{
  Fixture f;
  auto proxy = f.make();
  const std::string payload = R"({"nonce":1,"value":"0","receiver":"drt1r","sender":"drt1s"})";

  SECTION("Node rejection is Fatal with the node code")
  {
    f.transport->setFallback(
        reply(400, errorBody("insufficient funds", "invalid_transaction")));
    auto result = proxy.sendTransaction(payload);
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error().kind == ErrorKind::Fatal);
    REQUIRE(result.error().code == std::optional<std::string>("invalid_transaction"));
    REQUIRE(result.error().message == "insufficient funds");
    REQUIRE(f.transport->callCount() == 1);
  }

  SECTION("Transient failure is surfaced after one attempt")
  {
    f.transport->setFallback(reply(503, errorBody("unavailable")));
    auto result = proxy.sendTransaction(payload);
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error().kind == ErrorKind::Transient);
    REQUIRE(f.transport->callCount() == 1);
  }

  SECTION("Even an explicit retry policy does not retry a broadcast")
  {
    f.transport->setFallback(failure(TransportError::Connect));
    CallOptions opts;
    opts.retry = RetryPolicy(fastPolicy(5));
    auto result = proxy.sendTransaction(payload, opts);
    REQUIRE(result.error().kind == ErrorKind::Transient);
    REQUIRE(f.transport->callCount() == 1);
  }

  SECTION("Success returns and stores the hash")
  {
    f.transport->push(reply(200, envelope(R"({"txHash":"0xabc"})")));
    TransactionRequest request{payload, "drt1s", std::nullopt};
    auto result = proxy.sendTransaction(request);
    REQUIRE(result.ok());
    REQUIRE(result.value() == "0xabc");
    REQUIRE(request.hash == std::optional<std::string>("0xabc"));

    auto sent = f.transport->lastRequest();
    REQUIRE(sent.method == HttpMethod::Post);
    REQUIRE(sent.url == "http://gateway.test/transaction/send");
    REQUIRE(sent.body == std::optional<std::string>(payload));
  }

  SECTION("Empty payload never reaches the node")
  {
    auto result = proxy.sendTransaction(std::string());
    REQUIRE(result.error().kind == ErrorKind::Fatal);
    REQUIRE(f.transport->callCount() == 0);
  }
}

TEST_CASE("Idempotent reads follow the retry policy", "[proxy][retry]")
{
  Fixture f;

  SECTION("Three transient attempts then TimedOut")
  {
    ClientConfig config = testConfig();
    config.retry.maxAttempts = 3;
    config.retry.baseDelay = 100ms;
    config.retry.multiplier = 2.0;
    auto proxy = f.make(config);
    f.transport->setFallback(reply(503, errorBody("node is syncing")));

    auto start = std::chrono::steady_clock::now();
    auto result = proxy.getNetworkConfig();
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error().kind == ErrorKind::TimedOut);
    REQUIRE(result.error().message.find("node is syncing") != std::string::npos);
    REQUIRE(result.error().httpStatus == 503);
    REQUIRE(f.transport->callCount() == 3);
    REQUIRE(elapsed >= 300ms);
  }

  SECTION("Fatal stops immediately")
  {
    auto proxy = f.make();
    f.transport->setFallback(reply(400, errorBody("bad address", "bad_request")));
    auto result = proxy.getAccount("nope");
    REQUIRE(result.error().kind == ErrorKind::Fatal);
    REQUIRE(f.transport->callCount() == 1);
  }

  SECTION("Recovers after transient failures")
  {
    auto proxy = f.make();
    f.transport->push(failure(TransportError::Connect, "refused"))
        .push(failure(TransportError::Timeout, "slow"))
        .push(reply(200, envelope(R"({"txGasUnits":50000})")));
    auto result = proxy.estimateTransactionCost(R"({"nonce":1})");
    REQUIRE(result.ok());
    REQUIRE(result.value().gasUnits == 50000);
    REQUIRE(f.transport->callCount() == 3);
  }

  SECTION("Rate limiting is retried")
  {
    auto proxy = f.make();
    f.transport->push(reply(429, ""))
        .push(reply(200, envelope(R"({"status":{"erd_current_round":9,"erd_nonce":8}})")));
    auto status = proxy.getNetworkStatus(1);
    REQUIRE(status.ok());
    REQUIRE(status.value().nonce == 8);
    REQUIRE(f.transport->lastRequest().url == "http://gateway.test/network/status/1");
  }

  SECTION("Decode errors are not retried")
  {
    auto proxy = f.make();
    f.transport->setFallback(reply(200, envelope(R"({"config":{"erd_chain_id":"D"}})")));
    auto result = proxy.getNetworkConfig();
    REQUIRE(result.error().kind == ErrorKind::Decode);
    REQUIRE(f.transport->callCount() == 1);
  }

  SECTION("Node error inside a 200 envelope is Fatal")
  {
    auto proxy = f.make();
    f.transport->setFallback(reply(200, R"({"data":null,"error":"storage read failed","code":"internal_issue"})"));
    auto result = proxy.getAccountStorage("drt1abc");
    REQUIRE(result.error().kind == ErrorKind::Fatal);
    REQUIRE(result.error().code == std::optional<std::string>("internal_issue"));
    REQUIRE(f.transport->callCount() == 1);
  }

  SECTION("A single-attempt policy reports the classified error")
  {
    auto proxy = f.make();
    f.transport->setFallback(reply(502, ""));
    CallOptions opts;
    opts.retry = RetryPolicy::singleAttempt();
    auto result = proxy.getToken("WEGLD-bd4d79", opts);
    REQUIRE(result.error().kind == ErrorKind::Transient);
    REQUIRE(f.transport->callCount() == 1);
  }
}

TEST_CASE("Deadlines and cancellation", "[proxy][deadline][cancel]")
{
  Fixture f;
  ClientConfig config = testConfig();
  config.retry.maxAttempts = 10;
  config.retry.baseDelay = 2000ms;
  auto proxy = f.make(config);
  f.transport->setFallback(failure(TransportError::Connect, "refused"));

  SECTION("Deadline bounds the retry loop")
  {
    CallOptions opts;
    opts.deadline = drtgw::network::MonoClock::now() + 80ms;
    auto start = std::chrono::steady_clock::now();
    auto result = proxy.getNetworkConfig(opts);
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(result.error().kind == ErrorKind::TimedOut);
    REQUIRE(elapsed < 1000ms);
    REQUIRE(f.transport->callCount() <= 2);
  }

  SECTION("Per-attempt timeout never exceeds the remaining budget")
  {
    CallOptions opts;
    opts.deadline = drtgw::network::MonoClock::now() + 50ms;
    (void)proxy.getNetworkEconomics(opts);
    REQUIRE(f.transport->lastRequest().timeout <= 50ms);
  }

  SECTION("Cancellation during a backoff wait")
  {
    auto token = drtgw::core::CancellationToken::create();
    CallOptions opts;
    opts.cancel = token;
    std::thread canceller(
        [token]()
        {
          std::this_thread::sleep_for(30ms);
          token->cancel();
        });
    auto start = std::chrono::steady_clock::now();
    auto result = proxy.getNetworkConfig(opts);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();
    REQUIRE(result.error().kind == ErrorKind::Cancelled);
    REQUIRE(elapsed < 1000ms);
    REQUIRE(f.transport->callCount() == 1);
    REQUIRE(f.transport->lastRequest().cancel == token);
  }

  SECTION("Already cancelled calls never reach the transport")
  {
    auto token = drtgw::core::CancellationToken::create();
    token->cancel();
    CallOptions opts;
    opts.cancel = token;
    REQUIRE(proxy.getNetworkConfig(opts).error().kind == ErrorKind::Cancelled);
    REQUIRE(f.transport->callCount() == 0);
  }
}

TEST_CASE("Composite and batch operations", "[proxy][hyperblock][batch]")
{
  Fixture f;
  auto proxy = f.make();

  SECTION("Latest hyper block uses the metachain nonce")
  {
    f.transport->setResponder(
        [](const drtgw::network::HttpRequest &request)
        {
          if (endsWith(request.url, "/network/status/4294967295"))
          {
            return reply(200, envelope(R"({"status":{"erd_current_round":120,"erd_nonce":118}})"));
          }
          if (endsWith(request.url, "/hyperblock/by-nonce/118"))
          {
            return reply(200, envelope(R"({"hyperblock":{"nonce":118,"hash":"hb118","transactions":[]}})"));
          }
          return reply(404, errorBody("unexpected " + request.url));
        });
    auto block = proxy.getLatestHyperBlock();
    REQUIRE(block.ok());
    REQUIRE(block.value().nonce == 118);
    REQUIRE(block.value().hash == "hb118");
    REQUIRE(f.transport->callCount() == 2);
  }

  SECTION("Hyper block by hash")
  {
    f.transport->push(reply(200, envelope(R"({"hyperblock":{"nonce":5,"hash":"ab"}})")));
    REQUIRE(proxy.getHyperBlockByHash("ab").value().nonce == 5);
    REQUIRE(f.transport->lastRequest().url == "http://gateway.test/hyperblock/by-hash/ab");
  }

  SECTION("Batch send posts a JSON array")
  {
    f.transport->push(
        reply(200, envelope(R"({"numOfSentTxs":2,"txsHashes":{"0":"h0","1":"h1"}})")));
    auto result = proxy.sendTransactions({R"({"nonce":1})", R"({"nonce":2})"});
    REQUIRE(result.ok());
    REQUIRE(result.value().at(1) == "h1");
    auto sent = f.transport->lastRequest();
    REQUIRE(sent.url == "http://gateway.test/transaction/send-multiple");
    REQUIRE(sent.body == std::optional<std::string>(R"([{"nonce":1},{"nonce":2}])"));
    REQUIRE(proxy.sendTransactions({}).error().kind == ErrorKind::Fatal);
    REQUIRE(f.transport->callCount() == 1);
  }

  SECTION("Transaction queries")
  {
    f.transport->push(reply(200, envelope(transactionData("t1", "pending"))))
        .push(reply(200, envelope(R"({"status":"success"})")))
        .push(reply(200, envelope(R"({"status":"fail","reason":"out of gas"})")));

    auto tx = proxy.getTransaction("t1", true);
    REQUIRE(tx.value().status == TransactionStatus::Pending);
    REQUIRE(f.transport->lastRequest().url == "http://gateway.test/transaction/t1?withResults=true");

    auto status = proxy.getTransactionStatus("t1");
    REQUIRE(status.value().status == TransactionStatus::Success);
    REQUIRE(f.transport->lastRequest().url == "http://gateway.test/transaction/t1/status");

    auto process = proxy.getTransactionProcessStatus("t1");
    REQUIRE(process.value().status == TransactionStatus::Failed);
    REQUIRE(process.value().reason == "out of gas");
  }
}

TEST_CASE("Construction and configuration", "[proxy][config]")
{
  auto transport = std::make_shared<MockTransport>();
  REQUIRE_THROWS_AS(GatewayProxy(testConfig(), nullptr), std::invalid_argument);

  ClientConfig bad = testConfig();
  bad.baseUrl = "gateway.test";
  REQUIRE_THROWS_AS(GatewayProxy(bad, transport), std::invalid_argument);

  ClientConfig slashed = testConfig();
  slashed.baseUrl = "http://gateway.test/";
  slashed.apiVersion = ApiVersion::V2;
  GatewayProxy proxy(slashed, transport);
  REQUIRE(proxy.config().baseUrl == "http://gateway.test");
  REQUIRE_FALSE(proxy.isSimulator());

  transport->push(reply(200, envelope(R"({"account":{"balance":"0","nonce":0}})")));
  REQUIRE(proxy.getAccount("drt1").ok());
  REQUIRE(transport->lastRequest().url == "http://gateway.test/accounts/drt1");
}

TEST_CASE("Concurrent calls share one proxy", "[proxy][thread]")
{
  Fixture f;
  auto proxy = f.make();
  f.transport->setResponder(
      [](const drtgw::network::HttpRequest &request)
      {
        auto address = request.url.substr(request.url.rfind('/') + 1);
        return reply(200, envelope(R"({"account":{"address":")" + address +
                                   R"(","balance":"1","nonce":1}})"));
      });

  std::atomic<int> good{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < 8; ++t)
  {
    workers.emplace_back(
        [&proxy, &good, t]()
        {
          for (int i = 0; i < 25; ++i)
          {
            std::string address = "drt1w" + std::to_string(t) + "x" + std::to_string(i);
            auto account = proxy.getAccount(address);
            if (account.ok() && account.value().address == address)
            {
              good.fetch_add(1);
            }
          }
        });
  }
  for (auto &w : workers)
  {
    w.join();
  }
  REQUIRE(good.load() == 200);
  REQUIRE(f.transport->callCount() == 200);
}
