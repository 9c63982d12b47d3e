// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Drtgw, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <random>

using namespace drtgw::proxy;
using namespace drtgw::test;
using drtgw::network::TransportError;
using namespace std::chrono_literals;

namespace
{
struct Fixture
{
  std::shared_ptr<MockTransport> transport = std::make_shared<MockTransport>();
  std::shared_ptr<const GatewayProxy> proxy;

  explicit Fixture(ClientConfig config = testConfig())
      : proxy(std::make_shared<const GatewayProxy>(std::move(config), transport))
  {
  }

  MockTransport &pending(std::size_t count = 1)
  {
    return transport->pushMany(reply(200, envelope(transactionData("h1", "pending"))), count);
  }

  MockTransport &settle(const std::string &status)
  {
    return transport->push(reply(200, envelope(transactionData("h1", status))));
  }
};

auto notFound() { return reply(404, errorBody("transaction not found", "transaction_not_found")); }

ApiError nodeError(const std::string &message, int httpStatus)
{
  auto error = ApiError::make(ErrorKind::Fatal, message, std::nullopt, httpStatus);
  error.fromNode = true;
  return error;
}
} // namespace

TEST_CASE("Poller reaches a terminal status", "[poller]")
{
  initializeTestLogging();
  Fixture f;
  TransactionPoller poller(f.proxy);

  SECTION("Pending then success")
  {
    f.pending(2);
    f.settle("success");
    auto result = poller.await("h1");
    REQUIRE(result.state == PollState::Succeeded);
    REQUIRE(result.succeeded());
    REQUIRE(result.attempts == 3);
    REQUIRE(result.transaction->hash == "h1");
    REQUIRE_FALSE(result.error.has_value());
    REQUIRE(f.transport->lastRequest().url ==
            "http://gateway.test/transaction/h1?withResults=true");
  }

  SECTION("Failed and invalid are terminal failures")
  {
    f.settle("fail");
    auto failed = poller.await("h1");
    REQUIRE(failed.state == PollState::Failed);
    REQUIRE(failed.transaction->status == TransactionStatus::Failed);

    f.settle("invalid");
    auto invalid = poller.await("h1");
    REQUIRE(invalid.state == PollState::Failed);
    REQUIRE(invalid.transaction->status == TransactionStatus::Invalid);
    REQUIRE(invalid.transaction->rawStatus == "invalid");
  }
}

TEST_CASE("Not found right after broadcast keeps polling", "[poller][notfound]")
{
  Fixture f;
  TransactionPoller poller(f.proxy);
  f.transport->push(notFound()).push(notFound());
  f.pending();
  f.settle("success");

  auto result = poller.await("h1");
  REQUIRE(result.state == PollState::Succeeded);
  REQUIRE(result.attempts == 4);
  REQUIRE(f.transport->callCount() == 4);
}

TEST_CASE("Not found detection", "[poller][notfound]")
{
  Fixture f;
  TransactionPoller poller(f.proxy);
  REQUIRE(poller.isNotFound(ApiError::make(ErrorKind::Fatal, "x", "not_found", 400)));
  REQUIRE(poller.isNotFound(nodeError("Transaction Not Found", 400)));
  REQUIRE_FALSE(poller.isNotFound(ApiError::make(ErrorKind::Fatal, "invalid hash", std::nullopt, 400)));
  REQUIRE_FALSE(poller.isNotFound(ApiError::make(ErrorKind::Transient, "not found", std::nullopt, 503)));

  SECTION("A bare 404 is an error unless enabled")
  {
    auto bare = ApiError::make(ErrorKind::Fatal, "HTTP 404 Not Found", std::nullopt, 404);
    REQUIRE_FALSE(poller.isNotFound(bare));

    TransactionPoller::Config config;
    config.anyNotFoundStatus = true;
    REQUIRE(TransactionPoller(f.proxy, config).isNotFound(bare));
  }

  SECTION("Custom codes and messages")
  {
    TransactionPoller::Config config;
    config.notFoundCodes = {"unknown_tx"};
    config.notFoundMessages = {};
    TransactionPoller strict(f.proxy, config);
    REQUIRE(strict.isNotFound(ApiError::make(ErrorKind::Fatal, "x", "unknown_tx", 400)));
    REQUIRE_FALSE(strict.isNotFound(nodeError("not found", 400)));
  }
}

TEST_CASE("Plain-text 404 stops polling", "[poller][notfound]")
{
  Fixture f;
  f.transport->setFallback(reply(404, "404 page not found"));
  auto result = TransactionPoller(f.proxy).await("h1");
  REQUIRE(result.state == PollState::Errored);
  REQUIRE(result.error->kind == ErrorKind::Fatal);
  REQUIRE(result.error->httpStatus == 404);
  REQUIRE(f.transport->callCount() == 1);
}

TEST_CASE("Errors during polling", "[poller][errors]")
{
  Fixture f;
  TransactionPoller poller(f.proxy);

  SECTION("Transient failures are absorbed")
  {
    f.transport->push(failure(TransportError::Connect)).push(reply(503, errorBody("syncing")));
    f.settle("success");
    auto result = poller.await("h1");
    REQUIRE(result.state == PollState::Succeeded);
    // One request per tick: the proxy does not retry underneath the poller.
    REQUIRE(f.transport->callCount() == 3);
  }

  SECTION("Fatal stops at once")
  {
    f.transport->setFallback(reply(400, errorBody("invalid hash", "bad_request")));
    auto result = poller.await("zz");
    REQUIRE(result.state == PollState::Errored);
    REQUIRE(result.error->kind == ErrorKind::Fatal);
    REQUIRE(result.error->message == "invalid hash");
    REQUIRE(f.transport->callCount() == 1);
  }

  SECTION("Decode errors stop at once")
  {
    f.transport->setFallback(reply(200, envelope(R"({"transaction":{"nonce":1}})")));
    auto result = poller.await("h1");
    REQUIRE(result.state == PollState::Errored);
    REQUIRE(result.error->kind == ErrorKind::Decode);
  }

  SECTION("Persistent transient failures exhaust the budget")
  {
    f.transport->setFallback(failure(TransportError::Timeout, "slow node"));
    auto result = poller.await("h1");
    REQUIRE(result.state == PollState::TimedOut);
    REQUIRE(result.error->kind == ErrorKind::TimedOut);
    REQUIRE(result.error->message.find("slow node") != std::string::npos);
    REQUIRE(f.transport->callCount() == 5);
  }
}

TEST_CASE("Poller bounds", "[poller][bounds]")
{
  SECTION("Attempt budget")
  {
    Fixture f;
    f.transport->setFallback(reply(200, envelope(transactionData("h1", "pending"))));
    TransactionPoller poller(f.proxy);
    auto result = poller.await("h1");
    REQUIRE(result.state == PollState::TimedOut);
    REQUIRE(result.attempts == 5);
    REQUIRE_FALSE(result.transaction.has_value());
  }

  SECTION("Deadline")
  {
    ClientConfig config = testConfig();
    config.polling = fastPolicy(1000, 20);
    Fixture f(config);
    f.transport->setFallback(reply(200, envelope(transactionData("h1", "pending"))));
    TransactionPoller poller(f.proxy);

    CallOptions opts;
    opts.deadline = drtgw::network::MonoClock::now() + 150ms;
    auto start = std::chrono::steady_clock::now();
    auto result = poller.await("h1", opts);
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(result.state == PollState::TimedOut);
    REQUIRE(elapsed < 2s);
    REQUIRE(f.transport->callCount() < 20);
  }

  SECTION("Explicit polling policy")
  {
    Fixture f;
    f.transport->setFallback(reply(200, envelope(transactionData("h1", "pending"))));
    TransactionPoller poller(f.proxy);
    CallOptions opts;
    opts.retry = RetryPolicy(fastPolicy(2));
    REQUIRE(poller.await("h1", opts).attempts == 2);
  }

  SECTION("Random pending and transient sequences always terminate")
  {
    std::mt19937 rng(1234);
    for (int run = 0; run < 25; ++run)
    {
      Fixture f;
      std::size_t script = rng() % 8;
      for (std::size_t i = 0; i < script; ++i)
      {
        switch (rng() % 3)
        {
        case 0:
          f.pending();
          break;
        case 1:
          f.transport->push(failure(TransportError::PeerClosed));
          break;
        default:
          f.transport->push(notFound());
          break;
        }
      }
      f.settle("success");
      auto result = TransactionPoller(f.proxy).await("h1");
      if (script < 5)
      {
        REQUIRE(result.state == PollState::Succeeded);
      }
      else
      {
        REQUIRE(result.state == PollState::TimedOut);
      }
      REQUIRE(f.transport->callCount() <= 5);
    }
  }
}

TEST_CASE("Cancellation and async polling", "[poller][cancel][async]")
{
  ClientConfig config = testConfig();
  config.polling = fastPolicy(1000, 10);
  Fixture f(config);
  f.transport->setFallback(reply(200, envelope(transactionData("h1", "pending"))));
  TransactionPoller poller(f.proxy);

  SECTION("Cancel stops an async poll")
  {
    auto token = drtgw::core::CancellationToken::create();
    CallOptions opts;
    opts.cancel = token;
    auto future = poller.awaitCompletionAsync("h1", opts);
    REQUIRE(waitFor([&]() { return f.transport->callCount() >= 2; }, 2000ms));
    token->cancel();
    REQUIRE(future.wait_for(2s) == std::future_status::ready);
    auto result = future.get();
    REQUIRE(result.state == PollState::Cancelled);
    REQUIRE(result.error->kind == ErrorKind::Cancelled);
  }

  SECTION("Async poll completes")
  {
    Fixture g;
    g.pending();
    g.settle("success");
    auto future = TransactionPoller(g.proxy).awaitCompletionAsync("h1");
    REQUIRE(future.get().succeeded());
  }

  SECTION("Pre-cancelled token never polls")
  {
    auto token = drtgw::core::CancellationToken::create();
    token->cancel();
    CallOptions opts;
    opts.cancel = token;
    REQUIRE(poller.await("h1", opts).state == PollState::Cancelled);
    REQUIRE(f.transport->callCount() == 0);
  }
}

TEST_CASE("Process status mode", "[poller][process]")
{
  Fixture f;
  TransactionPoller::Config config;
  config.useProcessStatus = true;
  config.withResults = false;
  TransactionPoller poller(f.proxy, config);

  f.transport->push(reply(200, envelope(R"({"status":"pending"})")))
      .push(reply(200, envelope(R"({"status":"success"})")));
  f.settle("success");

  auto result = poller.await("h1");
  REQUIRE(result.state == PollState::Succeeded);
  auto requests = f.transport->requests();
  REQUIRE(requests.size() == 3);
  REQUIRE(requests[0].url == "http://gateway.test/transaction/h1/process-status");
  REQUIRE(requests[2].url == "http://gateway.test/transaction/h1?withResults=false");
}

TEST_CASE("Poller construction", "[poller]")
{
  REQUIRE_THROWS_AS(TransactionPoller(nullptr), std::invalid_argument);
  REQUIRE(std::string(toString(PollState::TimedOut)) == "TimedOut");

  TransactionPoller::Config defaults;
  REQUIRE(defaults.withResults);
  REQUIRE_FALSE(defaults.useProcessStatus);
  REQUIRE_FALSE(defaults.anyNotFoundStatus);
  REQUIRE(defaults.notFoundCodes == std::vector<std::string>{"transaction_not_found", "not_found"});
}
