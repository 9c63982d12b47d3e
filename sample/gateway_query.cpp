/// \file gateway_query.cpp
/// \brief Queries a gateway for network configuration, economics and a
/// hyper block.
///
/// Usage:
///   gateway_query [--config drtgw.toml] [base-url] [hyperblock-nonce]
///
/// Without a configuration file or URL the locally started chain simulator
/// is queried. With a configuration file, the [gateway] and [log] sections
/// are read; a URL on the command line still wins over gateway.base_url.
/// Without a nonce the latest hyper block is fetched.

#include "drtgw/drtgw.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

using namespace drtgw;

namespace
{

void printError(const char *what, const proxy::ApiError &error)
{
  std::cerr << what << " failed: " << error.toString() << std::endl;
}

} // namespace

int main(int argc, char **argv)
{
  std::string configFile;
  std::string url;
  std::optional<std::uint64_t> nonce;
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc)
    {
      configFile = argv[++i];
    }
    else if (url.empty())
    {
      url = arg;
    }
    else
    {
      try
      {
        nonce = std::stoull(arg);
      }
      catch (const std::exception &)
      {
        std::cerr << "invalid hyper block nonce: " << arg << std::endl;
        return EXIT_FAILURE;
      }
    }
  }

  proxy::ClientConfig config = proxy::ClientConfig::forSimulator();
  try
  {
    if (!configFile.empty())
    {
      core::ConfigLoader loader(configFile);
      core::configureLogger(loader);
      config = proxy::ClientConfig::fromConfig(loader);
    }
    else
    {
      core::Logger::init(core::Logger::Level::Info);
    }
    if (!url.empty())
    {
      config.baseUrl = url;
    }
  }
  catch (const std::exception &e)
  {
    std::cerr << "configuration error: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  std::unique_ptr<proxy::GatewayProxy> gateway;
  try
  {
    gateway = std::make_unique<proxy::GatewayProxy>(config);
  }
  catch (const std::invalid_argument &e)
  {
    std::cerr << "invalid gateway configuration: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
  DRTGW_LOG_INFO("Querying " << gateway->config().baseUrl << " (API "
                             << proxy::toString(gateway->config().apiVersion) << ")");

  int rc = EXIT_SUCCESS;

  auto networkConfig = gateway->getNetworkConfig();
  if (networkConfig)
  {
    const auto &c = networkConfig.value();
    std::cout << "network config:\n"
              << "  chain id:          " << c.chainId << "\n"
              << "  min gas price:     " << c.minGasPrice << "\n"
              << "  min gas limit:     " << c.minGasLimit << "\n"
              << "  gas per data byte: " << c.gasPerDataByte << "\n"
              << "  round duration:    " << c.roundDuration << "ms\n"
              << "  shards:            " << c.numShardsWithoutMeta << std::endl;
  }
  else
  {
    printError("getNetworkConfig", networkConfig.error());
    rc = EXIT_FAILURE;
  }

  auto economics = gateway->getNetworkEconomics();
  if (economics)
  {
    const auto &e = economics.value();
    std::cout << "network economics:\n"
              << "  total supply:  " << e.totalSupply << "\n"
              << "  staked:        " << e.totalStakedValue << "\n"
              << "  total fees:    " << e.totalFees << "\n"
              << "  inflation:     " << e.inflation << "\n"
              << "  epoch:         " << e.epochForEconomicsData << std::endl;
  }
  else
  {
    printError("getNetworkEconomics", economics.error());
    rc = EXIT_FAILURE;
  }

  auto block = nonce ? gateway->getHyperBlockByNonce(*nonce) : gateway->getLatestHyperBlock();
  if (block)
  {
    const auto &b = block.value();
    std::cout << "hyper block " << b.nonce << ":\n"
              << "  hash:         " << b.hash << "\n"
              << "  epoch/round:  " << b.epoch << "/" << b.round << "\n"
              << "  transactions: " << b.numTxs << std::endl;
    for (const auto &tx : b.transactions)
    {
      std::cout << "    " << tx.hash << " " << tx.sender << " -> " << tx.receiver << " ["
                << tx.rawStatus << "]" << std::endl;
    }
  }
  else
  {
    printError("hyper block lookup", block.error());
    rc = EXIT_FAILURE;
  }

  core::Logger::flush();
  return rc;
}
