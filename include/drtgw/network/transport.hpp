// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Drtgw, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <drtgw/core/cancellation_token.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace drtgw
{
namespace network
{

using MonoClock = std::chrono::steady_clock;
using MonoTime = std::chrono::time_point<MonoClock>;

enum class HttpMethod
{
  Get,
  Post
};

inline const char *toString(HttpMethod method)
{
  return method == HttpMethod::Post ? "POST" : "GET";
}

enum class TransportError
{
  None = 0,
  Resolve,
  Connect,
  TLSHandshake,
  TLSIO,
  Send,
  Receive,
  PeerClosed,
  Protocol,
  Timeout,
  Cancelled,
  Config
};

inline const char *toString(TransportError code)
{
  switch (code)
  {
  case TransportError::None:
    return "None";
  case TransportError::Resolve:
    return "Resolve";
  case TransportError::Connect:
    return "Connect";
  case TransportError::TLSHandshake:
    return "TLSHandshake";
  case TransportError::TLSIO:
    return "TLSIO";
  case TransportError::Send:
    return "Send";
  case TransportError::Receive:
    return "Receive";
  case TransportError::PeerClosed:
    return "PeerClosed";
  case TransportError::Protocol:
    return "Protocol";
  case TransportError::Timeout:
    return "Timeout";
  case TransportError::Cancelled:
    return "Cancelled";
  case TransportError::Config:
    return "Config";
  }
  return "Unknown";
}

/// \brief HTTP response as received; any status code counts as a response.
struct RawResponse
{
  int statusCode = 0;
  std::string statusText;
  std::map<std::string, std::string> headers; ///< names lower-cased
  std::string body;

  bool success() const { return statusCode >= 200 && statusCode < 300; }

  std::optional<std::string> header(const std::string &lowerName) const
  {
    auto it = headers.find(lowerName);
    if (it == headers.end())
    {
      return std::nullopt;
    }
    return it->second;
  }
};

/// \brief Why a request produced no HTTP response at all.
struct TransportFailure
{
  TransportError cause{TransportError::None};
  std::string message;
  int sysErrno{0};
};

/// \brief Outcome of a single attempt: either a response or a failure.
struct TransportResult
{
  bool ok{false};
  RawResponse response;
  TransportFailure failure;

  static TransportResult success(RawResponse r)
  {
    TransportResult result;
    result.ok = true;
    result.response = std::move(r);
    return result;
  }

  static TransportResult failed(TransportError cause, const std::string &message, int sysErrno = 0)
  {
    TransportResult result;
    result.failure = TransportFailure{cause, message, sysErrno};
    return result;
  }
};

struct HttpRequest
{
  HttpMethod method{HttpMethod::Get};
  std::string url;
  std::optional<std::string> body; ///< serialized JSON
  std::chrono::milliseconds timeout{0};
  std::map<std::string, std::string> headers;
  std::shared_ptr<core::CancellationToken> cancel;
};

/// \brief Single-attempt HTTP executor. Implementations never retry, never
/// throw, and never block past the request timeout.
class Transport
{
public:
  virtual ~Transport() = default;

  virtual TransportResult execute(const HttpRequest &request) = 0;

  TransportResult execute(HttpMethod method, const std::string &url,
                          const std::optional<std::string> &body,
                          std::chrono::milliseconds timeout)
  {
    HttpRequest request;
    request.method = method;
    request.url = url;
    request.body = body;
    request.timeout = timeout;
    return execute(request);
  }
};

} // namespace network
} // namespace drtgw
