// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Drtgw, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <drtgw/core/json.hpp>
#include <drtgw/network/transport.hpp>
#include <drtgw/proxy/api_error.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <vector>

namespace drtgw
{
namespace proxy
{

/// \brief Node error envelope fields pulled out of a response body.
struct ErrorEnvelope
{
  bool isJsonObject{false};
  std::string error;
  std::optional<std::string> code;
};

/// \brief Decides how a failed attempt should be treated by retry logic.
/// Never retries and never performs I/O.
class ErrorClassifier
{
public:
  struct Config
  {
    /// Node error codes that mean "slow down".
    std::vector<std::string> throttleCodes;
    /// Lower-case substrings of node error messages that mean "slow down".
    std::vector<std::string> throttleMessages;

    Config()
        : throttleCodes{"too_many_requests", "rate_limited", "throttled"},
          throttleMessages{"too many requests", "rate limit", "throttl"}
    {
    }
  };

  explicit ErrorClassifier(const Config &config = Config{}) : _config(config) {}

  ApiError classify(const network::TransportFailure &failure) const
  {
    using network::TransportError;
    std::string message =
        std::string("transport ") + network::toString(failure.cause) + ": " + failure.message;
    switch (failure.cause)
    {
    case TransportError::Timeout:
      return ApiError::make(ErrorKind::Timeout, message);
    case TransportError::Cancelled:
      return ApiError::make(ErrorKind::Cancelled, message);
    case TransportError::Config:
      return ApiError::make(ErrorKind::Fatal, message);
    case TransportError::Protocol:
      // Malformed or oversized response; sending again gets the same bytes.
      return ApiError::make(ErrorKind::Decode, message);
    default:
      return ApiError::make(ErrorKind::Transient, message);
    }
  }

  /// \brief Classifies a response that is either non-2xx or a 2xx carrying
  /// an explicit node error.
  ApiError classify(const network::RawResponse &response) const
  {
    ErrorEnvelope envelope = parseEnvelope(response.body);
    const int status = response.statusCode;
    std::string message = envelope.error;
    const bool fromNode = !message.empty();
    auto make = [&](ErrorKind kind, const std::string &text, const std::optional<std::string> &code)
    {
      ApiError error = ApiError::make(kind, text, code, status);
      error.fromNode = fromNode;
      return error;
    };
    if (message.empty())
    {
      message = "HTTP " + std::to_string(status);
      if (!response.statusText.empty())
      {
        message += " " + response.statusText;
      }
    }

    if (status == 429 || isThrottled(envelope))
    {
      return make(ErrorKind::RateLimited, message, envelope.code);
    }
    if (status >= 500)
    {
      return make(ErrorKind::Transient, message, envelope.code);
    }
    if (status >= 400)
    {
      return make(ErrorKind::Fatal, message, envelope.code);
    }
    if (status >= 200 && status < 300)
    {
      if (!envelope.isJsonObject)
      {
        return ApiError::make(ErrorKind::Decode, "response body is not a JSON object", std::nullopt,
                              status);
      }
      if (!envelope.error.empty())
      {
        return make(ErrorKind::Fatal, message, envelope.code);
      }
      return ApiError::make(ErrorKind::Decode, "response envelope has no usable payload",
                            envelope.code, status);
    }
    return ApiError::make(ErrorKind::Fatal, "unexpected " + message, envelope.code, status);
  }

  /// \brief Extracts "error" and "code" without judging them. "successful"
  /// is the node's no-error code and is dropped.
  static ErrorEnvelope parseEnvelope(const std::string &body)
  {
    ErrorEnvelope envelope;
    core::Json json = core::Json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object())
    {
      return envelope;
    }
    envelope.isJsonObject = true;
    auto error = json.find("error");
    if (error != json.end() && error->is_string())
    {
      envelope.error = error->get<std::string>();
    }
    else
    {
      auto message = json.find("message");
      if (message != json.end() && message->is_string())
      {
        envelope.error = message->get<std::string>();
      }
    }
    auto code = json.find("code");
    if (code != json.end() && code->is_string() && !code->get<std::string>().empty() &&
        code->get<std::string>() != "successful")
    {
      envelope.code = code->get<std::string>();
    }
    return envelope;
  }

private:
  bool isThrottled(const ErrorEnvelope &envelope) const
  {
    if (envelope.code)
    {
      std::string code = lower(*envelope.code);
      for (const auto &marker : _config.throttleCodes)
      {
        if (code == marker)
          return true;
      }
    }
    std::string message = lower(envelope.error);
    for (const auto &marker : _config.throttleMessages)
    {
      if (!marker.empty() && message.find(marker) != std::string::npos)
        return true;
    }
    return false;
  }

  static std::string lower(std::string s)
  {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }

  Config _config;
};

} // namespace proxy
} // namespace drtgw
