// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Drtgw, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <optional>
#include <sstream>
#include <string>

namespace drtgw
{
namespace proxy
{

enum class ErrorKind
{
  Transient,   ///< 5xx or connection-level failure
  RateLimited, ///< 429 or node throttling signal
  Fatal,       ///< rejected request, node-reported error, bad configuration
  Timeout,     ///< single attempt exceeded its timeout
  Decode,      ///< response body does not have the expected shape
  TimedOut,    ///< retry or poll budget exhausted
  Cancelled    ///< caller cancelled the operation
};

inline const char *toString(ErrorKind kind)
{
  switch (kind)
  {
  case ErrorKind::Transient:
    return "Transient";
  case ErrorKind::RateLimited:
    return "RateLimited";
  case ErrorKind::Fatal:
    return "Fatal";
  case ErrorKind::Timeout:
    return "Timeout";
  case ErrorKind::Decode:
    return "Decode";
  case ErrorKind::TimedOut:
    return "TimedOut";
  case ErrorKind::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

/// \brief Kinds that may succeed when the same request is sent again.
inline bool isRetryable(ErrorKind kind)
{
  return kind == ErrorKind::Transient || kind == ErrorKind::RateLimited ||
         kind == ErrorKind::Timeout;
}

/// \brief Classified failure of a gateway operation.
struct ApiError
{
  ErrorKind kind{ErrorKind::Fatal};
  std::string message;
  std::optional<std::string> code; ///< node-provided error code, if any
  int httpStatus{0};               ///< 0 when no HTTP response was received
  /// \brief True when message is the node's own error text rather than a
  /// description built from the HTTP status or transport failure.
  bool fromNode{false};

  static ApiError make(ErrorKind kind, std::string message, std::optional<std::string> code = {},
                       int httpStatus = 0)
  {
    return ApiError{kind, std::move(message), std::move(code), httpStatus, false};
  }

  bool retryable() const { return isRetryable(kind); }

  std::string toString() const
  {
    std::ostringstream oss;
    oss << proxy::toString(kind) << ": " << message;
    if (code)
    {
      oss << " [" << *code << "]";
    }
    if (httpStatus != 0)
    {
      oss << " (HTTP " << httpStatus << ")";
    }
    return oss.str();
  }
};

} // namespace proxy
} // namespace drtgw
