// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Drtgw, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <drtgw/proxy/api_error.hpp>

#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>

namespace drtgw
{
namespace proxy
{

/// \brief Value-or-ApiError returned by every gateway operation.
template <typename T> class Result
{
public:
  static Result success(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result failure(ApiError error) { return Result(std::in_place_index<1>, std::move(error)); }

  Result(ApiError error) : _data(std::in_place_index<1>, std::move(error)) {}

  bool ok() const { return _data.index() == 0; }
  explicit operator bool() const { return ok(); }

  /// \throws std::logic_error when the result holds an error.
  const T &value() const &
  {
    if (!ok())
    {
      throw std::logic_error("Result::value() on error: " + std::get<1>(_data).toString());
    }
    return std::get<0>(_data);
  }

  T &&value() &&
  {
    if (!ok())
    {
      throw std::logic_error("Result::value() on error: " + std::get<1>(_data).toString());
    }
    return std::get<0>(std::move(_data));
  }

  /// \throws std::logic_error when the result holds a value.
  const ApiError &error() const
  {
    if (ok())
    {
      throw std::logic_error("Result::error() on success");
    }
    return std::get<1>(_data);
  }

private:
  template <std::size_t I, typename U>
  Result(std::in_place_index_t<I> tag, U &&u) : _data(tag, std::forward<U>(u))
  {
  }

  std::variant<T, ApiError> _data;
};

template <> class Result<void>
{
public:
  Result() = default;
  Result(ApiError error) : _error(std::move(error)) {}

  static Result success() { return Result(); }
  static Result failure(ApiError error) { return Result(std::move(error)); }

  bool ok() const { return !_error.has_value(); }
  explicit operator bool() const { return ok(); }

  const ApiError &error() const
  {
    if (ok())
    {
      throw std::logic_error("Result::error() on success");
    }
    return *_error;
  }

private:
  std::optional<ApiError> _error;
};

} // namespace proxy
} // namespace drtgw
