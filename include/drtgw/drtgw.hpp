// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Drtgw, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "core/cancellation_token.hpp"
#include "core/config_loader.hpp"
#include "core/json.hpp"
#include "core/logger.hpp"
#include "network/http_transport.hpp"
#include "network/transport.hpp"
#include "proxy/api_error.hpp"
#include "proxy/client_config.hpp"
#include "proxy/decoders.hpp"
#include "proxy/endpoint_catalog.hpp"
#include "proxy/error_classifier.hpp"
#include "proxy/gateway_proxy.hpp"
#include "proxy/result.hpp"
#include "proxy/retry_policy.hpp"
#include "proxy/simulator_adapter.hpp"
#include "proxy/transaction_poller.hpp"
#include "proxy/types.hpp"

#define DRTGW_VERSION_MAJOR 1
#define DRTGW_VERSION_MINOR 0
#define DRTGW_VERSION_PATCH 0
