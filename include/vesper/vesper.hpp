// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <vesper/core/client_config.hpp>
#include <vesper/core/config_loader.hpp>
#include <vesper/core/logger.hpp>
#include <vesper/core/thread_pool.hpp>
#include <vesper/network/http_client.hpp>
#include <vesper/network/http_future.hpp>
#include <vesper/network/http_request.hpp>
#include <vesper/network/plain_transport.hpp>
#include <vesper/network/response_status.hpp>
#include <vesper/network/tls_transport.hpp>
#include <vesper/network/transport.hpp>
#include <vesper/network/transport_factory.hpp>
#include <vesper/network/url.hpp>
#include <vesper/parsers/http_headers.hpp>
#include <vesper/parsers/http_response_parser.hpp>
#include <vesper/parsers/minimal_toml.hpp>
