#pragma once
#include "client/transport.hpp"
#include "network/http_client.hpp"
#include "network/url.hpp"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
//---------------------------------------------------------------------------
// StatusPost - Signed Build Status Client
// StatusPost Contributors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace statuspost::client {
//---------------------------------------------------------------------------
/// The server answered with a non successful status
class RequestError : public std::runtime_error {
    /// The status code
    uint16_t _code;

    public:
    /// The constructor
    RequestError(uint16_t code, const std::string& message) : std::runtime_error(message), _code(code) {}

    /// Get the status code
    [[nodiscard]] uint16_t getCode() const { return _code; }
};
//---------------------------------------------------------------------------
/// Every attempt was rate limited
class RateLimitedError : public RequestError {
    public:
    using RequestError::RequestError;
};
//---------------------------------------------------------------------------
/// Posts statuses as json over HTTP/1.1 and retries rate limited requests
class HttpRequestExecutor : public Transport {
    /// The base url
    network::Url _baseUrl;
    /// The http client
    std::unique_ptr<network::HttpClient> _client;

    public:
    /// The constructor
    explicit HttpRequestExecutor(network::Url baseUrl, std::unique_ptr<network::HttpClient> client = std::make_unique<network::HttpClient>());

    /// Get the base url
    [[nodiscard]] network::Url getBaseUrl() const override { return _baseUrl; }
    /// Post the status, throws RequestError for error responses
    void makePostRequest(const network::Url& url, const model::BuildStatus& status, const HeaderDecorator& decorator, const network::RetryOnRateLimitConfig& retryConfig) override;
};
//---------------------------------------------------------------------------
} // namespace statuspost::client
