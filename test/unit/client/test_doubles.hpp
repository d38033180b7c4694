#pragma once
#include "client/key_provider.hpp"
#include "client/root_url_provider.hpp"
#include "client/transport.hpp"
#include "model/build_status.hpp"
#include "network/http_request.hpp"
#include <stdexcept>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// StatusPost - Signed Build Status Client
// StatusPost Contributors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace statuspost::client::test {
//---------------------------------------------------------------------------
/// Fails on every key request
class ThrowingKeyProvider : public KeyProvider {
    public:
    /// The number of calls
    unsigned calls = 0;

    /// Always throws
    const PrivateKey& getPrivate() override {
        calls++;
        throw utils::SigningError("No key configured");
    }
};
//---------------------------------------------------------------------------
/// A key store that reports failures with plain runtime errors
class UnavailableKeyProvider : public KeyProvider {
    public:
    /// Always throws
    const PrivateKey& getPrivate() override {
        throw std::runtime_error("keystore unavailable");
    }
};
//---------------------------------------------------------------------------
/// Records every post instead of sending it
class RecordingTransport : public Transport {
    public:
    /// One recorded request
    struct Record {
        /// The url
        std::string url;
        /// The status
        model::BuildStatus status;
        /// The decorated request
        network::HttpRequest request;
        /// The retry configuration
        network::RetryOnRateLimitConfig retryConfig;
    };

    /// The base url
    network::Url baseUrl = network::Url::parse("https://scm.example.com");
    /// The recorded requests
    std::vector<Record> records;

    /// Get the base url
    network::Url getBaseUrl() const override { return baseUrl; }
    /// Records the request
    void makePostRequest(const network::Url& url, const model::BuildStatus& status, const HeaderDecorator& decorator, const network::RetryOnRateLimitConfig& retryConfig) override {
        network::HttpRequest request;
        request.method = network::HttpRequest::Method::POST;
        request.path = url.getPath();
        decorator(request);
        records.push_back({url.toString(), status, request, retryConfig});
    }
};
//---------------------------------------------------------------------------
} // namespace statuspost::client::test
