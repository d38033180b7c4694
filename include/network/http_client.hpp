#pragma once
#include "network/http_request.hpp"
#include "network/http_response.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
//---------------------------------------------------------------------------
// StatusPost - Signed Build Status Client
// StatusPost Contributors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace statuspost::network {
//---------------------------------------------------------------------------
class TLSContext;
class Url;
//---------------------------------------------------------------------------
/// Performs one blocking http exchange per call, over TLS for https urls
class HttpClient {
    public:
    /// The client settings
    struct Settings {
        /// Default timeouts
        static constexpr std::chrono::milliseconds defaultConnectTimeout{10000};
        static constexpr std::chrono::milliseconds defaultReceiveTimeout{30000};
        /// Default upper bound for a response
        static constexpr uint64_t defaultMaxResponseSize = 1ull << 20;

        /// Timeout for connect and send
        std::chrono::milliseconds connectTimeout = defaultConnectTimeout;
        /// Timeout for a single receive
        std::chrono::milliseconds receiveTimeout = defaultReceiveTimeout;
        /// Check certificate and host name
        bool verifyPeer = true;
        /// The CA bundle, empty uses the system trust store
        std::string caFile;
        /// The maximum response size
        uint64_t maxResponseSize = defaultMaxResponseSize;
    };

    private:
    /// The settings
    Settings _settings;
    /// The TLS context, created on the first https request
    std::unique_ptr<TLSContext> _context;
    /// Guards the creation of the context
    std::mutex _contextMutex;

    public:
    /// The constructor with default settings
    HttpClient();
    /// The constructor
    explicit HttpClient(Settings settings);
    /// The destructor
    virtual ~HttpClient() noexcept;

    /// Sends the request to the host of the url and waits for the full response, throws std::runtime_error on socket or TLS errors
    [[nodiscard]] virtual HttpResponse send(const Url& url, const HttpRequest& request);
    /// Get the settings
    [[nodiscard]] const Settings& getSettings() const { return _settings; }
};
//---------------------------------------------------------------------------
} // namespace statuspost::network
