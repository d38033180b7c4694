#pragma once
#include "network/config.hpp"
#include "network/url.hpp"
#include <functional>
//---------------------------------------------------------------------------
// StatusPost - Signed Build Status Client
// StatusPost Contributors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace statuspost {
//---------------------------------------------------------------------------
namespace model {
class BuildStatus;
} // namespace model
namespace network {
struct HttpRequest;
} // namespace network
//---------------------------------------------------------------------------
namespace client {
//---------------------------------------------------------------------------
/// Delivers requests to the server, owns serialization and retries
class Transport {
    public:
    /// Adds headers to the request before it is sent
    using HeaderDecorator = std::function<void(network::HttpRequest&)>;

    /// Get the base url of the server
    [[nodiscard]] virtual network::Url getBaseUrl() const = 0;
    /// Post the status as request body; failures are reported with the transport's exceptions
    virtual void makePostRequest(const network::Url& url, const model::BuildStatus& status, const HeaderDecorator& decorator, const network::RetryOnRateLimitConfig& retryConfig) = 0;
    /// The destructor
    virtual ~Transport() noexcept = default;
};
//---------------------------------------------------------------------------
} // namespace client
} // namespace statuspost
