#include "client/http_request_executor.hpp"
#include "model/build_status.hpp"
#include "network/http_request.hpp"
#include "network/http_response.hpp"
#include <charconv>
#include <chrono>
#include <iostream>
#include <optional>
#include <thread>
#include <utility>
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
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
optional<chrono::milliseconds> retryAfter(const network::HttpResponse& response)
// Delay-seconds form of Retry-After, http dates are ignored
{
    auto header = response.findHeader("Retry-After");
    if (!header)
        return nullopt;
    uint64_t seconds = 0;
    auto result = from_chars(header->data(), header->data() + header->size(), seconds);
    if (result.ec != errc() || result.ptr != header->data() + header->size())
        return nullopt;
    return chrono::seconds(seconds);
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
HttpRequestExecutor::HttpRequestExecutor(network::Url baseUrl, unique_ptr<network::HttpClient> client) : _baseUrl(move(baseUrl)), _client(move(client))
// The constructor
{
    if (!_client)
        throw invalid_argument("client");
}
//---------------------------------------------------------------------------
void HttpRequestExecutor::makePostRequest(const network::Url& url, const model::BuildStatus& status, const HeaderDecorator& decorator, const network::RetryOnRateLimitConfig& retryConfig)
// Sends the status and retries while the server rate limits
{
    network::HttpRequest request;
    request.method = network::HttpRequest::Method::POST;
    request.type = network::HttpRequest::Type::HTTP_1_1;
    request.path = url.getPath();
    request.headers.emplace("Host", url.getHostHeader());
    request.headers.emplace("Content-Type", "application/json");
    request.headers.emplace("Accept", "application/json");
    request.headers.emplace("Connection", "close");
    if (decorator)
        decorator(request);
    request.body = model::BuildStatus::serialize(status);

    auto attempts = retryConfig.maxAttempts ? retryConfig.maxAttempts : 1u;
    for (auto attempt = 1u;; attempt++) {
        auto response = _client->send(url, request);
        if (network::HttpResponse::checkSuccess(response.code))
            return;

        if (!network::HttpResponse::checkRateLimited(response.code))
            throw RequestError(response.code, "Request to " + url.toString() + " failed with status " + to_string(response.code) + " " + response.reason);
        if (attempt >= attempts)
            throw RateLimitedError(response.code, "Request to " + url.toString() + " still rate limited after " + to_string(attempts) + " attempts");

        auto wait = retryAfter(response).value_or(retryConfig.backoff(attempt));
        if (wait > retryConfig.maxBackoff)
            wait = retryConfig.maxBackoff;
        cerr << "WARNING: Rate limited, retrying in " << chrono::duration_cast<chrono::seconds>(wait).count() << "s (attempt " << attempt + 1 << "/" << attempts << ")" << endl;
        this_thread::sleep_for(wait);
    }
}
//---------------------------------------------------------------------------
} // namespace statuspost::client
