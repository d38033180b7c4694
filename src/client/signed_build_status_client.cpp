#include "client/signed_build_status_client.hpp"
#include "client/http_request_executor.hpp"
#include "client/key_provider.hpp"
#include "client/root_url_provider.hpp"
#include "client/transport.hpp"
#include "network/http_request.hpp"
#include "utils/utils.hpp"
#include <stdexcept>
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
static string requireNonBlank(const string& value, const char* name)
// Trims the value and rejects blank ones
{
    auto trimmed = utils::trim(value);
    if (trimmed.empty())
        throw invalid_argument(string(name) + " must not be blank");
    return string(trimmed);
}
//---------------------------------------------------------------------------
SignedBuildStatusClient::SignedBuildStatusClient(shared_ptr<Transport> transport, const string& projectKey, const string& repoSlug, const string& revisionSha, shared_ptr<KeyProvider> keyProvider, shared_ptr<const RootUrlProvider> rootUrlProvider, bool supportsCancelledState, ClientOptions options)
    : _transport(move(transport)), _projectKey(requireNonBlank(projectKey, "projectKey")), _repoSlug(requireNonBlank(repoSlug, "repoSlug")), _revisionSha(requireNonBlank(revisionSha, "revisionSha")), _signer(move(keyProvider), move(rootUrlProvider), options.signingPolicy), _supportsCancelledState(supportsCancelledState), _options(options)
// The constructor
{
    if (!_transport)
        throw invalid_argument("transport");
    if (!_options.rateLimitAttempts)
        throw invalid_argument("rateLimitAttempts must be at least 1");
}
//---------------------------------------------------------------------------
unique_ptr<SignedBuildStatusClient> SignedBuildStatusClient::makeClient(const string& baseUrl, const string& projectKey, const string& repoSlug, const string& revisionSha, const string& keyFile, const string& rootUrl, bool supportsCancelledState, ClientOptions options)
// Wires the default collaborators
{
    auto transport = make_shared<HttpRequestExecutor>(network::Url::parse(baseUrl));
    auto keyProvider = make_shared<FileKeyProvider>(keyFile);
    auto rootUrlProvider = make_shared<StaticRootUrlProvider>(rootUrl);
    return make_unique<SignedBuildStatusClient>(move(transport), projectKey, repoSlug, revisionSha, move(keyProvider), move(rootUrlProvider), supportsCancelledState, options);
}
//---------------------------------------------------------------------------
network::Url SignedBuildStatusClient::getBuildsUrl() const
// Every identifier is escaped as a single segment
{
    auto url = _transport->getBaseUrl();
    url.addPathSegment("rest").addPathSegment("api").addPathSegment("1.0");
    url.addPathSegment("projects").addPathSegment(_projectKey);
    url.addPathSegment("repos").addPathSegment(_repoSlug);
    url.addPathSegment("commits").addPathSegment(_revisionSha);
    url.addPathSegment("builds");
    return url;
}
//---------------------------------------------------------------------------
network::RetryOnRateLimitConfig SignedBuildStatusClient::getRetryConfig() const
// The retry configuration
{
    network::RetryOnRateLimitConfig config;
    config.maxAttempts = _options.rateLimitAttempts;
    return config;
}
//---------------------------------------------------------------------------
void SignedBuildStatusClient::post(model::BuildStatus::Builder& statusBuilder, const BeforePost& beforePost)
// Finalize, notify, sign and send
{
    if (!_supportsCancelledState)
        statusBuilder.noCancelledState();
    auto status = statusBuilder.build();

    if (beforePost)
        beforePost(status);

    auto url = getBuildsUrl();
    auto headers = _signer.computeHeaders(status);
    auto decorator = [&headers](network::HttpRequest& request) {
        for (const auto& header : headers)
            request.headers[header.first] = header.second;
    };
    _transport->makePostRequest(url, status, decorator, getRetryConfig());
}
//---------------------------------------------------------------------------
} // namespace statuspost::client
