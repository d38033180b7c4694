#pragma once
#include "client/build_status_client.hpp"
#include "client/build_status_signer.hpp"
#include "network/config.hpp"
#include "network/url.hpp"
#include <memory>
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
class KeyProvider;
class RootUrlProvider;
class Transport;
//---------------------------------------------------------------------------
/// The client options
struct ClientOptions {
    /// Default attempts for rate limited requests
    static constexpr unsigned defaultRateLimitAttempts = network::RetryOnRateLimitConfig::defaultMaxAttempts;

    /// Total attempts for rate limited requests
    unsigned rateLimitAttempts = defaultRateLimitAttempts;
    /// Handling of signing errors
    SigningPolicy signingPolicy = SigningPolicy::FailOpen;
};
//---------------------------------------------------------------------------
/// Posts signed build statuses to the builds resource of one commit
/// Every request carries the root url of this instance and, if signing succeeds, a detached signature
class SignedBuildStatusClient : public BuildStatusClient {
    /// The transport
    std::shared_ptr<Transport> _transport;
    /// The project key
    std::string _projectKey;
    /// The repository slug
    std::string _repoSlug;
    /// The commit
    std::string _revisionSha;
    /// The signer
    BuildStatusSigner _signer;
    /// Can the server store CANCELLED?
    bool _supportsCancelledState;
    /// The options
    ClientOptions _options;

    public:
    /// The constructor, throws std::invalid_argument for blank addressing fields or missing collaborators
    SignedBuildStatusClient(std::shared_ptr<Transport> transport, const std::string& projectKey, const std::string& repoSlug, const std::string& revisionSha, std::shared_ptr<KeyProvider> keyProvider, std::shared_ptr<const RootUrlProvider> rootUrlProvider, bool supportsCancelledState, ClientOptions options = ClientOptions());

    /// Creates a client with the http transport, a PEM key file and a fixed root url
    [[nodiscard]] static std::unique_ptr<SignedBuildStatusClient> makeClient(const std::string& baseUrl, const std::string& projectKey, const std::string& repoSlug, const std::string& revisionSha, const std::string& keyFile, const std::string& rootUrl, bool supportsCancelledState = true, ClientOptions options = ClientOptions());

    /// Finalize, sign and post the status; transport errors propagate
    void post(model::BuildStatus::Builder& statusBuilder, const BeforePost& beforePost) override;

    /// The builds resource of the commit
    [[nodiscard]] network::Url getBuildsUrl() const;
    /// The retry configuration handed to the transport
    [[nodiscard]] network::RetryOnRateLimitConfig getRetryConfig() const;

    [[nodiscard]] const std::string& getProjectKey() const { return _projectKey; }
    [[nodiscard]] const std::string& getRepoSlug() const { return _repoSlug; }
    [[nodiscard]] const std::string& getRevisionSha() const { return _revisionSha; }
    [[nodiscard]] bool supportsCancelledState() const { return _supportsCancelledState; }
};
//---------------------------------------------------------------------------
} // namespace statuspost::client
