#include "client/signed_build_status_client.hpp"
#include "../test_keys.hpp"
#include "client/key_provider.hpp"
#include "client/root_url_provider.hpp"
#include "test_doubles.hpp"
#include <catch2/catch.hpp>
#include <memory>
#include <stdexcept>
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
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// Wires a client with a recording transport
struct ClientFixture {
    shared_ptr<RecordingTransport> transport = make_shared<RecordingTransport>();
    shared_ptr<KeyProvider> keyProvider = make_shared<StaticKeyProvider>(PrivateKey::fromPem(statuspost::test::rsaPrivateKey()));
    shared_ptr<const RootUrlProvider> rootUrlProvider = make_shared<StaticRootUrlProvider>("https://ci.example.com/");

    unique_ptr<SignedBuildStatusClient> makeClient(bool supportsCancelledState = true, ClientOptions options = ClientOptions()) {
        return make_unique<SignedBuildStatusClient>(transport, "PRJ", "repo1", "abc123", keyProvider, rootUrlProvider, supportsCancelledState, options);
    }
};
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
TEST_CASE("client_post") {
    ClientFixture fixture;
    auto client = fixture.makeClient();

    model::BuildStatus::Builder builder("k1", model::BuildState::SUCCESSFUL, "http://ci/job/1");
    builder.setRef("refs/heads/main");
    client->post(builder, nullptr);

    REQUIRE(fixture.transport->records.size() == 1);
    const auto& record = fixture.transport->records.front();
    REQUIRE(record.url == "https://scm.example.com/rest/api/1.0/projects/PRJ/repos/repo1/commits/abc123/builds");
    REQUIRE(record.request.path == "/rest/api/1.0/projects/PRJ/repos/repo1/commits/abc123/builds");
    REQUIRE(*record.request.findHeader("base-url") == "https://ci.example.com/");
    REQUIRE(*record.request.findHeader("BBS-Signature-Algorithm") == "SHA256withRSA");
    REQUIRE(*record.request.findHeader("BBS-Signature") == statuspost::test::rsaReferenceSignature);
    REQUIRE(record.status.getKey() == "k1");
    REQUIRE(record.retryConfig.maxAttempts == 3);
}
//---------------------------------------------------------------------------
TEST_CASE("client_url") {
    ClientFixture fixture;
    REQUIRE(fixture.makeClient()->getBuildsUrl().getPath() == "/rest/api/1.0/projects/PRJ/repos/repo1/commits/abc123/builds");

    // Identifiers are escaped segment by segment and the base path is kept
    fixture.transport->baseUrl = network::Url::parse("http://localhost:7990/bitbucket/");
    SignedBuildStatusClient client(fixture.transport, " ~user ", "my repo", "feature/x", fixture.keyProvider, fixture.rootUrlProvider, true);
    REQUIRE(client.getProjectKey() == "~user");
    REQUIRE(client.getBuildsUrl().toString() == "http://localhost:7990/bitbucket/rest/api/1.0/projects/~user/repos/my%20repo/commits/feature%2Fx/builds");
}
//---------------------------------------------------------------------------
TEST_CASE("client_before_post") {
    ClientFixture fixture;
    auto client = fixture.makeClient(false);

    unsigned calls = 0;
    size_t recordsAtCall = 1;
    model::BuildStatus::Builder builder("k1", model::BuildState::CANCELLED, "http://ci/job/1");
    client->post(builder, [&](const model::BuildStatus& status) {
        calls++;
        recordsAtCall = fixture.transport->records.size();
        REQUIRE(status.getState() == model::BuildState::FAILED);
    });
    REQUIRE(calls == 1);
    REQUIRE(recordsAtCall == 0);
    REQUIRE(fixture.transport->records.front().status.getState() == model::BuildState::FAILED);
}
//---------------------------------------------------------------------------
TEST_CASE("client_cancelled_state") {
    ClientFixture fixture;
    auto client = fixture.makeClient(true);
    REQUIRE(client->supportsCancelledState());

    model::BuildStatus::Builder builder("k1", model::BuildState::CANCELLED, "http://ci/job/1");
    client->post(builder, nullptr);
    REQUIRE(fixture.transport->records.back().status.getState() == model::BuildState::CANCELLED);
}
//---------------------------------------------------------------------------
TEST_CASE("client_signing_failure") {
    ClientFixture fixture;
    fixture.keyProvider = make_shared<ThrowingKeyProvider>();
    auto client = fixture.makeClient();

    // The hook still fires and the status is sent without signature
    unsigned calls = 0;
    model::BuildStatus::Builder builder("k1", model::BuildState::SUCCESSFUL, "http://ci/job/1");
    client->post(builder, [&](const model::BuildStatus&) { calls++; });
    REQUIRE(calls == 1);
    REQUIRE(fixture.transport->records.size() == 1);
    const auto& request = fixture.transport->records.front().request;
    REQUIRE(request.headers.size() == 1);
    REQUIRE(*request.findHeader("base-url") == "https://ci.example.com/");

    // Plain runtime errors from the key provider do not abort the post either
    fixture.keyProvider = make_shared<UnavailableKeyProvider>();
    auto keystoreClient = fixture.makeClient();
    REQUIRE_NOTHROW(keystoreClient->post(builder, nullptr));
    REQUIRE(fixture.transport->records.size() == 2);
    REQUIRE(fixture.transport->records.back().request.headers.size() == 1);
    fixture.keyProvider = make_shared<ThrowingKeyProvider>();

    // Fail closed aborts before anything is sent
    ClientOptions options;
    options.signingPolicy = SigningPolicy::FailClosed;
    options.rateLimitAttempts = 5;
    auto strictClient = fixture.makeClient(true, options);
    REQUIRE(strictClient->getRetryConfig().maxAttempts == 5);
    calls = 0;
    REQUIRE_THROWS_AS(strictClient->post(builder, [&](const model::BuildStatus&) { calls++; }), utils::SigningError);
    REQUIRE(calls == 1);
    REQUIRE(fixture.transport->records.size() == 2);
}
//---------------------------------------------------------------------------
TEST_CASE("client_construction") {
    ClientFixture fixture;
    auto make = [&](const string& projectKey, const string& repoSlug, const string& revisionSha) {
        return SignedBuildStatusClient(fixture.transport, projectKey, repoSlug, revisionSha, fixture.keyProvider, fixture.rootUrlProvider, true);
    };
    REQUIRE_THROWS_AS(make("", "repo1", "abc123"), invalid_argument);
    REQUIRE_THROWS_AS(make("PRJ", "  ", "abc123"), invalid_argument);
    REQUIRE_THROWS_AS(make("PRJ", "repo1", "\t"), invalid_argument);
    REQUIRE_NOTHROW(make("PRJ", "repo1", "abc123"));

    REQUIRE_THROWS_AS(SignedBuildStatusClient(nullptr, "PRJ", "repo1", "abc123", fixture.keyProvider, fixture.rootUrlProvider, true), invalid_argument);
    REQUIRE_THROWS_AS(SignedBuildStatusClient(fixture.transport, "PRJ", "repo1", "abc123", nullptr, fixture.rootUrlProvider, true), invalid_argument);
    REQUIRE_THROWS_AS(SignedBuildStatusClient(fixture.transport, "PRJ", "repo1", "abc123", fixture.keyProvider, nullptr, true), invalid_argument);
    REQUIRE(fixture.transport->records.empty());

    // Builder validation happens before the hook
    auto client = fixture.makeClient();
    unsigned calls = 0;
    model::BuildStatus::Builder builder("", model::BuildState::SUCCESSFUL, "http://ci/job/1");
    REQUIRE_THROWS_AS(client->post(builder, [&](const model::BuildStatus&) { calls++; }), invalid_argument);
    REQUIRE(calls == 0);
    REQUIRE(fixture.transport->records.empty());
}
//---------------------------------------------------------------------------
TEST_CASE("client_factory") {
    auto client = SignedBuildStatusClient::makeClient("https://scm.example.com/", "PRJ", "repo1", "abc123", "/nonexistent/statuspost/key.pem", "https://ci.example.com/");
    REQUIRE(client->getBuildsUrl().toString() == "https://scm.example.com/rest/api/1.0/projects/PRJ/repos/repo1/commits/abc123/builds");
    REQUIRE(client->supportsCancelledState());
    REQUIRE_THROWS_AS(SignedBuildStatusClient::makeClient("scm.example.com", "PRJ", "repo1", "abc123", "key.pem", "https://ci.example.com/"), invalid_argument);
}
//---------------------------------------------------------------------------
} // namespace statuspost::client::test
