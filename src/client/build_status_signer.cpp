#include "client/build_status_signer.hpp"
#include "client/key_provider.hpp"
#include "client/root_url_provider.hpp"
#include "model/build_status.hpp"
#include "utils/utils.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>
#include <openssl/evp.h>
//---------------------------------------------------------------------------
// StatusPost - Signed Build Status Client
// StatusPost Contributors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace statuspost {
namespace client {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
const EVP_MD* digestFor(string_view algorithm)
// The supported signature algorithms
{
    if (algorithm == "SHA256withRSA" || algorithm == "SHA256withDSA" || algorithm == "SHA256withEC")
        return EVP_sha256();
    throw utils::SigningError("Unsupported signature algorithm " + string(algorithm));
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
BuildStatusSigner::BuildStatusSigner(shared_ptr<KeyProvider> keyProvider, shared_ptr<const RootUrlProvider> rootUrlProvider, SigningPolicy policy)
    : _keyProvider(move(keyProvider)), _rootUrlProvider(move(rootUrlProvider)), _policy(policy)
// The constructor
{
    if (!_keyProvider)
        throw invalid_argument("keyProvider");
    if (!_rootUrlProvider)
        throw invalid_argument("rootUrlProvider");
}
//---------------------------------------------------------------------------
string BuildStatusSigner::algorithmName(string_view keyAlgorithm)
// Self describing name, e.g. SHA256withRSA
{
    string algorithm(hashAlgorithm);
    algorithm += "with";
    algorithm += keyAlgorithm;
    return algorithm;
}
//---------------------------------------------------------------------------
vector<string_view> BuildStatusSigner::canonicalFields(const model::BuildStatus& status)
// A missing ref is skipped, not signed as empty value
{
    vector<string_view> fields;
    fields.reserve(4);
    fields.emplace_back(status.getKey());
    if (status.getRef())
        fields.emplace_back(*status.getRef());
    fields.emplace_back(status.getStateName());
    fields.emplace_back(status.getUrl());
    return fields;
}
//---------------------------------------------------------------------------
BuildStatusSigner::SignatureEnvelope BuildStatusSigner::sign(const model::BuildStatus& status) const
// Signs the canonical fields with the instance key
{
    const auto& key = _keyProvider->getPrivate();
    auto algorithm = algorithmName(key.getAlgorithm());
    auto signature = utils::sign(key.get(), digestFor(algorithm), canonicalFields(status));
    return {utils::base64Encode(signature.first.get(), signature.second), move(algorithm)};
}
//---------------------------------------------------------------------------
map<string, string> BuildStatusSigner::computeHeaders(const model::BuildStatus& status) const
// The base url is always present, the signature only if signing succeeded
{
    map<string, string> headers;
    headers.emplace(baseUrlHeader, _rootUrlProvider->getRoot());
    try {
        auto envelope = sign(status);
        headers.emplace(signatureHeader, move(envelope.signature));
        headers.emplace(signatureAlgorithmHeader, move(envelope.algorithm));
    } catch (const exception& e) {
        if (_policy == SigningPolicy::FailClosed) {
            cerr << "ERROR: Error signing build status, not sending: " << e.what() << endl;
            throw;
        }
        cerr << "WARNING: Error signing build status, continuing without signature: " << e.what() << endl;
    }
    return headers;
}
//---------------------------------------------------------------------------
bool BuildStatusSigner::verify(const model::BuildStatus& status, const map<string, string>& headers, EVP_PKEY* publicKey)
// Rebuilds the canonical fields and checks the signature header
{
    auto signatureIt = headers.find(string(signatureHeader));
    auto algorithmIt = headers.find(string(signatureAlgorithmHeader));
    if (signatureIt == headers.end() || algorithmIt == headers.end())
        return false;
    if (algorithmIt->second != algorithmName(utils::keyAlgorithm(publicKey)))
        return false;

    // A malformed header reads as invalid signature
    const auto& encoded = signatureIt->second;
    if (encoded.empty() || encoded.size() % 4)
        return false;
    pair<unique_ptr<uint8_t[]>, uint64_t> signature;
    try {
        signature = utils::base64Decode(reinterpret_cast<const uint8_t*>(encoded.data()), encoded.size());
    } catch (const runtime_error&) {
        return false;
    }
    return utils::verify(publicKey, digestFor(algorithmIt->second), canonicalFields(status), signature.first.get(), signature.second);
}
//---------------------------------------------------------------------------
} // namespace client
} // namespace statuspost
