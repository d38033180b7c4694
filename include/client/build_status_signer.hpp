#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <openssl/types.h>
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
//---------------------------------------------------------------------------
namespace client {
//---------------------------------------------------------------------------
class KeyProvider;
class RootUrlProvider;
//---------------------------------------------------------------------------
/// What happens to a status whose signature could not be computed
enum class SigningPolicy : uint8_t {
    /// Log a warning and send the status without signature
    FailOpen,
    /// Log and rethrow, nothing is sent
    FailClosed
};
//---------------------------------------------------------------------------
/// Implements the build status signing logic
/// The signature covers key, ref (if present), state and url in this order without separators.
/// The receiver rebuilds the same byte sequence and checks it with the public key of the CI instance.
class BuildStatusSigner {
    public:
    /// Header with the externally reachable root url, always sent
    static constexpr std::string_view baseUrlHeader = "base-url";
    /// Header with the base64 signature
    static constexpr std::string_view signatureHeader = "BBS-Signature";
    /// Header with the signature algorithm
    static constexpr std::string_view signatureAlgorithmHeader = "BBS-Signature-Algorithm";
    /// The hash part of the algorithm name
    static constexpr std::string_view hashAlgorithm = "SHA256";

    /// The result of signing one status
    struct SignatureEnvelope {
        /// The base64 encoded signature
        std::string signature;
        /// The algorithm, e.g. SHA256withRSA
        std::string algorithm;
    };

    private:
    /// The key provider
    std::shared_ptr<KeyProvider> _keyProvider;
    /// The root url provider
    std::shared_ptr<const RootUrlProvider> _rootUrlProvider;
    /// The policy
    SigningPolicy _policy;

    public:
    /// The constructor, throws std::invalid_argument for missing providers
    BuildStatusSigner(std::shared_ptr<KeyProvider> keyProvider, std::shared_ptr<const RootUrlProvider> rootUrlProvider, SigningPolicy policy = SigningPolicy::FailOpen);

    /// Computes the request headers; any failure to sign, including key provider errors, is handled according to the policy
    [[nodiscard]] std::map<std::string, std::string> computeHeaders(const model::BuildStatus& status) const;
    /// Signs the status, throws utils::SigningError
    [[nodiscard]] SignatureEnvelope sign(const model::BuildStatus& status) const;
    /// Get the policy
    [[nodiscard]] SigningPolicy getPolicy() const { return _policy; }

    /// The algorithm name for a key family, e.g. SHA256withRSA for RSA
    [[nodiscard]] static std::string algorithmName(std::string_view keyAlgorithm);
    /// The signed fields in canonical order
    [[nodiscard]] static std::vector<std::string_view> canonicalFields(const model::BuildStatus& status);
    /// Verifies the signature headers of a status with the public key
    [[nodiscard]] static bool verify(const model::BuildStatus& status, const std::map<std::string, std::string>& headers, EVP_PKEY* publicKey);
};
//---------------------------------------------------------------------------
} // namespace client
} // namespace statuspost
