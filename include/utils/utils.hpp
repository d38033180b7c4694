#pragma once
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <openssl/evp.h>
//---------------------------------------------------------------------------
// StatusPost - Signed Build Status Client
// StatusPost Contributors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace statuspost::utils {
//---------------------------------------------------------------------------
/// An owned OpenSSL key
using EVPKey = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
//---------------------------------------------------------------------------
/// Raised for every failure of a cryptographic operation (missing key, unsupported algorithm, signing fault)
class SigningError : public std::runtime_error {
    public:
    using std::runtime_error::runtime_error;
};
//---------------------------------------------------------------------------
/// Encode url special characters in %HEX
std::string encodeUrlParameters(std::string_view encode);
/// Encode everything from binary representation to hex
std::string hexEncode(const uint8_t* input, uint64_t length, bool upper = false);
/// Encode everything from binary representation to base64
std::string base64Encode(const uint8_t* input, uint64_t length);
/// Decodes from base64 to raw string
std::pair<std::unique_ptr<uint8_t[]>, uint64_t> base64Decode(const uint8_t* input, uint64_t length);
/// Escape a string for a json string literal (without the quotes)
std::string jsonEscape(std::string_view input);
/// Strip leading and trailing whitespace
std::string_view trim(std::string_view input);
/// Case insensitive ascii compare
bool equalsIgnoreCase(std::string_view a, std::string_view b);

/// Read a PEM encoded private key
EVPKey readPrivateKey(const uint8_t* keyData, uint64_t keyLength);
/// Read a PEM encoded public key
EVPKey readPublicKey(const uint8_t* keyData, uint64_t keyLength);
/// The key family name as used in signature algorithm names (RSA, DSA, EC, ...)
std::string keyAlgorithm(const EVP_PKEY* key);
/// Sign the concatenation of parts with the key and the digest
std::pair<std::unique_ptr<uint8_t[]>, uint64_t> sign(EVP_PKEY* key, const EVP_MD* digest, const std::vector<std::string_view>& parts);
/// Verify a signature over the concatenation of parts
bool verify(EVP_PKEY* key, const EVP_MD* digest, const std::vector<std::string_view>& parts, const uint8_t* signature, uint64_t signatureLength);
//---------------------------------------------------------------------------
} // namespace statuspost::utils
