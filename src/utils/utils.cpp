#include "utils/utils.hpp"
#include <cassert>
#include <cctype>
#include <stdexcept>
#include <utility>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/pem.h>
//---------------------------------------------------------------------------
// StatusPost - Signed Build Status Client
// StatusPost Contributors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace statuspost {
namespace utils {
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
using MDContext = unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using MemoryBio = unique_ptr<BIO, decltype(&BIO_free_all)>;
//---------------------------------------------------------------------------
string openSSLError(const char* what)
// Appends the last queued OpenSSL error, if any
{
    string message = "OpenSSL Error - ";
    message += what;
    auto code = ERR_get_error();
    if (code) {
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        message += ": ";
        message += buffer;
    }
    ERR_clear_error();
    return message;
}
//---------------------------------------------------------------------------
MemoryBio memoryBio(const uint8_t* data, uint64_t length)
// Wraps the key data in a read only memory bio
{
    if (!in_range<int>(length))
        throw SigningError("OpenSSL Error - Key too large!");
    MemoryBio bio(BIO_new_mem_buf(reinterpret_cast<const void*>(data), static_cast<int>(length)), BIO_free_all);
    if (!bio)
        throw SigningError("OpenSSL Error - No Buffer Mem!");
    return bio;
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
string base64Encode(const uint8_t* input, uint64_t length)
// Encodes a string as a base64 string
{
    assert(in_range<int>(length));
    auto baseLength = 4 * ((length + 2) / 3);
    auto buffer = make_unique<char[]>(baseLength + 1);
    auto encodeLength = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(buffer.get()), input, static_cast<int>(length));
    if (encodeLength < 0 || static_cast<unsigned>(encodeLength) != baseLength)
        throw runtime_error("OpenSSL Error!");
    return string(buffer.get(), static_cast<unsigned>(encodeLength));
}
//---------------------------------------------------------------------------
pair<unique_ptr<uint8_t[]>, uint64_t> base64Decode(const uint8_t* input, uint64_t length)
// Decodes from base64 to raw string
{
    assert(in_range<int>(length));
    auto baseLength = 3 * length / 4;
    auto buffer = make_unique<uint8_t[]>(baseLength + 1);
    if (!length)
        return {move(buffer), 0};
    if (length % 4)
        throw runtime_error("Invalid base64 length!");
    auto decodeLength = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(buffer.get()), input, static_cast<int>(length));
    if (decodeLength < 0 || static_cast<unsigned>(decodeLength) != baseLength)
        throw runtime_error("OpenSSL Error!");
    // EVP_DecodeBlock keeps the zero bytes of the padding
    for (auto i = length; i > length - 2 && input[i - 1] == '='; i--)
        --decodeLength;
    return {move(buffer), static_cast<uint64_t>(decodeLength)};
}
//---------------------------------------------------------------------------
string hexEncode(const uint8_t* input, uint64_t length, bool upper)
// Encodes a string as a hex string
{
    const char hex[] = "0123456789abcdef";
    string output;
    output.reserve(length << 1);
    for (auto i = 0u; i < length; i++) {
        output.push_back(upper ? static_cast<char>(toupper(hex[input[i] >> 4])) : hex[input[i] >> 4]);
        output.push_back(upper ? static_cast<char>(toupper(hex[input[i] & 15])) : hex[input[i] & 15]);
    }
    return output;
}
//---------------------------------------------------------------------------
string encodeUrlParameters(string_view encode)
// Encodes a string for url, only the RFC 3986 unreserved characters are kept
{
    string result;
    result.reserve(encode.size());
    for (auto c : encode) {
        if (isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            result += c;
        } else {
            auto byte = static_cast<uint8_t>(c);
            result += "%";
            result += hexEncode(&byte, 1, true);
        }
    }
    return result;
}
//---------------------------------------------------------------------------
string jsonEscape(string_view input)
// Escapes quotes, backslashes and control characters
{
    string result;
    result.reserve(input.size());
    for (auto c : input) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default: {
                auto byte = static_cast<uint8_t>(c);
                if (byte < 0x20) {
                    result += "\\u00";
                    result += hexEncode(&byte, 1);
                } else {
                    result += c;
                }
            }
        }
    }
    return result;
}
//---------------------------------------------------------------------------
string_view trim(string_view input)
// Strip whitespaces
{
    auto begin = input.find_first_not_of(" \t\r\n\f\v");
    if (begin == input.npos)
        return {};
    auto end = input.find_last_not_of(" \t\r\n\f\v");
    return input.substr(begin, end - begin + 1);
}
//---------------------------------------------------------------------------
bool equalsIgnoreCase(string_view a, string_view b)
// Ascii case insensitive compare
{
    if (a.size() != b.size())
        return false;
    for (auto i = 0u; i < a.size(); i++)
        if (tolower(static_cast<unsigned char>(a[i])) != tolower(static_cast<unsigned char>(b[i])))
            return false;
    return true;
}
//---------------------------------------------------------------------------
EVPKey readPrivateKey(const uint8_t* keyData, uint64_t keyLength)
// Reads a PEM private key (PKCS#1 or PKCS#8)
{
    auto keybio = memoryBio(keyData, keyLength);
    EVPKey key(PEM_read_bio_PrivateKey(keybio.get(), nullptr, nullptr, nullptr), EVP_PKEY_free);
    if (!key)
        throw SigningError(openSSLError("Read Private Key!"));
    return key;
}
//---------------------------------------------------------------------------
EVPKey readPublicKey(const uint8_t* keyData, uint64_t keyLength)
// Reads a PEM public key (SubjectPublicKeyInfo)
{
    auto keybio = memoryBio(keyData, keyLength);
    EVPKey key(PEM_read_bio_PUBKEY(keybio.get(), nullptr, nullptr, nullptr), EVP_PKEY_free);
    if (!key)
        throw SigningError(openSSLError("Read Public Key!"));
    return key;
}
//---------------------------------------------------------------------------
string keyAlgorithm(const EVP_PKEY* key)
// Gets the family name of the key
{
    if (!key)
        throw SigningError("OpenSSL Error - No Key!");
    switch (EVP_PKEY_get_base_id(key)) {
        case EVP_PKEY_RSA: return "RSA";
        case EVP_PKEY_DSA: return "DSA";
        case EVP_PKEY_EC: return "EC";
        default: break;
    }
    auto name = EVP_PKEY_get0_type_name(key);
    if (name)
        return name;
    auto shortName = OBJ_nid2sn(EVP_PKEY_get_base_id(key));
    if (shortName)
        return shortName;
    throw SigningError("OpenSSL Error - Unknown Key Type!");
}
//---------------------------------------------------------------------------
pair<unique_ptr<uint8_t[]>, uint64_t> sign(EVP_PKEY* key, const EVP_MD* digest, const vector<string_view>& parts)
// Signs the parts in order, the result equals signing the concatenated parts
{
    MDContext signContext(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!signContext)
        throw SigningError("OpenSSL Error - No Context!");

    if (EVP_DigestSignInit(signContext.get(), nullptr, digest, nullptr, key) <= 0)
        throw SigningError(openSSLError("Sign Init!"));

    for (auto part : parts)
        if (EVP_DigestSignUpdate(signContext.get(), part.data(), part.size()) <= 0)
            throw SigningError(openSSLError("Sign Update!"));

    size_t signatureLength;
    if (EVP_DigestSignFinal(signContext.get(), nullptr, &signatureLength) <= 0)
        throw SigningError(openSSLError("Sign Final!"));

    auto signature = make_unique<uint8_t[]>(signatureLength);
    if (EVP_DigestSignFinal(signContext.get(), signature.get(), &signatureLength) <= 0)
        throw SigningError(openSSLError("Sign Final!"));

    return {move(signature), signatureLength};
}
//---------------------------------------------------------------------------
bool verify(EVP_PKEY* key, const EVP_MD* digest, const vector<string_view>& parts, const uint8_t* signature, uint64_t signatureLength)
// Verifies the signature over the parts in order
{
    MDContext verifyContext(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!verifyContext)
        throw SigningError("OpenSSL Error - No Context!");

    if (EVP_DigestVerifyInit(verifyContext.get(), nullptr, digest, nullptr, key) <= 0)
        throw SigningError(openSSLError("Verify Init!"));

    for (auto part : parts)
        if (EVP_DigestVerifyUpdate(verifyContext.get(), part.data(), part.size()) <= 0)
            throw SigningError(openSSLError("Verify Update!"));

    auto result = EVP_DigestVerifyFinal(verifyContext.get(), signature, signatureLength);
    ERR_clear_error();
    return result == 1;
}
//---------------------------------------------------------------------------
}; // namespace utils
}; // namespace statuspost
