#pragma once
#include "utils/utils.hpp"
#include <memory>
#include <mutex>
#include <string>
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
/// An asymmetric private key together with its algorithm family
class PrivateKey {
    /// The key
    utils::EVPKey _key;
    /// The family name, e.g. RSA
    std::string _algorithm;

    public:
    /// The constructor, takes ownership of the key
    explicit PrivateKey(utils::EVPKey key);

    /// Read a PEM encoded key, throws utils::SigningError
    [[nodiscard]] static PrivateKey fromPem(const std::string& pem);

    /// Get the algorithm family
    [[nodiscard]] const std::string& getAlgorithm() const { return _algorithm; }
    /// Get the OpenSSL key, the key stays owned by this object
    [[nodiscard]] EVP_PKEY* get() const { return _key.get(); }
};
//---------------------------------------------------------------------------
/// Supplies the signing key of this CI instance
class KeyProvider {
    public:
    /// Get the private key, the reference stays valid as long as the provider lives; throws utils::SigningError
    [[nodiscard]] virtual const PrivateKey& getPrivate() = 0;
    /// The destructor
    virtual ~KeyProvider() noexcept = default;
};
//---------------------------------------------------------------------------
/// Reads the key from a PEM file on first use
class FileKeyProvider : public KeyProvider {
    /// The key file
    std::string _keyFile;
    /// The cached key
    std::unique_ptr<PrivateKey> _key;
    /// Guards the cached key
    std::mutex _mutex;

    public:
    /// The constructor
    explicit FileKeyProvider(std::string keyFile) : _keyFile(std::move(keyFile)) {}

    /// Load the key, a failed load is retried on the next call
    [[nodiscard]] const PrivateKey& getPrivate() override;
    /// Get the key file
    [[nodiscard]] const std::string& getKeyFile() const { return _keyFile; }
};
//---------------------------------------------------------------------------
/// Holds an already loaded key
class StaticKeyProvider : public KeyProvider {
    /// The key
    PrivateKey _key;

    public:
    /// The constructor
    explicit StaticKeyProvider(PrivateKey key) : _key(std::move(key)) {}

    /// Get the key
    [[nodiscard]] const PrivateKey& getPrivate() override { return _key; }
};
//---------------------------------------------------------------------------
} // namespace statuspost::client
