#pragma once
#include <memory>
#include <string>
#include <openssl/ssl.h>
#include <openssl/types.h>
//---------------------------------------------------------------------------
// StatusPost - Signed Build Status Client
// StatusPost Contributors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace statuspost::network {
//---------------------------------------------------------------------------
// The context is shared by all connections of one http client.
// SSL_CTX is safe to use from multiple threads once it is configured.
class TLSContext {
    /// The ssl context
    SSL_CTX* _ctx;
    /// Verify the peer certificate and host name
    bool _verifyPeer;

    public:
    /// The constructor, an empty caFile uses the system trust store
    explicit TLSContext(bool verifyPeer = true, const std::string& caFile = "");
    /// The destructor
    ~TLSContext();

    TLSContext(const TLSContext&) = delete;
    TLSContext& operator=(const TLSContext&) = delete;

    /// Creates a client connection on the connected socket and performs the handshake
    [[nodiscard]] std::unique_ptr<SSL, decltype(&SSL_free)> connect(int fd, const std::string& hostname) const;

    /// Init the OpenSSL algos and errors
    static void initOpenSSL();
};
//---------------------------------------------------------------------------
} // namespace statuspost::network
