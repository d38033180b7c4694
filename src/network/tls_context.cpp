#include "network/tls_context.hpp"
#include <stdexcept>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>
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
using namespace std;
//---------------------------------------------------------------------------
TLSContext::TLSContext(bool verifyPeer, const string& caFile) : _ctx(nullptr), _verifyPeer(verifyPeer)
// Construct the TLS Context
{
    // Set to TLS
    auto method = TLS_client_method();

    // Set up the context
    _ctx = SSL_CTX_new(method);
    if (!_ctx)
        throw runtime_error("OpenSSL Error - TLS Context!");
    SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION);

    if (_verifyPeer) {
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_PEER, nullptr);
        auto loaded = caFile.empty() ? SSL_CTX_set_default_verify_paths(_ctx) : SSL_CTX_load_verify_locations(_ctx, caFile.c_str(), nullptr);
        if (loaded != 1) {
            SSL_CTX_free(_ctx);
            throw runtime_error("OpenSSL Error - Load Trust Store!");
        }
    } else {
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_NONE, nullptr);
    }
}
//---------------------------------------------------------------------------
TLSContext::~TLSContext()
// The desturctor
{
    // Destroy context
    if (_ctx)
        SSL_CTX_free(_ctx);
}
//---------------------------------------------------------------------------
void TLSContext::initOpenSSL()
// Inits the openssl algos
{
    // Load algos
    OpenSSL_add_ssl_algorithms();
    SSL_load_error_strings();
}
//---------------------------------------------------------------------------
unique_ptr<SSL, decltype(&SSL_free)> TLSContext::connect(int fd, const string& hostname) const
// Performs the blocking handshake
{
    unique_ptr<SSL, decltype(&SSL_free)> ssl(SSL_new(_ctx), SSL_free);
    if (!ssl)
        throw runtime_error("OpenSSL Error - No Connection!");

    // SNI and host name check
    SSL_set_tlsext_host_name(ssl.get(), hostname.c_str());
    if (_verifyPeer && SSL_set1_host(ssl.get(), hostname.c_str()) != 1)
        throw runtime_error("OpenSSL Error - Host Verification Setup!");

    if (SSL_set_fd(ssl.get(), fd) != 1)
        throw runtime_error("OpenSSL Error - Set Socket!");

    if (SSL_connect(ssl.get()) != 1) {
        string message = "TLS handshake with " + hostname + " failed";
        auto code = ERR_get_error();
        if (code) {
            char buffer[256];
            ERR_error_string_n(code, buffer, sizeof(buffer));
            message += ": ";
            message += buffer;
        }
        ERR_clear_error();
        throw runtime_error(message);
    }
    return ssl;
}
//---------------------------------------------------------------------------
} // namespace statuspost::network
