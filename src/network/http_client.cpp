#include "network/http_client.hpp"
#include "network/tls_context.hpp"
#include "network/url.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>
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
namespace {
//---------------------------------------------------------------------------
/// Closes the socket when leaving the scope
struct Socket {
    int fd = -1;
    ~Socket() {
        if (fd >= 0)
            ::close(fd);
    }
};
//---------------------------------------------------------------------------
timeval toTimeval(chrono::milliseconds timeout)
// Convert for setsockopt
{
    timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return tv;
}
//---------------------------------------------------------------------------
int connectSocket(const Url& url, const HttpClient::Settings& settings)
// Resolves the host and connects to the first reachable address
{
    struct addrinfo hints = {};
    memset(&hints, 0, sizeof hints);
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* temp;
    auto port = to_string(url.getPort());
    if (auto error = getaddrinfo(url.getHost().c_str(), port.c_str(), &hints, &temp); error != 0)
        throw runtime_error("hostname getaddrinfo error: " + string(gai_strerror(error)));
    unique_ptr<addrinfo, decltype(&freeaddrinfo)> addr(temp, &freeaddrinfo);

    auto sendTimeout = toTimeval(settings.connectTimeout);
    auto recvTimeout = toTimeval(settings.receiveTimeout);
    int lastError = 0;
    for (auto* info = addr.get(); info; info = info->ai_next) {
        auto fd = ::socket(info->ai_family, info->ai_socktype, info->ai_protocol);
        if (fd < 0) {
            lastError = errno;
            continue;
        }
        // SO_SNDTIMEO also bounds connect
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &sendTimeout, sizeof(sendTimeout));
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &recvTimeout, sizeof(recvTimeout));
        int flag = 1;
        ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
        if (::connect(fd, info->ai_addr, info->ai_addrlen) == 0)
            return fd;
        lastError = errno;
        ::close(fd);
    }
    throw runtime_error("Could not connect to " + url.getHostHeader() + ": " + strerror(lastError));
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
HttpClient::HttpClient() : HttpClient(Settings())
// The constructor with default settings
{
}
//---------------------------------------------------------------------------
HttpClient::HttpClient(Settings settings) : _settings(move(settings))
// The constructor
{
}
//---------------------------------------------------------------------------
HttpClient::~HttpClient() noexcept = default;
//---------------------------------------------------------------------------
HttpResponse HttpClient::send(const Url& url, const HttpRequest& request)
// One request per connection, the response ends with Content-Length, the last chunk, or the connection close
{
    Socket socket;
    socket.fd = connectSocket(url, _settings);

    unique_ptr<SSL, decltype(&SSL_free)> ssl(nullptr, SSL_free);
    if (url.isTls()) {
        TLSContext* context;
        {
            lock_guard<mutex> lock(_contextMutex);
            if (!_context) {
                TLSContext::initOpenSSL();
                _context = make_unique<TLSContext>(_settings.verifyPeer, _settings.caFile);
            }
            context = _context.get();
        }
        ssl = context->connect(socket.fd, url.getHost());
    }

    auto write = [&](const char* data, size_t length) -> int64_t {
        if (ssl)
            return SSL_write(ssl.get(), data, static_cast<int>(length));
        return ::send(socket.fd, data, length, MSG_NOSIGNAL);
    };
    auto read = [&](char* data, size_t length) -> int64_t {
        if (ssl)
            return SSL_read(ssl.get(), data, static_cast<int>(length));
        return ::recv(socket.fd, data, length, 0);
    };

    // Send the full request
    auto message = HttpRequest::serialize(request);
    size_t sent = 0;
    while (sent < message.size()) {
        auto chunk = min<size_t>(message.size() - sent, 1u << 16);
        auto result = write(message.data() + sent, chunk);
        if (result <= 0) {
            if (!ssl && errno == EINTR)
                continue;
            throw runtime_error("Request error! Error code: " + string(strerror(errno)));
        }
        sent += static_cast<size_t>(result);
    }

    // Receive until the response is complete
    static constexpr string_view headerEnd = "\r\n\r\n";
    string buffer;
    optional<HttpResponse> response;
    size_t headerLength = 0;
    char chunk[1 << 14];
    while (true) {
        if (response) {
            auto content = string_view(buffer).substr(headerLength);
            if (HttpResponse::withoutContent(response->code))
                break;
            if (response->isChunked()) {
                if (auto body = HttpResponse::decodeChunked(content)) {
                    response->body = move(*body);
                    return *response;
                }
            } else if (auto length = response->getContentLength()) {
                if (content.size() >= *length) {
                    response->body = string(content.substr(0, *length));
                    return *response;
                }
            }
        }

        auto result = read(chunk, sizeof(chunk));
        if (result == 0 || (ssl && result < 0 && SSL_get_error(ssl.get(), static_cast<int>(result)) == SSL_ERROR_ZERO_RETURN)) {
            // Connection closed
            if (!response)
                throw runtime_error("Empty response - connection closed!");
            if (response->isChunked() || response->getContentLength())
                throw runtime_error("Incomplete response - connection closed!");
            response->body = buffer.substr(headerLength);
            return *response;
        }
        if (result < 0) {
            if (!ssl && errno == EINTR)
                continue;
            if (!ssl && (errno == EAGAIN || errno == EWOULDBLOCK))
                throw runtime_error("Timeout error! Error code: " + string(strerror(errno)));
            throw runtime_error("Response error! Error code: " + string(strerror(errno)));
        }
        buffer.append(chunk, static_cast<size_t>(result));
        if (buffer.size() > _settings.maxResponseSize)
            throw runtime_error("Response exceeds the maximum size");

        if (!response) {
            auto end = buffer.find(headerEnd);
            if (end != buffer.npos) {
                headerLength = end + headerEnd.size();
                response = HttpResponse::deserialize(string_view(buffer).substr(0, headerLength));
            }
        }
    }

    if (ssl)
        SSL_shutdown(ssl.get());
    return *response;
}
//---------------------------------------------------------------------------
} // namespace statuspost::network
