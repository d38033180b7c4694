#pragma once
#include <cstdint>
#include <string>
#include <string_view>
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
/// An absolute http(s) url that is extended one escaped path segment at a time
class Url {
    /// Is it https?
    bool _tls;
    /// The host name
    std::string _host;
    /// The port
    uint32_t _port;
    /// The path - RFC 3986 conform, without trailing slash
    std::string _path;

    public:
    /// The constructor
    Url(bool tls, std::string host, uint32_t port, std::string path = "");

    /// Parse "http[s]://host[:port][/path]", throws std::invalid_argument
    [[nodiscard]] static Url parse(std::string_view url);

    /// Append a single segment, every reserved character is escaped including '/'
    Url& addPathSegment(std::string_view segment);

    [[nodiscard]] bool isTls() const { return _tls; }
    [[nodiscard]] const std::string& getHost() const { return _host; }
    [[nodiscard]] uint32_t getPort() const { return _port; }
    /// The path, "/" for the root
    [[nodiscard]] std::string getPath() const { return _path.empty() ? "/" : _path; }
    /// The value for the Host header, the port is omitted if it is the default one
    [[nodiscard]] std::string getHostHeader() const;
    /// The full url
    [[nodiscard]] std::string toString() const;
};
//---------------------------------------------------------------------------
} // namespace statuspost::network
