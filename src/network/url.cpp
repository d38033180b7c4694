#include "network/url.hpp"
#include "utils/utils.hpp"
#include <charconv>
#include <stdexcept>
#include <utility>
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
Url::Url(bool tls, string host, uint32_t port, string path) : _tls(tls), _host(move(host)), _port(port), _path(move(path))
// The constructor
{
    if (_host.empty())
        throw invalid_argument("Url requires a host");
    while (!_path.empty() && _path.back() == '/')
        _path.pop_back();
    if (!_path.empty() && _path.front() != '/')
        _path.insert(_path.begin(), '/');
}
//---------------------------------------------------------------------------
Url Url::parse(string_view url)
// Parse the scheme, the authority and the base path
{
    static constexpr string_view strHttp = "http://";
    static constexpr string_view strHttps = "https://";

    url = utils::trim(url);
    bool tls;
    if (url.starts_with(strHttps)) {
        tls = true;
        url = url.substr(strHttps.size());
    } else if (url.starts_with(strHttp)) {
        tls = false;
        url = url.substr(strHttp.size());
    } else {
        throw invalid_argument("Url needs to start with http:// or https://");
    }

    if (url.find_first_of("?#") != url.npos)
        throw invalid_argument("Url must not contain a query or fragment");

    auto pos = url.find('/');
    auto hostPort = url.substr(0, pos);
    auto path = pos == url.npos ? string_view() : url.substr(pos);

    uint32_t port = tls ? 443 : 80;
    string_view host = hostPort;
    if (auto colonPos = hostPort.find(':'); colonPos != hostPort.npos) {
        host = hostPort.substr(0, colonPos);
        auto portString = hostPort.substr(colonPos + 1);
        auto result = from_chars(portString.data(), portString.data() + portString.size(), port);
        if (result.ec != errc() || result.ptr != portString.data() + portString.size() || port == 0 || port > 65535)
            throw invalid_argument("Url has an invalid port");
    }
    if (host.empty())
        throw invalid_argument("Url requires a host");

    return Url(tls, string(host), port, string(path));
}
//---------------------------------------------------------------------------
Url& Url::addPathSegment(string_view segment)
// Append an escaped segment
{
    _path += "/";
    _path += utils::encodeUrlParameters(segment);
    return *this;
}
//---------------------------------------------------------------------------
string Url::getHostHeader() const
// Host with non default port
{
    if ((_tls && _port == 443) || (!_tls && _port == 80))
        return _host;
    return _host + ":" + to_string(_port);
}
//---------------------------------------------------------------------------
string Url::toString() const
// Build the url string
{
    return (_tls ? "https://" : "http://") + getHostHeader() + getPath();
}
//---------------------------------------------------------------------------
} // namespace statuspost::network
