#include "network/http_request.hpp"
#include "utils/utils.hpp"
#include <string>
//---------------------------------------------------------------------------
// StatusPost - Signed Build Status Client
// StatusPost Contributors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace statuspost {
namespace network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
const string* HttpRequest::findHeader(string_view name) const
// Find a header by name
{
    for (const auto& h : headers)
        if (utils::equalsIgnoreCase(h.first, name))
            return &h.second;
    return nullptr;
}
//---------------------------------------------------------------------------
string HttpRequest::serialize(const HttpRequest& request)
// Serialize an http request, the Content-Length is derived from the body
{
    string httpHeader = getRequestMethod(request.method);
    httpHeader += " " + (request.path.empty() ? string("/") : request.path) + " ";
    httpHeader += getRequestType(request.type);
    httpHeader += "\r\n";
    for (const auto& h : request.headers)
        if (!utils::equalsIgnoreCase(h.first, "Content-Length"))
            httpHeader += h.first + ": " + h.second + "\r\n";
    if (!request.body.empty() || request.method == Method::POST)
        httpHeader += "Content-Length: " + to_string(request.body.size()) + "\r\n";
    httpHeader += "\r\n";
    httpHeader += request.body;
    return httpHeader;
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace statuspost
