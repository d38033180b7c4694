#include "network/http_response.hpp"
#include "utils/utils.hpp"
#include <algorithm>
#include <charconv>
#include <stdexcept>
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
const string* HttpResponse::findHeader(string_view name) const
// Find a header by name
{
    for (const auto& h : headers)
        if (utils::equalsIgnoreCase(h.first, name))
            return &h.second;
    return nullptr;
}
//---------------------------------------------------------------------------
optional<uint64_t> HttpResponse::getContentLength() const
// Parse the Content-Length header
{
    auto value = findHeader("Content-Length");
    if (!value)
        return nullopt;
    uint64_t length;
    auto result = from_chars(value->data(), value->data() + value->size(), length);
    if (result.ec != errc() || result.ptr != value->data() + value->size())
        throw runtime_error("Invalid HttpResponse: Bad Content-Length!");
    return length;
}
//---------------------------------------------------------------------------
bool HttpResponse::isChunked() const
// Checks the Transfer-Encoding header
{
    auto value = findHeader("Transfer-Encoding");
    return value && utils::equalsIgnoreCase(*value, "chunked");
}
//---------------------------------------------------------------------------
HttpResponse HttpResponse::deserialize(string_view data)
// Deserialize the http header
{
    static constexpr string_view strHttp1_0 = "HTTP/1.0";
    static constexpr string_view strHttp1_1 = "HTTP/1.1";
    static constexpr string_view strNewline = "\r\n";
    static constexpr string_view strHeaderSeperator = ":";

    HttpResponse response;

    string_view line;
    auto firstLine = true;
    while (true) {
        auto pos = data.find(strNewline);
        if (pos == data.npos)
            throw runtime_error("Invalid HttpResponse: Incomplete header!");

        line = data.substr(0, pos);
        data = data.substr(pos + strNewline.size());
        if (line.empty()) {
            if (!firstLine)
                break;
            else
                throw runtime_error("Invalid HttpResponse: Missing first line!");
        }
        if (firstLine) {
            firstLine = false;
            // the http type
            if (line.starts_with(strHttp1_0)) {
                response.type = Type::HTTP_1_0;
            } else if (line.starts_with(strHttp1_1)) {
                response.type = Type::HTTP_1_1;
            } else {
                throw runtime_error("Invalid HttpResponse: Needs to be a HTTP type 1.0 or 1.1!");
            }

            // the status code and the optional reason
            line = line.substr(strHttp1_1.size());
            if (line.size() < 4 || line[0] != ' ')
                throw runtime_error("Invalid HttpResponse: Missing status code!");
            auto result = from_chars(line.data() + 1, line.data() + 4, response.code);
            if (result.ec != errc() || result.ptr != line.data() + 4 || response.code < 100)
                throw runtime_error("Invalid HttpResponse: Invalid status code!");
            response.reason = utils::trim(line.substr(4));
        } else {
            // headers
            auto keyPos = line.find(strHeaderSeperator);
            if (keyPos == line.npos)
                throw runtime_error("Invalid HttpResponse: Headers need key and value!");
            auto key = line.substr(0, keyPos);
            auto value = utils::trim(line.substr(keyPos + strHeaderSeperator.size()));
            response.headers.emplace(key, value);
        }
    }

    return response;
}
//---------------------------------------------------------------------------
optional<string> HttpResponse::decodeChunked(string_view data)
// Joins the chunks until the zero sized chunk
{
    static constexpr string_view strNewline = "\r\n";

    string body;
    while (true) {
        auto pos = data.find(strNewline);
        if (pos == data.npos)
            return nullopt;
        // chunk extensions follow the size after ';'
        auto sizeString = data.substr(0, min(pos, data.find(';')));
        uint64_t size;
        auto result = from_chars(sizeString.data(), sizeString.data() + sizeString.size(), size, 16);
        if (result.ec != errc())
            throw runtime_error("Invalid HttpResponse: Bad chunk size!");
        data = data.substr(pos + strNewline.size());
        if (!size) {
            // trailers are not supported, only the final empty line
            if (data.size() < strNewline.size())
                return nullopt;
            return body;
        }
        if (data.size() < size || data.size() - size < strNewline.size())
            return nullopt;
        body.append(data.substr(0, size));
        data = data.substr(size + strNewline.size());
    }
}
//---------------------------------------------------------------------------
} // namespace statuspost::network
