#pragma once
#include <cstdint>
#include <map>
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
namespace statuspost {
namespace network {
//---------------------------------------------------------------------------
/// Implements an helper to serialize http requests
struct HttpRequest {
    /// The method class
    enum class Method : uint8_t {
        GET,
        POST
    };
    enum class Type : uint8_t {
        HTTP_1_0,
        HTTP_1_1
    };
    /// The headers - need to be without trailing and leading whitespaces
    std::map<std::string, std::string> headers;
    /// The method
    Method method = Method::GET;
    /// The type
    Type type = Type::HTTP_1_1;
    /// The path - needs to be RFC 3986 conform
    std::string path;
    /// The body
    std::string body;

    /// Get the request method
    static constexpr auto getRequestMethod(const Method& method) {
        switch (method) {
            case Method::GET: return "GET";
            case Method::POST: return "POST";
            default: return "";
        }
    }
    /// Get the request type
    static constexpr auto getRequestType(const Type& type) {
        switch (type) {
            case Type::HTTP_1_0: return "HTTP/1.0";
            case Type::HTTP_1_1: return "HTTP/1.1";
            default: return "";
        }
    }
    /// Find a header, names are compared case insensitive
    [[nodiscard]] const std::string* findHeader(std::string_view name) const;
    /// Serialize the request including the body
    [[nodiscard]] static std::string serialize(const HttpRequest& request);
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace statuspost
