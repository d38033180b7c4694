#pragma once
#include <cstdint>
#include <map>
#include <optional>
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
/// Implements an helper to deserialize http responses
struct HttpResponse {
    /// Important status codes
    static constexpr uint16_t OK_200 = 200;
    static constexpr uint16_t NO_CONTENT_204 = 204;
    static constexpr uint16_t NOT_MODIFIED_304 = 304;
    static constexpr uint16_t BAD_REQUEST_400 = 400;
    static constexpr uint16_t UNAUTHORIZED_401 = 401;
    static constexpr uint16_t NOT_FOUND_404 = 404;
    static constexpr uint16_t TOO_MANY_REQUESTS_429 = 429;
    static constexpr uint16_t INTERNAL_SERVER_ERROR_500 = 500;

    enum class Type : uint8_t {
        HTTP_1_0,
        HTTP_1_1
    };
    /// The headers - need to be without trailing and leading whitespaces
    std::map<std::string, std::string> headers;
    /// The status code
    uint16_t code = 0;
    /// The reason phrase
    std::string reason;
    /// The type
    Type type = Type::HTTP_1_1;
    /// The body, without transfer encoding
    std::string body;

    /// Get the response type
    static constexpr auto getResponseType(const Type& type) noexcept {
        switch (type) {
            case Type::HTTP_1_0: return "HTTP/1.0";
            case Type::HTTP_1_1: return "HTTP/1.1";
            default: return "UNKNOWN";
        }
    }
    /// Check for successful operation 2xx operations
    static constexpr auto checkSuccess(uint16_t code) {
        return code >= 200 && code < 300;
    }
    /// Check for rate limiting
    static constexpr auto checkRateLimited(uint16_t code) {
        return code == TOO_MANY_REQUESTS_429;
    }
    /// Check if the result has no content
    static constexpr auto withoutContent(uint16_t code) {
        return code == NO_CONTENT_204 || code == NOT_MODIFIED_304 || (code >= 100 && code < 200);
    }

    /// Find a header, names are compared case insensitive
    [[nodiscard]] const std::string* findHeader(std::string_view name) const;
    /// The announced content length
    [[nodiscard]] std::optional<uint64_t> getContentLength() const;
    /// Is the body chunked encoded?
    [[nodiscard]] bool isChunked() const;

    /// Deserialize the status line and the headers up to the empty line
    [[nodiscard]] static HttpResponse deserialize(std::string_view data);
    /// Decode a chunked body, returns nullopt while the last chunk is missing
    [[nodiscard]] static std::optional<std::string> decodeChunked(std::string_view data);
};
//---------------------------------------------------------------------------
} // namespace statuspost::network
