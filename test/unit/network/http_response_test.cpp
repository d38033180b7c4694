#include "network/http_response.hpp"
#include <catch2/catch.hpp>
#include <stdexcept>
#include <string>
//---------------------------------------------------------------------------
// StatusPost - Signed Build Status Client
// StatusPost Contributors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace statuspost::network::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("http_response") {
    string header = "HTTP/1.1 429 Too Many Requests\r\nRetry-After: 5\r\ncontent-length: 2\r\n\r\n";
    auto response = HttpResponse::deserialize(header);
    REQUIRE(response.code == HttpResponse::TOO_MANY_REQUESTS_429);
    REQUIRE(response.reason == "Too Many Requests");
    REQUIRE(response.type == HttpResponse::Type::HTTP_1_1);
    REQUIRE(*response.findHeader("retry-after") == "5");
    REQUIRE(response.getContentLength() == 2u);
    REQUIRE(!response.isChunked());

    REQUIRE(HttpResponse::checkRateLimited(response.code));
    REQUIRE(!HttpResponse::checkSuccess(response.code));
    REQUIRE(HttpResponse::checkSuccess(HttpResponse::NO_CONTENT_204));
    REQUIRE(HttpResponse::withoutContent(HttpResponse::NO_CONTENT_204));
    REQUIRE(!HttpResponse::withoutContent(HttpResponse::OK_200));

    response = HttpResponse::deserialize("HTTP/1.0 204\r\n\r\n");
    REQUIRE(response.code == 204);
    REQUIRE(response.reason.empty());
    REQUIRE(response.type == HttpResponse::Type::HTTP_1_0);
    REQUIRE(!response.getContentLength());

    REQUIRE_THROWS_AS(HttpResponse::deserialize("HTTP/2 200 OK\r\n\r\n"), runtime_error);
    REQUIRE_THROWS_AS(HttpResponse::deserialize("HTTP/1.1 2x0 OK\r\n\r\n"), runtime_error);
    REQUIRE_THROWS_AS(HttpResponse::deserialize("HTTP/1.1 200 OK\r\nbroken\r\n\r\n"), runtime_error);
    REQUIRE_THROWS_AS(HttpResponse::deserialize("HTTP/1.1 200 OK\r\n"), runtime_error);
}
//---------------------------------------------------------------------------
TEST_CASE("http_response_chunked") {
    auto response = HttpResponse::deserialize("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n");
    REQUIRE(response.isChunked());

    REQUIRE(HttpResponse::decodeChunked("4\r\nWiki\r\n5;ext=1\r\npedia\r\n0\r\n\r\n") == "Wikipedia");
    REQUIRE(!HttpResponse::decodeChunked("4\r\nWiki\r\n5\r\nped"));
    REQUIRE(!HttpResponse::decodeChunked("4\r\nWiki\r\n0\r\n"));
    REQUIRE_THROWS_AS(HttpResponse::decodeChunked("zz\r\n"), runtime_error);

    // Huge chunk sizes wait for more data instead of wrapping around
    REQUIRE(!HttpResponse::decodeChunked("ffffffffffffffff\r\nWiki\r\n"));
    REQUIRE(!HttpResponse::decodeChunked("fffffffffffffffe\r\nWiki\r\n"));
}
//---------------------------------------------------------------------------
} // namespace statuspost::network::test
