/*
    Sandgate - sandbox egress gateway with TLS inspection and credential injection.
    Copyright (c) 2014, Ales Stibal <astib@mag0.net>, All rights reserved.

    Sandgate is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    Sandgate is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with Sandgate.  If not, see <http://www.gnu.org/licenses/>.

    Linking Sandgate statically or dynamically with other modules is
    making a combined work based on Sandgate. Thus, the terms and
    conditions of the GNU General Public License cover the whole combination.

    In addition, as a special exception, the copyright holders of Sandgate
    give you permission to combine Sandgate with free software programs
    or libraries that are released under the GNU LGPL and with code
    included in the standard release of OpenSSL under the OpenSSL's license
    (or modified versions of such code, with unchanged license).
    You may copy and distribute such a system following the terms
    of the GNU GPL for Sandgate and the licenses of the other code
    concerned, provided that you include the source code of that other code
    when and as the GNU GPL requires distribution of source code.

    Note that people who make modified versions of Sandgate are not
    obligated to grant this special exception for their modified versions;
    it is their choice whether to do so. The GNU General Public License
    gives permission to release a modified version without this exception;
    this exception also makes it possible to release a modified version
    which carries forward this exception.
*/

#include <proxy/http1.hpp>

#include <gtest/gtest.h>

using namespace sg::http1;

namespace {
    RequestHead request(std::string const& text) {
        RequestHead r;
        std::size_t consumed = 0;
        std::string err;

        auto st = parse_request_head(text, r, consumed, 64 * 1024, &err);
        EXPECT_EQ(st, ParseStatus::ok) << err;
        return r;
    }

    ResponseHead response(std::string const& text) {
        ResponseHead r;
        std::size_t consumed = 0;
        std::string err;

        auto st = parse_response_head(text, r, consumed, 64 * 1024, &err);
        EXPECT_EQ(st, ParseStatus::ok) << err;
        return r;
    }
}

TEST(Http1Test, parse_request) {
    std::string text =
            "GET /repos?x=1 HTTP/1.1\r\n"
            "Host: api.example.com\r\n"
            "user-agent:  curl/8  \r\n"
            "\r\n"
            "BODY";

    RequestHead r;
    std::size_t consumed = 0;
    ASSERT_EQ(parse_request_head(text, r, consumed, 1024), ParseStatus::ok);

    ASSERT_EQ(consumed, text.size() - 4);
    ASSERT_EQ(r.method, "GET");
    ASSERT_EQ(r.target, "/repos?x=1");
    ASSERT_EQ(r.minor_version(), 1);
    ASSERT_EQ(r.headers.get("User-Agent").value(), "curl/8");

    // parsed lines go out exactly as received
    ASSERT_EQ(r.serialize(), text.substr(0, consumed));
}

TEST(Http1Test, parse_request_incremental) {
    RequestHead r;
    std::size_t consumed = 0;

    ASSERT_EQ(parse_request_head("GET / HTTP/1.1\r\nHost: a", r, consumed, 1024), ParseStatus::incomplete);
    ASSERT_EQ(parse_request_head("GET / HTTP/1.1\nHost: a\n\n", r, consumed, 1024), ParseStatus::ok);
    ASSERT_EQ(r.serialize(), "GET / HTTP/1.1\r\nHost: a\r\n\r\n");
}

TEST(Http1Test, parse_request_errors) {
    RequestHead r;
    std::size_t consumed = 0;
    std::string err;

    ASSERT_EQ(parse_request_head("\x16\x03\x01\x02\x00", r, consumed, 1024, &err), ParseStatus::error);
    ASSERT_EQ(parse_request_head("GET  / HTTP/1.1\r\n\r\n", r, consumed, 1024), ParseStatus::error);
    ASSERT_EQ(parse_request_head("GET / HTTP/2.0\r\n\r\n", r, consumed, 1024), ParseStatus::error);
    ASSERT_EQ(parse_request_head("GET / HTTP/1.1\r\n folded\r\n\r\n", r, consumed, 1024), ParseStatus::error);
    ASSERT_EQ(parse_request_head("GET / HTTP/1.1\r\nBad Name: x\r\n\r\n", r, consumed, 1024), ParseStatus::error);
    ASSERT_EQ(parse_request_head("GET / HTTP/1.1\r\nX: a\rb\r\n\r\n", r, consumed, 1024), ParseStatus::error);

    std::string big = "GET / HTTP/1.1\r\nX: " + std::string(2000, 'a') + "\r\n\r\n";
    ASSERT_EQ(parse_request_head(big, r, consumed, 1024, &err), ParseStatus::error);
    ASSERT_EQ(err, "header section too large");
}

TEST(Http1Test, parse_response) {
    auto r = response("HTTP/1.1 404 Not Found\r\nContent-Length: 3\r\n\r\n");
    ASSERT_EQ(r.status, 404);
    ASSERT_EQ(r.reason, "Not Found");

    r = response("HTTP/1.1 204\r\n\r\n");
    ASSERT_EQ(r.status, 204);
    ASSERT_TRUE(r.reason.empty());

    ResponseHead bad;
    std::size_t consumed = 0;
    ASSERT_EQ(parse_response_head("SSH-2.0-OpenSSH\r\n\r\n", bad, consumed, 1024), ParseStatus::error);
    ASSERT_EQ(parse_response_head("HTTP/1.1 2x0 OK\r\n\r\n", bad, consumed, 1024), ParseStatus::error);
}

TEST(Http1Test, connect_target) {
    auto t = parse_connect_target("API.Example.com:443");
    ASSERT_TRUE(t);
    ASSERT_EQ(t->host, "api.example.com");
    ASSERT_EQ(t->port, 443);

    t = parse_connect_target("[::1]:8443");
    ASSERT_TRUE(t);
    ASSERT_EQ(t->host, "::1");
    ASSERT_EQ(t->port, 8443);

    ASSERT_FALSE(parse_connect_target("example.com"));
    ASSERT_FALSE(parse_connect_target("example.com:"));
    ASSERT_FALSE(parse_connect_target(":443"));
    ASSERT_FALSE(parse_connect_target("example.com:0"));
    ASSERT_FALSE(parse_connect_target("example.com:65536"));
    ASSERT_FALSE(parse_connect_target("example.com:44x"));
    ASSERT_FALSE(parse_connect_target("::1:443"));
}

TEST(Http1Test, request_framing) {
    auto f = request_framing(request("POST / HTTP/1.1\r\nContent-Length: 12\r\n\r\n"));
    ASSERT_EQ(f.kind, BodyKind::length);
    ASSERT_EQ(f.length, 12U);

    f = request_framing(request("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"));
    ASSERT_EQ(f.kind, BodyKind::chunked);

    f = request_framing(request("GET / HTTP/1.1\r\n\r\n"));
    ASSERT_EQ(f.kind, BodyKind::none);

    // repeated identical lengths are one length
    f = request_framing(request("POST / HTTP/1.1\r\nContent-Length: 5, 5\r\n\r\n"));
    ASSERT_EQ(f.length, 5U);
}

TEST(Http1Test, request_framing_smuggling) {
    try {
        request_framing(request("POST / HTTP/1.1\r\nContent-Length: 5\r\nTransfer-Encoding: chunked\r\n\r\n"));
        FAIL() << "CL with TE accepted";
    }
    catch(http_error const& e) {
        ASSERT_EQ(e.status(), 400);
    }

    try {
        request_framing(request("POST / HTTP/1.1\r\nTransfer-Encoding: gzip\r\n\r\n"));
        FAIL() << "non-chunked coding accepted";
    }
    catch(http_error const& e) {
        ASSERT_EQ(e.status(), 501);
    }

    ASSERT_THROW(request_framing(request("POST / HTTP/1.1\r\nContent-Length: 5\r\nContent-Length: 6\r\n\r\n")), http_error);
    ASSERT_THROW(request_framing(request("POST / HTTP/1.1\r\nContent-Length: -1\r\n\r\n")), http_error);
    ASSERT_THROW(request_framing(request("POST / HTTP/1.1\r\nContent-Length: 0x10\r\n\r\n")), http_error);
}

TEST(Http1Test, response_framing) {
    ASSERT_EQ(response_framing(response("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\n"), "HEAD").kind, BodyKind::none);
    ASSERT_EQ(response_framing(response("HTTP/1.1 304 Not Modified\r\nContent-Length: 10\r\n\r\n"), "GET").kind, BodyKind::none);
    ASSERT_EQ(response_framing(response("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"), "GET").kind, BodyKind::chunked);
    ASSERT_EQ(response_framing(response("HTTP/1.1 200 OK\r\n\r\n"), "GET").kind, BodyKind::until_close);
    ASSERT_EQ(response_framing(response("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n"), "GET").kind, BodyKind::none);

    try {
        response_framing(response("HTTP/1.1 200 OK\r\nContent-Length: 1\r\nContent-Length: 2\r\n\r\n"), "GET");
        FAIL() << "conflicting lengths accepted";
    }
    catch(http_error const& e) {
        ASSERT_EQ(e.status(), 502);
    }
}

TEST(Http1Test, chunk_size) {
    ASSERT_EQ(parse_chunk_size("1a").value(), 26U);
    ASSERT_EQ(parse_chunk_size("0;ext=1").value(), 0U);
    ASSERT_EQ(parse_chunk_size("FF ").value(), 255U);
    ASSERT_FALSE(parse_chunk_size(""));
    ASSERT_FALSE(parse_chunk_size("xyz"));
    ASSERT_FALSE(parse_chunk_size("1ffffffffffffffff"));
}

TEST(Http1Test, keep_alive) {
    Headers h;
    ASSERT_TRUE(keep_alive("HTTP/1.1", h));
    ASSERT_FALSE(keep_alive("HTTP/1.0", h));

    h.add("Connection", "Keep-Alive");
    ASSERT_TRUE(keep_alive("HTTP/1.0", h));

    Headers c;
    c.add("Connection", "foo, close");
    ASSERT_FALSE(keep_alive("HTTP/1.1", c));
}

TEST(Http1Test, hop_by_hop) {
    auto r = request("GET / HTTP/1.1\r\n"
                     "Host: a\r\n"
                     "Connection: X-Trace, close\r\n"
                     "X-Trace: 1\r\n"
                     "Proxy-Connection: keep-alive\r\n"
                     "Proxy-Authorization: Basic eA==\r\n"
                     "Accept: */*\r\n\r\n");

    ASSERT_EQ(strip_hop_by_hop(r.headers), 3U);
    ASSERT_EQ(r.headers.count("x-trace"), 0U);
    ASSERT_EQ(r.headers.count("proxy-authorization"), 0U);
    ASSERT_EQ(r.headers.count("connection"), 1U);
    ASSERT_EQ(r.headers.count("accept"), 1U);
}

TEST(Http1Test, host_of) {
    ASSERT_EQ(host_of(request("GET / HTTP/1.1\r\nHost: API.example.com:443\r\n\r\n")).value(), "api.example.com");
    ASSERT_EQ(host_of(request("GET / HTTP/1.1\r\nHost: [::1]:443\r\n\r\n")).value(), "::1");
    ASSERT_FALSE(host_of(request("GET / HTTP/1.1\r\n\r\n")));
    ASSERT_FALSE(host_of(request("GET / HTTP/1.1\r\nHost: a\r\nHost: b\r\n\r\n")));
}

TEST(Http1Test, headers_wipe) {
    Headers h;
    h.add("Authorization", "Bearer secret");
    h.wipe();

    ASSERT_EQ(h.size(), 0U);
}

TEST(Http1Test, simple_response) {
    auto r = simple_response(403, "denied\n");
    ASSERT_EQ(r.rfind("HTTP/1.1 403 Forbidden\r\n", 0), 0U);
    ASSERT_NE(r.find("Content-Length: 7\r\n"), std::string::npos);
    ASSERT_NE(r.find("Connection: close\r\n"), std::string::npos);
    ASSERT_EQ(r.substr(r.size() - 7), "denied\n");
}
