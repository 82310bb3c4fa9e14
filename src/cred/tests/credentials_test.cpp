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

#include <cstdlib>
#include <filesystem>

#include <cred/credentials.hpp>
#include <utils/fs.hpp>
#include <utils/str.hpp>

#include <gtest/gtest.h>

using namespace sg;
using namespace sg::cred;

namespace {
    std::string token_json(std::string const& token, time_t expires) {
        return "{\"token\": \"" + token + "\", \"expires_at\": \"" + str::format_iso8601(expires) + "\"}";
    }
}

TEST(TokenFileTest, parse_valid) {
    std::string err;

    auto p = parse_token_file(R"({"token":"ghs_abc","expires_at":"2026-01-02T03:04:05Z","token_type":"token"})", &err);
    ASSERT_TRUE(p) << err;
    ASSERT_EQ(p->token, "ghs_abc");
    ASSERT_EQ(p->expires_at, 1767323045);
    ASSERT_EQ(p->token_type, "token");
    ASSERT_FALSE(p->generated_at);

    p = parse_token_file(R"({"token":"x","expires_at_unix":1767323045,"generated_at":"2026-01-02T02:04:05+00:00"})");
    ASSERT_TRUE(p);
    ASSERT_EQ(p->expires_at, 1767323045);
    ASSERT_TRUE(p->generated_at);
    ASSERT_EQ(*p->generated_at, 1767323045 - 3600);
}

TEST(TokenFileTest, parse_invalid) {
    std::string err;

    ASSERT_FALSE(parse_token_file("not json", &err));
    ASSERT_FALSE(err.empty());

    ASSERT_FALSE(parse_token_file("[1,2]"));
    ASSERT_FALSE(parse_token_file(R"({"expires_at":"2026-01-02T03:04:05Z"})"));
    ASSERT_FALSE(parse_token_file(R"({"token":"","expires_at":"2026-01-02T03:04:05Z"})"));
    ASSERT_FALSE(parse_token_file(R"({"token":"abc"})"));
    ASSERT_FALSE(parse_token_file(R"({"token":"abc","expires_at":"tomorrow"})"));

    // numeric times outside the representable calendar
    ASSERT_FALSE(parse_token_file(R"({"token":"abc","expires_at_unix":1e300})"));
    ASSERT_FALSE(parse_token_file(R"({"token":"abc","expires_at_unix":-5})"));
    ASSERT_FALSE(parse_token_file(R"({"token":"abc","expires_at_unix":18446744073709551615})"));
    ASSERT_FALSE(parse_token_file(R"({"token":"abc","expires_at_unix":253402300800})"));

    auto p = parse_token_file(R"({"token":"abc","expires_at_unix":1767323045.5,"generated_at":-1e300})");
    ASSERT_TRUE(p);
    ASSERT_EQ(p->expires_at, 1767323045);
    ASSERT_FALSE(p->generated_at);

    // header injection through the token
    ASSERT_FALSE(parse_token_file(R"({"token":"abc\r\nX-Evil: 1","expires_at":"2026-01-02T03:04:05Z"})", &err));
    ASSERT_NE(err.find("not allowed"), std::string::npos);
}


class CredentialSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/sg_cred_XXXXXX";
        ASSERT_NE(::mkdtemp(tmpl), nullptr);
        dir = tmpl;

        spec.name = "github";
        spec.file = dir + "/github.json";
        spec.cache_seconds = 30;
        spec.expiry_margin = 30;
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    void write_token(std::string const& token, time_t expires) {
        ASSERT_TRUE(fs::write_file_atomic(spec.file, token_json(token, expires), 0600));
    }

    std::unique_ptr<CredentialSource> source() {
        return std::make_unique<CredentialSource>(std::vector<CredentialSpec>{ spec }, CredentialSource::options_t(),
                                                  [this]() { return now; });
    }

    std::string dir;
    CredentialSpec spec;
    time_t now = ::time(nullptr);
};

TEST_F(CredentialSourceTest, reads_and_caches) {
    write_token("tok-1", now + 3600);
    auto cs = source();

    auto rec = cs->get("github");
    ASSERT_NE(rec, nullptr);
    ASSERT_EQ(rec->generation(), 1U);
    ASSERT_EQ(rec->expires_at(), now + 3600);
    ASSERT_EQ(Injector::header_value(spec, *rec), "Bearer tok-1");

    auto again = cs->get("github");
    ASSERT_EQ(again, rec);
    ASSERT_EQ(cs->stats().reads, 1U);
    ASSERT_EQ(cs->stats().cache_hits, 1U);

    // masked
    ASSERT_EQ(rec->to_string().find("tok-1"), std::string::npos);
}

TEST_F(CredentialSourceTest, rotation_bumps_generation) {
    write_token("tok-1", now + 3600);
    auto cs = source();
    ASSERT_EQ(cs->get("github")->generation(), 1U);

    // replaced on disk: picked up despite the cache
    write_token("tok-2", now + 7200);
    auto rec = cs->get("github");
    ASSERT_EQ(rec->generation(), 2U);
    ASSERT_EQ(Injector::header_value(spec, *rec), "Bearer tok-2");

    // rewritten with identical content keeps the generation
    write_token("tok-2", now + 7200);
    now += 60;
    ASSERT_EQ(cs->get("github")->generation(), 2U);
}

TEST_F(CredentialSourceTest, cache_expires) {
    write_token("tok-1", now + 3600);
    auto cs = source();
    cs->get("github");

    now += 31;
    cs->get("github");
    ASSERT_EQ(cs->stats().reads, 2U);
}

TEST_F(CredentialSourceTest, expired_fails_closed) {
    write_token("tok-1", now + 3600);
    auto cs = source();
    ASSERT_NE(cs->get("github"), nullptr);

    // within the expiry margin counts as expired, even when cached
    now += 3600 - 20;
    ASSERT_EQ(cs->get("github"), nullptr);
    ASSERT_EQ(cs->stats().unavailable, 1U);

    write_token("tok-1", now + 10);
    ASSERT_EQ(cs->get("github"), nullptr);
}

TEST_F(CredentialSourceTest, missing_or_malformed) {
    auto cs = source();

    ASSERT_EQ(cs->get("github"), nullptr);
    ASSERT_EQ(cs->get("unknown"), nullptr);

    ASSERT_TRUE(fs::write_file_atomic(spec.file, "{ broken", 0600));
    ASSERT_EQ(cs->get("github"), nullptr);

    write_token("tok-1", now + 3600);
    ASSERT_NE(cs->get("github"), nullptr);

    // a broken rewrite must not keep serving the previous token
    ASSERT_TRUE(fs::write_file_atomic(spec.file, "{ broken", 0600));
    ASSERT_EQ(cs->get("github"), nullptr);
}

TEST_F(CredentialSourceTest, oversized_file) {
    ASSERT_TRUE(fs::write_file_atomic(spec.file, std::string(128 * 1024, ' ') + token_json("t", now + 3600), 0600));
    auto cs = source();

    ASSERT_EQ(cs->get("github"), nullptr);
}


TEST(InjectorTest, replaces_sandbox_credentials) {
    CredentialSpec spec;
    spec.name = "api";
    spec.header = "Authorization";
    spec.scheme = "Bearer";
    spec.strip = { "x-api-key", "Proxy-Authorization" };

    CredentialRecord rec("api", "real-secret", ::time(nullptr) + 3600, 1);

    http1::Headers h;
    h.add("Host", "api.example.com");
    h.add("authorization", "Bearer fake");
    h.add("AUTHORIZATION", "Basic Zm9vOmJhcg==");
    h.add("X-Api-Key", "fake");
    h.add("Accept", "*/*");

    Injector::apply(h, spec, rec);

    ASSERT_EQ(h.count("authorization"), 1U);
    ASSERT_EQ(h.get("Authorization").value(), "Bearer real-secret");
    ASSERT_EQ(h.count("x-api-key"), 0U);
    ASSERT_EQ(h.get("accept").value(), "*/*");
    ASSERT_EQ(h.get("host").value(), "api.example.com");
}

TEST(InjectorTest, custom_header_without_scheme) {
    CredentialSpec spec;
    spec.header = "X-Api-Key";
    spec.scheme = "";
    spec.strip = {};

    CredentialRecord rec("key", "k-123", ::time(nullptr) + 3600, 1);

    http1::Headers h;
    h.add("x-api-key", "placeholder");
    Injector::apply(h, spec, rec);

    ASSERT_EQ(h.size(), 1U);
    ASSERT_EQ(h.get("X-API-KEY").value(), "k-123");
}

TEST(InjectorTest, injected_header_not_hop_by_hop) {
    CredentialSpec spec;
    spec.header = "Authorization";
    spec.scheme = "Bearer";
    spec.strip = { "x-api-key" };

    CredentialRecord rec("api", "real-secret", ::time(nullptr) + 3600, 1);

    http1::Headers h;
    h.add("Connection", "authorization, keep-alive");
    h.add("Connection", "X-Api-Key");
    h.add("Authorization", "Bearer fake");

    Injector::apply(h, spec, rec);

    ASSERT_EQ(h.count("connection"), 1U);
    ASSERT_EQ(h.get("connection").value(), "keep-alive");
    ASSERT_FALSE(h.has_token("connection", "authorization"));
    ASSERT_EQ(h.get("authorization").value(), "Bearer real-secret");

    // nothing left to list
    http1::Headers only;
    only.add("Connection", "Authorization");
    Injector::apply(only, spec, rec);
    ASSERT_EQ(only.count("connection"), 0U);

    // unrelated tokens keep the header untouched
    http1::Headers other;
    other.add("Connection", "keep-alive, Upgrade");
    Injector::apply(other, spec, rec);
    ASSERT_EQ(other.get("connection").value(), "keep-alive, Upgrade");
}
