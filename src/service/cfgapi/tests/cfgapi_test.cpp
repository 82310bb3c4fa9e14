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

#include <service/cfgapi/cfgapi.hpp>

#include <gtest/gtest.h>

using namespace sg;

namespace {

    const char* base_config = R"(
        settings:
        {
            listen_address = "0.0.0.0";
            listen_port = 8443;
            allowed_ports = [ 443, 8443 ];
            max_sessions = 32;
            log_console = false;
            rotation_interval = 30;
        };

        authority:
        {
            ca_dir = "/var/lib/sandgate/ca";
            name = "test-ca";
            validity = 7200;
            safety_margin = 600;
        };

        leaf: { validity = 3600; capacity = 64; };

        timeouts:
        {
            connection_total = 120;
            idle = 15;
            upstream_connect = 3;
            credential_read_ms = 500;
            shutdown_grace = 2;
        };

        upstream:
        {
            ca_bundle = "/etc/ssl/bundle.pem";
            pool_max_idle = 4;
            hosts = (
                { host = "API.internal.example"; address = "10.0.0.5:443"; }
            );
        };

        credentials:
        {
            github:
            {
                file = "/run/tokens/github.json";
                strip = [ "X-Api-Key", "Proxy-Authorization" ];
                cache_seconds = 10;
            };
            internal:
            {
                file = "/run/tokens/internal.json";
                header = "X-Auth-Token";
                scheme = "";
            };
        };

        policy = (
            { name = "gh"; host = "api.github.com"; action = "inject"; credential = "github"; },
            { name = "gh-rest"; host = ".github.com"; action = "passthrough"; credential = "github"; },
            { host = "*.bad.example"; action = "deny"; }
        );

        audit: { file = "/var/log/sandgate/audit.log"; alert_threshold = 10; alert_window = 60; blocked_hosts_max = 16; };
    )";

    bool load(std::string const& text) {
        CfgFactory::init();
        if(not CfgFactory::get()->cfgapi_init_string(text)) return false;

        return CfgFactory::get()->load_all();
    }

    // smallest config which loads
    std::string with(std::string const& extra) {
        return std::string("authority: { ca_dir = \"/tmp/ca\"; };\n") + extra;
    }
}

TEST(CfgFactory, full_config) {
    ASSERT_TRUE(load(base_config));
    auto cfg = CfgFactory::get();

    ASSERT_EQ(cfg->listen_address, "0.0.0.0");
    ASSERT_EQ(cfg->listen_port, 8443);
    ASSERT_EQ(cfg->allowed_ports, std::set<uint16_t>({ 443, 8443 }));
    ASSERT_EQ(cfg->max_sessions, 32U);
    ASSERT_FALSE(cfg->log_console);
    ASSERT_EQ(cfg->rotation_interval, 30);

    ASSERT_EQ(cfg->authority.name, "test-ca");
    ASSERT_EQ(cfg->authority.validity, 7200);
    ASSERT_EQ(cfg->authority.safety_margin, 600);
    ASSERT_TRUE(cfg->authority.persist);

    ASSERT_EQ(cfg->leaf.validity, 3600);
    ASSERT_EQ(cfg->leaf.capacity, 64U);

    ASSERT_EQ(cfg->upstream.ca_bundle, "/etc/ssl/bundle.pem");
    ASSERT_EQ(cfg->upstream.pool_max_idle, 4U);
    ASSERT_EQ(cfg->upstream.connect_timeout, std::chrono::seconds(3));
    ASSERT_EQ(cfg->upstream.hosts.at("api.internal.example"), "10.0.0.5:443");

    ASSERT_EQ(cfg->db_credentials.size(), 2U);
    auto const* gh = cfg->credential("github");
    ASSERT_NE(gh, nullptr);
    ASSERT_EQ(gh->header, "Authorization");
    ASSERT_EQ(gh->scheme, "Bearer");
    ASSERT_EQ(gh->strip, std::vector<std::string>({ "X-Api-Key", "Proxy-Authorization" }));
    ASSERT_EQ(gh->cache_seconds, 10);

    auto const* internal = cfg->credential("internal");
    ASSERT_NE(internal, nullptr);
    ASSERT_EQ(internal->header, "X-Auth-Token");
    ASSERT_TRUE(internal->scheme.empty());

    ASSERT_EQ(cfg->db_policy.size(), 3U);
    ASSERT_EQ(cfg->db_policy[0].name, "gh");
    ASSERT_TRUE(cfg->db_policy[0].action == policy::Action::inject);
    ASSERT_EQ(cfg->db_policy[0].credential, "github");

    // credential on a non-injecting rule is dropped
    ASSERT_TRUE(cfg->db_policy[1].action == policy::Action::passthrough);
    ASSERT_TRUE(cfg->db_policy[1].credential.empty());

    ASSERT_EQ(cfg->db_policy[2].name, "rule-2");
    ASSERT_TRUE(cfg->db_policy[2].pattern.kind() == policy::HostPattern::kind_t::wildcard);

    ASSERT_EQ(cfg->audit_log.file, "/var/log/sandgate/audit.log");
    ASSERT_EQ(cfg->audit_log.alert_threshold, 10U);
    ASSERT_EQ(cfg->audit_log.alert_window, 60);
    ASSERT_EQ(cfg->audit_log.blocked_hosts_max, 16U);

    auto lo = cfg->listener_options();
    ASSERT_EQ(lo.port, 8443);
    ASSERT_EQ(lo.shutdown_grace, std::chrono::seconds(2));

    ASSERT_EQ(cfg->credential_options().read_timeout, std::chrono::milliseconds(500));
}

TEST(CfgFactory, defaults) {
    ASSERT_TRUE(load(with("")));
    auto cfg = CfgFactory::get();

    ASSERT_EQ(cfg->listen_address, "127.0.0.1");
    ASSERT_EQ(cfg->listen_port, 3128);
    ASSERT_EQ(cfg->allowed_ports, std::set<uint16_t>({ 443 }));
    ASSERT_TRUE(cfg->db_policy.empty());
    ASSERT_TRUE(cfg->audit_log.file.empty());
    ASSERT_EQ(cfg->upstream.connect_timeout, std::chrono::seconds(10));
}

TEST(CfgFactory, parse_error) {
    CfgFactory::init();
    ASSERT_FALSE(CfgFactory::get()->cfgapi_init_string("settings: { listen_port = ; };"));
}

TEST(CfgFactory, authority_required) {
    ASSERT_FALSE(load("settings: { listen_port = 3128; };"));
    ASSERT_TRUE(CfgFactory::LOAD_ERRORS);

    ASSERT_FALSE(load("authority: { persist = true; };"));

    // memory-only authority needs no directory
    ASSERT_TRUE(load("authority: { persist = false; };"));

    ASSERT_FALSE(load("authority: { ca_dir = \"/tmp/ca\"; name = \"../ca\"; };"));
    ASSERT_FALSE(load("authority: { ca_dir = \"/tmp/ca\"; validity = 600; safety_margin = 600; };"));
}

TEST(CfgFactory, invalid_settings) {
    ASSERT_FALSE(load(with("settings: { listen_port = 70000; };")));
    ASSERT_FALSE(load(with("settings: { allowed_ports = [ 0 ]; };")));
    ASSERT_FALSE(load(with("settings: { max_sessions = 0; };")));
    ASSERT_FALSE(load(with("settings: { listen_port = \"3128\"; };")));
    ASSERT_FALSE(load(with("timeouts: { idle = 0; };")));
    ASSERT_FALSE(load(with("leaf: { capacity = -1; };")));
    ASSERT_FALSE(load(with("audit: { alert_window = 0; };")));
    ASSERT_FALSE(load(with("audit: { blocked_hosts_max = -1; };")));
}

TEST(CfgFactory, invalid_policy) {
    ASSERT_FALSE(load(with("policy = ( { host = \"a.example\"; action = \"inject\"; } );")));
    ASSERT_FALSE(load(with("policy = ( { host = \"a.example\"; action = \"inject\"; credential = \"none\"; } );")));
    ASSERT_FALSE(load(with("policy = ( { host = \"a.example\"; action = \"allow\"; } );")));
    ASSERT_FALSE(load(with("policy = ( { host = \"a.*.example\"; action = \"deny\"; } );")));
    ASSERT_FALSE(load(with("policy = ( { action = \"deny\"; } );")));

    // valid rules survive the invalid ones
    ASSERT_FALSE(load(with("policy = ( { host = \"ok.example\"; action = \"passthrough\"; },"
                           "           { host = \"bad.example\"; action = \"maybe\"; } );")));
    ASSERT_EQ(CfgFactory::get()->db_policy.size(), 1U);
}

TEST(CfgFactory, invalid_upstream_and_credentials) {
    ASSERT_FALSE(load(with("upstream: { hosts = ( { host = \"a.example\"; address = \"10.0.0.1\"; } ); };")));
    ASSERT_FALSE(load(with("upstream: { hosts = ( { host = \"a.example\"; } ); };")));
    ASSERT_FALSE(load(with("credentials: { gh: { header = \"Authorization\"; }; };")));
    ASSERT_FALSE(load(with("credentials: { gh: { file = \"/x\"; header = \"\"; }; };")));
}

TEST(CfgFactory, shipped_example_parses) {
    CfgFactory::init();

    auto path = std::string(SANDGATE_SOURCE_DIR) + "/etc/sandgate.cfg";
    ASSERT_TRUE(CfgFactory::get()->cfgapi_init(path.c_str()));
    ASSERT_TRUE(CfgFactory::get()->load_all());
    ASSERT_EQ(CfgFactory::get()->db_policy.size(), 4U);
}
