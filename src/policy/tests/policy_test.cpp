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

#include <policy/hostpolicy.hpp>

#include <gtest/gtest.h>

using namespace sg::policy;

namespace {
    PolicyRule rule(std::string const& name, std::string const& host, Action a, std::string const& cred = "") {
        return PolicyRule { name, HostPattern::parse(host).value(), a, cred };
    }

    PolicyEngine sample_engine() {
        return PolicyEngine({
            rule("api", "api.example.com", Action::inject, "tok"),
            rule("domain", ".example.com", Action::passthrough),
            rule("wild", "*.internal.example.com", Action::deny),
            rule("cdn", "*.cdn.net", Action::passthrough),
            rule("pinned", "10.0.0.5", Action::passthrough),
        });
    }
}

TEST(HostPatternTest, parse) {
    ASSERT_EQ(HostPattern::parse("API.Example.COM.")->kind(), HostPattern::kind_t::exact);
    ASSERT_EQ(HostPattern::parse("API.Example.COM.")->value(), "api.example.com");
    ASSERT_EQ(HostPattern::parse("*.example.com")->kind(), HostPattern::kind_t::wildcard);
    ASSERT_EQ(HostPattern::parse(".example.com")->kind(), HostPattern::kind_t::domain);
    ASSERT_EQ(HostPattern::parse("*")->kind(), HostPattern::kind_t::any);

    ASSERT_FALSE(HostPattern::parse(""));
    ASSERT_FALSE(HostPattern::parse("exa mple.com"));
    ASSERT_FALSE(HostPattern::parse("foo.*.com"));
    ASSERT_FALSE(HostPattern::parse("-bad.com"));
}

TEST(HostPatternTest, wildcard_excludes_apex) {
    auto w = HostPattern::parse("*.example.com").value();
    ASSERT_TRUE(w.match("a.example.com"));
    ASSERT_TRUE(w.match("a.b.example.com"));
    ASSERT_FALSE(w.match("example.com"));
    ASSERT_FALSE(w.match("badexample.com"));

    auto d = HostPattern::parse(".example.com").value();
    ASSERT_TRUE(d.match("example.com"));
    ASSERT_TRUE(d.match("a.example.com"));
    ASSERT_FALSE(d.match("badexample.com"));

    ASSERT_GT(w.specificity(), d.specificity());
}

TEST(PolicyEngineTest, exact_before_suffix) {
    auto pe = sample_engine();

    auto d = pe.decide("API.example.com");
    ASSERT_EQ(d.action, Action::inject);
    ASSERT_EQ(d.credential, "tok");
    ASSERT_EQ(d.rule, "api");

    d = pe.decide("www.example.com");
    ASSERT_EQ(d.action, Action::passthrough);
    ASSERT_EQ(d.rule, "domain");
    ASSERT_TRUE(d.credential.empty());

    d = pe.decide("example.com.");
    ASSERT_EQ(d.action, Action::passthrough);
}

TEST(PolicyEngineTest, most_specific_suffix_wins) {
    auto pe = sample_engine();

    auto d = pe.decide("db.internal.example.com");
    ASSERT_EQ(d.action, Action::deny);
    ASSERT_EQ(d.rule, "wild");

    // apex of the wildcard falls back to the broader domain rule
    d = pe.decide("internal.example.com");
    ASSERT_EQ(d.action, Action::passthrough);
    ASSERT_EQ(d.rule, "domain");
}

TEST(PolicyEngineTest, implicit_deny) {
    auto pe = sample_engine();

    auto d = pe.decide("evil.org");
    ASSERT_FALSE(d.allowed());
    ASSERT_EQ(d.rule, "implicit-deny");

    d = pe.decide("cdn.net");
    ASSERT_FALSE(d.allowed());
}

TEST(PolicyEngineTest, ip_literals) {
    auto pe = PolicyEngine({ rule("all", "*", Action::passthrough), rule("pinned", "10.0.0.5", Action::passthrough) });

    ASSERT_TRUE(pe.decide("anything.org").allowed());

    for(auto const* h: { "127.0.0.1", "0177.0.0.1", "0x7f.0.0.1", "2130706433", "::1", "[::1]", "10.0.0.6" }) {
        auto d = pe.decide(h);
        ASSERT_FALSE(d.allowed()) << h;
        ASSERT_EQ(d.rule, "ip-literal") << h;
    }

    // only an exact rule may name an address
    ASSERT_TRUE(pe.decide("10.0.0.5").allowed());
}

TEST(PolicyEngineTest, duplicate_rules_first_wins) {
    auto pe = PolicyEngine({
        rule("first", "a.example.com", Action::passthrough),
        rule("second", "a.example.com", Action::deny),
        rule("w1", "*.example.com", Action::passthrough),
        rule("w2", "*.example.com", Action::deny),
    });

    ASSERT_EQ(pe.decide("a.example.com").rule, "first");
    ASSERT_EQ(pe.decide("b.example.com").rule, "w1");
}

TEST(PolicyEngineTest, ports) {
    auto pe = PolicyEngine(std::vector<PolicyRule>(), { 443, 8443 });

    ASSERT_TRUE(pe.port_allowed(443));
    ASSERT_TRUE(pe.port_allowed(8443));
    ASSERT_FALSE(pe.port_allowed(80));

    auto def = PolicyEngine(std::vector<PolicyRule>());
    ASSERT_TRUE(def.port_allowed(443));
    ASSERT_FALSE(def.port_allowed(22));
}

TEST(PolicyTest, helpers) {
    ASSERT_EQ(normalize_host(" Foo.COM. "), "foo.com");
    ASSERT_EQ(normalize_host("[::1]"), "::1");

    ASSERT_TRUE(is_ip_literal("1.2.3.4"));
    ASSERT_TRUE(is_ip_literal("fe80::1"));
    ASSERT_FALSE(is_ip_literal("1.2.3.com"));
    ASSERT_FALSE(is_ip_literal("example.com"));

    ASSERT_TRUE(is_valid_hostname("a-b.example.com"));
    ASSERT_FALSE(is_valid_hostname("a..b"));
    ASSERT_FALSE(is_valid_hostname("a-.b"));
    ASSERT_FALSE(is_valid_hostname(std::string(64, 'a') + ".com"));

    ASSERT_TRUE(action_from_string("PASS") == Action::passthrough);
    ASSERT_TRUE(action_from_string("inject") == Action::inject);
    ASSERT_FALSE(action_from_string("allow-all"));
}
