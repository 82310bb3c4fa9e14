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

#ifndef SANDGATE_POLICY_HOSTPOLICY_HPP
#define SANDGATE_POLICY_HOSTPOLICY_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <log/logan.hpp>

namespace sg::policy {

    enum class Action { deny, passthrough, inject };

    const char* action_name(Action a);
    std::optional<Action> action_from_string(std::string_view name);


    class HostPattern {
    public:
        enum class kind_t { exact, wildcard, domain, any };

        // "api.example.com", "*.example.com", ".example.com" or "*"
        static std::optional<HostPattern> parse(std::string_view text);

        // host must be normalized already
        bool match(std::string const& host) const;

        // longer suffix is more specific; "*.x" wins over ".x" on equal suffix
        std::size_t specificity() const;

        kind_t kind() const { return kind_; }
        std::string const& value() const { return value_; }
        std::string str() const;

    private:
        HostPattern(kind_t k, std::string v) : kind_(k), value_(std::move(v)) {};

        kind_t kind_;
        std::string value_;
    };


    struct PolicyRule {
        std::string name;
        HostPattern pattern;
        Action action = Action::deny;
        std::string credential;

        std::string to_string(int verbosity = iINF) const;
    };


    struct Decision {
        Action action = Action::deny;
        std::string credential;

        // name of the rule which decided, or the guard which denied
        std::string rule;

        bool allowed() const { return action != Action::deny; }
    };


    // immutable host -> action table; decide() takes no locks
    class PolicyEngine {
    public:
        explicit PolicyEngine(std::vector<PolicyRule> rules, std::set<uint16_t> allowed_ports = { 443 });

        Decision decide(std::string_view host) const;
        bool port_allowed(uint16_t port) const { return allowed_ports_.count(port) > 0; }

        std::vector<PolicyRule> const& rules() const { return rules_; }
        std::set<uint16_t> const& allowed_ports() const { return allowed_ports_; }

        static logan_lite& get_log() {
            static logan_lite l("policy");
            return l;
        }

    private:
        std::vector<PolicyRule> rules_;
        std::set<uint16_t> allowed_ports_;

        std::unordered_map<std::string, std::size_t> exact_;
        // indexes of suffix rules, most specific first
        std::vector<std::size_t> suffix_;
    };


    // lowercase, without a single trailing dot and IPv6 brackets
    std::string normalize_host(std::string_view host);

    // any notation a resolver would take as an address: dotted, octal, hex, integer, IPv6
    bool is_ip_literal(std::string_view host);

    bool is_valid_hostname(std::string_view host);
}

#endif
