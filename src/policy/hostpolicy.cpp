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

#include <algorithm>
#include <cctype>
#include <sstream>

#include <policy/hostpolicy.hpp>
#include <utils/str.hpp>

namespace sg::policy {

    const char* action_name(Action a) {
        switch(a) {
            case Action::deny:
                return "deny";
            case Action::passthrough:
                return "passthrough";
            case Action::inject:
                return "inject";
        }
        return "unknown";
    }

    std::optional<Action> action_from_string(std::string_view name) {
        auto n = str::to_lower(str::trim(name));

        if(n == "deny" or n == "block") return Action::deny;
        if(n == "passthrough" or n == "pass") return Action::passthrough;
        if(n == "inject") return Action::inject;

        return std::nullopt;
    }


    std::string normalize_host(std::string_view host) {
        auto ret = str::to_lower(str::trim(host));
        if(not ret.empty() and ret.back() == '.') {
            ret.pop_back();
        }
        if(ret.size() > 2 and ret.front() == '[' and ret.back() == ']') {
            ret = ret.substr(1, ret.size() - 2);
        }
        return ret;
    }

    namespace {
        bool is_numeric_label(std::string_view label) {
            if(label.empty()) return false;

            if(label.size() > 2 and label[0] == '0' and (label[1] == 'x' or label[1] == 'X')) {
                return std::all_of(label.begin() + 2, label.end(), [](char c) {
                    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
                });
            }
            return std::all_of(label.begin(), label.end(), [](char c) {
                return std::isdigit(static_cast<unsigned char>(c)) != 0;
            });
        }
    }

    bool is_ip_literal(std::string_view host) {
        if(host.empty()) return false;

        // bracketed or bare IPv6
        if(host.front() == '[' or host.find(':') != std::string_view::npos) {
            return true;
        }

        if(host.back() == '.') host.remove_suffix(1);

        // a numeric last label makes resolvers parse the whole name as IPv4
        // (127.0.0.1, 0177.1, 0x7f.0.0.1, 2130706433)
        auto dot = host.rfind('.');
        auto last = dot == std::string_view::npos ? host : host.substr(dot + 1);

        return is_numeric_label(last);
    }

    bool is_valid_hostname(std::string_view host) {
        if(host.empty() or host.size() > 253) return false;

        std::size_t label_len = 0;
        char prev = '.';

        for(auto c: host) {
            if(c == '.') {
                if(label_len == 0 or prev == '-') return false;
                label_len = 0;
            }
            else if(std::isalnum(static_cast<unsigned char>(c)) or c == '_' or c == '-') {
                if(c == '-' and label_len == 0) return false;
                if(++label_len > 63) return false;
            }
            else {
                return false;
            }
            prev = c;
        }

        return label_len > 0 and prev != '-';
    }


    std::optional<HostPattern> HostPattern::parse(std::string_view text) {
        auto t = normalize_host(text);

        if(t == "*") {
            return HostPattern(kind_t::any, "");
        }

        if(t.size() > 2 and t[0] == '*' and t[1] == '.') {
            auto suffix = t.substr(2);
            if(not is_valid_hostname(suffix)) return std::nullopt;

            return HostPattern(kind_t::wildcard, suffix);
        }

        if(t.size() > 1 and t[0] == '.') {
            auto suffix = t.substr(1);
            if(not is_valid_hostname(suffix)) return std::nullopt;

            return HostPattern(kind_t::domain, suffix);
        }

        if(is_valid_hostname(t) or (is_ip_literal(t) and t.find_first_of("*[] /") == std::string::npos)) {
            return HostPattern(kind_t::exact, t);
        }

        return std::nullopt;
    }

    bool HostPattern::match(std::string const& host) const {
        switch(kind_) {
            case kind_t::any:
                return true;

            case kind_t::exact:
                return host == value_;

            case kind_t::domain:
                if(host == value_) return true;
                [[fallthrough]];

            case kind_t::wildcard:
                return host.size() > value_.size() + 1
                       and str::ends_with(host, value_)
                       and host[host.size() - value_.size() - 1] == '.';
        }
        return false;
    }

    std::size_t HostPattern::specificity() const {
        switch(kind_) {
            case kind_t::any:
                return 0;
            case kind_t::domain:
                return value_.size() * 2 + 1;
            case kind_t::wildcard:
                return value_.size() * 2 + 2;
            case kind_t::exact:
                return value_.size() * 2 + 3;
        }
        return 0;
    }

    std::string HostPattern::str() const {
        switch(kind_) {
            case kind_t::any:
                return "*";
            case kind_t::wildcard:
                return "*." + value_;
            case kind_t::domain:
                return "." + value_;
            case kind_t::exact:
                return value_;
        }
        return "?";
    }


    std::string PolicyRule::to_string(int verbosity) const {
        std::stringstream out;
        out << "PolicyRule: " << pattern.str() << " = ";

        switch(action) {
            case Action::deny:
                out << "DENY";
                break;
            case Action::passthrough:
                out << "PASS";
                break;
            case Action::inject:
                out << "INJECT(" << credential << ")";
                break;
        }

        if(verbosity > iINF) {
            out << " [" << name << "]";
        }

        return out.str();
    }


    PolicyEngine::PolicyEngine(std::vector<PolicyRule> rules, std::set<uint16_t> allowed_ports)
    : rules_(std::move(rules)), allowed_ports_(std::move(allowed_ports)) {

        auto const& log = get_log();

        for(std::size_t i = 0; i < rules_.size(); ++i) {
            auto const& r = rules_[i];

            if(r.pattern.kind() == HostPattern::kind_t::exact) {
                if(not exact_.emplace(r.pattern.value(), i).second) {
                    _war("duplicate rule for '%s' ignored: %s", r.pattern.str().c_str(), r.to_string().c_str());
                }
            }
            else {
                auto dup = std::find_if(suffix_.begin(), suffix_.end(), [&](auto idx) {
                    return rules_[idx].pattern.str() == r.pattern.str();
                });

                if(dup != suffix_.end()) {
                    _war("duplicate rule for '%s' ignored: %s", r.pattern.str().c_str(), r.to_string().c_str());
                    continue;
                }
                suffix_.push_back(i);
            }
        }

        std::stable_sort(suffix_.begin(), suffix_.end(), [this](auto a, auto b) {
            return rules_[a].pattern.specificity() > rules_[b].pattern.specificity();
        });

        _dia("policy loaded: %zu exact, %zu suffix rules", exact_.size(), suffix_.size());
    }

    Decision PolicyEngine::decide(std::string_view raw_host) const {
        auto const& log = get_log();
        auto const host = normalize_host(raw_host);

        auto from_rule = [](PolicyRule const& r) {
            Decision d;
            d.action = r.action;
            d.credential = r.action == Action::inject ? r.credential : std::string();
            d.rule = r.name;
            return d;
        };

        if(auto it = exact_.find(host); it != exact_.end()) {
            auto d = from_rule(rules_[it->second]);
            _dia("decide: '%s' -> %s (exact, rule '%s')", host.c_str(), action_name(d.action), d.rule.c_str());
            return d;
        }

        if(is_ip_literal(host)) {
            _dia("decide: '%s' -> deny (address literal)", str::printable(host).c_str());

            Decision d;
            d.rule = "ip-literal";
            return d;
        }

        for(auto idx: suffix_) {
            auto const& r = rules_[idx];
            if(r.pattern.match(host)) {
                auto d = from_rule(r);
                _dia("decide: '%s' -> %s (%s, rule '%s')", host.c_str(), action_name(d.action),
                     r.pattern.str().c_str(), d.rule.c_str());
                return d;
            }
        }

        _dia("decide: '%s' -> deny (no match)", str::printable(host).c_str());

        Decision d;
        d.rule = "implicit-deny";
        return d;
    }
}
