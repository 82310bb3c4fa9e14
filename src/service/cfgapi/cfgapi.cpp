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

#include <map>

#include <service/cfgapi/cfgapi.hpp>
#include <proxy/http1.hpp>

#include <log/logger.hpp>
#include <display.hpp>

using namespace libconfig;

namespace sg {

    bool CfgFactory::cfgapi_init(const char* fnm) {

        std::scoped_lock<std::recursive_mutex> l(lock_);

        _dia("Reading config file");

        try {
            cfgapi.readFile(fnm);
        }
        catch(const FileIOException &fioex)
        {
            _err("I/O error while reading config file: %s: %s", fnm, fioex.what());
            return false;
        }
        catch(const ParseException &pex)
        {
            _err("Parse error in %s at %s:%d - %s", fnm, pex.getFile(), pex.getLine(), pex.getError());
            return false;
        }

        return true;
    }

    bool CfgFactory::cfgapi_init_string(std::string const& text) {

        std::scoped_lock<std::recursive_mutex> l(lock_);

        try {
            cfgapi.readString(text);
        }
        catch(const ParseException &pex)
        {
            _err("Parse error at line %d - %s", pex.getLine(), pex.getError());
            return false;
        }

        return true;
    }

    void CfgFactory::cleanup() {
        std::scoped_lock<std::recursive_mutex> l(lock_);

        db_credentials.clear();
        db_policy.clear();
        upstream.hosts.clear();
    }

    bool CfgFactory::load_all() {
        std::scoped_lock<std::recursive_mutex> l(lock_);

        LOAD_ERRORS = false;

        load_settings();
        load_authority();
        load_leaf();
        load_timeouts();
        load_upstream();
        load_credentials();
        load_policy();
        load_audit();

        if(LOAD_ERRORS) {
            _err("configuration contains errors");
        }
        return not LOAD_ERRORS;
    }


    namespace {
        bool in_range(int v, int lo, int hi) { return v >= lo and v <= hi; }

        void load_error(const char* fmt, std::string const& detail) {
            auto const& log = CfgFactory::log::config();

            auto msg = string_format(fmt, detail.c_str());
            _err("%s", msg.c_str());
            Log::get()->events().insert(ERR, "CONFIG: %s", msg.c_str());
            CfgFactory::LOAD_ERRORS = true;
        }
    }

    bool CfgFactory::load_settings() {
        std::scoped_lock<std::recursive_mutex> l(lock_);

        if(not cfgapi.getRoot().exists("settings")) {
            _dia("load_settings: no 'settings' section, using defaults");
            return true;
        }
        auto const& s = cfgapi.getRoot()["settings"];

        load_if_exists(s, "listen_address", listen_address);

        if(int port = listen_port; load_if_exists(s, "listen_port", port)) {
            if(not in_range(port, 0, 65535)) {
                load_error("settings.listen_port: %s out of range", std::to_string(port));
            } else {
                listen_port = static_cast<uint16_t>(port);
            }
        }

        if(s.exists("allowed_ports")) {
            auto const& ports = s["allowed_ports"];
            allowed_ports.clear();

            for(int i = 0; i < ports.getLength(); i++) {
                int p = 0;
                try {
                    p = ports[i];
                }
                catch(SettingTypeException const& e) {
                    load_error("settings.allowed_ports: %s", e.what());
                    continue;
                }

                if(not in_range(p, 1, 65535)) {
                    load_error("settings.allowed_ports: %s out of range", std::to_string(p));
                    continue;
                }
                allowed_ports.insert(static_cast<uint16_t>(p));
            }
        }

        if(int ms = static_cast<int>(max_sessions); load_if_exists(s, "max_sessions", ms)) {
            if(ms <= 0) {
                load_error("settings.max_sessions: %s must be positive", std::to_string(ms));
            } else {
                max_sessions = static_cast<std::size_t>(ms);
            }
        }

        if(int lev = 0; load_if_exists(s, "log_level", lev)) {
            internal_init_level.level_ref() = lev;
        }

        load_if_exists(s, "log_file", log_file);
        load_if_exists(s, "log_console", log_console);
        load_if_exists(s, "pid_file", pid_file);

        if(load_if_exists(s, "rotation_interval", rotation_interval) and rotation_interval <= 0) {
            load_error("settings.rotation_interval: %s must be positive", std::to_string(rotation_interval));
        }

        return true;
    }

    bool CfgFactory::load_authority() {
        std::scoped_lock<std::recursive_mutex> l(lock_);

        if(not cfgapi.getRoot().exists("authority")) {
            load_error("%s: 'authority' section is missing", config_file);
            return false;
        }
        auto const& s = cfgapi.getRoot()["authority"];

        load_if_exists(s, "ca_dir", authority.ca_dir);
        load_if_exists(s, "name", authority.name);
        load_if_exists(s, "common_name", authority.common_name);
        load_if_exists(s, "organization", authority.organization);
        load_if_exists(s, "key_password", authority.key_password);
        load_if_exists(s, "persist", authority.persist);

        if(int v = 0; load_if_exists(s, "validity", v)) authority.validity = v;
        if(int v = 0; load_if_exists(s, "safety_margin", v)) authority.safety_margin = v;

        if(authority.persist and authority.ca_dir.empty()) {
            load_error("authority.ca_dir: %s", "required");
        }
        if(authority.name.empty() or authority.name.find('/') != std::string::npos) {
            load_error("authority.name: '%s' is not a file name", authority.name);
        }
        if(authority.safety_margin < 0 or authority.validity <= authority.safety_margin) {
            load_error("authority.validity: %s must exceed safety_margin", std::to_string(authority.validity));
        }

        _dia("load_authority: '%s' in %s, validity %lds, margin %lds", authority.name.c_str(), authority.ca_dir.c_str(),
             static_cast<long>(authority.validity), static_cast<long>(authority.safety_margin));
        return true;
    }

    bool CfgFactory::load_leaf() {
        std::scoped_lock<std::recursive_mutex> l(lock_);

        if(not cfgapi.getRoot().exists("leaf")) return true;
        auto const& s = cfgapi.getRoot()["leaf"];

        if(int v = 0; load_if_exists(s, "validity", v)) {
            if(v <= 0) load_error("leaf.validity: %s must be positive", std::to_string(v));
            else leaf.validity = v;
        }
        if(int v = 0; load_if_exists(s, "capacity", v)) {
            if(v <= 0) load_error("leaf.capacity: %s must be positive", std::to_string(v));
            else leaf.capacity = static_cast<std::size_t>(v);
        }

        return true;
    }

    bool CfgFactory::load_timeouts() {
        std::scoped_lock<std::recursive_mutex> l(lock_);

        if(not cfgapi.getRoot().exists("timeouts")) return true;
        auto const& s = cfgapi.getRoot()["timeouts"];

        auto positive = [&](const char* key, int& ref) {
            if(load_if_exists(s, key, ref) and ref <= 0) {
                load_error("timeouts.%s must be positive", key);
            }
        };

        positive("connection_total", timeouts.connection_total);
        positive("idle", timeouts.idle);
        positive("upstream_connect", timeouts.upstream_connect);
        positive("credential_read_ms", timeouts.credential_read_ms);

        if(load_if_exists(s, "shutdown_grace", timeouts.shutdown_grace) and timeouts.shutdown_grace < 0) {
            load_error("timeouts.%s must not be negative", "shutdown_grace");
        }

        upstream.connect_timeout = std::chrono::seconds(timeouts.upstream_connect);
        return true;
    }

    bool CfgFactory::load_upstream() {
        std::scoped_lock<std::recursive_mutex> l(lock_);

        upstream.connect_timeout = std::chrono::seconds(timeouts.upstream_connect);

        if(not cfgapi.getRoot().exists("upstream")) return true;
        auto const& s = cfgapi.getRoot()["upstream"];

        load_if_exists(s, "ca_bundle", upstream.ca_bundle);

        if(int v = 0; load_if_exists(s, "pool_max_idle", v)) {
            if(v < 0) load_error("upstream.pool_max_idle: %s must not be negative", std::to_string(v));
            else upstream.pool_max_idle = static_cast<std::size_t>(v);
        }
        if(int v = 0; load_if_exists(s, "pool_idle_ttl", v)) {
            upstream.pool_idle_ttl = v;
        }

        upstream.hosts.clear();
        if(s.exists("hosts")) {
            auto const& hosts = s["hosts"];

            for(int i = 0; i < hosts.getLength(); i++) {
                std::string host;
                std::string address;

                if(not load_if_exists(hosts[i], "host", host) or not load_if_exists(hosts[i], "address", address)) {
                    load_error("upstream.hosts[%s]: 'host' and 'address' required", std::to_string(i));
                    continue;
                }

                if(not http1::parse_connect_target(address)) {
                    load_error("upstream.hosts: '%s' is not address:port", address);
                    continue;
                }

                upstream.hosts[policy::normalize_host(host)] = address;
            }
        }

        return true;
    }

    int CfgFactory::load_credentials() {
        std::scoped_lock<std::recursive_mutex> l(lock_);

        db_credentials.clear();

        if(not cfgapi.getRoot().exists("credentials")) return 0;
        auto const& s = cfgapi.getRoot()["credentials"];

        for(int i = 0; i < s.getLength(); i++) {
            auto const& cur = s[i];

            cred::CredentialSpec spec;
            spec.name = cur.getName() ? cur.getName() : "";

            if(not load_if_exists(cur, "file", spec.file) or spec.file.empty()) {
                load_error("credentials.%s: 'file' required", spec.name);
                continue;
            }

            load_if_exists(cur, "header", spec.header);
            load_if_exists(cur, "scheme", spec.scheme);

            if(cur.exists("strip")) {
                spec.strip.clear();
                for(int j = 0; j < cur["strip"].getLength(); j++) {
                    std::string h = cur["strip"][j];
                    spec.strip.push_back(h);
                }
            }

            if(int v = 0; load_if_exists(cur, "cache_seconds", v)) spec.cache_seconds = v;
            if(int v = 0; load_if_exists(cur, "expiry_margin", v)) spec.expiry_margin = v;

            if(spec.header.empty()) {
                load_error("credentials.%s: 'header' must not be empty", spec.name);
                continue;
            }

            _dia("load_credentials: '%s' from %s into '%s'", spec.name.c_str(), spec.file.c_str(), spec.header.c_str());
            db_credentials.push_back(std::move(spec));
        }

        return static_cast<int>(db_credentials.size());
    }

    int CfgFactory::load_policy() {
        std::scoped_lock<std::recursive_mutex> l(lock_);

        db_policy.clear();

        if(not cfgapi.getRoot().exists("policy")) {
            _war("load_policy: no policy, every destination is denied");
            return 0;
        }
        auto const& s = cfgapi.getRoot()["policy"];

        for(int i = 0; i < s.getLength(); i++) {
            auto const& cur = s[i];

            std::string name = string_format("rule-%d", i);
            std::string host;
            std::string action;
            std::string credential;

            load_if_exists(cur, "name", name);
            if(not load_if_exists(cur, "host", host)) {
                load_error("policy[%s]: 'host' required", std::to_string(i));
                continue;
            }
            if(not load_if_exists(cur, "action", action)) {
                load_error("policy[%s]: 'action' required", std::to_string(i));
                continue;
            }
            load_if_exists(cur, "credential", credential);

            auto pattern = policy::HostPattern::parse(host);
            if(not pattern) {
                load_error("policy: invalid host pattern '%s'", host);
                continue;
            }

            auto act = policy::action_from_string(action);
            if(not act) {
                load_error("policy: unknown action '%s'", action);
                continue;
            }

            if(*act == policy::Action::inject) {
                if(credential.empty()) {
                    load_error("policy: rule '%s' injects without a credential", name);
                    continue;
                }
                if(this->credential(credential) == nullptr) {
                    load_error("policy: undefined credential '%s'", credential);
                    continue;
                }
            }
            else if(not credential.empty()) {
                _war("load_policy: rule '%s' does not inject, credential '%s' ignored", name.c_str(), credential.c_str());
                credential.clear();
            }

            db_policy.push_back(policy::PolicyRule { name, *pattern, *act, credential });
            _dia("load_policy: %s", db_policy.back().to_string(iDIA).c_str());
        }

        return static_cast<int>(db_policy.size());
    }

    bool CfgFactory::load_audit() {
        std::scoped_lock<std::recursive_mutex> l(lock_);

        if(not cfgapi.getRoot().exists("audit")) return true;
        auto const& s = cfgapi.getRoot()["audit"];

        load_if_exists(s, "file", audit_log.file);

        if(int v = 0; load_if_exists(s, "alert_threshold", v)) {
            if(v < 0) load_error("audit.alert_threshold: %s must not be negative", std::to_string(v));
            else audit_log.alert_threshold = static_cast<std::size_t>(v);
        }
        if(int v = 0; load_if_exists(s, "alert_window", v)) {
            if(v <= 0) load_error("audit.alert_window: %s must be positive", std::to_string(v));
            else audit_log.alert_window = v;
        }
        if(int v = 0; load_if_exists(s, "blocked_hosts_max", v)) {
            if(v < 0) load_error("audit.blocked_hosts_max: %s must not be negative", std::to_string(v));
            else audit_log.blocked_hosts_max = static_cast<std::size_t>(v);
        }

        return true;
    }

    cred::CredentialSpec const* CfgFactory::credential(std::string const& name) const {
        for(auto const& c: db_credentials) {
            if(c.name == name) return &c;
        }
        return nullptr;
    }

    proxy::Listener::options_t CfgFactory::listener_options() const {
        proxy::Listener::options_t o;
        o.address = listen_address;
        o.port = listen_port;
        o.max_sessions = max_sessions;
        o.shutdown_grace = std::chrono::seconds(timeouts.shutdown_grace);
        return o;
    }

    cred::CredentialSource::options_t CfgFactory::credential_options() const {
        cred::CredentialSource::options_t o;
        o.read_timeout = std::chrono::milliseconds(timeouts.credential_read_ms);
        return o;
    }
}
