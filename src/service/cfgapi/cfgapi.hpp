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

#ifndef SANDGATE_CFGAPI_HPP
#define SANDGATE_CFGAPI_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <libconfig.h++>

#include <log/logan.hpp>

#include <audit/auditlog.hpp>
#include <ca/authority.hpp>
#include <ca/leafstore.hpp>
#include <cred/credentials.hpp>
#include <policy/hostpolicy.hpp>
#include <proxy/listener.hpp>
#include <proxy/upstream.hpp>

namespace sg {

    class CfgFactory {

        libconfig::Config cfgapi;
        std::recursive_mutex lock_;

        static inline std::shared_ptr<CfgFactory> self;

    public:
        struct log {
            static logan_lite& config() {
                static logan_lite l("config");
                return l;
            }
        };

        logan_lite& log = log::config();

        // set by loaders on any invalid value; a configuration with errors is not started
        static inline std::atomic_bool LOAD_ERRORS {false};

        CfgFactory() = default;
        CfgFactory(CfgFactory const&) = delete;
        CfgFactory& operator=(CfgFactory const&) = delete;
        ~CfgFactory() { cleanup(); }

        static void init() {
            self = std::make_shared<CfgFactory>();
            LOAD_ERRORS = false;
        }

        static std::shared_ptr<CfgFactory> get() {
            return CfgFactory::self;
        }

        static std::recursive_mutex& lock() { return get()->lock_; }
        static libconfig::Setting& cfg_root() { return get()->cfgapi.getRoot(); }
        static libconfig::Config& cfg_obj() { return get()->cfgapi; }

        std::string config_file = "/etc/sandgate/sandgate.cfg";
        bool config_file_check_only = false;

        loglevel args_debug_flag = NON;
        loglevel internal_init_level = INF;

        // settings
        std::string listen_address = "127.0.0.1";
        uint16_t listen_port = 3128;
        std::set<uint16_t> allowed_ports = { 443 };
        std::size_t max_sessions = 256;
        std::string log_file;
        bool log_console = true;
        std::string pid_file = "/var/run/sandgate.pid";
        int rotation_interval = 60;

        struct {
            int connection_total = 600;
            int idle = 60;
            int upstream_connect = 10;
            int credential_read_ms = 2000;
            int shutdown_grace = 10;
        } timeouts;

        ca::AuthorityManager::options_t authority;
        ca::LeafStore::options_t leaf;
        proxy::UpstreamConnector::options_t upstream;
        std::vector<cred::CredentialSpec> db_credentials;
        std::vector<policy::PolicyRule> db_policy;
        audit::AuditLog::options_t audit_log;

        bool cfgapi_init(const char* fnm);
        bool cfgapi_init_string(std::string const& text);
        void cleanup();

        // all sections; false when anything is invalid
        bool load_all();

        bool load_settings();
        bool load_authority();
        bool load_leaf();
        bool load_timeouts();
        bool load_upstream();
        int  load_credentials();
        int  load_policy();
        bool load_audit();

        cred::CredentialSpec const* credential(std::string const& name) const;

        proxy::Listener::options_t listener_options() const;
        cred::CredentialSource::options_t credential_options() const;
    };


    // load value from config if the config key exists

    template <class T>
    bool load_if_exists(libconfig::Setting const& s, const char* key, T& valref) {

        try {
            std::string str_key(key);

            if (not str_key.empty() and s.exists(str_key)) {

                T tmp = s[str_key.c_str()];
                valref = tmp;

                return true;
            }

        }
        catch(libconfig::SettingTypeException const& e) {
            static auto log = logan_lite("config");

            _war("cannot load: %s: %s", key, e.what());
            CfgFactory::LOAD_ERRORS = true;
        }

        return false;
    }
}

#endif
