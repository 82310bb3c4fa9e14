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

#ifndef SANDGATE_SANDGATE_HPP
#define SANDGATE_SANDGATE_HPP

#include <memory>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include <service/core/service.hpp>
#include <service/cfgapi/cfgapi.hpp>

#include <audit/auditlog.hpp>
#include <ca/authority.hpp>
#include <ca/leafstore.hpp>
#include <cred/credentials.hpp>
#include <policy/hostpolicy.hpp>
#include <proxy/listener.hpp>
#include <proxy/session.hpp>
#include <proxy/upstream.hpp>

namespace sg {

    class Sandgate : public Service {

        Sandgate() : Service() {};

    public:
        ~Sandgate() override;

        Sandgate(Sandgate const&) = delete;
        Sandgate& operator=(Sandgate const&) = delete;

        static Sandgate& instance() {
            static Sandgate sg;
            return sg;
        }

        // read and validate configuration file, false on any error
        bool load_config(std::string const& config_f);

        // attach log file target configured in settings
        void init_logging() const;

        // build all components from loaded configuration, false when startup must be refused
        bool init();

        void run() override;
        void stop() override;
        void reload() override;

        // one maintenance round: authority rotation, retention and cache purges
        void maintenance();

        nlohmann::json stats_json() const;

        // declaration order is teardown order in reverse: listener goes first
        std::unique_ptr<ca::AuthorityManager> ca_authority;
        std::unique_ptr<ca::LeafStore> leaf_store;
        std::unique_ptr<policy::PolicyEngine> host_policy;
        std::unique_ptr<cred::CredentialSource> cred_source;
        std::unique_ptr<proxy::UpstreamConnector> upstream_connector;
        std::unique_ptr<audit::AuditLog> audit_log;
        std::unique_ptr<proxy::SessionContext> session_ctx;
        std::unique_ptr<proxy::Listener> listener;

        std::shared_ptr<std::thread> maintenance_thread;

    private:
        void create_maintenance_thread();
        void join_all();
    };
}

#endif
