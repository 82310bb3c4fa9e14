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

#include <pthread.h>
#include <sys/stat.h>

#include <fstream>

#include <log/logger.hpp>
#include <display.hpp>

#include <service/core/sandgate.hpp>
#include <service/netservice.hpp>

namespace sg {

    Sandgate::~Sandgate() {
        join_all();
    }

    bool Sandgate::load_config(std::string const& config_f) {
        auto const& log = instance().log;

        if(not CfgFactory::get()->cfgapi_init(config_f.c_str())) {
            _fat("Unable to load config.");
            return false;
        }

        CfgFactory::get()->config_file = config_f;

        std::lock_guard<std::recursive_mutex> l_(CfgFactory::lock());
        bool ret = true;

        try {
            ret = CfgFactory::get()->load_all();
        }
        catch(libconfig::SettingException const& e) {
            _fat("Error in config file %s: %s at %s", config_f.c_str(), e.what(), e.getPath());
            ret = false;
        }

        if(not ret) {
            Log::get()->events().insert(ERR, "configuration %s not accepted", config_f.c_str());
        }
        return ret;
    }

    void Sandgate::init_logging() const {
        auto cfg = CfgFactory::get();

        if(cfg->log_file.empty()) return;

        auto* o = new std::ofstream(cfg->log_file.c_str(), std::ios::app);
        ::chmod(cfg->log_file.c_str(), 0600);

        Log::get()->targets(cfg->log_file, o);
        Log::get()->dup2_cout(cfg->log_console);
        Log::get()->level(cfg->internal_init_level);

        auto lp = std::make_unique<logger_profile>();
        lp->print_srcline_ = Log::get()->print_srcline();
        lp->print_srcline_always_ = Log::get()->print_srcline_always();
        lp->level_ = cfg->internal_init_level;
        Log::get()->target_profiles()[(uint64_t)o] = std::move(lp);
    }

    bool Sandgate::init() {
        auto const& log = this->log;
        auto cfg = CfgFactory::get();

        std::lock_guard<std::recursive_mutex> l_(CfgFactory::lock());

        try {
            ca_authority = std::make_unique<ca::AuthorityManager>(cfg->authority);

            // no tunnel may be intercepted without a signing authority
            if(not ca_authority->ensure_authority()) {
                _fat("init: no usable certificate authority in '%s'", cfg->authority.ca_dir.c_str());
                Log::get()->events().insert(CRI, "startup refused: no certificate authority");
                return false;
            }

            leaf_store = std::make_unique<ca::LeafStore>(*ca_authority, cfg->leaf);
            host_policy = std::make_unique<policy::PolicyEngine>(cfg->db_policy, cfg->allowed_ports);
            cred_source = std::make_unique<cred::CredentialSource>(cfg->db_credentials, cfg->credential_options());
            upstream_connector = std::make_unique<proxy::UpstreamConnector>(cfg->upstream);
            audit_log = std::make_unique<audit::AuditLog>(cfg->audit_log);

            session_ctx = std::unique_ptr<proxy::SessionContext>(new proxy::SessionContext {
                *ca_authority, *leaf_store, *host_policy, *cred_source, *upstream_connector, *audit_log,
                std::chrono::seconds(cfg->timeouts.connection_total),
                std::chrono::seconds(cfg->timeouts.idle)
            });

            listener = std::make_unique<proxy::Listener>(*session_ctx, cfg->listener_options());
            listener->start();
        }
        catch(ca::ca_error const& e) {
            _fat("init: certificate authority: %s", e.what());
            return false;
        }
        catch(audit::audit_error const& e) {
            _fat("init: audit log: %s", e.what());
            return false;
        }
        catch(service::netservice_error const& e) {
            _fat("init: listener: %s", e.what());
            return false;
        }
        catch(std::exception const& e) {
            _fat("init: %s", e.what());
            return false;
        }

        auto active = ca_authority->active();
        _not("Sandgate started: authority generation %lu, %zu rules, %zu credentials",
             static_cast<unsigned long>(active ? active->generation : 0),
             cfg->db_policy.size(), cfg->db_credentials.size());

        Log::get()->events().insert(INF, "Sandgate started on %s:%d", cfg->listen_address.c_str(), listener->port());
        return true;
    }

    void Sandgate::maintenance() {
        auto const& log = this->log;

        if(not ca_authority->ensure_authority()) {
            _cri("maintenance: no usable certificate authority, new tunnels are refused");
            Log::get()->events().insert(CRI, "certificate authority unavailable");
        }

        auto retired = ca_authority->retire_expired();
        auto leaves = leaf_store->purge();
        auto idle = upstream_connector->purge();

        if(retired + leaves + idle > 0) {
            _dia("maintenance: %zu authorities retired, %zu leaves purged, %zu idle upstreams closed", retired, leaves, idle);
        }
    }

    void Sandgate::create_maintenance_thread() {

        maintenance_thread = std::make_shared<std::thread>([this]() {
            auto const& log = this->log;
            auto interval = static_cast<unsigned int>(CfgFactory::get()->rotation_interval);

            while(not abort_sleep(interval * 10)) {
                try {
                    maintenance();
                }
                catch(std::exception const& e) {
                    _err("maintenance: %s", e.what());
                }
            }
            _dia("maintenance thread: terminating");
        });

        pthread_setname_np(maintenance_thread->native_handle(), "sg_maint");
    }

    void Sandgate::run() {
        auto const& log = this->log;

        create_maintenance_thread();

        while(not terminate_flag) {
            if(abort_sleep(10)) break;

            if(reload_flag.exchange(false)) {
                reload();
            }
        }

        _not("Sandgate: terminating");
        if(listener) listener->stop();

        join_all();
        terminated = true;
    }

    void Sandgate::stop() {
        terminate_flag = true;
    }

    void Sandgate::reload() {
        auto const& log = this->log;

        // configuration is immutable for the process lifetime, sessions hold references into it
        _war("reload requested: policy and credentials apply on restart only (config %s)",
             CfgFactory::get()->config_file.c_str());
        Log::get()->events().insert(WAR, "reload ignored, restart required");
    }

    void Sandgate::join_all() {
        if(maintenance_thread and maintenance_thread->joinable()) {
            terminate_flag = true;
            maintenance_thread->join();
        }
        maintenance_thread.reset();
    }

    nlohmann::json Sandgate::stats_json() const {
        nlohmann::json j;

        j["sessions"] = proxy::GatewaySession::total_sessions().load();
        j["bytes_up"] = proxy::GatewaySession::total_bytes_up().load();
        j["bytes_down"] = proxy::GatewaySession::total_bytes_down().load();

        if(listener) {
            j["listener"] = { { "accepted", listener->accepted() },
                              { "rejected", listener->rejected() },
                              { "active", listener->active_sessions() } };
        }

        if(ca_authority) {
            auto active = ca_authority->active();
            j["authority"] = { { "generation", active ? active->generation : 0 },
                               { "rotations", ca_authority->rotations() },
                               { "retained", ca_authority->retained_count() } };
        }

        if(leaf_store) {
            j["leaves"] = { { "cached", leaf_store->size() },
                            { "issued", leaf_store->issued_count() },
                            { "failures", leaf_store->failures() } };
        }

        if(upstream_connector) {
            j["upstream"] = { { "connected", upstream_connector->connected() },
                              { "reused", upstream_connector->reused() },
                              { "idle", upstream_connector->idle_count() } };
        }

        if(cred_source) {
            auto st = cred_source->stats();
            j["credentials"] = { { "reads", st.reads },
                                 { "cache_hits", st.cache_hits },
                                 { "unavailable", st.unavailable },
                                 { "timeouts", st.timeouts } };
        }

        if(audit_log) {
            j["audit"] = audit_log->stats().summary_json();
            j["audit"]["written"] = audit_log->written();
        }

        return j;
    }
}
