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

#ifndef SANDGATE_PROXY_SESSION_HPP
#define SANDGATE_PROXY_SESSION_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include <log/logan.hpp>

#include <audit/auditlog.hpp>
#include <ca/authority.hpp>
#include <ca/leafstore.hpp>
#include <cred/credentials.hpp>
#include <policy/hostpolicy.hpp>
#include <proxy/http1.hpp>
#include <proxy/stream.hpp>
#include <proxy/upstream.hpp>

namespace sg::proxy {

    // shared components every session works with; all outlive the sessions
    struct SessionContext {
        ca::AuthorityManager& authority;
        ca::LeafStore& leaves;
        policy::PolicyEngine const& policy;
        cred::CredentialSource& credentials;
        UpstreamConnector& upstream;
        audit::AuditLog& audit;

        std::chrono::milliseconds total_timeout {600000};
        std::chrono::milliseconds idle_timeout {60000};

        std::size_t max_connect_head = 16 * 1024;
        std::size_t max_request_head = 64 * 1024;
    };


    // one CONNECT tunnel from the sandbox, handled on its own thread
    class GatewaySession {
    public:
        enum class state_t { awaiting_connect, policy_decided, denied, tls_handshaking,
                             request_relay, response_relay, tunnel, closed };

        GatewaySession(SessionContext& ctx, int client_fd, std::string client_addr, uint64_t id);
        ~GatewaySession();

        GatewaySession(GatewaySession const&) = delete;
        GatewaySession& operator=(GatewaySession const&) = delete;

        // serve the connection until it is closed; writes exactly one audit record, never throws
        void run() noexcept;

        // callable from other threads: wake up blocked I/O of both legs
        void abort();

        uint64_t id() const { return record_.session_id; }
        state_t state() const { return state_; }
        audit::AuditRecord const& record() const { return record_; }

        static const char* state_name(state_t s);

        static std::atomic<uint64_t>& total_sessions() { static std::atomic<uint64_t> c{0}; return c; }
        static std::atomic<uint64_t>& total_bytes_up() { static std::atomic<uint64_t> c{0}; return c; }
        static std::atomic<uint64_t>& total_bytes_down() { static std::atomic<uint64_t> c{0}; return c; }

        static logan_lite& get_log() {
            static logan_lite l("proxy.session");
            return l;
        }

    private:
        void handle(Deadline const& deadline);

        // CONNECT head, guards, policy and the TLS handshake; nullptr when the tunnel is refused
        TlsStream* establish(Deadline const& deadline);

        void relay_requests(TlsStream& client, Deadline const& deadline);

        // one request/response exchange; false when the tunnel must close afterwards
        bool exchange(TlsStream& client, Reader& cr, std::unique_ptr<TlsStream>& up, std::unique_ptr<Reader>& ur,
                      Deadline const& deadline);

        // 101: opaque bidirectional relay until either side finishes
        void relay_raw(Stream& client, Reader& cr, Stream& up, Reader& ur, Deadline const& deadline);

        void respond(Stream& s, int status, audit::Outcome outcome, std::string detail);
        void finish(audit::Outcome outcome, std::string detail);

        void state(state_t s);
        void track_upstream(int fd);

        SessionContext& ctx_;

        std::unique_ptr<Stream> client_;
        policy::Decision decision_;

        audit::AuditRecord record_;
        bool outcome_set_ = false;

        std::atomic<state_t> state_ { state_t::awaiting_connect };
        std::atomic_bool aborted_ {false};

        // sockets abort() may shut down; cleared before the owning stream closes them
        std::mutex fd_lock_;
        int client_fd_ = -1;
        int upstream_fd_ = -1;
    };
}

#endif
