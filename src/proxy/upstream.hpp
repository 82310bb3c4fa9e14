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

#ifndef SANDGATE_PROXY_UPSTREAM_HPP
#define SANDGATE_PROXY_UPSTREAM_HPP

#include <atomic>
#include <chrono>
#include <ctime>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <log/logan.hpp>

#include <ca/x509.hpp>
#include <proxy/stream.hpp>

namespace sg::proxy {

    // genuine, fully verified TLS towards destinations, with a small idle connection pool
    class UpstreamConnector {
    public:
        struct options_t {
            // empty: system trust store
            std::string ca_bundle;

            // host -> "address:port", pins where a destination connects to
            std::map<std::string, std::string> hosts;

            std::chrono::milliseconds connect_timeout {10000};

            std::size_t pool_max_idle = 8;
            time_t pool_idle_ttl = 30;
        };

        // throws ca::ca_error when the client context cannot be prepared
        explicit UpstreamConnector(options_t opts);

        UpstreamConnector(UpstreamConnector const&) = delete;
        UpstreamConnector& operator=(UpstreamConnector const&) = delete;

        // pooled connection or a new one; throws io_error, tls_error, timeout_error
        // *pooled is set when the connection came from the pool
        std::unique_ptr<TlsStream> acquire(std::string const& host, uint16_t port, Deadline const& deadline,
                                           bool* pooled = nullptr);

        // hand a reusable connection back to the pool
        void release(std::string const& host, uint16_t port, std::unique_ptr<TlsStream> conn);

        // new connection, never pooled
        std::unique_ptr<TlsStream> connect(std::string const& host, uint16_t port, Deadline const& deadline);

        // close idle connections older than the TTL, returns number closed
        std::size_t purge();
        void clear();

        std::size_t idle_count() const;
        uint64_t reused() const { return reused_; }
        uint64_t connected() const { return connected_; }

        options_t const& options() const { return opts_; }

        // false when an idle connection has data or EOF waiting
        static bool still_usable(TlsStream& conn);

        static logan_lite& get_log() {
            static logan_lite l("proxy.upstream");
            return l;
        }

    private:
        int open_socket(std::string const& host, uint16_t port, Deadline const& deadline) const;

        options_t opts_;
        ca::SSL_CTX_ptr ctx_;

        struct idle_t {
            std::unique_ptr<TlsStream> conn;
            time_t since = 0;
        };

        mutable std::mutex pool_lock_;
        std::map<std::string, std::list<idle_t>> pool_;

        std::atomic<uint64_t> reused_ {0};
        std::atomic<uint64_t> connected_ {0};
    };
}

#endif
