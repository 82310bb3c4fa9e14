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

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <proxy/upstream.hpp>
#include <proxy/http1.hpp>

#include <display.hpp>

namespace sg::proxy {

    UpstreamConnector::UpstreamConnector(options_t opts) : opts_(std::move(opts)) {
        auto const& log = get_log();

        ctx_.reset(SSL_CTX_new(TLS_client_method()));
        if(not ctx_) {
            throw ca::ca_error("cannot create client context: " + ca::x509::last_error());
        }

        SSL_CTX_set_min_proto_version(ctx_.get(), TLS1_2_VERSION);
        SSL_CTX_set_options(ctx_.get(), SSL_OP_NO_COMPRESSION);
        SSL_CTX_set_verify(ctx_.get(), SSL_VERIFY_PEER, nullptr);

        if(opts_.ca_bundle.empty()) {
            if(SSL_CTX_set_default_verify_paths(ctx_.get()) != 1) {
                throw ca::ca_error("cannot load system trust store: " + ca::x509::last_error());
            }
            _dia("upstream verification uses the system trust store");
        }
        else {
            if(SSL_CTX_load_verify_locations(ctx_.get(), opts_.ca_bundle.c_str(), nullptr) != 1) {
                throw ca::ca_error(string_format("cannot load CA bundle '%s': %s",
                                                 opts_.ca_bundle.c_str(), ca::x509::last_error().c_str()));
            }
            _dia("upstream verification uses '%s'", opts_.ca_bundle.c_str());
        }
    }


    int UpstreamConnector::open_socket(std::string const& host, uint16_t port, Deadline const& deadline) const {
        auto const& log = get_log();

        std::string address = host;
        std::string service = std::to_string(port);

        if(auto it = opts_.hosts.find(host); it != opts_.hosts.end()) {
            auto pinned = http1::parse_connect_target(it->second);
            if(not pinned) {
                throw io_error(string_format("invalid static address '%s' for '%s'", it->second.c_str(), host.c_str()));
            }
            address = pinned->host;
            service = std::to_string(pinned->port);
            _deb("open_socket: '%s' pinned to %s:%s", host.c_str(), address.c_str(), service.c_str());
        }

        struct addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if(auto rc = ::getaddrinfo(address.c_str(), service.c_str(), &hints, &res); rc != 0) {
            throw io_error(string_format("cannot resolve '%s': %s", address.c_str(), gai_strerror(rc)));
        }
        std::unique_ptr<struct addrinfo, decltype(&::freeaddrinfo)> res_guard(res, &::freeaddrinfo);

        std::string last = "no address";

        for(auto* ai = res; ai != nullptr; ai = ai->ai_next) {
            int fd = ::socket(ai->ai_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
            if(fd < 0) {
                last = string_error();
                continue;
            }

            int one = 1;
            ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

            if(::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
                return fd;
            }
            if(errno != EINPROGRESS) {
                last = string_error();
                ::close(fd);
                continue;
            }

            struct pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;

            int r = 0;
            try {
                do {
                    r = ::poll(&pfd, 1, deadline.wait_ms(opts_.connect_timeout));
                } while(r < 0 and errno == EINTR);
            }
            catch(timeout_error const&) {
                ::close(fd);
                throw;
            }

            if(r == 0) {
                last = "connect timeout";
                ::close(fd);
                continue;
            }

            int err = 0;
            socklen_t len = sizeof(err);
            if(r < 0 or ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
                last = string_error();
                ::close(fd);
                continue;
            }
            if(err != 0) {
                last = std::strerror(err);
                ::close(fd);
                continue;
            }

            return fd;
        }

        throw io_error(string_format("cannot connect to %s:%s: %s", address.c_str(), service.c_str(), last.c_str()));
    }

    std::unique_ptr<TlsStream> UpstreamConnector::connect(std::string const& host, uint16_t port, Deadline const& deadline) {
        auto const& log = get_log();

        auto fd = open_socket(host, port, deadline);
        auto conn = TlsStream::connect(fd, ctx_.get(), host, deadline);
        ++connected_;

        _dia("connected to %s:%d, alpn '%s'", host.c_str(), port, conn->alpn().c_str());
        return conn;
    }


    bool UpstreamConnector::still_usable(TlsStream& conn) {
        if(conn.pending()) return false;

        struct pollfd pfd{};
        pfd.fd = conn.fd();
        pfd.events = POLLIN;

        // anything readable on an idle connection is either EOF or garbage
        return ::poll(&pfd, 1, 0) == 0;
    }

    std::unique_ptr<TlsStream> UpstreamConnector::acquire(std::string const& host, uint16_t port, Deadline const& deadline,
                                                          bool* pooled) {
        auto const& log = get_log();
        if(pooled) *pooled = false;
        auto const key = string_format("%s:%d", host.c_str(), port);
        auto const now = ::time(nullptr);

        while(true) {
            std::unique_ptr<TlsStream> cand;
            time_t since = 0;
            {
                auto l_ = std::scoped_lock(pool_lock_);
                auto it = pool_.find(key);
                if(it == pool_.end() or it->second.empty()) break;

                cand = std::move(it->second.back().conn);
                since = it->second.back().since;
                it->second.pop_back();
                if(it->second.empty()) pool_.erase(it);
            }

            if(now - since < opts_.pool_idle_ttl and still_usable(*cand)) {
                cand->deadline(&deadline);
                ++reused_;
                if(pooled) *pooled = true;
                _deb("acquire: reusing connection to %s", key.c_str());
                return cand;
            }
            _deb("acquire: discarding stale connection to %s", key.c_str());
        }

        return connect(host, port, deadline);
    }

    void UpstreamConnector::release(std::string const& host, uint16_t port, std::unique_ptr<TlsStream> conn) {
        if(not conn or opts_.pool_max_idle == 0) return;

        conn->deadline(nullptr);
        auto const key = string_format("%s:%d", host.c_str(), port);

        auto l_ = std::scoped_lock(pool_lock_);

        std::size_t total = 0;
        for(auto const& [k, l]: pool_) total += l.size();

        if(total >= opts_.pool_max_idle) {
            return;
        }

        pool_[key].push_back(idle_t{ std::move(conn), ::time(nullptr) });
    }

    std::size_t UpstreamConnector::purge() {
        auto const now = ::time(nullptr);
        std::size_t closed = 0;

        auto l_ = std::scoped_lock(pool_lock_);
        for(auto it = pool_.begin(); it != pool_.end(); ) {
            auto& l = it->second;
            auto before = l.size();
            l.remove_if([&](auto const& idle) { return now - idle.since >= opts_.pool_idle_ttl; });
            closed += before - l.size();

            it = l.empty() ? pool_.erase(it) : std::next(it);
        }
        return closed;
    }

    void UpstreamConnector::clear() {
        auto l_ = std::scoped_lock(pool_lock_);
        pool_.clear();
    }

    std::size_t UpstreamConnector::idle_count() const {
        auto l_ = std::scoped_lock(pool_lock_);

        std::size_t total = 0;
        for(auto const& [k, l]: pool_) total += l.size();
        return total;
    }
}
