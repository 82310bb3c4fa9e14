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

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <pthread.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

#include <proxy/listener.hpp>
#include <proxy/http1.hpp>
#include <service/netservice.hpp>

#include <display.hpp>

namespace sg::proxy {

    Listener::~Listener() {
        stop();
    }

    void Listener::start() {
        auto const& log = get_log();

        if(acceptor_.joinable()) return;

        sock_ = service::NetworkServiceFactory::prepare_listener(opts_.address, opts_.port, "gateway");
        bound_port_ = service::NetworkServiceFactory::bound_port(sock_);
        stopping_ = false;

        acceptor_ = std::thread([this]() { accept_loop(); });
        pthread_setname_np(acceptor_.native_handle(), "sg_acceptor");

        _not("listening on %s:%d, max %zu sessions", opts_.address.c_str(), bound_port_, opts_.max_sessions);
    }

    void Listener::accept_loop() {
        auto const& log = get_log();

        while(not stopping_) {
            struct pollfd pfd{};
            pfd.fd = sock_;
            pfd.events = POLLIN;

            auto r = ::poll(&pfd, 1, 200);
            if(r < 0) {
                if(errno == EINTR) continue;
                _err("accept_loop: poll failed: %s", string_error().c_str());
                break;
            }
            if(r == 0) continue;

            int fd = ::accept4(sock_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
            if(fd < 0) {
                if(errno == EAGAIN or errno == EWOULDBLOCK or errno == EINTR or errno == ECONNABORTED) continue;

                _err("accept_loop: accept failed: %s", string_error().c_str());
                if(errno == EMFILE or errno == ENFILE) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                }
                continue;
            }

            int one = 1;
            ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

            auto peer = service::NetworkServiceFactory::peer_string(fd);
            accepted_++;

            if(active_sessions() >= opts_.max_sessions) {
                reject(fd, peer);
                continue;
            }

            spawn(fd, std::move(peer));
        }

        _dia("accept_loop: finished");
    }

    void Listener::reject(int fd, std::string const& peer) {
        auto const& log = get_log();

        rejected_++;
        _war("session limit %zu reached: %s rejected", opts_.max_sessions, peer.c_str());

        auto msg = http1::simple_response(503, "503 Service Unavailable\n");
        if(::send(fd, msg.data(), msg.size(), MSG_NOSIGNAL | MSG_DONTWAIT) < 0) {
            _deb("reject: %s", string_error().c_str());
        }
        ::close(fd);
    }

    void Listener::spawn(int fd, std::string peer) {
        auto const& log = get_log();

        auto id = ++next_id_;
        std::shared_ptr<GatewaySession> session;

        try {
            session = std::make_shared<GatewaySession>(ctx_, fd, peer, id);
        }
        catch(std::exception const& e) {
            _err("spawn: cannot create session for %s: %s", peer.c_str(), e.what());
            ::close(fd);
            return;
        }

        {
            auto l_ = std::scoped_lock(sessions_lock_);
            sessions_[id] = session;
        }

        _deb("session %lu: accepted from %s", static_cast<unsigned long>(id), peer.c_str());

        try {
            std::thread t([this, session]() {
                session->run();

                auto l_ = std::scoped_lock(sessions_lock_);
                sessions_.erase(session->id());
                sessions_cv_.notify_all();
            });
            pthread_setname_np(t.native_handle(), string_format("sg_s%lu", static_cast<unsigned long>(id % 100000)).c_str());
            t.detach();
        }
        catch(std::system_error const& e) {
            _err("spawn: cannot start session thread: %s", e.what());

            auto l_ = std::scoped_lock(sessions_lock_);
            sessions_.erase(id);
        }
    }

    std::size_t Listener::active_sessions() const {
        auto l_ = std::scoped_lock(sessions_lock_);
        return sessions_.size();
    }

    bool Listener::wait_sessions(std::chrono::milliseconds limit) {
        auto l_ = std::unique_lock(sessions_lock_);
        return sessions_cv_.wait_for(l_, limit, [this]() { return sessions_.empty(); });
    }

    void Listener::stop() {
        auto const& log = get_log();

        if(not acceptor_.joinable()) return;

        stopping_ = true;
        acceptor_.join();

        ::close(sock_);
        sock_ = -1;

        auto active = active_sessions();
        if(active > 0) {
            _not("stop: waiting up to %ldms for %zu sessions", static_cast<long>(opts_.shutdown_grace.count()), active);
        }

        if(not wait_sessions(opts_.shutdown_grace)) {
            {
                auto l_ = std::scoped_lock(sessions_lock_);
                _war("stop: aborting %zu sessions", sessions_.size());

                for(auto const& [id, s]: sessions_) {
                    s->abort();
                }
            }

            // aborted sessions only need to unwind
            while(not wait_sessions(std::chrono::milliseconds(1000))) {
                _war("stop: %zu sessions still unwinding", active_sessions());
            }
        }

        _not("listener stopped, %lu connections accepted, %lu rejected",
             static_cast<unsigned long>(accepted_.load()), static_cast<unsigned long>(rejected_.load()));
    }
}
