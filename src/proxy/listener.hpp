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

#ifndef SANDGATE_PROXY_LISTENER_HPP
#define SANDGATE_PROXY_LISTENER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <log/logan.hpp>

#include <proxy/session.hpp>

namespace sg::proxy {

    // accepts sandbox connections and runs one GatewaySession thread per connection
    class Listener {
    public:
        struct options_t {
            std::string address = "127.0.0.1";
            uint16_t port = 3128;
            std::size_t max_sessions = 256;
            std::chrono::milliseconds shutdown_grace {10000};
        };

        Listener(SessionContext& ctx, options_t opts) : ctx_(ctx), opts_(std::move(opts)) {};
        ~Listener();

        Listener(Listener const&) = delete;
        Listener& operator=(Listener const&) = delete;

        // bind and start the acceptor thread; throws service::netservice_cannot_bind
        void start();

        // stop accepting, let sessions finish within the grace period, then abort the rest
        void stop();

        uint16_t port() const { return bound_port_; }
        bool running() const { return acceptor_.joinable(); }

        std::size_t active_sessions() const;
        uint64_t accepted() const { return accepted_; }
        uint64_t rejected() const { return rejected_; }

        static logan_lite& get_log() {
            static logan_lite l("proxy.listener");
            return l;
        }

    private:
        void accept_loop();
        void spawn(int fd, std::string peer);
        void reject(int fd, std::string const& peer);

        // true when all sessions finished in time
        bool wait_sessions(std::chrono::milliseconds limit);

        SessionContext& ctx_;
        options_t opts_;

        int sock_ = -1;
        uint16_t bound_port_ = 0;

        std::thread acceptor_;
        std::atomic_bool stopping_ {false};

        mutable std::mutex sessions_lock_;
        std::condition_variable sessions_cv_;
        std::map<uint64_t, std::shared_ptr<GatewaySession>> sessions_;

        std::atomic<uint64_t> next_id_ {0};
        std::atomic<uint64_t> accepted_ {0};
        std::atomic<uint64_t> rejected_ {0};
    };
}

#endif
