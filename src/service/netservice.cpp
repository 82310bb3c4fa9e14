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

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <memory>

#include <service/netservice.hpp>

#include <display.hpp>

namespace sg::service {

    int NetworkServiceFactory::prepare_listener(std::string const& address, uint16_t port, std::string const& friendly_name,
                                                int backlog) {
        auto const& log = NetworkServiceFactory::log();

        _not("Entering %s mode on %s:%d", friendly_name.c_str(), address.c_str(), port);

        struct addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags = AI_PASSIVE | AI_NUMERICHOST | AI_NUMERICSERV;

        struct addrinfo* res = nullptr;
        auto service = std::to_string(port);
        if(auto rc = ::getaddrinfo(address.empty() ? nullptr : address.c_str(), service.c_str(), &hints, &res); rc != 0) {
            auto err = string_format("error binding %s on %s:%d: %s", friendly_name.c_str(), address.c_str(), port, gai_strerror(rc));
            _fat("%s", err.c_str());
            throw netservice_cannot_bind(err);
        }
        std::unique_ptr<struct addrinfo, decltype(&::freeaddrinfo)> res_guard(res, &::freeaddrinfo);

        int sock = ::socket(res->ai_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        if(sock < 0) {
            auto err = string_format("error creating %s socket: %s", friendly_name.c_str(), string_error().c_str());
            _fat("%s", err.c_str());
            throw netservice_cannot_bind(err);
        }

        int one = 1;
        ::setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        if(::bind(sock, res->ai_addr, res->ai_addrlen) < 0 or ::listen(sock, backlog) < 0) {
            auto err = string_format("error binding %s on %s:%d: %s", friendly_name.c_str(), address.c_str(), port,
                                     string_error().c_str());
            ::close(sock);

            _fat("%s", err.c_str());
            throw netservice_cannot_bind(err);
        }

        return sock;
    }

    uint16_t NetworkServiceFactory::bound_port(int sock) {
        struct sockaddr_storage ss{};
        socklen_t len = sizeof(ss);

        if(::getsockname(sock, reinterpret_cast<struct sockaddr*>(&ss), &len) < 0) {
            throw netservice_error("getsockname failed: " + string_error());
        }

        if(ss.ss_family == AF_INET6) {
            return ntohs(reinterpret_cast<struct sockaddr_in6*>(&ss)->sin6_port);
        }
        return ntohs(reinterpret_cast<struct sockaddr_in*>(&ss)->sin_port);
    }

    std::string NetworkServiceFactory::peer_string(int sock) {
        struct sockaddr_storage ss{};
        socklen_t len = sizeof(ss);

        if(::getpeername(sock, reinterpret_cast<struct sockaddr*>(&ss), &len) < 0) {
            return "?";
        }

        std::array<char, NI_MAXHOST> host{};
        std::array<char, NI_MAXSERV> serv{};
        if(::getnameinfo(reinterpret_cast<struct sockaddr*>(&ss), len, host.data(), host.size(), serv.data(), serv.size(),
                         NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
            return "?";
        }

        return ss.ss_family == AF_INET6 ? string_format("[%s]:%s", host.data(), serv.data())
                                        : string_format("%s:%s", host.data(), serv.data());
    }
}
