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

#ifndef SANDGATE_SERVICE_NETSERVICE_HPP
#define SANDGATE_SERVICE_NETSERVICE_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include <log/logan.hpp>

namespace sg::service {

    class netservice_error : public std::runtime_error {
    public:
        explicit netservice_error(std::string const& what) : std::runtime_error(what) {};
    };


    class netservice_cannot_bind : public netservice_error {
    public:
        explicit netservice_cannot_bind(std::string const& what) : netservice_error(what) {};
    };


    struct NetworkServiceFactory {

        static logan_lite& log() {
            static logan_lite l("service");
            return l;
        }

        // non-blocking listening TCP socket; throws netservice_cannot_bind
        static int prepare_listener(std::string const& address, uint16_t port, std::string const& friendly_name,
                                    int backlog = 128);

        // port the socket is actually bound to (useful with port 0)
        static uint16_t bound_port(int sock);

        // numeric "address:port" of a peer
        static std::string peer_string(int sock);
    };
}

#endif
