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

#ifndef SANDGATE_DAEMON_HPP
#define SANDGATE_DAEMON_HPP

#include <memory>
#include <string>

#include <log/logan.hpp>

#define PID_FILE_DEFAULT "/var/run/sandgate.pid"

namespace sg {

    struct DaemonFactory {

        using signal_handler_t = void(*)(int);

        std::string pid_file = PID_FILE_DEFAULT;
        bool pid_file_owned = false;

        static std::shared_ptr<DaemonFactory> instance() {
            static std::shared_ptr<DaemonFactory> d = std::make_shared<DaemonFactory>();
            return d;
        }

        // fork into background; false in the parent's failure path
        bool daemonize();

        bool write_pidfile();
        bool exists_pidfile() const;
        void unlink_pidfile(bool force = false);

        static void set_signal(int SIG, signal_handler_t sig_handler);
        static void set_daemon_signals(signal_handler_t terminate_handler, signal_handler_t reload_handler);

        DaemonFactory() = default;
        DaemonFactory(DaemonFactory const&) = delete;
        DaemonFactory& operator=(DaemonFactory const&) = delete;
        virtual ~DaemonFactory() { unlink_pidfile(); }

        logan_lite& get_log() { return log; };
    private:
        logan_lite log {"service"};
    };
}

#endif
