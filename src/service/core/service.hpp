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

#ifndef SANDGATE_SERVICE_HPP
#define SANDGATE_SERVICE_HPP

#include <atomic>
#include <csignal>
#include <ctime>
#include <string>

#include <log/logan.hpp>

namespace sg {

    class Service {

    protected:

        explicit Service() : log(service_log()) {

            self() = this;
            ts_sys_started = ::time(nullptr);
        }

    public:
        virtual ~Service() = default;

        // handlers only raise these, the service loop acts on them
        std::atomic<bool> terminate_flag {false};
        std::atomic<bool> reload_flag {false};
        std::atomic<bool> terminated {false};

        // sleep 'steps' times 'step_ms', true when termination was requested meanwhile
        [[nodiscard]] static bool abort_sleep(unsigned int steps, unsigned int step_ms = 100);

        bool cfg_daemonize = false;
        std::time_t ts_sys_started {0};

        logan_lite& log;
        static logan_lite& service_log() { static logan_lite log = logan_lite("service"); return log; }

        // "self" is set by Service c-tor (there could be just one "self" at a time)
        static Service*& self() { static Service* s(nullptr); return s; };
        static void my_terminate(int param);
        static void my_usr1(int param);

        static inline volatile std::sig_atomic_t cnt_terminate = 0;

        virtual void run() = 0;
        virtual void stop() = 0;
        virtual void reload() = 0;
    };
}

#endif
