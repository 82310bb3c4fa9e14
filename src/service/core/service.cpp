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

#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <thread>

#include <service/core/service.hpp>

namespace sg {

    bool Service::abort_sleep(unsigned int steps, unsigned int step_ms) {
        for(unsigned int i = 0; i < steps; i++) {
            auto* s = self();
            if(s == nullptr or s->terminate_flag) return true;

            std::this_thread::sleep_for(std::chrono::milliseconds(step_ms));
        }

        auto* s = self();
        return s == nullptr or s->terminate_flag;
    }

    void Service::my_terminate(int param) {
        (void)param;

        if(auto* s = self(); s != nullptr) {
            s->terminate_flag = true;
        }

        cnt_terminate = cnt_terminate + 1;
        if(cnt_terminate > 3) {
            // third repeated request: give up on a graceful stop
            ::_exit(EXIT_FAILURE);
        }
    }

    void Service::my_usr1(int param) {
        (void)param;

        if(auto* s = self(); s != nullptr) {
            s->reload_flag = true;
        }
    }
}
