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

#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>

#include <csignal>
#include <cstdlib>

#include <service/daemon.hpp>

#include <display.hpp>

namespace sg {

    bool DaemonFactory::daemonize() {

        _dia("daemonize start");

        if(exists_pidfile()) {
            _err("There seems to be sandgate already running in the system. Aborting.");
            return false;
        }

        pid_t pid = fork();
        if (pid < 0) {
            _fat("daemonize: failed to fork: %s", string_error().c_str());
            return false;
        }

        // parent is done
        if (pid > 0) {
            _dia("daemonize: exiting from master");
            ::_exit(EXIT_SUCCESS);
        }

        umask(022);

        if (setsid() < 0) {
            _fat("daemonize: failed to setsid: %s", string_error().c_str());
            return false;
        }

        if ((chdir("/")) < 0) {
            _fat("daemonize: failed to chdir to '/': %s", string_error().c_str());
            return false;
        }

        int devnull = ::open("/dev/null", O_RDWR);
        if(devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            if(devnull > STDERR_FILENO) ::close(devnull);
        }

        _dia("daemonize: finished");
        return true;
    }

    bool DaemonFactory::write_pidfile() {

        int fd = ::open(pid_file.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if(fd < 0) {
            _err("write_pidfile: cannot create %s: %s", pid_file.c_str(), string_error().c_str());
            return false;
        }

        auto content = std::to_string(::getpid()) + "\n";
        bool ok = ::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size());
        ::close(fd);

        if(not ok) {
            _err("write_pidfile: cannot write %s", pid_file.c_str());
            ::unlink(pid_file.c_str());
            return false;
        }

        pid_file_owned = true;
        return true;
    }

    void DaemonFactory::unlink_pidfile(bool force) {
        if(pid_file_owned or force) {
            ::unlink(pid_file.c_str());
            pid_file_owned = false;
        }
    }

    bool DaemonFactory::exists_pidfile() const {
        struct stat st{};
        return ::stat(pid_file.c_str(), &st) == 0;
    }

    void DaemonFactory::set_signal(int SIG, signal_handler_t sig_handler) {
        struct sigaction act{};
        sigemptyset(&act.sa_mask);
        act.sa_flags = 0;
        act.sa_handler = sig_handler;

        ::sigaction(SIG, &act, nullptr);
    }

    void DaemonFactory::set_daemon_signals(signal_handler_t terminate_handler, signal_handler_t reload_handler) {
        set_signal(SIGTERM, terminate_handler);
        set_signal(SIGINT, terminate_handler);
        set_signal(SIGUSR1, reload_handler);
        set_signal(SIGPIPE, SIG_IGN);
    }
}
