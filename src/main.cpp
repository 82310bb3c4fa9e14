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

#include <cstdlib>
#include <iostream>
#include <sys/resource.h>

#include <getopt.h>

#include <log/logger.hpp>
#include <display.hpp>

#include <service/cfgapi/cfgapi.hpp>
#include <service/core/sandgate.hpp>
#include <service/daemon.hpp>

#ifndef SANDGATE_VERSION
#define SANDGATE_VERSION "0.0.0"
#endif

using namespace sg;

void print_stats() {
    auto const& log = DaemonFactory::instance()->get_log();

    auto& sx = Sandgate::instance();
    const time_t uptime = time(nullptr) - sx.ts_sys_started;
    const unsigned long t = proxy::GatewaySession::total_bytes_up().load() + proxy::GatewaySession::total_bytes_down().load();

    auto stat = string_format("Sandgate was running: %s, served %lu sessions and transferred %sB of data.\n",
                              uptime_string(uptime).c_str(),
                              static_cast<unsigned long>(proxy::GatewaySession::total_sessions().load()),
                              number_suffixed(t).c_str());

    if(sx.cfg_daemonize) {
        _inf("%s", stat.c_str());
    }
    else {
        std::cerr << stat;
    }

    _dia("statistics: %s", sx.stats_json().dump().c_str());
}

bool raise_limits() {
    rlimit r{};
    if(getrlimit(RLIMIT_NOFILE, &r) != 0) return false;

    rlimit fno {
        .rlim_cur = r.rlim_max,
        .rlim_max = r.rlim_max
    };

    return setrlimit(RLIMIT_NOFILE, &fno) == 0;
}

void print_help() {
    std::cerr << std::endl;
    std::cerr << "Sandgate " << SANDGATE_VERSION << " - sandbox egress gateway" << std::endl;
    std::cerr << std::endl;
    std::cerr << "  Startup debugs (optional):" << std::endl;
    std::cerr << std::endl;
    std::cerr << "    --daemonize, -D :  start and fork to background" << std::endl;
    std::cerr << "    --debug, -d     :  debug level startup logs" << std::endl;
    std::cerr << "    --diagnose      :  diag level startup logs" << std::endl;
    std::cerr << std::endl;
    std::cerr << "  Utility options (optional):" << std::endl;
    std::cerr << std::endl;
    std::cerr << "    --version, -v                :  print version and exit with 0" << std::endl;
    std::cerr << "    --config-file, -c <filename> :  specify/override configuration file" << std::endl;
    std::cerr << "    --config-check-only, -o      :  perform configuration file check" << std::endl;
    std::cerr << std::endl;
}

int main(int argc, char *argv[]) {

    CfgFactory::init();

    if(! raise_limits()) {
        std::cerr << "cannot raise file descriptor limit" << std::endl;
    }

    static struct option long_options[] =
            {
                    {"debug",   no_argument,        nullptr, 'd'},
                    {"diagnose",   no_argument,     (int*) &CfgFactory::get()->args_debug_flag.level_ref(), iDIA},
                    {"config-file", required_argument, nullptr, 'c'},
                    {"config-check-only", no_argument, nullptr, 'o'},
                    {"daemonize", no_argument, nullptr, 'D'},
                    {"version", no_argument, nullptr, 'v'},
                    {"help", no_argument, nullptr, 'h'},
                    {nullptr, 0, nullptr, 0}
            };

    auto this_daemon = DaemonFactory::instance();
    auto const& log = this_daemon->get_log();

    bool is_dup2cout = false;

    while(true) {
        int option_index = 0;
        int c = getopt_long(argc, argv, "hvodc:D", long_options, &option_index);
        if (c < 0) break;

        switch(c) {
            case 0:
                break;

            case 'd':
                CfgFactory::get()->args_debug_flag = DEB;
                break;

            case 'c':
                CfgFactory::get()->config_file = std::string(optarg);
                break;

            case 'o':
                CfgFactory::get()->config_file_check_only = true;
                is_dup2cout = true;
                break;

            case 'D':
                Sandgate::instance().cfg_daemonize = true;
                break;

            case 'h':
                print_help();
                return EXIT_SUCCESS;

            case 'v':
                std::cout << SANDGATE_VERSION << std::endl;
                return EXIT_SUCCESS;

            default:
                std::cerr << "unknown option: '" << (char)c << "'" << std::endl;
                return EXIT_FAILURE;
        }
    }

    // synchronous logger for the beginning
    Log::init();
    Log::set(Log::default_logger());
    Log::get()->level(WAR);

    if(is_dup2cout) {
        Log::get()->dup2_cout(true);
    }

    // be more verbose if check only requested
    if(CfgFactory::get()->config_file_check_only) {
        Log::get()->level(DIA);
    }

    bool CONFIG_LOADED = Sandgate::instance().load_config(CfgFactory::get()->config_file);

    if(CfgFactory::get()->config_file_check_only) {
        if (! CONFIG_LOADED) {
            std::cerr << "Failed to load config file!" << std::endl;
        } else {
            std::cerr << "Config file check OK" << std::endl;
        }

        CfgFactory::get()->cleanup();
        return CONFIG_LOADED ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (! CONFIG_LOADED ) {
        _fat("Config check: error loading config file.");
        std::cerr << "Config check: error loading config file." << std::endl;
        CfgFactory::get()->cleanup();
        return EXIT_FAILURE;
    }

    Sandgate::instance().init_logging();

    // if there is loglevel specified in config file and is bigger than we currently have set, use it
    if(CfgFactory::get()->internal_init_level > Log::get()->level()) {
        Log::get()->level(CfgFactory::get()->internal_init_level);
    }

    // command line wins
    if(CfgFactory::get()->args_debug_flag > NON) {
        Log::get()->level(CfgFactory::get()->args_debug_flag);
    }

    this_daemon->pid_file = CfgFactory::get()->pid_file;
    if(this_daemon->exists_pidfile()) {
        _fat("There is PID file already in the system.");
        _fat("Please make sure sandgate is not running, remove %s and try again.", this_daemon->pid_file.c_str());
        std::cerr << "There is PID file already in the system." << std::endl;
        std::cerr << "Please make sure sandgate is not running, remove " << this_daemon->pid_file << " and try again." << std::endl;
        CfgFactory::get()->cleanup();
        return EXIT_FAILURE;
    }

    if(Sandgate::instance().cfg_daemonize) {
        if (CfgFactory::get()->log_file.empty()) {
            _fat("Cannot daemonize without logging to file.");
            std::cerr << "Cannot daemonize without logging to file." << std::endl;
            CfgFactory::get()->cleanup();
            return EXIT_FAILURE;
        }

        Log::get()->dup2_cout(false);
        _inf("Entering daemon mode.");

        if(not this_daemon->daemonize()) {
            CfgFactory::get()->cleanup();
            return EXIT_FAILURE;
        }
    }

    // systemd doesn't favor forked daemons, write pidfile even in foreground
    if(not this_daemon->write_pidfile()) {
        _err("cannot write pidfile %s", this_daemon->pid_file.c_str());
    }

    DaemonFactory::set_daemon_signals(Service::my_terminate, Service::my_usr1);

    Log::get()->events().insert(INF, "Sandgate %s starting", SANDGATE_VERSION);

    int ret = EXIT_SUCCESS;

    if(Sandgate::instance().init()) {
        _dia("Sandgate %s starting...", SANDGATE_VERSION);
        Sandgate::instance().run();
        print_stats();
    } else {
        _cri("cannot start gateway, exiting...");
        std::cerr << "cannot start gateway, see log for details" << std::endl;

        Sandgate::instance().stop();
        if(Sandgate::instance().listener) Sandgate::instance().listener->stop();
        ret = EXIT_FAILURE;
    }

    this_daemon->unlink_pidfile();
    CfgFactory::get()->cleanup();

    return ret;
}
