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

#ifndef SANDGATE_AUDIT_AUDITLOG_HPP
#define SANDGATE_AUDIT_AUDITLOG_HPP

#include <cstdint>
#include <ctime>
#include <deque>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include <log/logan.hpp>

namespace sg::audit {

    class audit_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    enum class Outcome { ok, denied, no_authority, leaf_error, fail_closed, upstream_error, client_error, timeout, shutdown };

    const char* outcome_name(Outcome o);

    // one connection, never carries header values, bodies or credential material
    struct AuditRecord {
        time_t timestamp = 0;
        uint64_t session_id = 0;
        std::string client;
        std::string host;
        uint16_t port = 0;
        std::string action;
        std::string credential;
        uint64_t generation = 0;
        uint64_t requests = 0;
        int last_status = 0;
        uint64_t bytes_up = 0;
        uint64_t bytes_down = 0;
        long duration_ms = 0;
        Outcome outcome = Outcome::ok;
        std::string detail;

        nlohmann::json to_json() const;
    };


    // allowed/blocked counters and the burst-of-blocks alert
    class ProxyStats {
    public:
        // at most 'host_capacity' hosts are counted by name, the rest go to blocked_other()
        explicit ProxyStats(std::size_t alert_threshold = 50, time_t alert_window = 300, std::size_t host_capacity = 256)
        : threshold_(alert_threshold), window_(alert_window), host_capacity_(host_capacity) {};

        // returns true when this block raised the alert
        bool note_blocked(std::string const& host, time_t now);
        void note_allowed();

        uint64_t allowed() const;
        uint64_t blocked() const;
        std::map<std::string, uint64_t> blocked_hosts() const;
        uint64_t blocked_other() const;
        double block_rate() const;
        uint64_t alerts() const;

        nlohmann::json summary_json() const;

    private:
        std::size_t threshold_;
        time_t window_;
        std::size_t host_capacity_;

        mutable std::mutex lock_;
        uint64_t allowed_ = 0;
        uint64_t blocked_ = 0;
        uint64_t alerts_ = 0;
        std::map<std::string, uint64_t> blocked_hosts_;
        uint64_t blocked_other_ = 0;

        std::deque<time_t> recent_blocks_;
        time_t last_alert_ = 0;
    };


    class AuditLog {
    public:
        struct options_t {
            // empty: logging topic only
            std::string file;
            std::size_t alert_threshold = 50;
            time_t alert_window = 300;
            std::size_t blocked_hosts_max = 256;
        };

        // throws audit_error when the audit file cannot be opened
        explicit AuditLog(options_t opts);
        ~AuditLog();

        AuditLog(AuditLog const&) = delete;
        AuditLog& operator=(AuditLog const&) = delete;

        void write(AuditRecord const& rec);

        ProxyStats& stats() { return stats_; }
        ProxyStats const& stats() const { return stats_; }

        uint64_t written() const;
        options_t const& options() const { return opts_; }

        static logan_lite& get_log() {
            static logan_lite l("audit");
            return l;
        }

    private:
        options_t opts_;
        ProxyStats stats_;

        mutable std::mutex write_lock_;
        int fd_ = -1;
        uint64_t written_ = 0;
    };
}

#endif
