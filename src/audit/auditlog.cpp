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

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <string_view>

#include <audit/auditlog.hpp>
#include <utils/str.hpp>

#include <log/logger.hpp>
#include <display.hpp>

namespace sg::audit {

    const char* outcome_name(Outcome o) {
        switch(o) {
            case Outcome::ok: return "ok";
            case Outcome::denied: return "denied";
            case Outcome::no_authority: return "no_authority";
            case Outcome::leaf_error: return "leaf_error";
            case Outcome::fail_closed: return "fail_closed";
            case Outcome::upstream_error: return "upstream_error";
            case Outcome::client_error: return "client_error";
            case Outcome::timeout: return "timeout";
            case Outcome::shutdown: return "shutdown";
        }
        return "unknown";
    }

    nlohmann::json AuditRecord::to_json() const {
        nlohmann::json j;

        j["timestamp"] = str::format_iso8601(timestamp);
        j["session"] = session_id;
        j["client"] = client;
        j["host"] = host;
        j["port"] = port;
        j["action"] = action;
        if(not credential.empty()) {
            j["credential"] = credential;
        }
        if(generation > 0) {
            j["ca_generation"] = generation;
        }
        j["requests"] = requests;
        if(last_status > 0) {
            j["status"] = last_status;
        }
        j["bytes_up"] = bytes_up;
        j["bytes_down"] = bytes_down;
        j["duration_ms"] = duration_ms;
        j["outcome"] = outcome_name(outcome);
        if(not detail.empty()) {
            j["detail"] = detail;
        }

        return j;
    }


    bool ProxyStats::note_blocked(std::string const& host, time_t now) {
        auto const& log = AuditLog::get_log();
        auto l_ = std::scoped_lock(lock_);

        blocked_++;
        if(auto it = blocked_hosts_.find(host); it != blocked_hosts_.end()) {
            it->second++;
        }
        else if(blocked_hosts_.size() < host_capacity_) {
            blocked_hosts_.emplace(host, 1);
        }
        else {
            blocked_other_++;
        }

        recent_blocks_.push_back(now);
        while(not recent_blocks_.empty() and now - recent_blocks_.front() >= window_) {
            recent_blocks_.pop_front();
        }

        if(threshold_ == 0 or recent_blocks_.size() < threshold_) return false;

        // once per window
        if(last_alert_ != 0 and now - last_alert_ < window_) return false;

        last_alert_ = now;
        alerts_++;

        _cri("security alert: %zu blocked connections within %lds, last to '%s'",
             recent_blocks_.size(), static_cast<long>(window_), host.c_str());
        Log::get()->events().insert(CRI, "security alert: %zu blocked connections within %lds",
                                    recent_blocks_.size(), static_cast<long>(window_));
        return true;
    }

    void ProxyStats::note_allowed() {
        auto l_ = std::scoped_lock(lock_);
        allowed_++;
    }

    uint64_t ProxyStats::allowed() const {
        auto l_ = std::scoped_lock(lock_);
        return allowed_;
    }

    uint64_t ProxyStats::blocked() const {
        auto l_ = std::scoped_lock(lock_);
        return blocked_;
    }

    uint64_t ProxyStats::alerts() const {
        auto l_ = std::scoped_lock(lock_);
        return alerts_;
    }

    std::map<std::string, uint64_t> ProxyStats::blocked_hosts() const {
        auto l_ = std::scoped_lock(lock_);
        return blocked_hosts_;
    }

    uint64_t ProxyStats::blocked_other() const {
        auto l_ = std::scoped_lock(lock_);
        return blocked_other_;
    }

    double ProxyStats::block_rate() const {
        auto l_ = std::scoped_lock(lock_);

        auto total = allowed_ + blocked_;
        if(total == 0) return 0.0;

        return 100.0 * static_cast<double>(blocked_) / static_cast<double>(total);
    }

    nlohmann::json ProxyStats::summary_json() const {
        auto rate = block_rate();

        auto l_ = std::scoped_lock(lock_);
        nlohmann::json j;
        j["allowed"] = allowed_;
        j["blocked"] = blocked_;
        j["block_rate"] = rate;
        j["alerts"] = alerts_;
        j["blocked_hosts"] = blocked_hosts_;
        j["blocked_other"] = blocked_other_;

        return j;
    }


    AuditLog::AuditLog(options_t opts) : opts_(std::move(opts)), stats_(opts_.alert_threshold, opts_.alert_window, opts_.blocked_hosts_max) {
        auto const& log = get_log();

        if(not opts_.file.empty()) {
            fd_ = ::open(opts_.file.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
            if(fd_ < 0) {
                throw audit_error(string_format("cannot open audit file '%s': %s", opts_.file.c_str(), string_error().c_str()));
            }
            _dia("audit records appended to '%s'", opts_.file.c_str());
        }
    }

    AuditLog::~AuditLog() {
        if(fd_ >= 0) {
            ::close(fd_);
        }
    }

    void AuditLog::write(AuditRecord const& rec) {
        auto const& log = get_log();

        if(rec.outcome == Outcome::denied) {
            stats_.note_blocked(rec.host, rec.timestamp);
        }
        else if(not rec.action.empty() and rec.action != "deny") {
            stats_.note_allowed();
        }

        auto line = rec.to_json().dump();
        _inf("%s", line.c_str());

        auto l_ = std::scoped_lock(write_lock_);
        written_++;

        if(fd_ < 0) return;

        line += '\n';
        std::string_view rest = line;
        while(not rest.empty()) {
            auto n = ::write(fd_, rest.data(), rest.size());
            if(n < 0) {
                if(errno == EINTR) continue;
                _err("write to audit file failed: %s", string_error().c_str());
                return;
            }
            rest.remove_prefix(static_cast<std::size_t>(n));
        }
    }

    uint64_t AuditLog::written() const {
        auto l_ = std::scoped_lock(write_lock_);
        return written_;
    }
}
