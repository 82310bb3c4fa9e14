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

#include <algorithm>
#include <ctime>
#include <cctype>
#include <cstdio>

#include <utils/str.hpp>

namespace sg::str {

    std::string to_lower(std::string_view sv) {
        std::string ret(sv);
        for(auto& c: ret) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return ret;
    }

    std::string_view trim(std::string_view sv) {
        while(not sv.empty() and (sv.front() == ' ' or sv.front() == '\t')) sv.remove_prefix(1);
        while(not sv.empty() and (sv.back() == ' ' or sv.back() == '\t' or sv.back() == '\r')) sv.remove_suffix(1);
        return sv;
    }

    bool iequals(std::string_view a, std::string_view b) {
        if(a.size() != b.size()) return false;

        for(std::size_t i = 0; i < a.size(); ++i) {
            if(std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
                return false;
        }
        return true;
    }

    bool ends_with(std::string_view s, std::string_view suffix) {
        return s.size() >= suffix.size() and s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    std::vector<std::string> split_tokens(std::string_view sv, char sep) {
        std::vector<std::string> ret;

        while(true) {
            auto pos = sv.find(sep);
            auto elem = trim(sv.substr(0, pos));
            if(not elem.empty()) {
                ret.emplace_back(elem);
            }
            if(pos == std::string_view::npos) break;
            sv.remove_prefix(pos + 1);
        }
        return ret;
    }

    std::string printable(std::string_view sv, std::size_t max_len) {
        std::string ret;
        ret.reserve(std::min(sv.size(), max_len));

        for(auto c: sv.substr(0, max_len)) {
            ret += (c >= 0x20 and c < 0x7f) ? c : '.';
        }
        if(sv.size() > max_len) ret += "...";

        return ret;
    }

    bool parse_iso8601(std::string const& str, time_t& out) {

        int year = 0, mon = 0, day = 0, hour = 0, min = 0, sec = 0;
        int consumed = 0;

        if(std::sscanf(str.c_str(), "%4d-%2d-%2d%*1[Tt ]%2d:%2d:%2d%n",
                       &year, &mon, &day, &hour, &min, &sec, &consumed) != 6) {
            return false;
        }

        if(mon < 1 or mon > 12 or day < 1 or day > 31 or hour > 23 or min > 59 or sec > 60) {
            return false;
        }

        std::string_view rest(str);
        rest.remove_prefix(static_cast<std::size_t>(consumed));

        // fractional seconds are dropped
        if(not rest.empty() and rest.front() == '.') {
            rest.remove_prefix(1);
            while(not rest.empty() and std::isdigit(static_cast<unsigned char>(rest.front()))) rest.remove_prefix(1);
        }

        long offset = 0;
        if(rest == "Z" or rest == "z") {
            offset = 0;
        }
        else if(rest.size() == 6 and (rest[0] == '+' or rest[0] == '-') and rest[3] == ':') {
            int oh = 0, om = 0;
            if(std::sscanf(std::string(rest.substr(1)).c_str(), "%2d:%2d", &oh, &om) != 2) {
                return false;
            }
            offset = (oh * 3600L + om * 60L) * (rest[0] == '-' ? -1 : 1);
        }
        else {
            // timestamps without zone are ambiguous - refuse them
            return false;
        }

        std::tm tm_{};
        tm_.tm_year = year - 1900;
        tm_.tm_mon = mon - 1;
        tm_.tm_mday = day;
        tm_.tm_hour = hour;
        tm_.tm_min = min;
        tm_.tm_sec = sec;

        out = ::timegm(&tm_) - offset;
        return true;
    }

    std::string format_iso8601(time_t t) {
        std::tm tm_{};
        ::gmtime_r(&t, &tm_);

        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_);
        return buf;
    }
}
