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

#ifndef SANDGATE_UTILS_STR_HPP
#define SANDGATE_UTILS_STR_HPP

#include <ctime>
#include <string>
#include <string_view>
#include <vector>

namespace sg::str {

    std::string to_lower(std::string_view sv);
    std::string_view trim(std::string_view sv);
    bool iequals(std::string_view a, std::string_view b);
    bool ends_with(std::string_view s, std::string_view suffix);

    // split by separator, trimming elements and omitting empty ones
    std::vector<std::string> split_tokens(std::string_view sv, char sep);

    // render value for logs: keep printable ASCII, replace the rest by '.'
    std::string printable(std::string_view sv, std::size_t max_len = 64);

    // RFC 3339 / ISO-8601 timestamp (2026-01-02T03:04:05[.fff](Z|+hh:mm)) to unix time
    bool parse_iso8601(std::string const& str, time_t& out);
    std::string format_iso8601(time_t t);
}

#endif
