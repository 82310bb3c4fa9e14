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

#ifndef SANDGATE_PROXY_HTTP1_HPP
#define SANDGATE_PROXY_HTTP1_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sg::http1 {

    class http_error : public std::runtime_error {
    public:
        explicit http_error(std::string const& what, int status = 400) : std::runtime_error(what), status_(status) {};
        int status() const { return status_; }
    private:
        int status_;
    };

    struct Header {
        std::string name;
        std::string value;

        // original line without terminator, empty for synthesized headers
        std::string raw;
    };

    // ordered header list; parsed lines are serialized unchanged
    class Headers {
    public:
        void add(std::string name, std::string value);
        void add_raw(std::string name, std::string value, std::string raw);

        // case-insensitive; returns number of removed fields
        std::size_t remove(std::string_view name);

        std::optional<std::string> get(std::string_view name) const;
        std::vector<std::string> get_all(std::string_view name) const;
        std::size_t count(std::string_view name) const;

        // token in comma separated list of all 'name' fields, case-insensitive
        bool has_token(std::string_view name, std::string_view token) const;

        std::vector<Header> const& items() const { return items_; }
        std::size_t size() const { return items_.size(); }

        void serialize(std::string& out) const;

        // overwrite all values in memory and drop them
        void wipe();

    private:
        std::vector<Header> items_;
    };


    struct RequestHead {
        std::string method;
        std::string target;
        std::string version;
        Headers headers;

        std::string start_line;

        int minor_version() const { return version == "HTTP/1.0" ? 0 : 1; }
        std::string serialize() const;
    };

    struct ResponseHead {
        std::string version;
        int status = 0;
        std::string reason;
        Headers headers;

        std::string start_line;

        bool interim() const { return status >= 100 and status < 200; }
        std::string serialize() const;
    };


    enum class ParseStatus { incomplete, ok, error };

    // parse head from the start of buf; on ok 'consumed' is the head length including the empty line.
    // Bare LF line ends are accepted, lines are re-emitted with CRLF.
    ParseStatus parse_request_head(std::string_view buf, RequestHead& out, std::size_t& consumed,
                                   std::size_t max_size, std::string* error = nullptr);
    ParseStatus parse_response_head(std::string_view buf, ResponseHead& out, std::size_t& consumed,
                                    std::size_t max_size, std::string* error = nullptr);


    struct ConnectTarget {
        std::string host;
        uint16_t port = 0;
    };

    // "host:port" or "[v6]:port"; host is returned lowercase without brackets
    std::optional<ConnectTarget> parse_connect_target(std::string_view target);


    enum class BodyKind { none, length, chunked, until_close };

    struct BodyFraming {
        BodyKind kind = BodyKind::none;
        uint64_t length = 0;
    };

    // throws http_error on ambiguous framing (Content-Length with Transfer-Encoding, differing lengths)
    BodyFraming request_framing(RequestHead const& req);
    BodyFraming response_framing(ResponseHead const& resp, std::string_view request_method);

    // chunk size line ("1a;ext=1"), nullopt if malformed
    std::optional<uint64_t> parse_chunk_size(std::string_view line);

    bool keep_alive(std::string_view version, Headers const& headers);

    // Proxy-Connection, Proxy-Authorization and fields named by Connection (except close/upgrade)
    std::size_t strip_hop_by_hop(Headers& headers);

    // Host header host part, lowercase, without port
    std::optional<std::string> host_of(RequestHead const& req);

    const char* reason_phrase(int status);

    // complete response generated by the gateway itself
    std::string simple_response(int status, std::string_view body = {}, bool close = true);
}

#endif
