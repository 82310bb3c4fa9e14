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
#include <cctype>
#include <charconv>

#include <openssl/crypto.h>

#include <proxy/http1.hpp>
#include <utils/str.hpp>

#include <display.hpp>

namespace sg::http1 {

    namespace {

        bool is_tchar(char c) {
            if(std::isalnum(static_cast<unsigned char>(c))) return true;

            switch(c) {
                case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
                case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
                    return true;
                default:
                    return false;
            }
        }

        bool is_token(std::string_view s) {
            return not s.empty() and std::all_of(s.begin(), s.end(), is_tchar);
        }

        void set_error(std::string* error, const char* what) {
            if(error) *error = what;
        }

        ParseStatus split_head(std::string_view buf, std::vector<std::string_view>& lines, std::size_t& consumed,
                               std::size_t max_size, std::string* error) {
            lines.clear();
            std::size_t pos = 0;

            while(true) {
                auto nl = buf.find('\n', pos);
                if(nl == std::string_view::npos) {
                    if(buf.size() > max_size) {
                        set_error(error, "header section too large");
                        return ParseStatus::error;
                    }
                    return ParseStatus::incomplete;
                }
                if(nl + 1 > max_size) {
                    set_error(error, "header section too large");
                    return ParseStatus::error;
                }

                auto line = buf.substr(pos, nl - pos);
                if(not line.empty() and line.back() == '\r') line.remove_suffix(1);
                pos = nl + 1;

                if(line.empty()) {
                    // empty lines before the start line are ignored
                    if(lines.empty()) continue;

                    consumed = pos;
                    return ParseStatus::ok;
                }

                if(line.find('\r') != std::string_view::npos or line.find('\0') != std::string_view::npos) {
                    set_error(error, "control character in header section");
                    return ParseStatus::error;
                }

                lines.push_back(line);
            }
        }

        bool parse_fields(std::vector<std::string_view> const& lines, Headers& headers, std::string* error) {
            for(std::size_t i = 1; i < lines.size(); ++i) {
                auto line = lines[i];

                if(line.front() == ' ' or line.front() == '\t') {
                    set_error(error, "obsolete line folding");
                    return false;
                }

                auto colon = line.find(':');
                if(colon == std::string_view::npos or colon == 0) {
                    set_error(error, "malformed header field");
                    return false;
                }

                auto name = line.substr(0, colon);
                if(not is_token(name)) {
                    set_error(error, "invalid header field name");
                    return false;
                }

                headers.add_raw(std::string(name), std::string(str::trim(line.substr(colon + 1))), std::string(line));
            }
            return true;
        }

        bool valid_version(std::string_view v) {
            return v.size() == 8 and v.substr(0, 7) == "HTTP/1." and std::isdigit(static_cast<unsigned char>(v[7]));
        }

        // first bytes after the tunnel opens must look like a request line
        bool plausible_request_prefix(std::string_view buf) {
            while(not buf.empty() and (buf.front() == '\r' or buf.front() == '\n')) buf.remove_prefix(1);

            std::size_t n = 0;
            for(auto c: buf) {
                if(c == ' ') return n > 0;
                if(not is_tchar(c)) return false;
                if(++n > 32) return false;
            }
            return true;
        }

        std::optional<uint64_t> parse_decimal(std::string_view s) {
            s = str::trim(s);
            if(s.empty() or s.size() > 19) return std::nullopt;

            uint64_t ret = 0;
            auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), ret);
            if(ec != std::errc() or p != s.data() + s.size()) return std::nullopt;

            return ret;
        }

        std::optional<uint64_t> content_length(Headers const& headers) {
            std::optional<uint64_t> ret;

            for(auto const& v: headers.get_all("content-length")) {
                auto parts = str::split_tokens(v, ',');
                if(parts.empty()) throw http_error("empty Content-Length");

                for(auto const& p: parts) {
                    auto len = parse_decimal(p);
                    if(not len) throw http_error("invalid Content-Length");

                    if(ret and *ret != *len) throw http_error("conflicting Content-Length values");
                    ret = len;
                }
            }
            return ret;
        }

        std::vector<std::string> codings(Headers const& headers) {
            std::vector<std::string> ret;
            for(auto const& v: headers.get_all("transfer-encoding")) {
                for(auto& t: str::split_tokens(v, ',')) {
                    ret.push_back(str::to_lower(t));
                }
            }
            return ret;
        }
    }


    void Headers::add(std::string name, std::string value) {
        items_.push_back({ std::move(name), std::move(value), std::string() });
    }

    void Headers::add_raw(std::string name, std::string value, std::string raw) {
        items_.push_back({ std::move(name), std::move(value), std::move(raw) });
    }

    std::size_t Headers::remove(std::string_view name) {
        auto before = items_.size();
        items_.erase(std::remove_if(items_.begin(), items_.end(), [&](auto const& h) {
            return str::iequals(h.name, name);
        }), items_.end());

        return before - items_.size();
    }

    std::optional<std::string> Headers::get(std::string_view name) const {
        for(auto const& h: items_) {
            if(str::iequals(h.name, name)) return h.value;
        }
        return std::nullopt;
    }

    std::vector<std::string> Headers::get_all(std::string_view name) const {
        std::vector<std::string> ret;
        for(auto const& h: items_) {
            if(str::iequals(h.name, name)) ret.push_back(h.value);
        }
        return ret;
    }

    std::size_t Headers::count(std::string_view name) const {
        return std::count_if(items_.begin(), items_.end(), [&](auto const& h) {
            return str::iequals(h.name, name);
        });
    }

    bool Headers::has_token(std::string_view name, std::string_view token) const {
        for(auto const& v: get_all(name)) {
            for(auto const& t: str::split_tokens(v, ',')) {
                if(str::iequals(t, token)) return true;
            }
        }
        return false;
    }

    void Headers::serialize(std::string& out) const {
        for(auto const& h: items_) {
            if(not h.raw.empty()) {
                out += h.raw;
            } else {
                out += h.name;
                out += ": ";
                out += h.value;
            }
            out += "\r\n";
        }
    }


    void Headers::wipe() {
        for(auto& h: items_) {
            if(not h.value.empty()) OPENSSL_cleanse(h.value.data(), h.value.size());
            if(not h.raw.empty()) OPENSSL_cleanse(h.raw.data(), h.raw.size());
        }
        items_.clear();
    }


    std::string RequestHead::serialize() const {
        std::string out = start_line.empty() ? method + " " + target + " " + version : start_line;
        out += "\r\n";
        headers.serialize(out);
        out += "\r\n";
        return out;
    }

    std::string ResponseHead::serialize() const {
        std::string out = start_line.empty() ? string_format("%s %03d %s", version.c_str(), status, reason.c_str()) : start_line;
        out += "\r\n";
        headers.serialize(out);
        out += "\r\n";
        return out;
    }


    ParseStatus parse_request_head(std::string_view buf, RequestHead& out, std::size_t& consumed,
                                   std::size_t max_size, std::string* error) {

        if(not plausible_request_prefix(buf.substr(0, std::min<std::size_t>(buf.size(), 64)))) {
            set_error(error, "not an HTTP request");
            return ParseStatus::error;
        }

        std::vector<std::string_view> lines;
        auto st = split_head(buf, lines, consumed, max_size, error);
        if(st != ParseStatus::ok) return st;

        auto line = lines[0];
        auto sp1 = line.find(' ');
        auto sp2 = sp1 == std::string_view::npos ? sp1 : line.find(' ', sp1 + 1);

        if(sp1 == std::string_view::npos or sp2 == std::string_view::npos or line.find(' ', sp2 + 1) != std::string_view::npos) {
            set_error(error, "malformed request line");
            return ParseStatus::error;
        }

        RequestHead req;
        req.method = line.substr(0, sp1);
        req.target = line.substr(sp1 + 1, sp2 - sp1 - 1);
        req.version = line.substr(sp2 + 1);
        req.start_line = line;

        if(not is_token(req.method) or req.target.empty() or not valid_version(req.version)) {
            set_error(error, "malformed request line");
            return ParseStatus::error;
        }

        if(not parse_fields(lines, req.headers, error)) {
            return ParseStatus::error;
        }

        out = std::move(req);
        return ParseStatus::ok;
    }

    ParseStatus parse_response_head(std::string_view buf, ResponseHead& out, std::size_t& consumed,
                                    std::size_t max_size, std::string* error) {

        if(buf.size() >= 5 and buf.substr(0, 5) != "HTTP/") {
            set_error(error, "not an HTTP response");
            return ParseStatus::error;
        }

        std::vector<std::string_view> lines;
        auto st = split_head(buf, lines, consumed, max_size, error);
        if(st != ParseStatus::ok) return st;

        auto line = lines[0];

        ResponseHead resp;
        resp.start_line = line;

        auto sp1 = line.find(' ');
        if(sp1 == std::string_view::npos or line.size() < sp1 + 4) {
            set_error(error, "malformed status line");
            return ParseStatus::error;
        }

        resp.version = line.substr(0, sp1);
        auto code = line.substr(sp1 + 1, 3);
        if(not valid_version(resp.version) or not std::all_of(code.begin(), code.end(), [](char c) {
                return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
            set_error(error, "malformed status line");
            return ParseStatus::error;
        }
        resp.status = std::stoi(std::string(code));

        if(line.size() > sp1 + 4) {
            if(line[sp1 + 4] != ' ') {
                set_error(error, "malformed status line");
                return ParseStatus::error;
            }
            resp.reason = line.substr(sp1 + 5);
        }

        if(not parse_fields(lines, resp.headers, error)) {
            return ParseStatus::error;
        }

        out = std::move(resp);
        return ParseStatus::ok;
    }


    std::optional<ConnectTarget> parse_connect_target(std::string_view target) {
        ConnectTarget ret;
        std::string_view port;

        if(not target.empty() and target.front() == '[') {
            auto close = target.find(']');
            if(close == std::string_view::npos or close + 1 >= target.size() or target[close + 1] != ':') {
                return std::nullopt;
            }
            ret.host = target.substr(1, close - 1);
            port = target.substr(close + 2);
        }
        else {
            auto colon = target.rfind(':');
            if(colon == std::string_view::npos or target.find(':') != colon) {
                return std::nullopt;
            }
            ret.host = target.substr(0, colon);
            port = target.substr(colon + 1);
        }

        if(ret.host.empty() or port.empty() or port.size() > 5) return std::nullopt;

        unsigned int p = 0;
        auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), p);
        if(ec != std::errc() or ptr != port.data() + port.size() or p == 0 or p > 65535) {
            return std::nullopt;
        }

        ret.host = str::to_lower(ret.host);
        ret.port = static_cast<uint16_t>(p);
        return ret;
    }


    BodyFraming request_framing(RequestHead const& req) {
        BodyFraming ret;

        auto te = codings(req.headers);
        auto cl = content_length(req.headers);

        if(not te.empty()) {
            if(cl) {
                throw http_error("request has both Content-Length and Transfer-Encoding");
            }
            if(te.back() != "chunked" or req.minor_version() == 0) {
                throw http_error("unsupported transfer coding", 501);
            }
            ret.kind = BodyKind::chunked;
            return ret;
        }

        if(cl) {
            ret.kind = *cl > 0 ? BodyKind::length : BodyKind::none;
            ret.length = *cl;
        }
        return ret;
    }

    BodyFraming response_framing(ResponseHead const& resp, std::string_view request_method) {
        BodyFraming ret;

        if(str::iequals(request_method, "HEAD") or resp.interim() or resp.status == 204 or resp.status == 304) {
            return ret;
        }

        auto te = codings(resp.headers);
        if(not te.empty()) {
            ret.kind = te.back() == "chunked" ? BodyKind::chunked : BodyKind::until_close;
            return ret;
        }

        std::optional<uint64_t> cl;
        try {
            cl = content_length(resp.headers);
        }
        catch(http_error const& e) {
            throw http_error(std::string("upstream: ") + e.what(), 502);
        }

        if(cl) {
            ret.kind = *cl > 0 ? BodyKind::length : BodyKind::none;
            ret.length = *cl;
            return ret;
        }

        ret.kind = BodyKind::until_close;
        return ret;
    }

    std::optional<uint64_t> parse_chunk_size(std::string_view line) {
        auto semi = line.find(';');
        auto hex = str::trim(line.substr(0, semi));

        if(hex.empty() or hex.size() > 15) return std::nullopt;

        uint64_t ret = 0;
        auto [p, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), ret, 16);
        if(ec != std::errc() or p != hex.data() + hex.size()) return std::nullopt;

        return ret;
    }

    bool keep_alive(std::string_view version, Headers const& headers) {
        if(headers.has_token("connection", "close")) return false;
        if(version == "HTTP/1.0") return headers.has_token("connection", "keep-alive");

        return true;
    }

    std::size_t strip_hop_by_hop(Headers& headers) {
        std::size_t removed = 0;

        for(auto const& v: headers.get_all("connection")) {
            for(auto const& t: str::split_tokens(v, ',')) {
                if(str::iequals(t, "close") or str::iequals(t, "upgrade") or str::iequals(t, "connection")) {
                    continue;
                }
                removed += headers.remove(t);
            }
        }

        removed += headers.remove("proxy-connection");
        removed += headers.remove("proxy-authorization");

        return removed;
    }

    std::optional<std::string> host_of(RequestHead const& req) {
        if(req.headers.count("host") != 1) return std::nullopt;

        auto value = *req.headers.get("host");
        std::string_view v(value);

        std::string_view host;
        if(not v.empty() and v.front() == '[') {
            auto close = v.find(']');
            if(close == std::string_view::npos) return std::nullopt;
            host = v.substr(1, close - 1);
        } else {
            host = v.substr(0, v.find(':'));
        }

        auto ret = str::to_lower(host);
        if(not ret.empty() and ret.back() == '.') ret.pop_back();
        if(ret.empty()) return std::nullopt;

        return ret;
    }

    const char* reason_phrase(int status) {
        switch(status) {
            case 100: return "Continue";
            case 101: return "Switching Protocols";
            case 200: return "OK";
            case 400: return "Bad Request";
            case 403: return "Forbidden";
            case 405: return "Method Not Allowed";
            case 408: return "Request Timeout";
            case 421: return "Misdirected Request";
            case 431: return "Request Header Fields Too Large";
            case 501: return "Not Implemented";
            case 502: return "Bad Gateway";
            case 503: return "Service Unavailable";
            case 504: return "Gateway Timeout";
            default:  return "Unknown";
        }
    }

    std::string simple_response(int status, std::string_view body, bool close) {
        std::string text = body.empty() ? string_format("%d %s\n", status, reason_phrase(status)) : std::string(body);

        auto out = string_format("HTTP/1.1 %d %s\r\n", status, reason_phrase(status));
        out += "Content-Type: text/plain\r\n";
        out += string_format("Content-Length: %zu\r\n", text.size());
        if(status == 405) {
            out += "Allow: CONNECT\r\n";
        }
        if(close) {
            out += "Connection: close\r\n";
        }
        out += "\r\n";
        out += text;

        return out;
    }
}
