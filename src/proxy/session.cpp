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

#include <poll.h>
#include <sys/socket.h>

#include <array>
#include <cerrno>

#include <openssl/crypto.h>

#include <proxy/session.hpp>
#include <utils/str.hpp>

#include <display.hpp>

namespace sg::proxy {

    using audit::Outcome;

    namespace {

        // io failure attributed to one leg of the tunnel
        class leg_error : public io_error {
        public:
            leg_error(std::string const& what, bool upstream) : io_error(what), upstream_(upstream) {};
            bool upstream() const { return upstream_; }
        private:
            bool upstream_;
        };

        template <typename F>
        auto on_leg(bool upstream, F&& f) -> decltype(f()) {
            try {
                return f();
            }
            catch(timeout_error const&) {
                throw;
            }
            catch(leg_error const&) {
                throw;
            }
            catch(io_error const& e) {
                throw leg_error(e.what(), upstream);
            }
        }

        bool fill(Reader& r, bool upstream) {
            return on_leg(upstream, [&]() { return r.fill(); });
        }

        void send(Stream& s, std::string_view data, bool upstream) {
            on_leg(upstream, [&]() { s.write_all(data); });
        }

        std::string line(Reader& r, bool upstream) {
            return on_leg(upstream, [&]() { return r.read_line(4096); });
        }

        // malformed input: the upstream side is a leg failure, the client side a protocol error
        [[noreturn]] void malformed(std::string const& what, bool upstream) {
            if(upstream) throw leg_error(what, true);
            throw http1::http_error(what);
        }

        template <typename Head, typename Parser>
        bool read_head(Reader& r, bool upstream, Head& out, std::size_t max_size, Parser parse) {
            while(true) {
                if(not r.buffer().empty()) {
                    std::size_t consumed = 0;
                    std::string err;

                    auto st = parse(r.buffer(), out, consumed, max_size, &err);
                    if(st == http1::ParseStatus::ok) {
                        r.consume(consumed);
                        return true;
                    }
                    if(st == http1::ParseStatus::error) {
                        malformed(err, upstream);
                    }
                }

                if(not fill(r, upstream)) {
                    if(r.buffer().empty()) return false;
                    malformed("connection closed inside message head", upstream);
                }
            }
        }

        uint64_t relay_length(Reader& from, bool from_up, Stream& to, uint64_t length) {
            uint64_t left = length;

            while(left > 0) {
                auto& buf = from.buffer();
                if(buf.empty()) {
                    if(not fill(from, from_up)) {
                        throw leg_error("connection closed inside body", from_up);
                    }
                    continue;
                }

                auto take = static_cast<std::size_t>(std::min<uint64_t>(left, buf.size()));
                send(to, std::string_view(buf.data(), take), not from_up);
                from.consume(take);
                left -= take;
            }

            return length;
        }

        // chunks, extensions and trailers are relayed as they are
        uint64_t relay_chunked(Reader& from, bool from_up, Stream& to) {
            uint64_t total = 0;

            while(true) {
                auto size_line = line(from, from_up);
                auto size = http1::parse_chunk_size(str::trim(size_line));
                if(not size) {
                    malformed("malformed chunk size", from_up);
                }

                send(to, size_line, not from_up);
                total += size_line.size();

                if(*size == 0) {
                    while(true) {
                        auto trailer = line(from, from_up);
                        send(to, trailer, not from_up);
                        total += trailer.size();

                        if(str::trim(trailer).empty()) return total;
                    }
                }

                total += relay_length(from, from_up, to, *size);

                auto crlf = line(from, from_up);
                if(not str::trim(crlf).empty()) {
                    malformed("missing chunk terminator", from_up);
                }
                send(to, crlf, not from_up);
                total += crlf.size();
            }
        }

        uint64_t relay_until_close(Reader& from, bool from_up, Stream& to) {
            uint64_t total = 0;

            do {
                auto& buf = from.buffer();
                if(not buf.empty()) {
                    send(to, buf, not from_up);
                    total += buf.size();
                    from.consume(buf.size());
                }
            } while(fill(from, from_up));

            return total;
        }

        uint64_t relay_body(Reader& from, bool from_up, Stream& to, http1::BodyFraming const& f) {
            switch(f.kind) {
                case http1::BodyKind::none:
                    return 0;
                case http1::BodyKind::length:
                    return relay_length(from, from_up, to, f.length);
                case http1::BodyKind::chunked:
                    return relay_chunked(from, from_up, to);
                case http1::BodyKind::until_close:
                    return relay_until_close(from, from_up, to);
            }
            return 0;
        }
    }


    GatewaySession::GatewaySession(SessionContext& ctx, int client_fd, std::string client_addr, uint64_t id)
    : ctx_(ctx), client_(std::make_unique<PlainStream>(client_fd)), client_fd_(client_fd) {

        record_.session_id = id;
        record_.client = std::move(client_addr);
        record_.timestamp = ::time(nullptr);
    }

    GatewaySession::~GatewaySession() {
        auto l_ = std::scoped_lock(fd_lock_);
        client_fd_ = -1;
        upstream_fd_ = -1;
    }

    const char* GatewaySession::state_name(state_t s) {
        switch(s) {
            case state_t::awaiting_connect: return "awaiting_connect";
            case state_t::policy_decided: return "policy_decided";
            case state_t::denied: return "denied";
            case state_t::tls_handshaking: return "tls_handshaking";
            case state_t::request_relay: return "request_relay";
            case state_t::response_relay: return "response_relay";
            case state_t::tunnel: return "tunnel";
            case state_t::closed: return "closed";
        }
        return "unknown";
    }

    void GatewaySession::state(state_t s) {
        auto const& log = get_log();

        _deb("session %lu: %s -> %s", static_cast<unsigned long>(id()), state_name(state_), state_name(s));
        state_ = s;
    }

    void GatewaySession::track_upstream(int fd) {
        auto l_ = std::scoped_lock(fd_lock_);
        upstream_fd_ = fd;
    }

    void GatewaySession::abort() {
        aborted_ = true;

        auto l_ = std::scoped_lock(fd_lock_);
        if(client_fd_ >= 0) ::shutdown(client_fd_, SHUT_RDWR);
        if(upstream_fd_ >= 0) ::shutdown(upstream_fd_, SHUT_RDWR);
    }

    void GatewaySession::finish(Outcome outcome, std::string detail) {
        if(outcome_set_) return;

        outcome_set_ = true;
        record_.outcome = outcome;
        record_.detail = str::printable(detail, 256);
    }

    void GatewaySession::respond(Stream& s, int status, Outcome outcome, std::string detail) {
        auto const& log = get_log();

        _dia("session %lu: %d to %s: %s", static_cast<unsigned long>(id()), status, record_.client.c_str(), detail.c_str());

        record_.last_status = status;
        finish(outcome, std::move(detail));

        s.write_all(http1::simple_response(status, string_format("%d %s\n", status, http1::reason_phrase(status))));
    }


    void GatewaySession::run() noexcept {
        auto const& log = get_log();
        auto const started = std::chrono::steady_clock::now();

        total_sessions()++;

        Deadline deadline(ctx_.total_timeout, ctx_.idle_timeout);

        try {
            handle(deadline);
            finish(aborted_ ? Outcome::shutdown : Outcome::ok, "");
        }
        catch(timeout_error const& e) {
            finish(aborted_ ? Outcome::shutdown : Outcome::timeout, e.what());
        }
        catch(leg_error const& e) {
            finish(aborted_ ? Outcome::shutdown : (e.upstream() ? Outcome::upstream_error : Outcome::client_error), e.what());
        }
        catch(http1::http_error const& e) {
            finish(Outcome::client_error, e.what());
        }
        catch(io_error const& e) {
            finish(aborted_ ? Outcome::shutdown : Outcome::client_error, e.what());
        }
        catch(std::exception const& e) {
            _err("session %lu: unexpected error: %s", static_cast<unsigned long>(id()), e.what());
            finish(Outcome::client_error, e.what());
        }

        state(state_t::closed);

        record_.duration_ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                                    std::chrono::steady_clock::now() - started).count());
        total_bytes_up() += record_.bytes_up;
        total_bytes_down() += record_.bytes_down;

        _dia("session %lu: %s:%d closed, outcome %s, %lu requests, up %lu, down %lu",
             static_cast<unsigned long>(id()), record_.host.c_str(), record_.port, audit::outcome_name(record_.outcome),
             static_cast<unsigned long>(record_.requests), static_cast<unsigned long>(record_.bytes_up),
             static_cast<unsigned long>(record_.bytes_down));

        try {
            ctx_.audit.write(record_);
        }
        catch(std::exception const& e) {
            _err("session %lu: audit record not written: %s", static_cast<unsigned long>(id()), e.what());
        }
    }

    void GatewaySession::handle(Deadline const& deadline) {
        client_->deadline(&deadline);

        auto* tls = establish(deadline);
        if(tls == nullptr) return;

        relay_requests(*tls, deadline);
    }

    TlsStream* GatewaySession::establish(Deadline const& deadline) {
        auto const& log = get_log();

        Reader r(*client_);
        http1::RequestHead head;

        if(not read_head(r, false, head, ctx_.max_connect_head, http1::parse_request_head)) {
            throw io_error("client closed before CONNECT");
        }

        if(head.method != "CONNECT") {
            respond(*client_, 405, Outcome::client_error, "method " + head.method + " not allowed");
            return nullptr;
        }

        auto target = http1::parse_connect_target(head.target);
        auto host = target ? policy::normalize_host(target->host) : std::string();

        if(not target or target->port == 0 or not (policy::is_valid_hostname(host) or policy::is_ip_literal(host))) {
            record_.host = str::printable(head.target);
            respond(*client_, 400, Outcome::client_error, "invalid CONNECT target");
            return nullptr;
        }

        record_.host = host;
        record_.port = target->port;

        // the client has to wait for our 200 before its handshake
        if(not r.buffer().empty()) {
            throw http1::http_error("data sent before the tunnel was established");
        }

        state(state_t::policy_decided);

        decision_ = ctx_.policy.decide(host);
        if(decision_.allowed() and not ctx_.policy.port_allowed(target->port)) {
            decision_ = policy::Decision { policy::Action::deny, "", "port-guard" };
        }

        record_.action = policy::action_name(decision_.action);
        record_.credential = decision_.credential;

        if(not decision_.allowed()) {
            state(state_t::denied);
            respond(*client_, 403, Outcome::denied, string_format("denied by %s", decision_.rule.c_str()));
            return nullptr;
        }

        _dia("session %lu: %s:%d %s by %s", static_cast<unsigned long>(id()), host.c_str(), target->port,
             policy::action_name(decision_.action), decision_.rule.c_str());

        if(not ctx_.authority.active()) {
            respond(*client_, 503, Outcome::no_authority, "no valid authority");
            return nullptr;
        }

        ca::leaf_ptr leaf;
        try {
            leaf = ctx_.leaves.get(host);
        }
        catch(ca::leaf_error const& e) {
            respond(*client_, 503, Outcome::leaf_error, e.what());
            return nullptr;
        }
        record_.generation = leaf->generation;

        client_->write_all("HTTP/1.1 200 Connection established\r\n\r\n");

        state(state_t::tls_handshaking);

        auto fd = client_->release();
        client_.reset();

        auto tls = TlsStream::accept(fd, leaf->ctx.get(), deadline);
        auto* ret = tls.get();
        client_ = std::move(tls);

        _deb("session %lu: client handshake done, sni '%s', alpn '%s'", static_cast<unsigned long>(id()),
             ret->servername().c_str(), ret->alpn().c_str());

        return ret;
    }

    void GatewaySession::relay_requests(TlsStream& client, Deadline const& deadline) {
        Reader cr(client);

        std::unique_ptr<TlsStream> up;
        std::unique_ptr<Reader> ur;

        struct upstream_guard {
            GatewaySession& s;
            ~upstream_guard() { s.track_upstream(-1); }
        } guard { *this };

        while(not aborted_) {
            if(not exchange(client, cr, up, ur, deadline)) break;
        }

        if(up and ur and ur->buffer().empty() and not up->pending() and not aborted_) {
            track_upstream(-1);
            ur.reset();
            ctx_.upstream.release(record_.host, record_.port, std::move(up));
        }
    }

    bool GatewaySession::exchange(TlsStream& client, Reader& cr, std::unique_ptr<TlsStream>& up,
                                  std::unique_ptr<Reader>& ur, Deadline const& deadline) {
        auto const& log = get_log();

        auto drop_upstream = [&]() {
            track_upstream(-1);
            ur.reset();
            up.reset();
        };

        state(state_t::request_relay);

        http1::RequestHead req;
        if(not read_head(cr, false, req, ctx_.max_request_head, http1::parse_request_head)) {
            return false;
        }
        record_.requests++;

        if(req.method == "CONNECT") {
            respond(client, 405, Outcome::client_error, "CONNECT inside the tunnel");
            return false;
        }

        auto req_host = http1::host_of(req);
        if(not req_host or policy::normalize_host(*req_host) != record_.host) {
            respond(client, 421, Outcome::client_error,
                    string_format("Host '%s' does not match tunnel", req_host ? req_host->c_str() : ""));
            return false;
        }

        http1::BodyFraming framing;
        try {
            framing = http1::request_framing(req);
        }
        catch(http1::http_error const& e) {
            respond(client, e.status(), Outcome::client_error, e.what());
            return false;
        }

        bool client_keep = http1::keep_alive(req.version, req.headers);
        http1::strip_hop_by_hop(req.headers);

        bool injected = false;
        if(decision_.action == policy::Action::inject) {
            auto const* spec = ctx_.credentials.spec(decision_.credential);
            auto rec = spec ? ctx_.credentials.get(decision_.credential) : nullptr;

            if(not rec) {
                respond(client, 502, Outcome::fail_closed,
                        string_format("credential '%s' not available", decision_.credential.c_str()));
                return false;
            }

            cred::Injector::apply(req.headers, *spec, *rec);
            injected = true;
        }

        bool const expect = framing.kind != http1::BodyKind::none and req.headers.has_token("expect", "100-continue");

        auto head = req.serialize();
        if(injected) {
            req.headers.wipe();
        }

        // head is kept until the exchange ends, a reused connection may need it twice
        struct head_wipe {
            std::string& head;
            bool injected;
            ~head_wipe() { if(injected and not head.empty()) OPENSSL_cleanse(head.data(), head.size()); }
        } head_guard { head, injected };

        for(int attempt = 1; ; ++attempt) {

            // origins close idle keep-alive connections at will
            if(up and not UpstreamConnector::still_usable(*up)) {
                _deb("session %lu: upstream connection closed while idle", static_cast<unsigned long>(id()));
                drop_upstream();
            }

            bool reused = (up != nullptr);

            if(not up) {
                try {
                    up = attempt == 1 ? ctx_.upstream.acquire(record_.host, record_.port, deadline, &reused)
                                      : ctx_.upstream.connect(record_.host, record_.port, deadline);
                }
                catch(timeout_error const&) {
                    throw;
                }
                catch(io_error const& e) {
                    _err("session %lu: upstream %s:%d: %s", static_cast<unsigned long>(id()), record_.host.c_str(),
                         record_.port, e.what());
                    respond(client, 502, Outcome::upstream_error, e.what());
                    return false;
                }
                track_upstream(up->fd());
                ur = std::make_unique<Reader>(*up);
            }
            else {
                up->deadline(&deadline);
            }

            bool response_started = false;
            bool body_started = false;
            bool body_sent = false;

            try {
                send(*up, head, true);
                record_.bytes_up += head.size();

                if(not expect) {
                    body_started = true;
                    record_.bytes_up += relay_body(cr, false, *up, framing);
                    body_sent = true;
                }

                state(state_t::response_relay);

                http1::ResponseHead resp;
                while(true) {
                    resp = http1::ResponseHead();
                    if(not read_head(*ur, true, resp, ctx_.max_request_head, http1::parse_response_head)) {
                        throw leg_error("upstream closed before response", true);
                    }
                    record_.last_status = resp.status;

                    auto out = resp.serialize();
                    send(client, out, false);
                    record_.bytes_down += out.size();
                    response_started = true;

                    if(resp.status == 101) {
                        state(state_t::tunnel);
                        relay_raw(client, cr, *up, *ur, deadline);
                        drop_upstream();
                        return false;
                    }

                    if(not resp.interim()) break;

                    if(resp.status == 100 and expect and not body_sent) {
                        body_started = true;
                        record_.bytes_up += relay_body(cr, false, *up, framing);
                        body_sent = true;
                    }
                }

                http1::BodyFraming rf;
                try {
                    rf = http1::response_framing(resp, req.method);
                }
                catch(http1::http_error const& e) {
                    throw leg_error(e.what(), true);
                }

                record_.bytes_down += relay_body(*ur, true, client, rf);

                bool const up_keep = rf.kind != http1::BodyKind::until_close
                                     and http1::keep_alive(resp.version, resp.headers)
                                     and ur->buffer().empty();

                // unsent request body is still on the client connection
                if(expect and not body_sent) {
                    client_keep = false;
                }

                if(not up_keep) {
                    drop_upstream();
                }

                return client_keep;
            }
            catch(leg_error const& e) {
                if(not e.upstream()) throw;

                drop_upstream();

                if(aborted_) throw;

                // nothing reached the client and the request can be sent again as is
                bool const replayable = not response_started
                                        and (framing.kind == http1::BodyKind::none or not body_started);
                if(reused and attempt == 1 and replayable) {
                    _dia("session %lu: reused upstream connection failed (%s), retrying on a new one",
                         static_cast<unsigned long>(id()), e.what());
                    state(state_t::request_relay);
                    continue;
                }

                _err("session %lu: upstream %s:%d failed: %s", static_cast<unsigned long>(id()), record_.host.c_str(),
                     record_.port, e.what());

                if(not response_started) {
                    respond(client, 502, Outcome::upstream_error, e.what());
                } else {
                    finish(Outcome::upstream_error, e.what());
                }
                return false;
            }
        }
    }

    void GatewaySession::relay_raw(Stream& client, Reader& cr, Stream& up, Reader& ur, Deadline const& deadline) {
        if(not cr.buffer().empty()) {
            send(up, cr.buffer(), true);
            record_.bytes_up += cr.buffer().size();
            cr.consume(cr.buffer().size());
        }
        if(not ur.buffer().empty()) {
            send(client, ur.buffer(), false);
            record_.bytes_down += ur.buffer().size();
            ur.consume(ur.buffer().size());
        }

        bool client_open = true;
        bool up_open = true;
        std::array<char, 16 * 1024> buf{};

        // returns false once 'from' is finished
        auto pump = [&](Stream& from, bool from_up, Stream& to, uint64_t& counter) {
            auto n = on_leg(from_up, [&]() { return from.read_some(buf.data(), buf.size()); });
            if(n == 0) {
                to.shutdown_write();
                return false;
            }
            send(to, std::string_view(buf.data(), n), not from_up);
            counter += n;
            return true;
        };

        while(client_open or up_open) {
            std::array<struct pollfd, 2> pfd{};
            pfd[0].fd = client_open ? client.fd() : -1;
            pfd[0].events = POLLIN;
            pfd[1].fd = up_open ? up.fd() : -1;
            pfd[1].events = POLLIN;

            bool const buffered = (client_open and client.pending()) or (up_open and up.pending());

            auto r = ::poll(pfd.data(), pfd.size(), buffered ? 0 : deadline.wait_ms());
            if(r < 0) {
                if(errno == EINTR) continue;
                throw io_error("poll failed: " + string_error());
            }
            if(r == 0 and not buffered) {
                throw timeout_error("idle timeout in upgraded connection");
            }

            if(client_open and (client.pending() or pfd[0].revents != 0)) {
                client_open = pump(client, false, up, record_.bytes_up);
            }
            if(up_open and (up.pending() or pfd[1].revents != 0)) {
                up_open = pump(up, true, client, record_.bytes_down);
            }
        }
    }
}
