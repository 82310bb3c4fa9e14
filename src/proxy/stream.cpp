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

#include <arpa/inet.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <climits>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <proxy/stream.hpp>
#include <ca/x509.hpp>

#include <display.hpp>

namespace sg::proxy {

    int Deadline::wait_ms() const {
        return wait_ms(idle_);
    }

    int Deadline::wait_ms(std::chrono::milliseconds cap) const {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(end_ - clock::now());
        if(remaining.count() <= 0) {
            throw timeout_error("total deadline exceeded");
        }

        auto ms = std::min({ remaining, idle_, cap });
        return static_cast<int>(std::max<long long>(1, std::min<long long>(ms.count(), INT_MAX)));
    }


    void set_nonblocking(int fd) {
        auto flags = ::fcntl(fd, F_GETFL, 0);
        if(flags < 0 or ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
            throw io_error("cannot set non-blocking mode: " + string_error());
        }
    }

    void wait_fd(int fd, short events, Deadline const& deadline) {
        while(true) {
            struct pollfd pfd{};
            pfd.fd = fd;
            pfd.events = events;

            auto r = ::poll(&pfd, 1, deadline.wait_ms());
            if(r > 0) return;

            if(r == 0) {
                if(deadline.expired()) throw timeout_error("total deadline exceeded");
                throw timeout_error("idle timeout");
            }
            if(errno != EINTR) {
                throw io_error("poll failed: " + string_error());
            }
        }
    }


    Stream::~Stream() {
        if(fd_ >= 0) {
            ::close(fd_);
        }
    }

    void Stream::shutdown_write() {
        if(fd_ >= 0) {
            ::shutdown(fd_, SHUT_WR);
        }
    }

    Deadline const& Stream::deadline() const {
        if(deadline_ == nullptr) {
            throw io_error("stream used without deadline");
        }
        return *deadline_;
    }


    std::size_t PlainStream::read_some(char* buf, std::size_t len) {
        while(true) {
            auto n = ::recv(fd_, buf, len, 0);
            if(n >= 0) return static_cast<std::size_t>(n);

            if(errno == EAGAIN or errno == EWOULDBLOCK) {
                wait_fd(fd_, POLLIN, deadline());
            }
            else if(errno != EINTR) {
                throw io_error("read failed: " + string_error());
            }
        }
    }

    void PlainStream::write_all(std::string_view data) {
        while(not data.empty()) {
            auto n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
            if(n >= 0) {
                data.remove_prefix(static_cast<std::size_t>(n));
                continue;
            }

            if(errno == EAGAIN or errno == EWOULDBLOCK) {
                wait_fd(fd_, POLLOUT, deadline());
            }
            else if(errno != EINTR) {
                throw io_error("write failed: " + string_error());
            }
        }
    }


    namespace {
        void common_ssl_options(SSL* ssl) {
            // peers closing without close_notify end the stream like a normal close
            SSL_set_options(ssl, SSL_OP_IGNORE_UNEXPECTED_EOF);
            SSL_set_mode(ssl, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
        }

        unsigned char const alpn_http11[] = { 8, 'h','t','t','p','/','1','.','1' };
    }

    bool TlsStream::retry(int ret, const char* op) {
        auto err = SSL_get_error(ssl_.get(), ret);

        switch(err) {
            case SSL_ERROR_WANT_READ:
                wait_fd(fd_, POLLIN, deadline());
                return true;

            case SSL_ERROR_WANT_WRITE:
                wait_fd(fd_, POLLOUT, deadline());
                return true;

            case SSL_ERROR_ZERO_RETURN:
                return false;

            case SSL_ERROR_SYSCALL:
                if(ERR_peek_error() == 0) {
                    if(ret == 0 or errno == 0 or errno == ECONNRESET or errno == EPIPE) return false;
                    throw io_error(string_format("%s: %s", op, string_error().c_str()));
                }
                [[fallthrough]];

            default:
                throw tls_error(string_format("%s: %s", op, ca::x509::last_error().c_str()));
        }
    }

    std::unique_ptr<TlsStream> TlsStream::accept(int fd, SSL_CTX* ctx, Deadline const& deadline) {
        SSL_ptr ssl(SSL_new(ctx));
        if(not ssl) {
            ::close(fd);
            throw tls_error("cannot create TLS session: " + ca::x509::last_error());
        }

        common_ssl_options(ssl.get());
        SSL_set_fd(ssl.get(), fd);

        std::unique_ptr<TlsStream> s(new TlsStream(fd, std::move(ssl)));
        s->deadline(&deadline);

        while(true) {
            ERR_clear_error();
            auto r = SSL_accept(s->ssl());
            if(r == 1) break;

            if(not s->retry(r, "handshake")) {
                throw tls_error("client closed connection during handshake");
            }
        }

        return s;
    }

    std::unique_ptr<TlsStream> TlsStream::connect(int fd, SSL_CTX* ctx, std::string const& host, Deadline const& deadline) {
        SSL_ptr ssl(SSL_new(ctx));
        if(not ssl) {
            ::close(fd);
            throw tls_error("cannot create TLS session: " + ca::x509::last_error());
        }

        common_ssl_options(ssl.get());

        std::array<unsigned char, 16> addr{};
        bool const ip = inet_pton(AF_INET, host.c_str(), addr.data()) == 1 or inet_pton(AF_INET6, host.c_str(), addr.data()) == 1;

        bool params_ok = ip ? X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl.get()), host.c_str()) == 1
                            : (SSL_set_tlsext_host_name(ssl.get(), host.c_str()) == 1 and SSL_set1_host(ssl.get(), host.c_str()) == 1);

        if(not params_ok or SSL_set_alpn_protos(ssl.get(), alpn_http11, sizeof(alpn_http11)) != 0) {
            ::close(fd);
            throw tls_error("cannot prepare TLS session for '" + host + "': " + ca::x509::last_error());
        }

        SSL_set_verify(ssl.get(), SSL_VERIFY_PEER, nullptr);
        SSL_set_fd(ssl.get(), fd);

        std::unique_ptr<TlsStream> s(new TlsStream(fd, std::move(ssl)));
        s->deadline(&deadline);

        try {
            while(true) {
                ERR_clear_error();
                auto r = SSL_connect(s->ssl());
                if(r == 1) break;

                if(not s->retry(r, "handshake")) {
                    throw tls_error("upstream closed connection during handshake");
                }
            }
        }
        catch(tls_error const& e) {
            auto vr = SSL_get_verify_result(s->ssl());
            if(vr != X509_V_OK) {
                throw tls_error(string_format("certificate of '%s' rejected: %s", host.c_str(), X509_verify_cert_error_string(vr)));
            }
            throw;
        }

        if(SSL_get_verify_result(s->ssl()) != X509_V_OK or SSL_get0_peer_certificate(s->ssl()) == nullptr) {
            throw tls_error(string_format("certificate of '%s' not verified", host.c_str()));
        }

        return s;
    }

    std::size_t TlsStream::read_some(char* buf, std::size_t len) {
        if(closed_) return 0;

        while(true) {
            ERR_clear_error();
            auto r = SSL_read(ssl_.get(), buf, static_cast<int>(std::min<std::size_t>(len, INT_MAX)));
            if(r > 0) return static_cast<std::size_t>(r);

            if(not retry(r, "read")) {
                closed_ = true;
                return 0;
            }
        }
    }

    void TlsStream::write_all(std::string_view data) {
        while(not data.empty()) {
            ERR_clear_error();
            auto r = SSL_write(ssl_.get(), data.data(), static_cast<int>(std::min<std::size_t>(data.size(), 64 * 1024)));
            if(r > 0) {
                data.remove_prefix(static_cast<std::size_t>(r));
                continue;
            }

            if(not retry(r, "write")) {
                throw io_error("peer closed connection during write");
            }
        }
    }

    bool TlsStream::pending() const {
        return SSL_pending(ssl_.get()) > 0;
    }

    void TlsStream::shutdown_write() {
        if(closed_) return;

        // close_notify only, we do not wait for the peer's reply
        if(SSL_shutdown(ssl_.get()) < 0) {
            ERR_clear_error();
        }
    }

    std::string TlsStream::alpn() const {
        unsigned char const* data = nullptr;
        unsigned int len = 0;
        SSL_get0_alpn_selected(ssl_.get(), &data, &len);

        return data ? std::string(reinterpret_cast<char const*>(data), len) : std::string();
    }

    std::string TlsStream::servername() const {
        auto const* sn = SSL_get_servername(ssl_.get(), TLSEXT_NAMETYPE_host_name);
        return sn ? std::string(sn) : std::string();
    }


    bool Reader::fill() {
        std::array<char, 16 * 1024> tmp{};

        auto n = stream_.read_some(tmp.data(), tmp.size());
        if(n == 0) return false;

        buf_.append(tmp.data(), n);
        return true;
    }

    std::string Reader::read_line(std::size_t max_len) {
        std::size_t scanned = 0;

        while(true) {
            auto nl = buf_.find('\n', scanned);
            if(nl != std::string::npos) {
                auto line = buf_.substr(0, nl + 1);
                consume(nl + 1);
                return line;
            }

            scanned = buf_.size();
            if(scanned > max_len) {
                throw io_error("line too long");
            }
            if(not fill()) {
                throw io_error("connection closed inside a line");
            }
        }
    }
}
