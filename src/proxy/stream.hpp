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

#ifndef SANDGATE_PROXY_STREAM_HPP
#define SANDGATE_PROXY_STREAM_HPP

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <openssl/ssl.h>

namespace sg::proxy {

    class io_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class timeout_error : public io_error {
    public:
        using io_error::io_error;
    };

    class tls_error : public io_error {
    public:
        using io_error::io_error;
    };


    // total deadline of a connection plus the longest a single I/O wait may block
    class Deadline {
    public:
        using clock = std::chrono::steady_clock;

        Deadline(std::chrono::milliseconds total, std::chrono::milliseconds idle)
        : end_(clock::now() + total), idle_(idle) {};

        // poll timeout for the next wait, throws timeout_error when the total deadline passed
        int wait_ms() const;

        // like wait_ms(), but never longer than 'cap'
        int wait_ms(std::chrono::milliseconds cap) const;

        bool expired() const { return clock::now() >= end_; }
        std::chrono::milliseconds idle() const { return idle_; }

    private:
        clock::time_point end_;
        std::chrono::milliseconds idle_;
    };


    void set_nonblocking(int fd);

    // wait for 'events' on fd within the deadline; throws timeout_error
    void wait_fd(int fd, short events, Deadline const& deadline);


    class Stream {
    public:
        explicit Stream(int fd) : fd_(fd) {};
        virtual ~Stream();

        Stream(Stream const&) = delete;
        Stream& operator=(Stream const&) = delete;

        // 0 on orderly close; throws io_error, timeout_error
        virtual std::size_t read_some(char* buf, std::size_t len) = 0;
        virtual void write_all(std::string_view data) = 0;

        // bytes already decoded and waiting in the stream layer
        virtual bool pending() const { return false; }

        // best effort end of our sending direction
        virtual void shutdown_write();

        int fd() const { return fd_; }

        // give up socket ownership without closing it
        int release() { auto f = fd_; fd_ = -1; return f; }

        // deadline is owned by the session currently using the stream
        void deadline(Deadline const* d) { deadline_ = d; }
        Deadline const& deadline() const;

    protected:
        int fd_;
        Deadline const* deadline_ = nullptr;
    };


    class PlainStream : public Stream {
    public:
        explicit PlainStream(int fd) : Stream(fd) {};

        std::size_t read_some(char* buf, std::size_t len) override;
        void write_all(std::string_view data) override;
    };


    struct ssl_free_t { void operator()(SSL* p) const { SSL_free(p); } };
    using SSL_ptr = std::unique_ptr<SSL, ssl_free_t>;

    class TlsStream : public Stream {
    public:
        // server side handshake over accepted socket; ownership of fd moves into the stream
        static std::unique_ptr<TlsStream> accept(int fd, SSL_CTX* ctx, Deadline const& deadline);

        // client side handshake with SNI and peer name verification
        static std::unique_ptr<TlsStream> connect(int fd, SSL_CTX* ctx, std::string const& host, Deadline const& deadline);

        std::size_t read_some(char* buf, std::size_t len) override;
        void write_all(std::string_view data) override;
        bool pending() const override;
        void shutdown_write() override;

        SSL* ssl() const { return ssl_.get(); }
        std::string alpn() const;
        std::string servername() const;

    private:
        TlsStream(int fd, SSL_ptr ssl) : Stream(fd), ssl_(std::move(ssl)) {};

        // handles WANT_READ/WANT_WRITE, returns false for orderly close
        bool retry(int ret, const char* op);

        SSL_ptr ssl_;
        bool closed_ = false;
    };


    // buffered reading on top of a stream
    class Reader {
    public:
        explicit Reader(Stream& s) : stream_(s) {};

        // read more data into the buffer, false on orderly close
        bool fill();

        std::string& buffer() { return buf_; }
        void consume(std::size_t n) { buf_.erase(0, n); }

        // line including its terminator; throws io_error on close or when longer than max_len
        std::string read_line(std::size_t max_len);

        Stream& stream() { return stream_; }

    private:
        Stream& stream_;
        std::string buf_;
    };
}

#endif
