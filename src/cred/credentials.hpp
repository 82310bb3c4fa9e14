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

#ifndef SANDGATE_CRED_CREDENTIALS_HPP
#define SANDGATE_CRED_CREDENTIALS_HPP

#include <chrono>
#include <ctime>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <log/logan.hpp>

#include <proxy/http1.hpp>
#include <utils/fs.hpp>
#include <utils/tpool.hpp>

namespace sg::cred {

    // secret material; printable form is masked and the value is wiped on destruction
    class CredentialRecord {
    public:
        CredentialRecord(std::string name, std::string secret, time_t expires_at, uint64_t generation,
                         std::string token_type = "Bearer");
        ~CredentialRecord();

        CredentialRecord(CredentialRecord const&) = delete;
        CredentialRecord& operator=(CredentialRecord const&) = delete;

        std::string const& name() const { return name_; }
        time_t expires_at() const { return expires_at_; }
        uint64_t generation() const { return generation_; }
        std::string const& token_type() const { return token_type_; }

        bool expired_at(time_t now, time_t margin = 0) const { return now + margin >= expires_at_; }

        std::string to_string() const;

    private:
        friend class Injector;
        std::string const& secret() const { return secret_; }

        std::string name_;
        std::string secret_;
        time_t expires_at_;
        uint64_t generation_;
        std::string token_type_;
    };

    using credential_ptr = std::shared_ptr<CredentialRecord const>;


    struct CredentialSpec {
        std::string name;
        std::string file;

        std::string header = "Authorization";
        std::string scheme = "Bearer";

        // removed from requests in addition to 'header'
        std::vector<std::string> strip = { "x-api-key" };

        time_t cache_seconds = 5;
        time_t expiry_margin = 30;
    };


    struct ParsedToken {
        std::string token;
        time_t expires_at = 0;
        std::string token_type;
        std::optional<time_t> generated_at;
    };

    // contents of a refresher-written token file; nullopt when malformed
    std::optional<ParsedToken> parse_token_file(std::string const& content, std::string* error = nullptr);


    class CredentialSource {
    public:
        struct options_t {
            std::chrono::milliseconds read_timeout {2000};
            std::size_t max_file_size = 64 * 1024;
        };

        using clock_fn = std::function<time_t()>;

        CredentialSource(std::vector<CredentialSpec> specs, options_t opts, clock_fn clock = nullptr);

        CredentialSource(CredentialSource const&) = delete;
        CredentialSource& operator=(CredentialSource const&) = delete;

        // current non-expired credential, nullptr when not available
        credential_ptr get(std::string const& name);

        CredentialSpec const* spec(std::string const& name) const;

        struct stats_t {
            uint64_t reads = 0;
            uint64_t cache_hits = 0;
            uint64_t unavailable = 0;
            uint64_t timeouts = 0;
        };
        stats_t stats() const;

        static logan_lite& get_log() {
            static logan_lite l("cred");
            return l;
        }

    private:
        std::optional<std::string> read_bounded(std::string const& path);

        struct cache_entry {
            credential_ptr record;
            fs::FileStamp stamp;
            time_t loaded_at = 0;
        };

        std::map<std::string, CredentialSpec> specs_;
        options_t opts_;
        clock_fn clock_;

        mutable std::mutex lock_;
        std::map<std::string, cache_entry> cache_;

        // content digest and generation of the last accepted content per credential
        std::map<std::string, std::pair<std::string, uint64_t>> generation_;
        stats_t stats_;

        ThreadPool io_pool_ {2, "sg_cred"};
    };


    class Injector {
    public:
        // drop every header named like spec.header or spec.strip, then add exactly one authoritative value
        static void apply(http1::Headers& headers, CredentialSpec const& spec, CredentialRecord const& record);

        // value apply() puts into spec.header
        static std::string header_value(CredentialSpec const& spec, CredentialRecord const& record);
    };
}

#endif
