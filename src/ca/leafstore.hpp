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

#ifndef SANDGATE_CA_LEAFSTORE_HPP
#define SANDGATE_CA_LEAFSTORE_HPP

#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <ca/authority.hpp>

namespace sg::ca {

    class leaf_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // per-host server identity, read-only after creation
    struct LeafCertificateEntry {
        std::string host;
        X509_ptr cert;
        EVP_PKEY_ptr key;
        time_t not_after = 0;
        uint64_t generation = 0;

        // keeps the signer alive as long as this leaf is referenced
        authority_ptr issuer;

        // server context with leaf, issuer chain, ALPN and SNI check
        SSL_CTX_ptr ctx;

        bool usable(time_t now, uint64_t active_generation) const {
            return now < not_after and generation == active_generation;
        }
    };

    using leaf_ptr = std::shared_ptr<LeafCertificateEntry const>;


    class LeafStore {
    public:
        struct options_t {
            time_t validity = 6 * 3600;
            std::size_t capacity = 1024;
        };

        LeafStore(AuthorityManager& authority, options_t opts) : authority_(authority), opts_(opts) {};

        LeafStore(LeafStore const&) = delete;
        LeafStore& operator=(LeafStore const&) = delete;

        // cached or newly issued leaf for host, throws leaf_error
        leaf_ptr get(std::string const& host);

        // cached entry regardless of validity, nullptr if none
        leaf_ptr peek(std::string const& host) const;

        // remove expired entries and entries of other generations, returns number removed
        std::size_t purge();

        std::size_t size() const;
        uint64_t issued_count() const { return issued_; }
        uint64_t failures() const { return failures_; }

        static logan_lite& get_log() {
            static logan_lite l("ca.leaf");
            return l;
        }

    private:
        using map_type = std::map<std::string, leaf_ptr>;

        leaf_ptr lookup(std::string const& host, time_t now, uint64_t generation) const;
        leaf_ptr issue(std::string const& host, authority_ptr const& signer);
        leaf_ptr issue_with_retry(std::string const& host);
        void publish(leaf_ptr const& entry);

        AuthorityManager& authority_;
        options_t opts_;

        // copy-on-write snapshot, readers use atomic_load only
        std::shared_ptr<map_type const> entries_ = std::make_shared<map_type const>();
        std::mutex write_lock_;

        // single-flight issuance per host
        std::mutex inflight_lock_;
        std::unordered_map<std::string, std::shared_future<leaf_ptr>> inflight_;

        std::atomic<uint64_t> issued_ {0};
        std::atomic<uint64_t> failures_ {0};
    };
}

#endif
