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

#ifndef SANDGATE_CA_AUTHORITY_HPP
#define SANDGATE_CA_AUTHORITY_HPP

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <ca/x509.hpp>
#include <log/logan.hpp>

namespace sg::ca {

    // self-signed signing identity; immutable once published
    struct RootAuthority {
        EVP_PKEY_ptr key;
        X509_ptr cert;
        time_t not_before = 0;
        time_t not_after = 0;
        uint64_t generation = 0;
        std::string fingerprint;

        bool expired_at(time_t now) const { return now >= not_after; }
        time_t remaining(time_t now) const { return not_after - now; }
    };

    using authority_ptr = std::shared_ptr<RootAuthority const>;


    class AuthorityManager {
    public:
        struct options_t {
            std::string ca_dir;
            std::string name = "sandgate-ca";
            std::string common_name = "Sandgate Egress Root";
            std::string organization = "Sandgate";
            std::string key_password;

            time_t validity = 86400;
            time_t safety_margin = 7200;
            time_t backdate = 300;

            bool persist = true;
        };

        using clock_fn = std::function<time_t()>;

        explicit AuthorityManager(options_t opts, clock_fn clock = nullptr);

        AuthorityManager(AuthorityManager const&) = delete;
        AuthorityManager& operator=(AuthorityManager const&) = delete;

        // make sure an authority valid beyond the safety margin is active; rotates when needed.
        // Returns false when no usable authority exists (caller must refuse new tunnels).
        bool ensure_authority();

        // authority for new issuance, nullptr when none or when it has already expired
        authority_ptr active() const;

        // a leaf signed by 'generation' lives until 'leaf_not_after': keep the signer retained until then
        void note_issued(uint64_t generation, time_t leaf_not_after);

        // drop retired authorities whose last leaf is expired, returns number dropped
        std::size_t retire_expired();

        // retired authorities still kept in memory
        std::size_t retained_count() const;
        uint64_t rotations() const { return rotations_; }

        time_t now() const { return clock_(); }
        options_t const& options() const { return opts_; }

        std::string key_path() const;
        std::string cert_path() const;
        std::string export_path() const;

        static logan_lite& get_log() {
            static logan_lite l("ca.authority");
            return l;
        }

    private:
        authority_ptr load_from_disk(uint64_t generation);
        std::shared_ptr<RootAuthority> generate(uint64_t generation) const;
        void persist(RootAuthority const& ra) const;

        options_t opts_;
        clock_fn clock_;

        // published with atomic_load/atomic_store
        authority_ptr active_;

        std::mutex rotate_lock_;
        bool disk_checked_ = false;
        uint64_t last_generation_ = 0;
        std::atomic<uint64_t> rotations_ {0};

        // retired signers which may still have live leaves
        mutable std::mutex retained_lock_;
        std::map<uint64_t, authority_ptr> retired_;
        // latest leaf expiry per generation
        std::map<uint64_t, time_t> leaf_horizon_;
    };
}

#endif
