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

#include <openssl/crypto.h>

#include <ca/authority.hpp>
#include <utils/fs.hpp>
#include <utils/str.hpp>

#include <log/logger.hpp>
#include <display.hpp>

namespace sg::ca {

    AuthorityManager::AuthorityManager(options_t opts, clock_fn clock) : opts_(std::move(opts)), clock_(std::move(clock)) {
        if(not clock_) {
            clock_ = []() { return ::time(nullptr); };
        }

        auto const& log = get_log();
        if(opts_.validity <= opts_.safety_margin) {
            _war("authority validity %lds does not exceed safety margin %lds: every check will rotate",
                 static_cast<long>(opts_.validity), static_cast<long>(opts_.safety_margin));
        }
    }

    std::string AuthorityManager::key_path() const {
        return opts_.ca_dir + "/" + opts_.name + ".key";
    }

    std::string AuthorityManager::cert_path() const {
        return opts_.ca_dir + "/" + opts_.name + ".pem";
    }

    std::string AuthorityManager::export_path() const {
        return opts_.ca_dir + "/" + opts_.name + ".crt";
    }


    authority_ptr AuthorityManager::active() const {
        auto cur = std::atomic_load(&active_);
        if(not cur or cur->expired_at(now())) {
            return nullptr;
        }
        return cur;
    }

    void AuthorityManager::note_issued(uint64_t generation, time_t leaf_not_after) {
        auto l_ = std::scoped_lock(retained_lock_);

        auto& horizon = leaf_horizon_[generation];
        if(leaf_not_after > horizon) {
            horizon = leaf_not_after;
        }
    }

    std::size_t AuthorityManager::retire_expired() {
        auto const& log = get_log();
        auto const now_ = now();

        auto l_ = std::scoped_lock(retained_lock_);

        std::size_t dropped = 0;
        for(auto it = retired_.begin(); it != retired_.end(); ) {

            auto horizon = leaf_horizon_.find(it->first);
            auto last_leaf = horizon != leaf_horizon_.end() ? horizon->second : 0;

            if(now_ >= last_leaf or it->second->expired_at(now_)) {
                _not("authority generation %lu released, fingerprint %s",
                     static_cast<unsigned long>(it->first), it->second->fingerprint.c_str());

                if(horizon != leaf_horizon_.end()) leaf_horizon_.erase(horizon);
                it = retired_.erase(it);
                ++dropped;
            }
            else {
                ++it;
            }
        }

        return dropped;
    }

    std::size_t AuthorityManager::retained_count() const {
        auto l_ = std::scoped_lock(retained_lock_);
        return retired_.size();
    }


    bool AuthorityManager::ensure_authority() {
        auto const& log = get_log();
        auto l_ = std::scoped_lock(rotate_lock_);

        auto const now_ = now();
        auto cur = std::atomic_load(&active_);

        if(not cur and not disk_checked_ and opts_.persist) {
            disk_checked_ = true;
            cur = load_from_disk(last_generation_ + 1);

            if(cur) {
                last_generation_ = cur->generation;
                std::atomic_store(&active_, cur);
                Log::get()->events().insert(NOT, "authority loaded from %s, valid until %s",
                                            cert_path().c_str(), str::format_iso8601(cur->not_after).c_str());
            }
        }

        if(cur and cur->remaining(now_) > opts_.safety_margin) {
            _deb("ensure_authority: generation %lu valid for %lds",
                 static_cast<unsigned long>(cur->generation), static_cast<long>(cur->remaining(now_)));
            return true;
        }

        if(cur) {
            _not("authority generation %lu expires in %lds (margin %lds): rotating",
                 static_cast<unsigned long>(cur->generation), static_cast<long>(cur->remaining(now_)),
                 static_cast<long>(opts_.safety_margin));
        }

        try {
            auto fresh = generate(last_generation_ + 1);

            if(opts_.persist) {
                persist(*fresh);
            }

            last_generation_ = fresh->generation;

            if(cur) {
                auto lr_ = std::scoped_lock(retained_lock_);
                retired_[cur->generation] = cur;
            }

            std::atomic_store(&active_, authority_ptr(fresh));
            ++rotations_;

            Log::get()->events().insert(NOT, "authority generation %lu active, valid until %s",
                                        static_cast<unsigned long>(fresh->generation),
                                        str::format_iso8601(fresh->not_after).c_str());
            _not("authority generation %lu active: fingerprint %s, valid until %s",
                 static_cast<unsigned long>(fresh->generation), fresh->fingerprint.c_str(),
                 str::format_iso8601(fresh->not_after).c_str());

            return true;
        }
        catch(ca_error const& e) {
            _err("authority rotation failed: %s", e.what());
            Log::get()->events().insert(ERR, "authority rotation failed: %s", e.what());
        }

        // rotation failed; keep serving only while the current one has not expired
        auto still = active();
        if(still) {
            _war("continuing with authority generation %lu for %lds",
                 static_cast<unsigned long>(still->generation), static_cast<long>(still->remaining(now_)));
            return true;
        }

        _cri("no valid authority available: new tunnels are refused");
        return false;
    }


    authority_ptr AuthorityManager::load_from_disk(uint64_t generation) {
        auto const& log = get_log();

        if(not fs::is_file(key_path()) or not fs::is_file(cert_path())) {
            _dia("load_from_disk: no authority files in '%s'", opts_.ca_dir.c_str());
            return nullptr;
        }

        if(auto mode = fs::file_mode(key_path()); mode and (*mode & 077) != 0) {
            _war("load_from_disk: key file '%s' has mode %04o, ignoring it", key_path().c_str(), *mode);
            return nullptr;
        }

        auto key_pem = fs::read_file(key_path(), 64 * 1024);
        auto cert_pem = fs::read_file(cert_path(), 64 * 1024);
        if(not key_pem or not cert_pem) {
            _war("load_from_disk: cannot read authority files");
            return nullptr;
        }

        auto ra = std::make_shared<RootAuthority>();
        ra->key = x509::key_from_pem(*key_pem, opts_.key_password);
        ra->cert = x509::cert_from_pem(*cert_pem);

        OPENSSL_cleanse(key_pem->data(), key_pem->size());

        if(not ra->key or not ra->cert) {
            _war("load_from_disk: cannot parse authority key or certificate (wrong password?)");
            return nullptr;
        }

        if(not x509::key_matches(ra->cert.get(), ra->key.get())) {
            _war("load_from_disk: authority key does not match certificate");
            return nullptr;
        }

        ra->not_before = x509::not_before(ra->cert.get());
        ra->not_after = x509::not_after(ra->cert.get());
        ra->generation = generation;
        ra->fingerprint = x509::fingerprint_sha256(ra->cert.get());

        auto const now_ = now();
        if(ra->remaining(now_) <= opts_.safety_margin) {
            _not("load_from_disk: stored authority expires in %lds, it will be replaced",
                 static_cast<long>(ra->remaining(now_)));
            return nullptr;
        }

        _dia("load_from_disk: reusing authority %s", ra->fingerprint.c_str());
        return ra;
    }

    std::shared_ptr<RootAuthority> AuthorityManager::generate(uint64_t generation) const {
        auto const& log = get_log();
        auto const now_ = now();

        auto ra = std::make_shared<RootAuthority>();
        ra->key = x509::generate_ec_key();
        ra->not_before = now_ - opts_.backdate;
        ra->not_after = now_ + opts_.validity;
        ra->generation = generation;

        ra->cert = x509::new_certificate(ra->key.get(), ra->not_before, ra->not_after);

        auto* name = X509_get_subject_name(ra->cert.get());
        x509::add_name_entry(name, "CN", opts_.common_name);
        x509::add_name_entry(name, "O", opts_.organization);
        x509::add_name_entry(name, "OU", "credential-injection");

        if(X509_set_issuer_name(ra->cert.get(), name) != 1) {
            throw ca_error("cannot set issuer name: " + x509::last_error());
        }

        auto* c = ra->cert.get();
        x509::add_ext(c, c, NID_basic_constraints, "critical,CA:TRUE,pathlen:0");
        x509::add_ext(c, c, NID_key_usage, "critical,keyCertSign,cRLSign");
        x509::add_ext(c, c, NID_subject_key_identifier, "hash");

        x509::sign(c, ra->key.get());
        ra->fingerprint = x509::fingerprint_sha256(c);

        _dia("generated authority generation %lu, fingerprint %s",
             static_cast<unsigned long>(generation), ra->fingerprint.c_str());
        return ra;
    }

    void AuthorityManager::persist(RootAuthority const& ra) const {
        if(not fs::make_dirs(opts_.ca_dir, 0755)) {
            throw ca_error(string_format("cannot create authority directory '%s'", opts_.ca_dir.c_str()));
        }

        auto key_pem = x509::key_to_pem(ra.key.get(), opts_.key_password);
        auto cert_pem = x509::cert_to_pem(ra.cert.get());

        auto key_ok = fs::write_file_atomic(key_path(), key_pem, 0600);
        OPENSSL_cleanse(key_pem.data(), key_pem.size());

        if(not key_ok) {
            throw ca_error(string_format("cannot write authority key '%s'", key_path().c_str()));
        }
        if(not fs::write_file_atomic(cert_path(), cert_pem, 0644)) {
            throw ca_error(string_format("cannot write authority certificate '%s'", cert_path().c_str()));
        }
        if(not fs::write_file_atomic(export_path(), cert_pem, 0644)) {
            throw ca_error(string_format("cannot write exported certificate '%s'", export_path().c_str()));
        }
    }
}
