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

#include <algorithm>
#include <array>
#include <vector>

#include <ca/leafstore.hpp>
#include <utils/str.hpp>

#include <display.hpp>

namespace sg::ca {

    namespace {

        unsigned char const alpn_http11[] = { 8, 'h','t','t','p','/','1','.','1' };

        // only http/1.1 is relayed; anything else continues without ALPN
        int alpn_select_cb(SSL* /* ssl */, unsigned char const** out, unsigned char* outlen,
                           unsigned char const* in, unsigned int inlen, void* /* arg */) {

            unsigned char* selected = nullptr;
            unsigned char selected_len = 0;

            if(SSL_select_next_proto(&selected, &selected_len, alpn_http11, sizeof(alpn_http11), in, inlen)
                    == OPENSSL_NPN_NEGOTIATED) {
                *out = selected;
                *outlen = selected_len;
                return SSL_TLSEXT_ERR_OK;
            }

            return SSL_TLSEXT_ERR_NOACK;
        }

        // client announcing a different name than the tunnel target is refused
        int sni_check_cb(SSL* ssl, int* al, void* arg) {
            auto const* expected = static_cast<std::string const*>(arg);
            auto const* sni = SSL_get_servername(ssl, TLSEXT_NAMETYPE_host_name);

            if(sni == nullptr or expected == nullptr) {
                return SSL_TLSEXT_ERR_OK;
            }

            std::string_view name(sni);
            if(not name.empty() and name.back() == '.') name.remove_suffix(1);

            if(str::iequals(name, *expected)) {
                return SSL_TLSEXT_ERR_OK;
            }

            auto const& log = LeafStore::get_log();
            _war("SNI '%s' does not match tunnel host '%s': handshake aborted",
                 str::printable(name).c_str(), expected->c_str());

            *al = SSL_AD_UNRECOGNIZED_NAME;
            return SSL_TLSEXT_ERR_ALERT_FATAL;
        }

        bool is_ip_address(std::string const& host) {
            std::array<unsigned char, 16> buf{};
            return inet_pton(AF_INET, host.c_str(), buf.data()) == 1 or inet_pton(AF_INET6, host.c_str(), buf.data()) == 1;
        }

        bool safe_dns_name(std::string const& host) {
            return not host.empty() and std::all_of(host.begin(), host.end(), [](char c) {
                return (c >= 'a' and c <= 'z') or (c >= '0' and c <= '9') or c == '-' or c == '.' or c == '_';
            });
        }
    }


    leaf_ptr LeafStore::lookup(std::string const& host, time_t now, uint64_t generation) const {
        auto snap = std::atomic_load(&entries_);

        if(auto it = snap->find(host); it != snap->end() and it->second->usable(now, generation)) {
            return it->second;
        }
        return nullptr;
    }

    leaf_ptr LeafStore::peek(std::string const& host) const {
        auto snap = std::atomic_load(&entries_);

        if(auto it = snap->find(str::to_lower(host)); it != snap->end()) {
            return it->second;
        }
        return nullptr;
    }

    std::size_t LeafStore::size() const {
        return std::atomic_load(&entries_)->size();
    }


    leaf_ptr LeafStore::get(std::string const& requested) {
        auto const& log = get_log();
        auto const host = str::to_lower(requested);

        auto signer = authority_.active();
        if(not signer) {
            throw leaf_error("no active authority");
        }

        if(auto hit = lookup(host, authority_.now(), signer->generation)) {
            _deb("get: cache hit for '%s'", host.c_str());
            return hit;
        }

        std::promise<leaf_ptr> promise;
        std::shared_future<leaf_ptr> pending;
        bool leader = false;
        {
            auto l_ = std::scoped_lock(inflight_lock_);

            // published while we were waiting for the lock
            if(auto hit = lookup(host, authority_.now(), signer->generation)) {
                return hit;
            }

            if(auto it = inflight_.find(host); it != inflight_.end()) {
                pending = it->second;
            } else {
                pending = promise.get_future().share();
                inflight_.emplace(host, pending);
                leader = true;
            }
        }

        if(not leader) {
            _deb("get: waiting for issuance of '%s' in progress", host.c_str());
            return pending.get();
        }

        auto finish = [this, &host]() {
            auto l_ = std::scoped_lock(inflight_lock_);
            inflight_.erase(host);
        };

        try {
            auto entry = issue_with_retry(host);
            publish(entry);
            promise.set_value(entry);
            finish();

            return entry;
        }
        catch(std::exception const&) {
            promise.set_exception(std::current_exception());
            finish();

            throw;
        }
    }

    leaf_ptr LeafStore::issue_with_retry(std::string const& host) {
        auto const& log = get_log();

        std::string reason;
        for(int attempt = 1; attempt <= 2; ++attempt) {

            auto signer = authority_.active();
            if(not signer) {
                throw leaf_error("no active authority");
            }

            try {
                return issue(host, signer);
            }
            catch(ca_error const& e) {
                ++failures_;
                reason = e.what();
                _war("issuance for '%s' failed (attempt %d): %s", host.c_str(), attempt, e.what());
            }
        }

        _err("issuance for '%s' failed: %s", host.c_str(), reason.c_str());
        throw leaf_error(string_format("cannot issue certificate for '%s': %s", host.c_str(), reason.c_str()));
    }

    leaf_ptr LeafStore::issue(std::string const& host, authority_ptr const& signer) {
        auto const& log = get_log();

        bool const ip = is_ip_address(host);
        if(not ip and not safe_dns_name(host)) {
            throw ca_error(string_format("refusing to issue for name '%s'", str::printable(host).c_str()));
        }

        auto const now = authority_.now();
        auto not_before = std::max(now - authority_.options().backdate, signer->not_before);
        auto not_after = std::min(now + opts_.validity, signer->not_after);

        if(not_after <= now) {
            throw ca_error("signing authority has no remaining lifetime");
        }

        auto entry = std::make_shared<LeafCertificateEntry>();
        entry->host = host;
        entry->generation = signer->generation;
        entry->issuer = signer;
        entry->not_after = not_after;
        entry->key = x509::generate_ec_key();
        entry->cert = x509::new_certificate(entry->key.get(), not_before, not_after);

        auto* c = entry->cert.get();
        auto* issuer = signer->cert.get();

        // CN is limited to 64 characters, SAN carries the name anyway
        if(host.size() <= 64) {
            x509::add_name_entry(X509_get_subject_name(c), "CN", host);
        }
        if(X509_set_issuer_name(c, X509_get_subject_name(issuer)) != 1) {
            throw ca_error("cannot set issuer name: " + x509::last_error());
        }

        x509::add_ext(c, issuer, NID_basic_constraints, "critical,CA:FALSE");
        x509::add_ext(c, issuer, NID_key_usage, "critical,digitalSignature");
        x509::add_ext(c, issuer, NID_ext_key_usage, "serverAuth");
        x509::add_ext(c, issuer, NID_subject_alt_name, (ip ? "IP:" : "DNS:") + host);
        x509::add_ext(c, issuer, NID_subject_key_identifier, "hash");
        x509::add_ext(c, issuer, NID_authority_key_identifier, "keyid:always");

        x509::sign(c, signer->key.get());

        SSL_CTX_ptr ctx(SSL_CTX_new(TLS_server_method()));
        if(not ctx) {
            throw ca_error("cannot create server context: " + x509::last_error());
        }

        SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);
        SSL_CTX_set_options(ctx.get(), SSL_OP_NO_COMPRESSION | SSL_OP_NO_RENEGOTIATION);
        SSL_CTX_set_session_cache_mode(ctx.get(), SSL_SESS_CACHE_OFF);

        if(SSL_CTX_use_certificate(ctx.get(), c) != 1 or
           SSL_CTX_use_PrivateKey(ctx.get(), entry->key.get()) != 1 or
           SSL_CTX_check_private_key(ctx.get()) != 1 or
           SSL_CTX_add1_chain_cert(ctx.get(), issuer) != 1) {
            throw ca_error("cannot load leaf into server context: " + x509::last_error());
        }

        SSL_CTX_set_alpn_select_cb(ctx.get(), alpn_select_cb, nullptr);
        SSL_CTX_set_tlsext_servername_callback(ctx.get(), sni_check_cb);
        SSL_CTX_set_tlsext_servername_arg(ctx.get(), &entry->host);

        entry->ctx = std::move(ctx);

        authority_.note_issued(entry->generation, entry->not_after);
        ++issued_;

        _dia("issued leaf for '%s' under generation %lu, valid until %s",
             host.c_str(), static_cast<unsigned long>(entry->generation), str::format_iso8601(not_after).c_str());

        return entry;
    }

    void LeafStore::publish(leaf_ptr const& entry) {
        auto const& log = get_log();
        auto l_ = std::scoped_lock(write_lock_);

        auto next = std::make_shared<map_type>(*std::atomic_load(&entries_));
        (*next)[entry->host] = entry;

        if(next->size() > opts_.capacity) {
            std::vector<std::pair<time_t, std::string>> order;
            for(auto const& [h, e]: *next) {
                if(h != entry->host) order.emplace_back(e->not_after, h);
            }
            std::sort(order.begin(), order.end());

            for(auto const& [exp, h]: order) {
                if(next->size() <= opts_.capacity) break;

                _deb("publish: evicting '%s'", h.c_str());
                next->erase(h);
            }
        }

        std::atomic_store(&entries_, std::shared_ptr<map_type const>(std::move(next)));
    }

    std::size_t LeafStore::purge() {
        auto const& log = get_log();

        auto signer = authority_.active();
        auto const generation = signer ? signer->generation : 0;
        auto const now = authority_.now();

        auto l_ = std::scoped_lock(write_lock_);

        auto cur = std::atomic_load(&entries_);
        auto next = std::make_shared<map_type>();

        for(auto const& [h, e]: *cur) {
            if(e->usable(now, generation)) {
                next->emplace(h, e);
            }
        }

        auto removed = cur->size() - next->size();
        if(removed > 0) {
            _dia("purge: %zu stale entries removed, %zu kept", removed, next->size());
            std::atomic_store(&entries_, std::shared_ptr<map_type const>(std::move(next)));
        }

        return removed;
    }
}
