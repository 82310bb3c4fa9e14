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
#include <array>
#include <cmath>
#include <future>

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <nlohmann/json.hpp>

#include <cred/credentials.hpp>
#include <utils/str.hpp>

#include <display.hpp>

namespace sg::cred {

    CredentialRecord::CredentialRecord(std::string name, std::string secret, time_t expires_at, uint64_t generation,
                                       std::string token_type)
    : name_(std::move(name)), secret_(std::move(secret)), expires_at_(expires_at), generation_(generation),
      token_type_(std::move(token_type)) {}

    CredentialRecord::~CredentialRecord() {
        if(not secret_.empty()) {
            OPENSSL_cleanse(secret_.data(), secret_.size());
        }
    }

    std::string CredentialRecord::to_string() const {
        return string_format("CredentialRecord(name=%s, type=%s, expires=%s, generation=%lu, value=<%zu bytes>)",
                             name_.c_str(), token_type_.c_str(), str::format_iso8601(expires_at_).c_str(),
                             static_cast<unsigned long>(generation_), secret_.size());
    }


    namespace {
        void set_error(std::string* error, std::string const& what) {
            if(error) *error = what;
        }

        // 9999-12-31T23:59:59Z
        constexpr int64_t max_unix_time = 253402300799;

        std::optional<time_t> json_time(nlohmann::json const& v) {
            if(v.is_number_unsigned()) {
                auto u = v.get<uint64_t>();
                if(u > static_cast<uint64_t>(max_unix_time)) return std::nullopt;
                return static_cast<time_t>(u);
            }
            if(v.is_number_integer()) {
                auto i = v.get<int64_t>();
                if(i < 0 or i > max_unix_time) return std::nullopt;
                return static_cast<time_t>(i);
            }
            if(v.is_number_float()) {
                auto d = v.get<double>();
                if(not std::isfinite(d) or d < 0 or d > static_cast<double>(max_unix_time)) return std::nullopt;
                return static_cast<time_t>(d);
            }
            if(v.is_string()) {
                time_t t = 0;
                if(str::parse_iso8601(v.get<std::string>(), t)) return t;
            }
            return std::nullopt;
        }

        // token goes into a header line: no control characters, no surrounding whitespace
        bool header_safe(std::string const& token) {
            for(auto c: token) {
                auto uc = static_cast<unsigned char>(c);
                if(uc < 0x20 or uc == 0x7f) return false;
            }
            return not token.empty() and token.front() != ' ' and token.back() != ' ';
        }

        std::string content_digest(ParsedToken const& p) {
            std::string material = p.token + "|" + std::to_string(p.expires_at);

            std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
            unsigned int len = 0;
            EVP_Digest(material.data(), material.size(), md.data(), &len, EVP_sha256(), nullptr);
            OPENSSL_cleanse(material.data(), material.size());

            return std::string(reinterpret_cast<char const*>(md.data()), len);
        }
    }

    std::optional<ParsedToken> parse_token_file(std::string const& content, std::string* error) {

        auto j = nlohmann::json::parse(content, nullptr, false);
        if(j.is_discarded() or not j.is_object()) {
            set_error(error, "not a JSON object");
            return std::nullopt;
        }

        ParsedToken ret;

        auto tok = j.find("token");
        if(tok == j.end() or not tok->is_string() or tok->get<std::string>().empty()) {
            set_error(error, "missing 'token'");
            return std::nullopt;
        }
        ret.token = tok->get<std::string>();

        if(not header_safe(ret.token)) {
            OPENSSL_cleanse(ret.token.data(), ret.token.size());
            set_error(error, "'token' contains characters not allowed in a header");
            return std::nullopt;
        }

        std::optional<time_t> exp;
        if(auto it = j.find("expires_at_unix"); it != j.end()) {
            exp = json_time(*it);
        }
        else if(auto it2 = j.find("expires_at"); it2 != j.end()) {
            exp = json_time(*it2);
        }

        if(not exp) {
            OPENSSL_cleanse(ret.token.data(), ret.token.size());
            set_error(error, "missing or invalid 'expires_at'");
            return std::nullopt;
        }
        ret.expires_at = *exp;

        if(auto it = j.find("token_type"); it != j.end() and it->is_string()) {
            ret.token_type = it->get<std::string>();
        }
        if(auto it = j.find("generated_at"); it != j.end()) {
            ret.generated_at = json_time(*it);
        }

        // the parsed tree still holds a copy of the token
        if(auto& t = j["token"].get_ref<std::string&>(); not t.empty()) {
            OPENSSL_cleanse(t.data(), t.size());
        }

        return ret;
    }


    CredentialSource::CredentialSource(std::vector<CredentialSpec> specs, options_t opts, clock_fn clock)
    : opts_(opts), clock_(std::move(clock)) {

        if(not clock_) {
            clock_ = []() { return ::time(nullptr); };
        }

        for(auto& s: specs) {
            auto name = s.name;
            specs_.emplace(std::move(name), std::move(s));
        }
    }

    CredentialSpec const* CredentialSource::spec(std::string const& name) const {
        if(auto it = specs_.find(name); it != specs_.end()) {
            return &it->second;
        }
        return nullptr;
    }

    CredentialSource::stats_t CredentialSource::stats() const {
        auto l_ = std::scoped_lock(lock_);
        return stats_;
    }

    std::optional<std::string> CredentialSource::read_bounded(std::string const& path) {
        auto const& log = get_log();

        auto result = std::make_shared<std::promise<std::optional<std::string>>>();
        auto done = result->get_future();
        auto const max_size = opts_.max_file_size;

        bool queued = io_pool_.enqueue([path, max_size, result](std::atomic_bool const& stop_flag) {
            if(stop_flag) {
                result->set_value(std::nullopt);
                return;
            }
            result->set_value(fs::read_file(path, max_size));
        });

        if(not queued) {
            _err("read of '%s' not scheduled: pool is stopping", path.c_str());
            return std::nullopt;
        }

        if(done.wait_for(opts_.read_timeout) != std::future_status::ready) {
            _err("read of '%s' timed out after %ldms", path.c_str(), static_cast<long>(opts_.read_timeout.count()));

            auto l_ = std::scoped_lock(lock_);
            stats_.timeouts++;
            return std::nullopt;
        }

        return done.get();
    }

    credential_ptr CredentialSource::get(std::string const& name) {
        auto const& log = get_log();

        auto const* sp = spec(name);
        if(sp == nullptr) {
            _err("get: unknown credential '%s'", name.c_str());
            return nullptr;
        }

        auto const now = clock_();

        auto unavailable = [&]() -> credential_ptr {
            auto l_ = std::scoped_lock(lock_);
            stats_.unavailable++;
            cache_.erase(name);
            return nullptr;
        };

        {
            auto l_ = std::scoped_lock(lock_);

            if(auto it = cache_.find(name); it != cache_.end()) {
                auto const& e = it->second;

                if(e.record->expired_at(now, sp->expiry_margin)) {
                    _dia("get: cached '%s' expired", name.c_str());
                    cache_.erase(it);
                }
                else if(now - e.loaded_at < sp->cache_seconds) {
                    if(auto st = fs::stamp(sp->file); st and *st == e.stamp) {
                        stats_.cache_hits++;
                        return e.record;
                    }
                    _dia("get: '%s' changed on disk", sp->file.c_str());
                }
            }
        }

        auto stamp = fs::stamp(sp->file);
        auto content = read_bounded(sp->file);
        if(not content) {
            _err("get: credential '%s' not available: cannot read '%s'", name.c_str(), sp->file.c_str());
            return unavailable();
        }

        std::string err;
        auto parsed = parse_token_file(*content, &err);
        OPENSSL_cleanse(content->data(), content->size());

        if(not parsed) {
            _err("get: credential '%s' not available: %s", name.c_str(), err.c_str());
            return unavailable();
        }

        if(now + sp->expiry_margin >= parsed->expires_at) {
            OPENSSL_cleanse(parsed->token.data(), parsed->token.size());
            _war("get: credential '%s' expired at %s", name.c_str(), str::format_iso8601(parsed->expires_at).c_str());
            return unavailable();
        }

        auto digest = content_digest(*parsed);
        auto token_type = parsed->token_type.empty() ? std::string("Bearer") : parsed->token_type;

        auto l_ = std::scoped_lock(lock_);

        auto& gen = generation_[name];
        if(gen.first != digest) {
            gen.first = digest;
            gen.second++;
            _not("credential '%s' generation %lu, expires %s", name.c_str(),
                 static_cast<unsigned long>(gen.second), str::format_iso8601(parsed->expires_at).c_str());
        }

        auto rec = std::make_shared<CredentialRecord const>(name, std::move(parsed->token), parsed->expires_at,
                                                            gen.second, token_type);

        cache_[name] = cache_entry { rec, stamp.value_or(fs::FileStamp{}), now };
        stats_.reads++;

        return rec;
    }


    std::string Injector::header_value(CredentialSpec const& spec, CredentialRecord const& record) {
        if(spec.scheme.empty()) {
            return record.secret();
        }
        return spec.scheme + " " + record.secret();
    }

    void Injector::apply(http1::Headers& headers, CredentialSpec const& spec, CredentialRecord const& record) {
        headers.remove(spec.header);
        for(auto const& h: spec.strip) {
            headers.remove(h);
        }

        // the injected header must not be listed as hop-by-hop
        auto replaced = [&](std::string_view t) {
            if(str::iequals(t, spec.header)) return true;
            return std::any_of(spec.strip.begin(), spec.strip.end(), [&](auto const& h) { return str::iequals(t, h); });
        };

        std::vector<std::string> kept;
        bool dropped = false;
        for(auto const& v: headers.get_all("connection")) {
            for(auto& t: str::split_tokens(v, ',')) {
                if(replaced(t)) dropped = true;
                else kept.push_back(std::move(t));
            }
        }

        if(dropped) {
            headers.remove("connection");

            std::string value;
            for(auto const& t: kept) {
                if(not value.empty()) value += ", ";
                value += t;
            }
            if(not value.empty()) headers.add("Connection", value);
        }

        headers.add(spec.header, header_value(spec, record));
    }
}
