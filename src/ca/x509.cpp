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

#include <array>
#include <cstring>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>

#include <ca/x509.hpp>
#include <display.hpp>

namespace sg::ca::x509 {

    namespace {
        struct bio_free_t { void operator()(BIO* p) const { BIO_free(p); } };
        using BIO_ptr = std::unique_ptr<BIO, bio_free_t>;

        struct bn_free_t { void operator()(BIGNUM* p) const { BN_free(p); } };
        struct pkey_ctx_free_t { void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); } };
        struct ext_free_t { void operator()(X509_EXTENSION* p) const { X509_EXTENSION_free(p); } };

        std::string bio_to_string(BIO* bio) {
            char* data = nullptr;
            auto len = BIO_get_mem_data(bio, &data);
            if(len <= 0 or data == nullptr) return {};
            return std::string(data, static_cast<std::size_t>(len));
        }

        // never fall back to interactive prompt
        int pem_password_cb(char* buf, int size, int /* rwflag */, void* u) {
            auto const* pass = static_cast<std::string const*>(u);
            if(pass == nullptr or pass->empty()) return 0;

            auto len = static_cast<int>(pass->size());
            if(len > size) return 0;

            std::memcpy(buf, pass->data(), static_cast<std::size_t>(len));
            return len;
        }

        time_t asn1_to_time(ASN1_TIME const* t) {
            if(t == nullptr) return 0;

            struct tm tm_{};
            if(ASN1_TIME_to_tm(t, &tm_) != 1) return 0;

            return ::timegm(&tm_);
        }
    }


    std::string last_error() {
        std::string ret;

        for(unsigned long e = ERR_get_error(); e != 0; e = ERR_get_error()) {
            std::array<char, 256> buf{};
            ERR_error_string_n(e, buf.data(), buf.size());

            if(not ret.empty()) ret += "; ";
            ret += buf.data();
        }

        if(ret.empty()) ret = "unknown openssl error";
        return ret;
    }

    EVP_PKEY_ptr generate_ec_key() {
        std::unique_ptr<EVP_PKEY_CTX, pkey_ctx_free_t> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
        if(not ctx) {
            throw ca_error("cannot create key context: " + last_error());
        }

        if(EVP_PKEY_keygen_init(ctx.get()) <= 0 or
           EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_X9_62_prime256v1) <= 0) {
            throw ca_error("cannot initialize EC key generation: " + last_error());
        }

        EVP_PKEY* raw = nullptr;
        if(EVP_PKEY_keygen(ctx.get(), &raw) <= 0 or raw == nullptr) {
            throw ca_error("EC key generation failed: " + last_error());
        }

        return EVP_PKEY_ptr(raw);
    }

    X509_ptr new_certificate(EVP_PKEY* pubkey, time_t not_before, time_t not_after) {
        X509_ptr cert(X509_new());
        if(not cert) {
            throw ca_error("cannot allocate certificate: " + last_error());
        }

        if(X509_set_version(cert.get(), 2) != 1) {
            throw ca_error("cannot set certificate version: " + last_error());
        }

        std::unique_ptr<BIGNUM, bn_free_t> bn(BN_new());
        if(not bn or BN_rand(bn.get(), 127, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) != 1 or
           BN_to_ASN1_INTEGER(bn.get(), X509_get_serialNumber(cert.get())) == nullptr) {
            throw ca_error("cannot set certificate serial: " + last_error());
        }

        if(ASN1_TIME_set(X509_getm_notBefore(cert.get()), not_before) == nullptr or
           ASN1_TIME_set(X509_getm_notAfter(cert.get()), not_after) == nullptr) {
            throw ca_error("cannot set certificate validity: " + last_error());
        }

        if(X509_set_pubkey(cert.get(), pubkey) != 1) {
            throw ca_error("cannot set certificate public key: " + last_error());
        }

        return cert;
    }

    void add_name_entry(X509_NAME* name, const char* field, std::string const& value) {
        if(value.empty()) return;

        if(X509_NAME_add_entry_by_txt(name, field, MBSTRING_UTF8,
                                      reinterpret_cast<unsigned char const*>(value.c_str()), -1, -1, 0) != 1) {
            throw ca_error(string_format("cannot set name entry %s: %s", field, last_error().c_str()));
        }
    }

    void add_ext(X509* cert, X509* issuer, int nid, std::string const& value) {
        X509V3_CTX ctx;
        X509V3_set_ctx_nodb(&ctx);
        X509V3_set_ctx(&ctx, issuer, cert, nullptr, nullptr, 0);

        std::unique_ptr<X509_EXTENSION, ext_free_t> ex(X509V3_EXT_nconf_nid(nullptr, &ctx, nid, value.c_str()));
        if(not ex) {
            throw ca_error(string_format("cannot create extension %s=%s: %s",
                                         OBJ_nid2sn(nid), value.c_str(), last_error().c_str()));
        }

        if(X509_add_ext(cert, ex.get(), -1) != 1) {
            throw ca_error(string_format("cannot add extension %s: %s", OBJ_nid2sn(nid), last_error().c_str()));
        }
    }

    void sign(X509* cert, EVP_PKEY* key) {
        if(X509_sign(cert, key, EVP_sha256()) <= 0) {
            throw ca_error("certificate signing failed: " + last_error());
        }
    }

    time_t not_before(X509 const* cert) {
        return asn1_to_time(X509_get0_notBefore(cert));
    }

    time_t not_after(X509 const* cert) {
        return asn1_to_time(X509_get0_notAfter(cert));
    }

    std::string fingerprint_sha256(X509 const* cert) {
        std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
        unsigned int len = 0;

        if(X509_digest(cert, EVP_sha256(), md.data(), &len) != 1) {
            return {};
        }

        std::string ret;
        for(unsigned int i = 0; i < len; ++i) {
            if(i > 0) ret += ':';
            ret += string_format("%02X", md[i]);
        }
        return ret;
    }

    std::string subject_cn(X509 const* cert) {
        auto* name = X509_get_subject_name(cert);
        if(name == nullptr) return {};

        auto idx = X509_NAME_get_index_by_NID(name, NID_commonName, -1);
        if(idx < 0) return {};

        auto* data = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(name, idx));
        unsigned char* utf8 = nullptr;
        auto len = ASN1_STRING_to_UTF8(&utf8, data);
        if(len < 0 or utf8 == nullptr) return {};

        std::string ret(reinterpret_cast<char*>(utf8), static_cast<std::size_t>(len));
        OPENSSL_free(utf8);
        return ret;
    }

    std::string cert_to_pem(X509 const* cert) {
        BIO_ptr bio(BIO_new(BIO_s_mem()));
        if(not bio or PEM_write_bio_X509(bio.get(), const_cast<X509*>(cert)) != 1) {
            throw ca_error("cannot serialize certificate: " + last_error());
        }
        return bio_to_string(bio.get());
    }

    X509_ptr cert_from_pem(std::string const& pem) {
        BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
        if(not bio) return nullptr;

        X509_ptr ret(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
        if(not ret) {
            ERR_clear_error();
        }
        return ret;
    }

    std::string key_to_pem(EVP_PKEY* key, std::string const& password) {
        BIO_ptr bio(BIO_new(BIO_s_mem()));
        if(not bio) {
            throw ca_error("cannot allocate buffer: " + last_error());
        }

        EVP_CIPHER const* cipher = password.empty() ? nullptr : EVP_aes_256_cbc();

        auto* pass = password.empty() ? nullptr
                : const_cast<unsigned char*>(reinterpret_cast<unsigned char const*>(password.data()));

        if(PEM_write_bio_PrivateKey(bio.get(), key, cipher, pass, static_cast<int>(password.size()), nullptr, nullptr) != 1) {
            throw ca_error("cannot serialize private key: " + last_error());
        }

        return bio_to_string(bio.get());
    }

    EVP_PKEY_ptr key_from_pem(std::string const& pem, std::string const& password) {
        BIO_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
        if(not bio) return nullptr;

        EVP_PKEY_ptr ret(PEM_read_bio_PrivateKey(bio.get(), nullptr, pem_password_cb,
                                                 const_cast<std::string*>(&password)));
        if(not ret) {
            ERR_clear_error();
        }
        return ret;
    }

    bool key_matches(X509 const* cert, EVP_PKEY* key) {
        auto ret = X509_check_private_key(const_cast<X509*>(cert), key) == 1;
        if(not ret) ERR_clear_error();
        return ret;
    }
}
