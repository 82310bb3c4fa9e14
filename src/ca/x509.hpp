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

#ifndef SANDGATE_CA_X509_HPP
#define SANDGATE_CA_X509_HPP

#include <ctime>
#include <memory>
#include <stdexcept>
#include <string>

#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <openssl/evp.h>

namespace sg::ca {

    class ca_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    struct x509_free_t { void operator()(X509* p) const { X509_free(p); } };
    struct pkey_free_t { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
    struct ssl_ctx_free_t { void operator()(SSL_CTX* p) const { SSL_CTX_free(p); } };

    using X509_ptr = std::unique_ptr<X509, x509_free_t>;
    using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, pkey_free_t>;
    using SSL_CTX_ptr = std::unique_ptr<SSL_CTX, ssl_ctx_free_t>;

    namespace x509 {

        // collect and clear pending OpenSSL errors of this thread
        std::string last_error();

        // prime256v1 keypair, throws ca_error
        EVP_PKEY_ptr generate_ec_key();

        // new certificate with random 127-bit serial, subject/issuer left empty
        X509_ptr new_certificate(EVP_PKEY* pubkey, time_t not_before, time_t not_after);

        void add_name_entry(X509_NAME* name, const char* field, std::string const& value);

        // extension in openssl config syntax ("critical,CA:TRUE"), issuer may equal cert
        void add_ext(X509* cert, X509* issuer, int nid, std::string const& value);

        void sign(X509* cert, EVP_PKEY* key);

        time_t not_before(X509 const* cert);
        time_t not_after(X509 const* cert);

        std::string fingerprint_sha256(X509 const* cert);
        std::string subject_cn(X509 const* cert);

        std::string cert_to_pem(X509 const* cert);
        X509_ptr cert_from_pem(std::string const& pem);

        // key PEM, encrypted with AES-256-CBC when password is not empty
        std::string key_to_pem(EVP_PKEY* key, std::string const& password);
        EVP_PKEY_ptr key_from_pem(std::string const& pem, std::string const& password);

        bool key_matches(X509 const* cert, EVP_PKEY* key);
    }
}

#endif
