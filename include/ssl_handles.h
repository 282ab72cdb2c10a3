// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <memory>
#include <string>

namespace vprinter {

// RAII owners for OpenSSL objects. Every OpenSSL allocation in the project
// goes through one of these so error paths never leak.

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* p) const {
        EVP_PKEY_free(p);
    }
};
struct EvpPkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* p) const {
        EVP_PKEY_CTX_free(p);
    }
};
struct X509Deleter {
    void operator()(X509* p) const {
        X509_free(p);
    }
};
struct X509ExtensionDeleter {
    void operator()(X509_EXTENSION* p) const {
        X509_EXTENSION_free(p);
    }
};
struct BioDeleter {
    void operator()(BIO* p) const {
        BIO_free_all(p);
    }
};
struct BignumDeleter {
    void operator()(BIGNUM* p) const {
        BN_free(p);
    }
};
struct SslCtxDeleter {
    void operator()(SSL_CTX* p) const {
        SSL_CTX_free(p);
    }
};
struct SslDeleter {
    void operator()(SSL* p) const {
        SSL_free(p);
    }
};

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using X509ExtensionPtr = std::unique_ptr<X509_EXTENSION, X509ExtensionDeleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;
using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxDeleter>;
using SslPtr = std::unique_ptr<SSL, SslDeleter>;

/**
 * @brief Drain the OpenSSL error queue into a single string
 *
 * @param context Prefix naming the failed call (e.g., "X509_sign")
 * @return "context: err1; err2" or just context when the queue is empty
 */
inline std::string openssl_error_string(const std::string& context) {
    std::string result = context;
    bool first = true;
    unsigned long code;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        result += first ? ": " : "; ";
        result += buf;
        first = false;
    }
    return result;
}

} // namespace vprinter
