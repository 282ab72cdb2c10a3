// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file certificate_service.cpp
 * @brief RSA CA + leaf issuance with OpenSSL
 *
 * @pattern Every OpenSSL object held by a unique_ptr from ssl_handles.h
 * @gotchas SKI/AKI "hash"/"keyid" need the public key set before the extension
 *          is built, and AKI needs the issuer to already carry an SKI
 */

#include "certificate_service.h"

#include "ssl_handles.h"
#include "utils/network_validation.h"

#include <spdlog/spdlog.h>

#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace vprinter {

namespace {

EvpPkeyPtr generate_rsa_key(int bits) {
    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!ctx) {
        throw CertificateError(openssl_error_string("EVP_PKEY_CTX_new_id"));
    }
    if (EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        throw CertificateError(openssl_error_string("EVP_PKEY_keygen_init"));
    }
    if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0) {
        throw CertificateError(openssl_error_string("EVP_PKEY_CTX_set_rsa_keygen_bits"));
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
        throw CertificateError(openssl_error_string("EVP_PKEY_keygen"));
    }
    return EvpPkeyPtr(raw);
}

/// Fill version, random 64-bit serial, validity window, subject CN and public key
X509Ptr new_certificate(const std::string& common_name, EVP_PKEY* key, std::time_t now,
                        int validity_days) {
    X509Ptr cert(X509_new());
    if (!cert) {
        throw CertificateError(openssl_error_string("X509_new"));
    }

    // X.509 v3
    if (X509_set_version(cert.get(), 2) != 1) {
        throw CertificateError(openssl_error_string("X509_set_version"));
    }

    BignumPtr serial(BN_new());
    if (!serial || BN_rand(serial.get(), 64, BN_RAND_TOP_ONE, BN_RAND_BOTTOM_ANY) != 1 ||
        !BN_to_ASN1_INTEGER(serial.get(), X509_get_serialNumber(cert.get()))) {
        throw CertificateError(openssl_error_string("serial number"));
    }

    if (!ASN1_TIME_set(X509_getm_notBefore(cert.get()), now) ||
        !ASN1_TIME_adj(X509_getm_notAfter(cert.get()), now, validity_days, 0)) {
        throw CertificateError(openssl_error_string("validity"));
    }

    X509_NAME* name = X509_get_subject_name(cert.get());
    if (X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>(common_name.c_str()),
                                   -1, -1, 0) != 1) {
        throw CertificateError(openssl_error_string("subject CN"));
    }

    if (X509_set_pubkey(cert.get(), key) != 1) {
        throw CertificateError(openssl_error_string("X509_set_pubkey"));
    }
    return cert;
}

/**
 * @brief Add one extension in openssl.cnf syntax
 *
 * @param issuer Signing certificate (same as @p cert when self-signed)
 */
void add_extension(X509* cert, X509* issuer, int nid, const std::string& value) {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, issuer, cert, nullptr, nullptr, 0);

    X509ExtensionPtr ext(X509V3_EXT_conf_nid(nullptr, &ctx, nid, value.c_str()));
    if (!ext) {
        throw CertificateError(openssl_error_string(std::string("extension ") + OBJ_nid2sn(nid) +
                                                    "=" + value));
    }
    if (X509_add_ext(cert, ext.get(), -1) != 1) {
        throw CertificateError(openssl_error_string("X509_add_ext"));
    }
}

void sign(X509* cert, EVP_PKEY* key) {
    if (X509_sign(cert, key, EVP_sha256()) <= 0) {
        throw CertificateError(openssl_error_string("X509_sign"));
    }
}

std::string bio_to_string(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    return std::string(data, static_cast<size_t>(len));
}

std::string certificate_pem(X509* cert) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_X509(bio.get(), cert) != 1) {
        throw CertificateError(openssl_error_string("PEM_write_bio_X509"));
    }
    return bio_to_string(bio.get());
}

/// Traditional (PKCS#1 "BEGIN RSA PRIVATE KEY") form, unencrypted
std::string private_key_pem(EVP_PKEY* key) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PrivateKey_traditional(bio.get(), key, nullptr, nullptr, 0,
                                                     nullptr, nullptr) != 1) {
        throw CertificateError(openssl_error_string("PEM_write_bio_PrivateKey_traditional"));
    }
    return bio_to_string(bio.get());
}

void write_file(const std::string& path, const std::string& content, bool private_key) {
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw CertificateError("Cannot open " + path + " for writing");
        }
        out << content;
        out.flush();
        if (!out) {
            throw CertificateError("Failed writing " + path);
        }
    }

    if (private_key) {
        std::error_code ec;
        fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace, ec);
        if (ec) {
            throw CertificateError("Cannot restrict permissions on " + path + ": " +
                                   ec.message());
        }
    }
}

/// SAN entries in order, duplicates removed (the detected IP may be loopback)
std::string build_san(const std::string& serial, const std::string& hostname,
                      const std::string& local_ip) {
    std::vector<std::string> entries = {"DNS:localhost", "DNS:" + hostname, "DNS:" + serial};
    if (is_valid_ipv4(local_ip)) {
        entries.push_back("IP:" + local_ip);
    } else {
        spdlog::warn("[CertService] Ignoring invalid local address '{}'", local_ip);
    }
    entries.push_back("IP:127.0.0.1");

    std::string san;
    std::vector<std::string> seen;
    for (const auto& entry : entries) {
        if (std::find(seen.begin(), seen.end(), entry) != seen.end()) {
            continue;
        }
        seen.push_back(entry);
        if (!san.empty()) {
            san += ",";
        }
        san += entry;
    }
    return san;
}

} // namespace

CertificateService::CertificateService(CertificateOptions options) : options_(std::move(options)) {
    if (!options_.address_provider) {
        options_.address_provider = std::make_shared<InterfaceAddressProvider>();
    }
    if (!options_.clock) {
        options_.clock = [] { return std::chrono::system_clock::now(); };
    }

    fs::path dir(options_.cert_dir);
    paths_.ca_key = (dir / "virtual_printer_ca.key").string();
    paths_.ca_cert = (dir / "virtual_printer_ca.crt").string();
    paths_.leaf_key = (dir / "virtual_printer.key").string();
    paths_.chain = (dir / "virtual_printer.crt").string();
}

bool CertificateService::has_certificates() const {
    std::error_code ec;
    return fs::exists(paths_.chain, ec) && fs::exists(paths_.leaf_key, ec);
}

std::pair<std::string, std::string> CertificateService::ensure_certificates() {
    if (has_certificates()) {
        spdlog::debug("[CertService] Using existing certificates in {}", options_.cert_dir);
        return {paths_.chain, paths_.leaf_key};
    }
    return generate_certificates();
}

std::pair<std::string, std::string> CertificateService::generate_certificates() {
    spdlog::info("[CertService] Generating certificates for serial {}", options_.serial_number);

    if (options_.serial_number.empty()) {
        throw CertificateError("Serial number is required for the leaf certificate");
    }

    std::error_code ec;
    fs::create_directories(options_.cert_dir, ec);
    if (ec) {
        throw CertificateError("Cannot create " + options_.cert_dir + ": " + ec.message());
    }

    std::time_t now = std::chrono::system_clock::to_time_t(options_.clock());

    // Root authority: self-signed, may only sign the leaf
    EvpPkeyPtr ca_key = generate_rsa_key(options_.key_bits);
    X509Ptr ca_cert = new_certificate(CA_COMMON_NAME, ca_key.get(), now,
                                      options_.ca_validity_days);
    X509_set_issuer_name(ca_cert.get(), X509_get_subject_name(ca_cert.get()));
    add_extension(ca_cert.get(), ca_cert.get(), NID_basic_constraints,
                  "critical,CA:TRUE,pathlen:0");
    add_extension(ca_cert.get(), ca_cert.get(), NID_key_usage, "critical,keyCertSign,cRLSign");
    add_extension(ca_cert.get(), ca_cert.get(), NID_subject_key_identifier, "hash");
    sign(ca_cert.get(), ca_key.get());

    // Printer leaf: CN = serial, signed by the root
    std::string local_ip = options_.address_provider->local_ipv4();
    spdlog::info("[CertService] Leaf CN={}, local IP {}", options_.serial_number, local_ip);

    EvpPkeyPtr leaf_key = generate_rsa_key(options_.key_bits);
    X509Ptr leaf_cert = new_certificate(options_.serial_number, leaf_key.get(), now,
                                        options_.leaf_validity_days);
    X509_set_issuer_name(leaf_cert.get(), X509_get_subject_name(ca_cert.get()));
    add_extension(leaf_cert.get(), ca_cert.get(), NID_basic_constraints, "critical,CA:FALSE");
    add_extension(leaf_cert.get(), ca_cert.get(), NID_subject_alt_name,
                  build_san(options_.serial_number, options_.product_hostname, local_ip));
    add_extension(leaf_cert.get(), ca_cert.get(), NID_ext_key_usage, "serverAuth,clientAuth");
    add_extension(leaf_cert.get(), ca_cert.get(), NID_key_usage,
                  "critical,digitalSignature,keyEncipherment");
    add_extension(leaf_cert.get(), ca_cert.get(), NID_subject_key_identifier, "hash");
    add_extension(leaf_cert.get(), ca_cert.get(), NID_authority_key_identifier, "keyid:always");
    sign(leaf_cert.get(), ca_key.get());

    std::string ca_pem = certificate_pem(ca_cert.get());
    std::string chain_pem = certificate_pem(leaf_cert.get()) + ca_pem;

    // Chain last: its presence (with the leaf key) marks the set as complete
    write_file(paths_.ca_key, private_key_pem(ca_key.get()), true);
    write_file(paths_.ca_cert, ca_pem, false);
    write_file(paths_.leaf_key, private_key_pem(leaf_key.get()), true);
    write_file(paths_.chain, chain_pem, false);

    spdlog::info("[CertService] Generated certificate chain in {}", options_.cert_dir);
    spdlog::debug("[CertService]   CA: CN={}", CA_COMMON_NAME);
    spdlog::debug("[CertService]   Printer: CN={}", options_.serial_number);
    return {paths_.chain, paths_.leaf_key};
}

void CertificateService::delete_certificates() {
    for (const auto& path : {paths_.chain, paths_.leaf_key, paths_.ca_cert, paths_.ca_key}) {
        std::error_code ec;
        if (fs::remove(path, ec)) {
            spdlog::debug("[CertService] Removed {}", path);
        } else if (ec) {
            spdlog::warn("[CertService] Failed to remove {}: {}", path, ec.message());
        }
    }
    spdlog::info("[CertService] Deleted virtual printer certificates");
}

} // namespace vprinter
