// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "local_address.h"

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace vprinter {

/**
 * @brief Fatal failure while creating or persisting certificate material
 *
 * The message carries the OpenSSL error queue (or the failing path).
 */
class CertificateError : public std::runtime_error {
  public:
    explicit CertificateError(const std::string& what) : std::runtime_error(what) {}
};

/// Host name placed in every leaf SAN list in addition to localhost/serial
constexpr const char* PRODUCT_HOSTNAME = "vprinter";

/// Subject CN of the generated root. Deliberately not the vendor's CA name.
constexpr const char* CA_COMMON_NAME = "Virtual Printer CA";

struct CertificateOptions {
    std::string cert_dir;      ///< Directory holding the four PEM files
    std::string serial_number; ///< Leaf CN, must match the SSDP USN
    std::string product_hostname = PRODUCT_HOSTNAME;

    /// Source of the IP placed in the SAN list (InterfaceAddressProvider when null)
    std::shared_ptr<LocalAddressProvider> address_provider;

    /// Time used for notBefore/notAfter (system clock when empty)
    std::function<std::chrono::system_clock::time_point()> clock;

    int ca_validity_days = 7300;   // 20 years
    int leaf_validity_days = 3650; // 10 years
    int key_bits = 2048;
};

/// Locations of the generated files
struct CertificatePaths {
    std::string ca_key;   ///< virtual_printer_ca.key (0600)
    std::string ca_cert;  ///< virtual_printer_ca.crt
    std::string leaf_key; ///< virtual_printer.key (0600)
    std::string chain;    ///< virtual_printer.crt: leaf followed by CA
};

/**
 * @brief Issues and persists the printer's CA + leaf certificate chain
 *
 * The leaf is signed by a locally generated root and carries the serial
 * number as its CN, so a slicer that pins the serial accepts the TLS
 * identity of both the FTPS control and data channels.
 *
 * Generation happens once; later calls reuse what is on disk so slicers that
 * already trust the material keep working across restarts.
 *
 * Not thread-safe. Owned and driven by the orchestrator.
 */
class CertificateService {
  public:
    explicit CertificateService(CertificateOptions options);

    /**
     * @brief Return existing material or generate it
     *
     * @return (certificate chain path, leaf key path)
     * @throws CertificateError on any crypto or I/O failure
     */
    std::pair<std::string, std::string> ensure_certificates();

    /**
     * @brief Unconditionally generate new CA and leaf material
     *
     * @return (certificate chain path, leaf key path)
     * @throws CertificateError on any crypto or I/O failure
     */
    std::pair<std::string, std::string> generate_certificates();

    /// Remove all four files so the next ensure_certificates() regenerates
    void delete_certificates();

    /// True when the chain and leaf key exist (ensure_certificates fast path)
    bool has_certificates() const;

    const CertificatePaths& paths() const {
        return paths_;
    }

    const CertificateOptions& options() const {
        return options_;
    }

  private:
    CertificateOptions options_;
    CertificatePaths paths_;
};

} // namespace vprinter
