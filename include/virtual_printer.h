// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "certificate_service.h"
#include "ftps_server.h"
#include "local_address.h"
#include "ssdp_responder.h"

#include <memory>
#include <mutex>
#include <string>

namespace vprinter {

class Config;

/**
 * @brief Everything the three services need, resolved from the config file
 */
struct VirtualPrinterSettings {
    bool ssdp_enabled = true;
    bool ftps_enabled = true;

    /// Empty = autodetect
    std::string advertise_ip;

    SsdpSettings ssdp;
    FtpsSettings ftps; ///< cert_chain_path/key_path are filled in by start()
    CertificateOptions certificates;

    /**
     * @brief Build settings from a loaded config
     *
     * Invalid values (bad port, access code that is not 8 printable
     * characters, empty or non-alphanumeric serial, malformed IP) are logged
     * and replaced by the built-in defaults.
     */
    static VirtualPrinterSettings from_config(Config& config);
};

/**
 * @brief Runs the discovery responder and the FTPS upload server as one printer
 *
 * Certificates are prepared before FTPS starts. Failure of one service does
 * not stop the other: a certificate error only disables FTPS.
 *
 * @threading start(), stop() and regenerate_certificates() are serialized
 *            internally; the upload callback runs on FTPS session threads
 */
class VirtualPrinter {
  public:
    /**
     * @param address_provider Overrides address detection (tests); when null a
     *        StaticAddressProvider is used if settings.advertise_ip is set,
     *        InterfaceAddressProvider otherwise
     */
    VirtualPrinter(VirtualPrinterSettings settings, UploadCallback on_upload,
                   std::shared_ptr<LocalAddressProvider> address_provider = nullptr);
    ~VirtualPrinter();

    // Non-copyable, non-movable
    VirtualPrinter(const VirtualPrinter&) = delete;
    VirtualPrinter& operator=(const VirtualPrinter&) = delete;

    /**
     * @brief Start every enabled service
     * @return true if at least one service is running
     */
    bool start();

    void stop();

    /**
     * @brief Replace the certificate material and restart FTPS
     *
     * Open FTPS sessions are dropped. SSDP keeps running.
     *
     * @return false if generation or the FTPS restart failed
     */
    bool regenerate_certificates();

    bool is_ssdp_running() const;
    bool is_ftps_running() const;

    /// Bound ports (0 when the service is not running)
    uint16_t ssdp_port() const;
    uint16_t ftps_port() const;

    const CertificatePaths& certificate_paths() const {
        return cert_service_.paths();
    }

    const VirtualPrinterSettings& settings() const {
        return settings_;
    }

  private:
    /// Caller holds mutex_
    bool start_ftps();

    VirtualPrinterSettings settings_;
    UploadCallback on_upload_;
    std::shared_ptr<LocalAddressProvider> address_provider_;
    CertificateService cert_service_;

    mutable std::mutex mutex_;
    std::unique_ptr<SsdpResponder> ssdp_;
    std::unique_ptr<FtpsServer> ftps_;
};

/**
 * @brief Directory holding config, certificates and uploads
 *
 * @p override_dir when non-empty, else $XDG_DATA_HOME/vprinter
 * (~/.local/share/vprinter).
 */
std::string resolve_data_dir(const std::string& override_dir);

} // namespace vprinter
