// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file virtual_printer.cpp
 * @brief Wires certificates, SSDP and FTPS into one advertised printer
 *
 * @pattern Owner of independently failing services
 * @threading All lifecycle calls hold mutex_; services run their own threads
 */

#include "virtual_printer.h"

#include "config.h"
#include "utils/network_validation.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace vprinter {

namespace {

constexpr const char* DEFAULT_NAME = "Virtual Printer";
constexpr const char* DEFAULT_SERIAL = "00M09A391800001";
constexpr const char* DEFAULT_MODEL = "BL-P001";
constexpr const char* DEFAULT_ACCESS_CODE = "12345678";
constexpr int DEFAULT_ANNOUNCE_INTERVAL_SEC = 30;
constexpr int DEFAULT_IDLE_TIMEOUT_SEC = 300;

uint16_t port_or_default(Config& config, const std::string& ptr, uint16_t fallback) {
    int port = config.get<int>(ptr, fallback);
    if (!is_valid_port(port)) {
        spdlog::warn("[VirtualPrinter] {} = {} is not a valid port, using {}", ptr, port,
                     fallback);
        return fallback;
    }
    return static_cast<uint16_t>(port);
}

int positive_or_default(Config& config, const std::string& ptr, int fallback) {
    int value = config.get<int>(ptr, fallback);
    if (value <= 0) {
        spdlog::warn("[VirtualPrinter] {} = {} must be positive, using {}", ptr, value, fallback);
        return fallback;
    }
    return value;
}

std::shared_ptr<LocalAddressProvider>
choose_address_provider(const VirtualPrinterSettings& settings,
                        std::shared_ptr<LocalAddressProvider> provided) {
    if (provided) {
        return provided;
    }
    if (!settings.advertise_ip.empty()) {
        return std::make_shared<StaticAddressProvider>(settings.advertise_ip);
    }
    return std::make_shared<InterfaceAddressProvider>();
}

CertificateOptions with_provider(CertificateOptions options,
                                 std::shared_ptr<LocalAddressProvider> provider) {
    if (!options.address_provider) {
        options.address_provider = std::move(provider);
    }
    return options;
}

} // namespace

// ============================================================================
// VirtualPrinterSettings
// ============================================================================

VirtualPrinterSettings VirtualPrinterSettings::from_config(Config& config) {
    VirtualPrinterSettings s;

    std::string name = config.get<std::string>("/printer/name", DEFAULT_NAME);
    if (name.empty()) {
        spdlog::warn("[VirtualPrinter] Empty printer name, using '{}'", DEFAULT_NAME);
        name = DEFAULT_NAME;
    }

    std::string serial = config.get<std::string>("/printer/serial", DEFAULT_SERIAL);
    if (!is_valid_serial(serial)) {
        spdlog::warn("[VirtualPrinter] Invalid serial '{}', using {}", serial, DEFAULT_SERIAL);
        serial = DEFAULT_SERIAL;
    }

    std::string model = config.get<std::string>("/printer/model", DEFAULT_MODEL);
    if (model.empty()) {
        model = DEFAULT_MODEL;
    }

    std::string access_code = config.get<std::string>("/printer/access_code", DEFAULT_ACCESS_CODE);
    if (!is_valid_access_code(access_code)) {
        // Never log the rejected code itself
        spdlog::warn("[VirtualPrinter] Access code must be 8 printable characters, using default");
        access_code = DEFAULT_ACCESS_CODE;
    }

    std::string advertise_ip = config.get<std::string>("/printer/advertise_ip", "");
    if (!advertise_ip.empty() && !is_valid_ipv4(advertise_ip)) {
        spdlog::warn("[VirtualPrinter] Invalid advertise_ip '{}', autodetecting", advertise_ip);
        advertise_ip.clear();
    }
    s.advertise_ip = advertise_ip;

    std::string cert_dir = config.get<std::string>("/paths/cert_dir", "");
    std::string upload_dir = config.get<std::string>("/paths/upload_dir", "");
    if (cert_dir.empty()) {
        cert_dir = (fs::path(resolve_data_dir("")) / "certs").string();
    }
    if (upload_dir.empty()) {
        upload_dir = (fs::path(resolve_data_dir("")) / "uploads").string();
    }

    // SSDP
    s.ssdp_enabled = config.get<bool>("/ssdp/enabled", true);
    s.ssdp.identity.display_name = name;
    s.ssdp.identity.serial_number = serial;
    s.ssdp.identity.model_code = model;
    s.ssdp.advertise_ip = advertise_ip;
    s.ssdp.port = port_or_default(config, "/ssdp/port", ssdp::DEFAULT_PORT);
    s.ssdp.announce_interval = std::chrono::seconds(
        positive_or_default(config, "/ssdp/announce_interval_sec", DEFAULT_ANNOUNCE_INTERVAL_SEC));

    // FTPS
    s.ftps_enabled = config.get<bool>("/ftps/enabled", true);
    s.ftps.port = port_or_default(config, "/ftps/port", DEFAULT_FTPS_PORT);
    s.ftps.upload_dir = upload_dir;
    s.ftps.access_code = access_code;
    s.ftps.idle_timeout = std::chrono::seconds(
        positive_or_default(config, "/ftps/idle_timeout_sec", DEFAULT_IDLE_TIMEOUT_SEC));

    // Certificates
    s.certificates.cert_dir = cert_dir;
    s.certificates.serial_number = serial;

    return s;
}

// ============================================================================
// VirtualPrinter
// ============================================================================

VirtualPrinter::VirtualPrinter(VirtualPrinterSettings settings, UploadCallback on_upload,
                               std::shared_ptr<LocalAddressProvider> address_provider)
    : settings_(std::move(settings)), on_upload_(std::move(on_upload)),
      address_provider_(choose_address_provider(settings_, std::move(address_provider))),
      cert_service_(with_provider(settings_.certificates, address_provider_)) {}

VirtualPrinter::~VirtualPrinter() {
    if (ssdp_ || ftps_) {
        fprintf(stderr, "[VirtualPrinter] Destroyed while running, stopping\n");
    }
    stop();
}

bool VirtualPrinter::start() {
    std::lock_guard<std::mutex> lock(mutex_);

    spdlog::info("[VirtualPrinter] Starting '{}' ({}, serial {})",
                 settings_.ssdp.identity.display_name, settings_.ssdp.identity.model_code,
                 settings_.ssdp.identity.serial_number);

    if (settings_.ftps_enabled && !ftps_) {
        if (!start_ftps()) {
            spdlog::error("[VirtualPrinter] FTPS upload server not running");
        }
    }

    if (settings_.ssdp_enabled && !ssdp_) {
        auto responder = std::make_unique<SsdpResponder>(settings_.ssdp, address_provider_);
        if (responder->start()) {
            ssdp_ = std::move(responder);
        } else {
            spdlog::error("[VirtualPrinter] SSDP discovery not running");
        }
    }

    bool any = ssdp_ || ftps_;
    if (any) {
        spdlog::info("[VirtualPrinter] Running: ssdp={} ftps={}", ssdp_ ? "on" : "off",
                     ftps_ ? "on" : "off");
    } else {
        spdlog::error("[VirtualPrinter] No service could be started");
    }
    return any;
}

bool VirtualPrinter::start_ftps() {
    try {
        auto [chain, key] = cert_service_.ensure_certificates();
        settings_.ftps.cert_chain_path = chain;
        settings_.ftps.key_path = key;
    } catch (const CertificateError& e) {
        spdlog::error("[VirtualPrinter] Certificate setup failed: {}", e.what());
        return false;
    }

    auto server = std::make_unique<FtpsServer>(settings_.ftps, on_upload_);
    if (!server->start()) {
        return false;
    }
    ftps_ = std::move(server);
    return true;
}

void VirtualPrinter::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ssdp_ && !ftps_) {
        return;
    }

    if (ftps_) {
        ftps_->stop();
        ftps_.reset();
    }
    if (ssdp_) {
        ssdp_->stop();
        ssdp_.reset();
    }
    spdlog::info("[VirtualPrinter] Stopped");
}

bool VirtualPrinter::regenerate_certificates() {
    std::lock_guard<std::mutex> lock(mutex_);

    bool restart = ftps_ != nullptr;
    if (ftps_) {
        spdlog::info("[VirtualPrinter] Stopping FTPS for certificate regeneration");
        ftps_->stop();
        ftps_.reset();
    }

    cert_service_.delete_certificates();
    try {
        cert_service_.generate_certificates();
    } catch (const CertificateError& e) {
        spdlog::error("[VirtualPrinter] Certificate regeneration failed: {}", e.what());
        return false;
    }

    if (!restart) {
        return true;
    }
    if (!start_ftps()) {
        spdlog::error("[VirtualPrinter] FTPS did not come back after regeneration");
        return false;
    }
    return true;
}

bool VirtualPrinter::is_ssdp_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ssdp_ && ssdp_->is_running();
}

bool VirtualPrinter::is_ftps_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ftps_ && ftps_->is_running();
}

uint16_t VirtualPrinter::ssdp_port() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ssdp_ ? ssdp_->bound_port() : 0;
}

uint16_t VirtualPrinter::ftps_port() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ftps_ ? ftps_->bound_port() : 0;
}

std::string resolve_data_dir(const std::string& override_dir) {
    if (!override_dir.empty()) {
        return override_dir;
    }

    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/vprinter";
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/share/vprinter";
    }

    return "/tmp/vprinter";
}

} // namespace vprinter
