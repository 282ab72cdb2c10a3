// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ftp_session.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace vprinter {

/// Port real printers serve implicit FTPS on
constexpr uint16_t DEFAULT_FTPS_PORT = 990;

struct FtpsSettings {
    std::string bind_address = "0.0.0.0";
    uint16_t port = DEFAULT_FTPS_PORT; ///< 0 binds an ephemeral port (see bound_port())

    std::string upload_dir;
    std::string access_code;

    std::string cert_chain_path; ///< Leaf + CA PEM chain
    std::string key_path;        ///< Leaf private key

    std::chrono::milliseconds handshake_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds idle_timeout{std::chrono::minutes(5)};
    std::chrono::milliseconds data_connect_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds data_read_timeout{std::chrono::seconds(60)};

    std::string passive_bind_address = "0.0.0.0";
    uint16_t passive_port_min = 50000;
    uint16_t passive_port_max = 60000;
};

/**
 * @brief Implicit FTPS upload server
 *
 * TLS is negotiated the moment a TCP connection is accepted; there is no
 * plaintext phase and no AUTH TLS. Every connection gets its own thread and
 * FtpSession; sessions share nothing but the read-only TLS context.
 *
 * start() loads the certificate material and binds synchronously, so a
 * missing certificate or a port conflict is reported to the caller and the
 * rest of the process keeps running. stop() closes the listener and drops
 * in-flight sessions.
 *
 * @code
 * FtpsServer ftps(settings, [](const std::string& path, const std::string& ip) {
 *     spdlog::info("{} uploaded {}", ip, path);
 * });
 * ftps.start();
 * @endcode
 */
class FtpsServer {
  public:
    FtpsServer(FtpsSettings settings, UploadCallback on_upload);
    ~FtpsServer();

    // Non-copyable (owns sockets and threads)
    FtpsServer(const FtpsServer&) = delete;
    FtpsServer& operator=(const FtpsServer&) = delete;

    /**
     * @brief Build the TLS context, create the upload directory and listen
     *
     * @return false if certificates cannot be loaded or the port cannot be bound
     */
    bool start();

    /**
     * @brief Stop accepting and terminate all sessions
     *
     * Blocks until every session thread has exited. Safe to call repeatedly.
     */
    void stop();

    bool is_running() const;

    /// Actual listening port; 0 when stopped
    uint16_t bound_port() const;

    /// Sessions whose threads have not yet finished
    size_t active_sessions() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vprinter
