// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ftp_channels.h"
#include "tls_socket.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <random>
#include <string>
#include <thread>

namespace vprinter {

/**
 * @brief FTP control channel over an established TLS socket
 *
 * Lines end at LF; a trailing CR is stripped. A line longer than
 * MAX_CONTROL_LINE is reported once as Overflow and the rest of it is
 * skipped up to the next LF.
 */
class TlsControlChannel : public ControlChannel {
  public:
    explicit TlsControlChannel(std::unique_ptr<TlsSocket> socket,
                               std::chrono::milliseconds write_timeout = std::chrono::seconds(30));

    IoStatus read_line(std::string& line, std::chrono::milliseconds timeout) override;
    IoStatus write_line(const std::string& line) override;
    std::string peer_address() const override;
    std::string local_address() const override;
    void interrupt() override;
    void close() override;

  private:
    std::unique_ptr<TlsSocket> socket_;
    std::chrono::milliseconds write_timeout_;
    std::string buffer_;
    bool discarding_ = false;
    std::string peer_;
    std::string local_;
};

class TlsDataConnection : public DataConnection {
  public:
    explicit TlsDataConnection(std::unique_ptr<TlsSocket> socket) : socket_(std::move(socket)) {}

    IoStatus read_chunk(uint8_t* buf, size_t len, size_t& received,
                        std::chrono::milliseconds timeout) override;
    IoStatus write_all(const std::string& data, std::chrono::milliseconds timeout) override;
    void close() override;

  private:
    std::unique_ptr<TlsSocket> socket_;
};

/**
 * @brief Passive listener that accepts and handshakes one TLS connection
 *
 * A background thread accepts eagerly, completes the TLS handshake and parks
 * the result until accept() collects it. Connections that fail the handshake
 * are dropped and accepting continues. The listening socket is closed once a
 * handshake succeeds or close() is called.
 */
class TlsPassiveListener : public PassiveListener {
  public:
    /**
     * @param listen_fd Bound and listening socket (ownership transferred)
     * @param port Port @p listen_fd is bound to
     */
    TlsPassiveListener(int listen_fd, uint16_t port, std::shared_ptr<TlsServerContext> context,
                       std::chrono::milliseconds handshake_timeout);
    ~TlsPassiveListener() override;

    uint16_t port() const override {
        return port_;
    }

    std::unique_ptr<DataConnection> accept(std::chrono::milliseconds timeout,
                                           IoStatus& status) override;
    void close() override;

  private:
    void accept_loop();

    int listen_fd_;
    uint16_t port_;
    std::shared_ptr<TlsServerContext> context_;
    std::chrono::milliseconds handshake_timeout_;

    std::atomic<bool> closing_{false};
    std::mutex mutex_;
    std::condition_variable ready_cv_;
    bool ready_ = false;
    int pending_fd_ = -1;
    std::unique_ptr<TlsSocket> accepted_;
    std::string error_;
    std::thread thread_;
};

/**
 * @brief Binds passive listeners on random ports in a fixed range
 */
class TlsPassiveListenerFactory : public PassiveListenerFactory {
  public:
    struct Options {
        std::string bind_address = "0.0.0.0";
        uint16_t port_min = 50000;
        uint16_t port_max = 60000;
        int bind_attempts = 16;
        std::chrono::milliseconds handshake_timeout{std::chrono::seconds(30)};
    };

    TlsPassiveListenerFactory(std::shared_ptr<TlsServerContext> context, Options options);

    std::unique_ptr<PassiveListener> open(std::string& error) override;

  private:
    std::shared_ptr<TlsServerContext> context_;
    Options options_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

} // namespace vprinter
