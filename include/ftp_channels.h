// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "io_status.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace vprinter {

/// Longest accepted control line (without CRLF)
constexpr size_t MAX_CONTROL_LINE = 4096;

/**
 * @brief Line-oriented FTP control connection
 *
 * Abstract so FtpSession can be driven by an in-memory script in tests;
 * production uses TlsControlChannel.
 */
class ControlChannel {
  public:
    virtual ~ControlChannel() = default;

    /**
     * @brief Read one command line without its CR/LF terminator
     *
     * @return Ok, Timeout (idle), Closed, Overflow (line too long, already
     *         discarded) or Error
     */
    virtual IoStatus read_line(std::string& line, std::chrono::milliseconds timeout) = 0;

    /// Send one reply line; CRLF is appended
    virtual IoStatus write_line(const std::string& line) = 0;

    /// Client address (used in logs and handed to the upload callback)
    virtual std::string peer_address() const = 0;

    /// Address the client connected to (advertised in PASV replies)
    virtual std::string local_address() const = 0;

    /// Unblock a pending read_line() from another thread
    virtual void interrupt() = 0;

    virtual void close() = 0;
};

/**
 * @brief One accepted passive-mode data connection
 */
class DataConnection {
  public:
    virtual ~DataConnection() = default;

    virtual IoStatus read_chunk(uint8_t* buf, size_t len, size_t& received,
                                std::chrono::milliseconds timeout) = 0;
    virtual IoStatus write_all(const std::string& data, std::chrono::milliseconds timeout) = 0;
    virtual void close() = 0;
};

/**
 * @brief Listener opened by PASV; serves at most one data connection
 *
 * The listener starts accepting as soon as it exists, so a client that
 * connects before STOR is picked up. close() releases the port, after which
 * connection attempts are refused.
 */
class PassiveListener {
  public:
    virtual ~PassiveListener() = default;

    virtual uint16_t port() const = 0;

    /**
     * @brief Wait for the single data connection
     *
     * @param timeout Maximum wait
     * @param status Output: Ok, Timeout, or Error (handshake/accept failed)
     * @return Connection on Ok, nullptr otherwise
     */
    virtual std::unique_ptr<DataConnection> accept(std::chrono::milliseconds timeout,
                                                   IoStatus& status) = 0;

    virtual void close() = 0;
};

/**
 * @brief Opens passive listeners on behalf of sessions
 *
 * Shared by all sessions of a server; implementations must be thread-safe.
 */
class PassiveListenerFactory {
  public:
    virtual ~PassiveListenerFactory() = default;

    /**
     * @param error Output: reason on failure
     * @return Listener, or nullptr if no port could be bound
     */
    virtual std::unique_ptr<PassiveListener> open(std::string& error) = 0;
};

} // namespace vprinter
