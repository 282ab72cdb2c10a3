// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "io_status.h"
#include "ssl_handles.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace vprinter {

/**
 * @brief Server-side TLS context built from the certificate chain and key
 *
 * Shared (read-only) by the control listener and every passive data
 * listener, so data channels present the same identity as the control
 * channel. Minimum protocol version is pinned to TLS 1.2.
 */
class TlsServerContext {
  public:
    /**
     * @brief Load chain + key and build the context
     *
     * @param chain_path PEM file with leaf certificate followed by CA certificate
     * @param key_path PEM private key matching the leaf
     * @param error Output: reason on failure
     * @return Context, or nullptr on failure
     */
    static std::shared_ptr<TlsServerContext> create(const std::string& chain_path,
                                                    const std::string& key_path,
                                                    std::string& error);

    SSL_CTX* native() const {
        return ctx_.get();
    }

  private:
    explicit TlsServerContext(SslCtxPtr ctx) : ctx_(std::move(ctx)) {}

    SslCtxPtr ctx_;
};

/**
 * @brief TLS stream over a non-blocking TCP socket
 *
 * Every operation takes a timeout and reports through IoStatus. The socket
 * owns its file descriptor once constructed.
 *
 * interrupt() may be called from another thread to unblock a pending read
 * (used when a server is stopping and must drop its sessions).
 */
class TlsSocket {
  public:
    /**
     * @brief Wrap an already-handshaken SSL object
     *
     * Takes ownership of @p fd and switches it to non-blocking mode.
     */
    TlsSocket(int fd, SslPtr ssl);
    ~TlsSocket();

    TlsSocket(const TlsSocket&) = delete;
    TlsSocket& operator=(const TlsSocket&) = delete;

    /**
     * @brief Perform the server-side handshake on an accepted socket
     *
     * On success the returned socket owns @p fd. On failure the caller still
     * owns @p fd and must close it.
     */
    static std::unique_ptr<TlsSocket> accept(int fd, SSL_CTX* ctx,
                                             std::chrono::milliseconds timeout,
                                             std::string& error);

    /**
     * @brief Read whatever is available (at least one byte)
     *
     * @param buf Destination buffer
     * @param len Buffer capacity
     * @param received Output: number of bytes read when status is Ok
     * @param timeout Maximum time to wait for data
     */
    IoStatus read_some(uint8_t* buf, size_t len, size_t& received,
                       std::chrono::milliseconds timeout);

    /**
     * @brief Write the whole buffer or fail
     */
    IoStatus write_all(const void* data, size_t len, std::chrono::milliseconds timeout);

    /// Best-effort close_notify followed by closing the descriptor
    void close();

    /// Wake any thread blocked on this socket (thread-safe, does not free anything)
    void interrupt();

    std::string peer_address() const;
    std::string local_address() const;

  private:
    /// Wait for readiness after WANT_READ / WANT_WRITE. Returns false on timeout or poll error.
    bool wait_for(int ssl_error, std::chrono::steady_clock::time_point deadline,
                  IoStatus& status) const;

    int fd_;
    SslPtr ssl_;
};

} // namespace vprinter
