// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file tls_channels.cpp
 * @brief TLS-backed FTP control/data channels and passive listeners
 *
 * @threading TlsPassiveListener runs one accept thread per PASV; everything
 *            else is used from the owning session thread
 * @gotchas The passive listener stops accepting after its first successful
 *          handshake so a superseded PASV port refuses new clients; failed
 *          handshakes are dropped and accepting continues
 */

#include "tls_channels.h"

#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace vprinter {

namespace {

constexpr size_t READ_CHUNK = 1024;
constexpr int ACCEPT_POLL_MS = 100;

} // namespace

// ============================================================================
// TlsControlChannel
// ============================================================================

TlsControlChannel::TlsControlChannel(std::unique_ptr<TlsSocket> socket,
                                     std::chrono::milliseconds write_timeout)
    : socket_(std::move(socket)), write_timeout_(write_timeout) {
    // Cached: getpeername() no longer works once the socket is closed
    peer_ = socket_->peer_address();
    local_ = socket_->local_address();
}

IoStatus TlsControlChannel::read_line(std::string& line, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        size_t pos = buffer_.find('\n');
        if (pos != std::string::npos) {
            if (discarding_) {
                // Tail of an oversized line
                buffer_.erase(0, pos + 1);
                discarding_ = false;
                continue;
            }
            size_t length = (pos > 0 && buffer_[pos - 1] == '\r') ? pos - 1 : pos;
            if (length > MAX_CONTROL_LINE) {
                buffer_.erase(0, pos + 1);
                return IoStatus::Overflow;
            }

            line = buffer_.substr(0, pos);
            buffer_.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return IoStatus::Ok;
        }

        // One extra byte for a CR whose LF has not arrived yet
        if (buffer_.size() > MAX_CONTROL_LINE + 1) {
            buffer_.clear();
            if (!discarding_) {
                discarding_ = true;
                return IoStatus::Overflow;
            }
        }

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            return IoStatus::Timeout;
        }

        uint8_t chunk[READ_CHUNK];
        size_t received = 0;
        IoStatus status = socket_->read_some(chunk, sizeof(chunk), received, left);
        if (status != IoStatus::Ok) {
            return status;
        }
        buffer_.append(reinterpret_cast<const char*>(chunk), received);
    }
}

IoStatus TlsControlChannel::write_line(const std::string& line) {
    std::string wire = line + "\r\n";
    return socket_->write_all(wire.data(), wire.size(), write_timeout_);
}

std::string TlsControlChannel::peer_address() const {
    return peer_;
}

std::string TlsControlChannel::local_address() const {
    return local_;
}

void TlsControlChannel::interrupt() {
    socket_->interrupt();
}

void TlsControlChannel::close() {
    socket_->close();
}

// ============================================================================
// TlsDataConnection
// ============================================================================

IoStatus TlsDataConnection::read_chunk(uint8_t* buf, size_t len, size_t& received,
                                       std::chrono::milliseconds timeout) {
    return socket_->read_some(buf, len, received, timeout);
}

IoStatus TlsDataConnection::write_all(const std::string& data,
                                      std::chrono::milliseconds timeout) {
    return socket_->write_all(data.data(), data.size(), timeout);
}

void TlsDataConnection::close() {
    socket_->close();
}

// ============================================================================
// TlsPassiveListener
// ============================================================================

TlsPassiveListener::TlsPassiveListener(int listen_fd, uint16_t port,
                                       std::shared_ptr<TlsServerContext> context,
                                       std::chrono::milliseconds handshake_timeout)
    : listen_fd_(listen_fd), port_(port), context_(std::move(context)),
      handshake_timeout_(handshake_timeout) {
    thread_ = std::thread(&TlsPassiveListener::accept_loop, this);
}

TlsPassiveListener::~TlsPassiveListener() {
    close();
}

void TlsPassiveListener::accept_loop() {
    while (!closing_.load()) {
        pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, ACCEPT_POLL_MS);
        if (rc == 0 || (rc < 0 && errno == EINTR)) {
            continue;
        }
        if (rc < 0) {
            std::lock_guard<std::mutex> lock(mutex_);
            error_ = std::string("poll: ") + strerror(errno);
            ready_ = true;
            break;
        }

        int fd = ::accept(listen_fd_, nullptr, nullptr);
        if (fd < 0) {
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_fd_ = fd;
            // close() may have run between accept() and publishing the fd
            if (closing_.load()) {
                ::shutdown(fd, SHUT_RDWR);
            }
        }

        std::string error;
        auto socket = TlsSocket::accept(fd, context_->native(), handshake_timeout_, error);

        std::lock_guard<std::mutex> lock(mutex_);
        pending_fd_ = -1;
        if (!socket) {
            // Port scanners and health checks must not take the slot
            ::close(fd);
            spdlog::debug("[FTPS] Passive port {}: handshake failed: {}", port_, error);
            continue;
        }
        accepted_ = std::move(socket);
        ready_ = true;
        break;
    }

    // One connection per PASV: later connects are refused
    ::close(listen_fd_);
    listen_fd_ = -1;
    ready_cv_.notify_all();
    spdlog::trace("[FTPS] Passive port {} no longer accepting", port_);
}

std::unique_ptr<DataConnection> TlsPassiveListener::accept(std::chrono::milliseconds timeout,
                                                           IoStatus& status) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!ready_cv_.wait_for(lock, timeout, [this]() { return ready_ || closing_.load(); })) {
        status = IoStatus::Timeout;
        return nullptr;
    }

    if (!accepted_) {
        if (!error_.empty()) {
            spdlog::debug("[FTPS] Passive port {}: {}", port_, error_);
            error_.clear();
        }
        status = closing_.load() ? IoStatus::Closed : IoStatus::Error;
        return nullptr;
    }

    status = IoStatus::Ok;
    return std::make_unique<TlsDataConnection>(std::move(accepted_));
}

void TlsPassiveListener::close() {
    if (closing_.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_fd_ >= 0) {
            ::shutdown(pending_fd_, SHUT_RDWR);
        }
    }
    ready_cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    accepted_.reset();
}

// ============================================================================
// TlsPassiveListenerFactory
// ============================================================================

TlsPassiveListenerFactory::TlsPassiveListenerFactory(std::shared_ptr<TlsServerContext> context,
                                                     Options options)
    : context_(std::move(context)), options_(std::move(options)), rng_(std::random_device{}()) {}

std::unique_ptr<PassiveListener> TlsPassiveListenerFactory::open(std::string& error) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    if (inet_pton(AF_INET, options_.bind_address.c_str(), &addr.sin_addr) != 1) {
        error = "invalid passive bind address " + options_.bind_address;
        return nullptr;
    }

    std::uniform_int_distribution<int> dist(options_.port_min, options_.port_max);

    for (int attempt = 0; attempt < options_.bind_attempts; ++attempt) {
        uint16_t port;
        {
            std::lock_guard<std::mutex> lock(rng_mutex_);
            port = static_cast<uint16_t>(dist(rng_));
        }

        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0) {
            error = std::string("socket: ") + strerror(errno);
            return nullptr;
        }
        int one = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        addr.sin_port = htons(port);
        if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
            int bind_errno = errno;
            ::close(fd);
            if (bind_errno == EADDRINUSE) {
                spdlog::trace("[FTPS] Passive port {} busy, retrying", port);
                continue;
            }
            error = std::string("bind: ") + strerror(bind_errno);
            return nullptr;
        }

        if (listen(fd, 1) != 0) {
            error = std::string("listen: ") + strerror(errno);
            ::close(fd);
            return nullptr;
        }

        return std::make_unique<TlsPassiveListener>(fd, port, context_,
                                                    options_.handshake_timeout);
    }

    error = "no free passive port after " + std::to_string(options_.bind_attempts) + " attempts";
    return nullptr;
}

} // namespace vprinter
