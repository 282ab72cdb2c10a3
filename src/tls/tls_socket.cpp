// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file tls_socket.cpp
 * @brief OpenSSL server context and deadline-bounded TLS stream
 *
 * @pattern Non-blocking socket + poll() for every WANT_READ/WANT_WRITE
 * @threading A TlsSocket is used by one thread; only interrupt() is cross-thread
 * @gotchas OpenSSL requires SSL_write to be retried with identical arguments
 */

#include "tls_socket.h"

#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <cerrno>
#include <climits>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace vprinter {

namespace {

using Clock = std::chrono::steady_clock;

int remaining_ms(Clock::time_point deadline) {
    auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

std::string address_to_string(const sockaddr_storage& addr) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (addr.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
        if (inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf))) {
            return buf;
        }
    } else if (addr.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        if (inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf))) {
            std::string ip = buf;
            // IPv4-mapped addresses are reported in dotted form
            const std::string mapped_prefix = "::ffff:";
            if (ip.compare(0, mapped_prefix.size(), mapped_prefix) == 0 &&
                ip.find('.') != std::string::npos) {
                return ip.substr(mapped_prefix.size());
            }
            return ip;
        }
    }
    return "";
}

} // namespace

// ============================================================================
// TlsServerContext
// ============================================================================

std::shared_ptr<TlsServerContext> TlsServerContext::create(const std::string& chain_path,
                                                           const std::string& key_path,
                                                           std::string& error) {
    SslCtxPtr ctx(SSL_CTX_new(TLS_server_method()));
    if (!ctx) {
        error = openssl_error_string("SSL_CTX_new");
        return nullptr;
    }

    if (SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION) != 1) {
        error = openssl_error_string("SSL_CTX_set_min_proto_version");
        return nullptr;
    }

    SSL_CTX_set_options(ctx.get(), SSL_OP_NO_COMPRESSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // Slicers routinely drop the data connection without sending close_notify
    SSL_CTX_set_options(ctx.get(), SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

    static const unsigned char kSessionContext[] = "vprinter-ftps";
    SSL_CTX_set_session_id_context(ctx.get(), kSessionContext, sizeof(kSessionContext) - 1);

    if (SSL_CTX_use_certificate_chain_file(ctx.get(), chain_path.c_str()) != 1) {
        error = openssl_error_string("load certificate chain " + chain_path);
        return nullptr;
    }
    if (SSL_CTX_use_PrivateKey_file(ctx.get(), key_path.c_str(), SSL_FILETYPE_PEM) != 1) {
        error = openssl_error_string("load private key " + key_path);
        return nullptr;
    }
    if (SSL_CTX_check_private_key(ctx.get()) != 1) {
        error = openssl_error_string("private key does not match certificate");
        return nullptr;
    }

    spdlog::debug("[TLS] Server context ready (chain={}, min=TLSv1.2)", chain_path);
    return std::shared_ptr<TlsServerContext>(new TlsServerContext(std::move(ctx)));
}

// ============================================================================
// TlsSocket
// ============================================================================

TlsSocket::TlsSocket(int fd, SslPtr ssl) : fd_(fd), ssl_(std::move(ssl)) {
    set_nonblocking(fd_);
}

TlsSocket::~TlsSocket() {
    close();
}

std::unique_ptr<TlsSocket> TlsSocket::accept(int fd, SSL_CTX* ctx,
                                             std::chrono::milliseconds timeout,
                                             std::string& error) {
    SslPtr ssl(SSL_new(ctx));
    if (!ssl) {
        error = openssl_error_string("SSL_new");
        return nullptr;
    }
    if (!set_nonblocking(fd)) {
        error = std::string("fcntl: ") + strerror(errno);
        return nullptr;
    }
    if (SSL_set_fd(ssl.get(), fd) != 1) {
        error = openssl_error_string("SSL_set_fd");
        return nullptr;
    }

    auto deadline = Clock::now() + timeout;
    while (true) {
        ERR_clear_error();
        errno = 0;
        int rc = SSL_accept(ssl.get());
        if (rc == 1) {
            break;
        }

        int err = SSL_get_error(ssl.get(), rc);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = (err == SSL_ERROR_WANT_READ) ? POLLIN : POLLOUT;
            int ms = remaining_ms(deadline);
            if (ms == 0) {
                error = "handshake timed out";
                return nullptr;
            }
            int pr = ::poll(&pfd, 1, ms);
            if (pr == 0) {
                error = "handshake timed out";
                return nullptr;
            }
            if (pr < 0 && errno != EINTR) {
                error = std::string("poll: ") + strerror(errno);
                return nullptr;
            }
            continue;
        }

        if (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) {
            error = errno != 0 ? std::string("handshake: ") + strerror(errno)
                               : std::string("peer closed during handshake");
        } else {
            error = openssl_error_string("SSL_accept");
        }
        return nullptr;
    }

    spdlog::trace("[TLS] Handshake complete: {} {}", SSL_get_version(ssl.get()),
                  SSL_get_cipher_name(ssl.get()));
    return std::make_unique<TlsSocket>(fd, std::move(ssl));
}

bool TlsSocket::wait_for(int ssl_error, Clock::time_point deadline, IoStatus& status) const {
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = (ssl_error == SSL_ERROR_WANT_WRITE) ? POLLOUT : POLLIN;

    while (true) {
        int ms = remaining_ms(deadline);
        if (ms == 0) {
            status = IoStatus::Timeout;
            return false;
        }
        int rc = ::poll(&pfd, 1, ms);
        if (rc > 0) {
            // Readable, writable, or hung up: the next SSL call reports which
            return true;
        }
        if (rc == 0) {
            status = IoStatus::Timeout;
            return false;
        }
        if (errno != EINTR) {
            status = IoStatus::Error;
            return false;
        }
    }
}

IoStatus TlsSocket::read_some(uint8_t* buf, size_t len, size_t& received,
                              std::chrono::milliseconds timeout) {
    received = 0;
    if (fd_ < 0 || !ssl_) {
        return IoStatus::Closed;
    }

    int want = len > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(len);
    auto deadline = Clock::now() + timeout;

    while (true) {
        ERR_clear_error();
        errno = 0;
        int n = SSL_read(ssl_.get(), buf, want);
        if (n > 0) {
            received = static_cast<size_t>(n);
            return IoStatus::Ok;
        }

        int err = SSL_get_error(ssl_.get(), n);
        switch (err) {
        case SSL_ERROR_WANT_READ:
        case SSL_ERROR_WANT_WRITE: {
            IoStatus status = IoStatus::Ok;
            if (!wait_for(err, deadline, status)) {
                return status;
            }
            continue;
        }
        case SSL_ERROR_ZERO_RETURN:
            return IoStatus::Closed;
        case SSL_ERROR_SYSCALL:
            if (errno == 0 || errno == ECONNRESET || errno == EPIPE) {
                return IoStatus::Closed;
            }
            spdlog::debug("[TLS] read failed: {}", strerror(errno));
            return IoStatus::Error;
        default:
            spdlog::debug("[TLS] {}", openssl_error_string("SSL_read"));
            return IoStatus::Error;
        }
    }
}

IoStatus TlsSocket::write_all(const void* data, size_t len, std::chrono::milliseconds timeout) {
    if (fd_ < 0 || !ssl_) {
        return IoStatus::Closed;
    }

    const auto* bytes = static_cast<const uint8_t*>(data);
    size_t offset = 0;
    auto deadline = Clock::now() + timeout;

    while (offset < len) {
        size_t left = len - offset;
        int chunk = left > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(left);

        ERR_clear_error();
        errno = 0;
        int n = SSL_write(ssl_.get(), bytes + offset, chunk);
        if (n > 0) {
            offset += static_cast<size_t>(n);
            continue;
        }

        int err = SSL_get_error(ssl_.get(), n);
        switch (err) {
        case SSL_ERROR_WANT_READ:
        case SSL_ERROR_WANT_WRITE: {
            IoStatus status = IoStatus::Ok;
            if (!wait_for(err, deadline, status)) {
                return status;
            }
            continue;
        }
        case SSL_ERROR_ZERO_RETURN:
            return IoStatus::Closed;
        case SSL_ERROR_SYSCALL:
            if (errno == 0 || errno == ECONNRESET || errno == EPIPE) {
                return IoStatus::Closed;
            }
            spdlog::debug("[TLS] write failed: {}", strerror(errno));
            return IoStatus::Error;
        default:
            spdlog::debug("[TLS] {}", openssl_error_string("SSL_write"));
            return IoStatus::Error;
        }
    }
    return IoStatus::Ok;
}

void TlsSocket::close() {
    if (fd_ < 0) {
        return;
    }
    if (ssl_) {
        // Single non-blocking attempt; we do not wait for the peer's close_notify
        ERR_clear_error();
        SSL_shutdown(ssl_.get());
        ERR_clear_error();
    }
    ::close(fd_);
    fd_ = -1;
}

void TlsSocket::interrupt() {
    int fd = fd_;
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

std::string TlsSocket::peer_address() const {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (fd_ < 0 || getpeername(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return "";
    }
    return address_to_string(addr);
}

std::string TlsSocket::local_address() const {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (fd_ < 0 || getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return "";
    }
    return address_to_string(addr);
}

} // namespace vprinter
