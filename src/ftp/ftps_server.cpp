// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file ftps_server.cpp
 * @brief Implicit FTPS listener dispatching one thread per control connection
 *
 * @pattern PIMPL with background accept thread
 * @threading Accept thread + one thread per session; sessions share only the
 *            TLS context and the passive listener factory
 * @gotchas The TLS handshake runs on the session thread so a slow client
 *          cannot stall the accept loop
 */

#include "ftps_server.h"

#include "tls_channels.h"
#include "tls_socket.h"

#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace vprinter {

namespace {

constexpr int ACCEPT_POLL_MS = 250;
constexpr int LISTEN_BACKLOG = 16;

std::string peer_of(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    char buf[INET_ADDRSTRLEN] = {0};
    if (getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0 &&
        inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf))) {
        return buf;
    }
    return "unknown";
}

/**
 * @brief One control connection and the thread serving it
 *
 * handshake_fd is only valid until the TLS handshake finished; session only
 * after it. Both are guarded by mutex so stop() can interrupt either phase.
 */
struct SessionSlot {
    uint64_t id = 0;
    std::thread thread;
    std::atomic<bool> finished{false};
    std::mutex mutex;
    int handshake_fd = -1;
    std::shared_ptr<FtpSession> session;
};

} // namespace

/**
 * @brief PIMPL implementation class
 */
class FtpsServer::Impl {
  public:
    Impl(FtpsSettings settings, UploadCallback on_upload)
        : settings_(std::move(settings)), on_upload_(std::move(on_upload)) {}

    ~Impl() {
        if (running_.load()) {
            fprintf(stderr, "[FTPS] Destroyed while running, stopping\n");
        }
        stop();
    }

    bool start() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (running_.load()) {
            return true;
        }

        // A client vanishing mid-write must not kill the process
        std::signal(SIGPIPE, SIG_IGN);

        std::error_code ec;
        fs::create_directories(fs::path(settings_.upload_dir) / "cache", ec);
        if (ec) {
            spdlog::error("[FTPS] Cannot create upload directory {}: {}", settings_.upload_dir,
                          ec.message());
            return false;
        }

        std::string error;
        context_ = TlsServerContext::create(settings_.cert_chain_path, settings_.key_path, error);
        if (!context_) {
            spdlog::error("[FTPS] TLS setup failed: {}", error);
            return false;
        }

        if (!open_listener()) {
            context_.reset();
            return false;
        }

        TlsPassiveListenerFactory::Options passive;
        passive.bind_address = settings_.passive_bind_address;
        passive.port_min = settings_.passive_port_min;
        passive.port_max = settings_.passive_port_max;
        passive.handshake_timeout = settings_.handshake_timeout;
        listeners_ = std::make_shared<TlsPassiveListenerFactory>(context_, passive);

        running_.store(true);
        accept_thread_ = std::thread(&Impl::accept_loop, this);

        spdlog::info("[FTPS] Implicit FTPS listening on {}:{} (uploads -> {})",
                     settings_.bind_address, bound_port_.load(), settings_.upload_dir);
        return true;
    }

    void stop() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (!running_.load()) {
            return;
        }
        running_.store(false);

        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        close(listen_fd_);
        listen_fd_ = -1;

        std::vector<std::shared_ptr<SessionSlot>> slots;
        {
            std::lock_guard<std::mutex> sessions_lock(sessions_mutex_);
            slots.swap(sessions_);
        }

        for (auto& slot : slots) {
            std::lock_guard<std::mutex> slot_lock(slot->mutex);
            if (slot->handshake_fd >= 0) {
                ::shutdown(slot->handshake_fd, SHUT_RDWR);
            }
            if (slot->session) {
                slot->session->request_stop();
            }
        }
        for (auto& slot : slots) {
            if (slot->thread.joinable()) {
                slot->thread.join();
            }
        }

        listeners_.reset();
        context_.reset();
        bound_port_.store(0);
        spdlog::info("[FTPS] Stopped ({} session(s) dropped)", slots.size());
    }

    bool is_running() const {
        return running_.load();
    }

    uint16_t bound_port() const {
        return bound_port_.load();
    }

    size_t active_sessions() const {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        size_t count = 0;
        for (const auto& slot : sessions_) {
            if (!slot->finished.load()) {
                ++count;
            }
        }
        return count;
    }

  private:
    /// Must be called with lifecycle_mutex_ held
    bool open_listener() {
        listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) {
            spdlog::error("[FTPS] socket() failed: {}", strerror(errno));
            return false;
        }

        int one = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(settings_.port);
        if (inet_pton(AF_INET, settings_.bind_address.c_str(), &addr.sin_addr) != 1) {
            spdlog::error("[FTPS] Invalid bind address '{}'", settings_.bind_address);
            close_listener();
            return false;
        }

        if (bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
            if (errno == EADDRINUSE) {
                spdlog::error("[FTPS] Port {} is already in use", settings_.port);
            } else {
                spdlog::error("[FTPS] bind({}:{}) failed: {}", settings_.bind_address,
                              settings_.port, strerror(errno));
            }
            close_listener();
            return false;
        }

        if (listen(listen_fd_, LISTEN_BACKLOG) != 0) {
            spdlog::error("[FTPS] listen() failed: {}", strerror(errno));
            close_listener();
            return false;
        }

        sockaddr_in bound{};
        socklen_t len = sizeof(bound);
        if (getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
            bound_port_.store(ntohs(bound.sin_port));
        }
        return true;
    }

    void close_listener() {
        if (listen_fd_ >= 0) {
            close(listen_fd_);
            listen_fd_ = -1;
        }
    }

    /**
     * @brief Accept loop running on background thread
     */
    void accept_loop() {
        spdlog::debug("[FTPS] Accept thread started");

        while (running_.load()) {
            reap_finished();

            pollfd pfd{};
            pfd.fd = listen_fd_;
            pfd.events = POLLIN;
            int rc = ::poll(&pfd, 1, ACCEPT_POLL_MS);
            if (rc <= 0) {
                if (rc < 0 && errno != EINTR) {
                    spdlog::warn("[FTPS] poll() failed: {}", strerror(errno));
                }
                continue;
            }

            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) {
                if (errno != EAGAIN && errno != EINTR && errno != ECONNABORTED) {
                    spdlog::warn("[FTPS] accept() failed: {}", strerror(errno));
                }
                continue;
            }
            spawn_session(fd);
        }

        spdlog::debug("[FTPS] Accept thread exiting");
    }

    void spawn_session(int fd) {
        auto slot = std::make_shared<SessionSlot>();
        slot->id = ++next_session_id_;
        slot->handshake_fd = fd;

        spdlog::info("[FTPS] Connection #{} from {}", slot->id, peer_of(fd));

        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            sessions_.push_back(slot);
        }
        slot->thread = std::thread(&Impl::session_main, this, slot);
    }

    /// Join threads of sessions that already ended. Runs on the accept thread.
    void reap_finished() {
        std::vector<std::shared_ptr<SessionSlot>> done;
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            auto it = sessions_.begin();
            while (it != sessions_.end()) {
                if ((*it)->finished.load()) {
                    done.push_back(*it);
                    it = sessions_.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto& slot : done) {
            if (slot->thread.joinable()) {
                slot->thread.join();
            }
        }
    }

    void session_main(std::shared_ptr<SessionSlot> slot) {
        int fd = slot->handshake_fd;
        std::string peer = peer_of(fd);

        std::string error;
        auto socket =
            TlsSocket::accept(fd, context_->native(), settings_.handshake_timeout, error);
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            slot->handshake_fd = -1;
            if (!socket) {
                close(fd);
            }
        }
        if (!socket) {
            spdlog::warn("[FTPS] TLS handshake with {} failed (#{}): {}", peer, slot->id, error);
            slot->finished.store(true);
            return;
        }

        FtpSessionConfig config;
        config.upload_dir = settings_.upload_dir;
        config.access_code = settings_.access_code;
        config.idle_timeout = settings_.idle_timeout;
        config.data_connect_timeout = settings_.data_connect_timeout;
        config.data_read_timeout = settings_.data_read_timeout;

        auto session = std::make_shared<FtpSession>(
            std::make_unique<TlsControlChannel>(std::move(socket)), listeners_, config,
            on_upload_);
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            slot->session = session;
        }
        // stop() may have scanned the slots before the session existed
        if (!running_.load()) {
            session->request_stop();
        }

        session->run();

        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            slot->session.reset();
        }
        slot->finished.store(true);
    }

    FtpsSettings settings_;
    UploadCallback on_upload_;

    std::shared_ptr<TlsServerContext> context_;
    std::shared_ptr<TlsPassiveListenerFactory> listeners_;

    int listen_fd_ = -1;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_{0};
    uint64_t next_session_id_ = 0;

    std::mutex lifecycle_mutex_;
    mutable std::mutex sessions_mutex_;
    std::vector<std::shared_ptr<SessionSlot>> sessions_;
    std::thread accept_thread_;
};

// ============================================================================
// Public interface
// ============================================================================

FtpsServer::FtpsServer(FtpsSettings settings, UploadCallback on_upload)
    : impl_(std::make_unique<Impl>(std::move(settings), std::move(on_upload))) {}

FtpsServer::~FtpsServer() = default;

bool FtpsServer::start() {
    return impl_->start();
}

void FtpsServer::stop() {
    impl_->stop();
}

bool FtpsServer::is_running() const {
    return impl_->is_running();
}

uint16_t FtpsServer::bound_port() const {
    return impl_->bound_port();
}

size_t FtpsServer::active_sessions() const {
    return impl_->active_sessions();
}

} // namespace vprinter
