// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file ssdp_responder.cpp
 * @brief SSDP discovery responder advertising the virtual printer
 *
 * @pattern PIMPL with background thread for network I/O
 * @threading One loop thread per responder; public getters are atomic
 * @gotchas Port 2021 is often already claimed by a real printer's responder
 *          on the same host; that is reported, not fatal
 */

#include "ssdp_responder.h"

#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace vprinter {

namespace {

constexpr size_t RECV_BUFFER_SIZE = 4096;
constexpr unsigned char MULTICAST_TTL = 2;

std::string sockaddr_to_string(const sockaddr_in& addr) {
    char buf[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf))) {
        return std::string(buf);
    }
    return "";
}

} // namespace

/**
 * @brief PIMPL implementation class
 */
class SsdpResponder::Impl {
  public:
    Impl(SsdpSettings settings, std::shared_ptr<LocalAddressProvider> provider)
        : settings_(std::move(settings)), provider_(std::move(provider)) {
        if (!provider_) {
            provider_ = std::make_shared<InterfaceAddressProvider>();
        }
        host_header_ =
            std::string(ssdp::MULTICAST_GROUP) + ":" + std::to_string(ssdp::DEFAULT_PORT);
    }

    ~Impl() {
        if (state_.load() != State::Stopped) {
            fprintf(stderr, "[SSDP] Destroyed while running, stopping\n");
        }
        stop();
    }

    bool start() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (state_.load() != State::Stopped) {
            return state_.load() == State::Running;
        }
        state_.store(State::Starting);

        {
            std::lock_guard<std::mutex> ip_lock(ip_mutex_);
            advertised_ip_ = settings_.advertise_ip.empty() ? provider_->local_ipv4()
                                                            : settings_.advertise_ip;
        }

        if (!open_socket()) {
            state_.store(State::Stopped);
            return false;
        }

        spdlog::info("[SSDP] Listening on port {}, advertising {} as '{}' ({}) model={}",
                     bound_port_.load(), advertised_ip(), settings_.identity.display_name,
                     settings_.identity.serial_number, settings_.identity.model_code);

        running_.store(true);
        state_.store(State::Running);

        send_notify();
        spdlog::debug("[SSDP] Sent initial NOTIFY");

        thread_ = std::thread(&Impl::run_loop, this);
        return true;
    }

    void stop() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (state_.load() != State::Running) {
            return;
        }
        state_.store(State::Stopping);

        // Signal thread to stop
        {
            std::lock_guard<std::mutex> stop_lock(stop_mutex_);
            running_.store(false);
        }
        stop_cv_.notify_all();

        if (thread_.joinable()) {
            thread_.join();
        }

        send_byebye();
        close(sock_);
        sock_ = -1;
        bound_port_.store(0);

        state_.store(State::Stopped);
        spdlog::info("[SSDP] Stopped ({} announcements, {} responses)", announcements_.load(),
                     responses_.load());
    }

    State state() const {
        return state_.load();
    }

    uint16_t bound_port() const {
        return bound_port_.load();
    }

    std::string advertised_ip() const {
        std::lock_guard<std::mutex> lock(ip_mutex_);
        return advertised_ip_;
    }

    uint64_t announcements_sent() const {
        return announcements_.load();
    }

    uint64_t responses_sent() const {
        return responses_.load();
    }

  private:
    /**
     * @brief Create, configure and bind the UDP socket
     *
     * Must be called with lifecycle_mutex_ held.
     */
    bool open_socket() {
        sock_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
        if (sock_ < 0) {
            spdlog::error("[SSDP] socket() failed: {}", strerror(errno));
            return false;
        }

        int one = 1;
        setsockopt(sock_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
#ifdef SO_REUSEPORT
        setsockopt(sock_, SOL_SOCKET, SO_REUSEPORT, &one, sizeof(one));
#endif

        sockaddr_in local{};
        local.sin_family = AF_INET;
        local.sin_port = htons(settings_.port);
        if (inet_pton(AF_INET, settings_.bind_address.c_str(), &local.sin_addr) != 1) {
            spdlog::error("[SSDP] Invalid bind address '{}'", settings_.bind_address);
            close_socket();
            return false;
        }

        if (bind(sock_, reinterpret_cast<sockaddr*>(&local), sizeof(local)) != 0) {
            if (errno == EADDRINUSE) {
                spdlog::warn("[SSDP] Port {} in use - a real printer may be running on this host",
                             settings_.port);
            } else {
                spdlog::error("[SSDP] bind({}:{}) failed: {}", settings_.bind_address,
                              settings_.port, strerror(errno));
            }
            close_socket();
            return false;
        }

        if (settings_.join_multicast) {
            ip_mreq mreq{};
            inet_pton(AF_INET, ssdp::MULTICAST_GROUP, &mreq.imr_multiaddr);
            mreq.imr_interface.s_addr = htonl(INADDR_ANY);
            if (setsockopt(sock_, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) != 0) {
                spdlog::error("[SSDP] Failed to join {}: {}", ssdp::MULTICAST_GROUP,
                              strerror(errno));
                close_socket();
                return false;
            }
        }

        setsockopt(sock_, SOL_SOCKET, SO_BROADCAST, &one, sizeof(one));
        unsigned char ttl = MULTICAST_TTL;
        setsockopt(sock_, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));

        sockaddr_in bound{};
        socklen_t len = sizeof(bound);
        if (getsockname(sock_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
            bound_port_.store(ntohs(bound.sin_port));
        }

        announce_addr_ = sockaddr_in{};
        announce_addr_.sin_family = AF_INET;
        announce_addr_.sin_port = htons(settings_.announce_port);
        if (inet_pton(AF_INET, settings_.announce_host.c_str(), &announce_addr_.sin_addr) != 1) {
            spdlog::error("[SSDP] Invalid announce address '{}'", settings_.announce_host);
            close_socket();
            return false;
        }
        return true;
    }

    void close_socket() {
        if (sock_ >= 0) {
            close(sock_);
            sock_ = -1;
        }
    }

    /**
     * @brief Main loop running on background thread
     */
    void run_loop() {
        spdlog::debug("[SSDP] Responder thread started");
        auto last_notify = std::chrono::steady_clock::now();

        while (running_.load()) {
            drain_socket();

            auto now = std::chrono::steady_clock::now();
            if (now - last_notify >= settings_.announce_interval) {
                send_notify();
                last_notify = now;
            }

            std::unique_lock<std::mutex> lock(stop_mutex_);
            stop_cv_.wait_for(lock, settings_.poll_interval, [this]() { return !running_.load(); });
        }

        spdlog::debug("[SSDP] Responder thread exiting");
    }

    /// Handle every datagram queued since the last iteration
    void drain_socket() {
        char buffer[RECV_BUFFER_SIZE];
        while (running_.load()) {
            sockaddr_in from{};
            socklen_t from_len = sizeof(from);
            ssize_t n = recvfrom(sock_, buffer, sizeof(buffer), MSG_DONTWAIT,
                                 reinterpret_cast<sockaddr*>(&from), &from_len);
            if (n < 0) {
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    spdlog::debug("[SSDP] Receive error: {}", strerror(errno));
                }
                return;
            }
            handle_datagram(std::string(buffer, static_cast<size_t>(n)), from);
        }
    }

    void handle_datagram(const std::string& message, const sockaddr_in& from) {
        if (!ssdp::is_search_request(message)) {
            return;
        }

        std::string sender = sockaddr_to_string(from);
        spdlog::debug("[SSDP] Received M-SEARCH from {}:{}", sender, ntohs(from.sin_port));

        std::string response = ssdp::build_search_response(settings_.identity, advertised_ip(),
                                                           std::chrono::system_clock::now());
        ssize_t sent = sendto(sock_, response.data(), response.size(), 0,
                              reinterpret_cast<const sockaddr*>(&from), sizeof(from));
        if (sent < 0) {
            spdlog::debug("[SSDP] Failed to send response to {}: {}", sender, strerror(errno));
            return;
        }

        responses_.fetch_add(1);
        spdlog::info("[SSDP] Sent response to {} for '{}'", sender,
                     settings_.identity.display_name);
    }

    void send_notify() {
        std::string message =
            ssdp::build_notify_alive(settings_.identity, advertised_ip(), host_header_);
        ssize_t sent = sendto(sock_, message.data(), message.size(), 0,
                              reinterpret_cast<const sockaddr*>(&announce_addr_),
                              sizeof(announce_addr_));
        if (sent < 0) {
            spdlog::debug("[SSDP] Failed to send NOTIFY: {}", strerror(errno));
            return;
        }
        announcements_.fetch_add(1);
        spdlog::trace("[SSDP] Sent NOTIFY for '{}'", settings_.identity.display_name);
    }

    void send_byebye() {
        std::string message = ssdp::build_notify_byebye(settings_.identity, host_header_);
        if (sendto(sock_, message.data(), message.size(), 0,
                   reinterpret_cast<const sockaddr*>(&announce_addr_),
                   sizeof(announce_addr_)) < 0) {
            spdlog::debug("[SSDP] Failed to send byebye: {}", strerror(errno));
            return;
        }
        spdlog::debug("[SSDP] Sent byebye");
    }

    SsdpSettings settings_;
    std::shared_ptr<LocalAddressProvider> provider_;
    std::string host_header_;

    int sock_ = -1;
    sockaddr_in announce_addr_{};

    std::atomic<State> state_{State::Stopped};
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_{0};
    std::atomic<uint64_t> announcements_{0};
    std::atomic<uint64_t> responses_{0};

    mutable std::mutex ip_mutex_;
    std::string advertised_ip_;

    std::mutex lifecycle_mutex_;
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    std::thread thread_;
};

// ============================================================================
// Public interface
// ============================================================================

SsdpResponder::SsdpResponder(SsdpSettings settings,
                             std::shared_ptr<LocalAddressProvider> address_provider)
    : impl_(std::make_unique<Impl>(std::move(settings), std::move(address_provider))) {}

SsdpResponder::~SsdpResponder() = default;

bool SsdpResponder::start() {
    return impl_->start();
}

void SsdpResponder::stop() {
    impl_->stop();
}

SsdpResponder::State SsdpResponder::state() const {
    return impl_->state();
}

bool SsdpResponder::is_running() const {
    return impl_->state() == State::Running;
}

uint16_t SsdpResponder::bound_port() const {
    return impl_->bound_port();
}

std::string SsdpResponder::advertised_ip() const {
    return impl_->advertised_ip();
}

uint64_t SsdpResponder::announcements_sent() const {
    return impl_->announcements_sent();
}

uint64_t SsdpResponder::responses_sent() const {
    return impl_->responses_sent();
}

const char* ssdp_state_name(SsdpResponder::State state) {
    switch (state) {
    case SsdpResponder::State::Stopped:
        return "stopped";
    case SsdpResponder::State::Starting:
        return "starting";
    case SsdpResponder::State::Running:
        return "running";
    case SsdpResponder::State::Stopping:
        return "stopping";
    }
    return "unknown";
}

} // namespace vprinter
