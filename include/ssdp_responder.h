// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "local_address.h"
#include "ssdp_messages.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace vprinter {

/**
 * @brief Runtime settings for the SSDP responder
 *
 * Defaults are the real-network values; tests override the port, the
 * announce target and multicast membership to stay on loopback.
 */
struct SsdpSettings {
    ssdp::SsdpIdentity identity;

    /// Location header value; empty = ask the address provider at start()
    std::string advertise_ip;

    std::string bind_address = "0.0.0.0";
    uint16_t port = ssdp::DEFAULT_PORT; ///< 0 binds an ephemeral port (see bound_port())

    /// Where NOTIFY alive/byebye datagrams go
    std::string announce_host = ssdp::MULTICAST_GROUP;
    uint16_t announce_port = ssdp::DEFAULT_PORT;

    std::chrono::milliseconds announce_interval{30000};
    std::chrono::milliseconds poll_interval{100};

    bool join_multicast = true;
};

/**
 * @brief Makes the virtual printer discoverable by slicers
 *
 * Listens on the Bambu SSDP port, answers matching M-SEARCH requests with a
 * unicast 200 OK and multicasts NOTIFY ssdp:alive on a fixed interval.
 * Non-matching traffic is dropped without logging.
 *
 * Lifecycle: Stopped -> Starting -> Running -> Stopping -> Stopped.
 * start() binds synchronously so the caller learns about port conflicts
 * (e.g. a real printer's responder on the same host) immediately; receive
 * and send errors inside the loop are logged and the loop carries on.
 *
 * @code
 * SsdpResponder ssdp(settings);
 * if (!ssdp.start()) {
 *     spdlog::warn("discovery unavailable");
 * }
 * ...
 * ssdp.stop(); // sends byebye
 * @endcode
 */
class SsdpResponder {
  public:
    enum class State { Stopped, Starting, Running, Stopping };

    explicit SsdpResponder(SsdpSettings settings,
                           std::shared_ptr<LocalAddressProvider> address_provider = nullptr);
    ~SsdpResponder();

    // Non-copyable (owns socket and background thread)
    SsdpResponder(const SsdpResponder&) = delete;
    SsdpResponder& operator=(const SsdpResponder&) = delete;

    /**
     * @brief Bind, join the group, send the first NOTIFY and start the loop
     *
     * @return false if the socket could not be bound or the group joined
     */
    bool start();

    /**
     * @brief Stop the loop, send byebye, release the socket
     *
     * Blocks until the background thread has exited. Safe to call repeatedly.
     */
    void stop();

    State state() const;
    bool is_running() const;

    /// Actual bound port (useful when settings.port was 0); 0 when stopped
    uint16_t bound_port() const;

    /// Address placed in the Location header
    std::string advertised_ip() const;

    uint64_t announcements_sent() const;
    uint64_t responses_sent() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

const char* ssdp_state_name(SsdpResponder::State state);

} // namespace vprinter
