// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef MOCK_FTP_CHANNELS_H
#define MOCK_FTP_CHANNELS_H

/**
 * @file mock_ftp_channels.h
 * @brief In-memory FTP channels for driving FtpSession without sockets
 *
 * - ScriptedControlChannel replays a fixed list of client lines, then
 *   reports Closed, and records every reply.
 * - MockPassiveListenerFactory hands out listeners whose single data
 *   connection delivers the chunks configured in MockDataPlan.
 *
 * @example
 * auto control = std::make_unique<ScriptedControlChannel>(
 *     std::vector<std::string>{"USER bblp", "PASS 12345678", "QUIT"});
 * auto* replies = control.get();
 * FtpSession session(std::move(control), factory, config, nullptr);
 * session.run();
 * REQUIRE(replies->replies().back() == "221 Goodbye");
 */

#include "ftp_channels.h"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace vprinter;

/**
 * @brief Control channel fed from a script of (status, line) steps
 */
class ScriptedControlChannel : public ControlChannel {
  public:
    struct Step {
        IoStatus status;
        std::string line;
    };

    explicit ScriptedControlChannel(const std::vector<std::string>& lines) {
        for (const auto& l : lines) {
            steps_.push_back({IoStatus::Ok, l});
        }
    }

    explicit ScriptedControlChannel(std::vector<Step> steps)
        : steps_(steps.begin(), steps.end()) {}

    IoStatus read_line(std::string& line, std::chrono::milliseconds) override {
        if (steps_.empty()) {
            return IoStatus::Closed;
        }
        Step step = steps_.front();
        steps_.pop_front();
        line = step.line;
        return step.status;
    }

    IoStatus write_line(const std::string& line) override {
        replies_.push_back(line);
        return fail_writes_ ? IoStatus::Error : IoStatus::Ok;
    }

    std::string peer_address() const override {
        return peer_;
    }

    std::string local_address() const override {
        return local_;
    }

    void interrupt() override {
        interrupted_ = true;
    }

    void close() override {
        closed_ = true;
    }

    // =========================================================================
    // Test Control Methods
    // =========================================================================

    const std::vector<std::string>& replies() const {
        return replies_;
    }

    /// Reply lines starting with the three-digit @p code
    std::vector<std::string> replies_with(int code) const {
        std::vector<std::string> out;
        std::string prefix = std::to_string(code);
        for (const auto& r : replies_) {
            if (r.compare(0, 3, prefix) == 0) {
                out.push_back(r);
            }
        }
        return out;
    }

    void set_local_address(std::string ip) {
        local_ = std::move(ip);
    }

    void set_fail_writes(bool fail) {
        fail_writes_ = fail;
    }

    bool closed() const {
        return closed_;
    }

    bool interrupted() const {
        return interrupted_;
    }

  private:
    std::deque<Step> steps_;
    std::vector<std::string> replies_;
    std::string peer_ = "10.0.0.5";
    std::string local_ = "192.168.1.20";
    bool fail_writes_ = false;
    bool closed_ = false;
    bool interrupted_ = false;
};

/**
 * @brief What the next data connection does
 */
struct MockDataPlan {
    IoStatus accept_status = IoStatus::Ok; ///< Non-Ok: accept() fails with this
    std::vector<std::string> chunks;       ///< Delivered one per read_chunk()
    IoStatus final_status = IoStatus::Closed;
};

/// Observations shared between the factory and the objects it created
struct MockDataState {
    MockDataPlan plan;
    int listeners_opened = 0;
    int listeners_closed = 0;
    int connections_accepted = 0;
    int connections_closed = 0;
};

class MockDataConnection : public DataConnection {
  public:
    explicit MockDataConnection(std::shared_ptr<MockDataState> state)
        : state_(std::move(state)), chunks_(state_->plan.chunks.begin(),
                                            state_->plan.chunks.end()) {}

    IoStatus read_chunk(uint8_t* buf, size_t len, size_t& received,
                        std::chrono::milliseconds timeout) override {
        received = 0;
        if (chunks_.empty()) {
            if (state_->plan.final_status == IoStatus::Timeout) {
                std::this_thread::sleep_for(timeout);
            }
            return state_->plan.final_status;
        }
        std::string& front = chunks_.front();
        size_t n = std::min(len, front.size());
        std::copy(front.begin(), front.begin() + static_cast<std::ptrdiff_t>(n), buf);
        front.erase(0, n);
        if (front.empty()) {
            chunks_.pop_front();
        }
        received = n;
        return IoStatus::Ok;
    }

    IoStatus write_all(const std::string&, std::chrono::milliseconds) override {
        return IoStatus::Ok;
    }

    void close() override {
        if (!closed_) {
            closed_ = true;
            state_->connections_closed++;
        }
    }

  private:
    std::shared_ptr<MockDataState> state_;
    std::deque<std::string> chunks_;
    bool closed_ = false;
};

class MockPassiveListener : public PassiveListener {
  public:
    MockPassiveListener(std::shared_ptr<MockDataState> state, uint16_t port)
        : state_(std::move(state)), port_(port) {}

    ~MockPassiveListener() override {
        close();
    }

    uint16_t port() const override {
        return port_;
    }

    std::unique_ptr<DataConnection> accept(std::chrono::milliseconds timeout,
                                           IoStatus& status) override {
        if (closed_) {
            status = IoStatus::Closed;
            return nullptr;
        }
        status = state_->plan.accept_status;
        if (status == IoStatus::Timeout) {
            std::this_thread::sleep_for(timeout);
            return nullptr;
        }
        if (status != IoStatus::Ok || accepted_) {
            return nullptr;
        }
        accepted_ = true;
        state_->connections_accepted++;
        return std::make_unique<MockDataConnection>(state_);
    }

    void close() override {
        if (!closed_) {
            closed_ = true;
            state_->listeners_closed++;
        }
    }

  private:
    std::shared_ptr<MockDataState> state_;
    uint16_t port_;
    bool accepted_ = false;
    bool closed_ = false;
};

/**
 * @brief Factory handing out MockPassiveListener on increasing ports
 */
class MockPassiveListenerFactory : public PassiveListenerFactory {
  public:
    std::unique_ptr<PassiveListener> open(std::string& error) override {
        if (fail_open_) {
            error = "no free port";
            return nullptr;
        }
        state_->listeners_opened++;
        return std::make_unique<MockPassiveListener>(state_, next_port_++);
    }

    // =========================================================================
    // Test Control Methods
    // =========================================================================

    MockDataPlan& plan() {
        return state_->plan;
    }

    const MockDataState& state() const {
        return *state_;
    }

    void set_fail_open(bool fail) {
        fail_open_ = fail;
    }

    /// Port the next listener will report
    void set_next_port(uint16_t port) {
        next_port_ = port;
    }

  private:
    std::shared_ptr<MockDataState> state_ = std::make_shared<MockDataState>();
    bool fail_open_ = false;
    uint16_t next_port_ = 50123;
};

#endif // MOCK_FTP_CHANNELS_H
