// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file ftp_session.cpp
 * @brief Minimal FTP command state machine for slicer uploads
 *
 * @pattern Static command table -> member function, preconditions checked centrally
 * @threading run() on the session thread; request_stop() from any thread
 * @gotchas Reply ordering matters to slicers: 150 before waiting for the data
 *          connection, 226 before the upload callback runs
 */

#include "ftp_session.h"

#include "utils/filename_utils.h"
#include "utils/network_validation.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace vprinter {

namespace {

constexpr size_t DATA_CHUNK = 64 * 1024;

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

} // namespace

std::string format_passive_address(const std::string& ipv4, uint16_t port) {
    std::string host = ipv4;
    std::replace(host.begin(), host.end(), '.', ',');
    return "(" + host + "," + std::to_string(port / 256) + "," + std::to_string(port % 256) + ")";
}

const std::unordered_map<std::string, FtpSession::Command>& FtpSession::command_table() {
    using R = Requirement;
    static const std::unordered_map<std::string, Command> table = {
        {"USER", {&FtpSession::cmd_user, R::Nothing, false}},
        {"PASS", {&FtpSession::cmd_pass, R::KnownUser, false}},
        {"SYST", {&FtpSession::cmd_syst, R::Nothing, false}},
        {"FEAT", {&FtpSession::cmd_feat, R::Nothing, false}},
        {"OPTS", {&FtpSession::cmd_opts, R::Nothing, false}},
        {"PBSZ", {&FtpSession::cmd_pbsz, R::Nothing, false}},
        {"PROT", {&FtpSession::cmd_prot, R::Nothing, false}},
        {"NOOP", {&FtpSession::cmd_noop, R::Nothing, false}},
        {"QUIT", {&FtpSession::cmd_quit, R::Nothing, false}},
        {"PWD", {&FtpSession::cmd_pwd, R::Login, false}},
        {"CWD", {&FtpSession::cmd_cwd, R::Login, false}},
        {"MKD", {&FtpSession::cmd_mkd, R::Login, false}},
        {"TYPE", {&FtpSession::cmd_type, R::Login, false}},
        {"PASV", {&FtpSession::cmd_pasv, R::Login, false}},
        {"STOR", {&FtpSession::cmd_stor, R::Login, true}},
        {"LIST", {&FtpSession::cmd_list, R::Login, false}},
        {"SIZE", {&FtpSession::cmd_size, R::Login, false}},
    };
    return table;
}

FtpSession::FtpSession(std::unique_ptr<ControlChannel> control,
                       std::shared_ptr<PassiveListenerFactory> listeners, FtpSessionConfig config,
                       UploadCallback on_upload)
    : control_(std::move(control)), listeners_(std::move(listeners)), config_(std::move(config)),
      on_upload_(std::move(on_upload)) {
    peer_ = control_->peer_address();
    log_tag_ = "[FTP " + (peer_.empty() ? std::string("unknown") : peer_) + "]";
}

FtpSession::~FtpSession() {
    close_passive();
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (!control_closed_) {
        control_->close();
        control_closed_ = true;
    }
}

void FtpSession::run() {
    reply(220, config_.banner);

    while (!quit_ && !control_broken_ && !stop_requested_.load()) {
        std::string line;
        IoStatus status = control_->read_line(line, config_.idle_timeout);

        if (status == IoStatus::Overflow) {
            spdlog::warn("{} Command line exceeds {} bytes, discarded", log_tag_,
                         MAX_CONTROL_LINE);
            reply(500, "Line too long");
            continue;
        }
        if (status == IoStatus::Timeout) {
            spdlog::info("{} Idle timeout", log_tag_);
            break;
        }
        if (status != IoStatus::Ok) {
            if (status == IoStatus::Error) {
                spdlog::warn("{} Control connection error", log_tag_);
            }
            break;
        }

        line = trim(line);
        if (line.empty()) {
            continue;
        }
        dispatch(line);
    }

    close_passive();
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        control_->close();
        control_closed_ = true;
    }
    spdlog::info("{} Session ended", log_tag_);
}

void FtpSession::request_stop() {
    stop_requested_.store(true);
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (!control_closed_) {
        control_->interrupt();
    }
}

void FtpSession::dispatch(const std::string& line) {
    size_t space = line.find(' ');
    std::string cmd = to_upper(line.substr(0, space));
    std::string arg = space == std::string::npos ? "" : trim(line.substr(space + 1));

    // Never log the access code
    spdlog::debug("{} <- {}", log_tag_, cmd == "PASS" ? "PASS ****" : line);

    const auto& table = command_table();
    auto it = table.find(cmd);
    if (it == table.end()) {
        spdlog::warn("{} Command not implemented: {}", log_tag_, cmd);
        reply(502, "Command " + cmd + " not implemented");
        return;
    }

    const Command& command = it->second;
    switch (command.requirement) {
    case Requirement::Nothing:
        break;
    case Requirement::KnownUser:
        if (!is_known_user()) {
            reply(503, "Login with USER first");
            return;
        }
        break;
    case Requirement::Login:
        if (!authenticated_) {
            reply(530, "Not logged in");
            return;
        }
        break;
    }

    if (command.needs_passive && !passive_) {
        reply(425, "Use PASV first");
        return;
    }

    (this->*command.handler)(arg);
}

void FtpSession::reply(int code, const std::string& text) {
    reply_raw(std::to_string(code) + " " + text);
}

void FtpSession::reply_raw(const std::string& line) {
    if (control_broken_) {
        return;
    }
    spdlog::debug("{} -> {}", log_tag_, line);
    IoStatus status = control_->write_line(line);
    if (status != IoStatus::Ok) {
        spdlog::debug("{} Reply failed ({})", log_tag_, io_status_name(status));
        control_broken_ = true;
    }
}

bool FtpSession::is_known_user() const {
    return !username_.empty() && iequals(username_, config_.username);
}

void FtpSession::close_passive() {
    if (passive_) {
        spdlog::trace("{} Closing passive port {}", log_tag_, passive_->port());
        passive_->close();
        passive_.reset();
    }
}

std::unique_ptr<DataConnection> FtpSession::wait_for_data_connection(IoStatus& status) {
    auto deadline = std::chrono::steady_clock::now() + config_.data_connect_timeout;
    while (!stop_requested_.load()) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            status = IoStatus::Timeout;
            return nullptr;
        }
        auto conn = passive_->accept(std::min(left, config_.stop_check_interval), status);
        if (status != IoStatus::Timeout) {
            return conn;
        }
    }
    status = IoStatus::Closed;
    return nullptr;
}

IoStatus FtpSession::read_data(DataConnection& conn, uint8_t* buf, size_t len,
                               size_t& received) {
    auto deadline = std::chrono::steady_clock::now() + config_.data_read_timeout;
    while (!stop_requested_.load()) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            return IoStatus::Timeout;
        }
        IoStatus status =
            conn.read_chunk(buf, len, received, std::min(left, config_.stop_check_interval));
        if (status != IoStatus::Timeout) {
            return status;
        }
    }
    return IoStatus::Error;
}

// ============================================================================
// Authentication
// ============================================================================

void FtpSession::cmd_user(const std::string& arg) {
    // A new USER always restarts authentication
    username_ = arg;
    authenticated_ = false;
    if (is_known_user()) {
        reply(331, "Password required");
    } else {
        spdlog::warn("{} Rejected user '{}'", log_tag_, arg);
        reply(530, "Invalid user");
    }
}

void FtpSession::cmd_pass(const std::string& arg) {
    if (arg == config_.access_code) {
        authenticated_ = true;
        spdlog::info("{} Login successful", log_tag_);
        reply(230, "Login successful");
    } else {
        authenticated_ = false;
        spdlog::warn("{} Failed login", log_tag_);
        reply(530, "Login incorrect");
    }
}

// ============================================================================
// Capability and handshake replies
// ============================================================================

void FtpSession::cmd_syst(const std::string&) {
    reply(215, "UNIX Type: L8");
}

void FtpSession::cmd_feat(const std::string&) {
    reply_raw("211-Features:");
    reply_raw(" PASV");
    reply_raw(" UTF8");
    reply_raw(" SIZE");
    reply_raw("211 End");
}

void FtpSession::cmd_opts(const std::string& arg) {
    if (to_upper(arg).rfind("UTF8", 0) == 0) {
        reply(200, "UTF8 mode enabled");
    } else {
        reply(501, "Option not supported");
    }
}

void FtpSession::cmd_pbsz(const std::string&) {
    reply(200, "PBSZ=0");
}

void FtpSession::cmd_prot(const std::string& arg) {
    std::string level = to_upper(arg);
    if (level == "P") {
        reply(200, "Protection level set to Private");
    } else if (level == "C") {
        // Always encrypted: implicit TLS on every channel
        reply(536, "Protection level C not supported");
    } else {
        reply(504, "Protection level " + arg + " not supported");
    }
}

void FtpSession::cmd_noop(const std::string&) {
    reply(200, "OK");
}

void FtpSession::cmd_quit(const std::string&) {
    reply(221, "Goodbye");
    quit_ = true;
}

// ============================================================================
// Directory commands (flat namespace)
// ============================================================================

void FtpSession::cmd_pwd(const std::string&) {
    reply(257, "\"/\" is current directory");
}

void FtpSession::cmd_cwd(const std::string& arg) {
    current_dir_ = arg.empty() ? "/" : arg;
    reply(250, "Directory changed");
}

void FtpSession::cmd_mkd(const std::string& arg) {
    reply(257, "\"" + arg + "\" directory created");
}

void FtpSession::cmd_type(const std::string& arg) {
    std::string type = to_upper(arg.substr(0, arg.find(' ')));
    if (type == "A") {
        transfer_type_ = TransferType::Ascii;
        reply(200, "Type set to ASCII");
    } else if (type == "I") {
        transfer_type_ = TransferType::Binary;
        reply(200, "Type set to Binary");
    } else {
        reply(504, "Type not supported");
    }
}

void FtpSession::cmd_size(const std::string&) {
    // No server-side metadata; answering keeps probing clients from hanging
    reply(550, "File not found");
}

// ============================================================================
// Data transfer
// ============================================================================

void FtpSession::cmd_pasv(const std::string&) {
    close_passive();

    std::string error;
    passive_ = listeners_->open(error);
    if (!passive_) {
        spdlog::error("{} Failed to open passive data channel: {}", log_tag_, error);
        reply(425, "Cannot open data connection");
        return;
    }

    // Advertise the address the client reached us on
    std::string ip = control_->local_address();
    if (!is_valid_ipv4(ip) || ip == "0.0.0.0") {
        ip = "127.0.0.1";
    }

    spdlog::debug("{} PASV listening on port {}", log_tag_, passive_->port());
    reply(227, "Entering Passive Mode " + format_passive_address(ip, passive_->port()));
}

void FtpSession::cmd_stor(const std::string& arg) {
    std::string filename = sanitize_upload_filename(arg);
    if (filename.empty()) {
        close_passive();
        reply(501, "Invalid file name");
        return;
    }
    fs::path file_path = fs::path(config_.upload_dir) / filename;

    spdlog::info("{} Receiving {}", log_tag_, filename);
    reply(150, "Opening data connection for " + filename);

    IoStatus status = IoStatus::Ok;
    std::unique_ptr<DataConnection> conn = wait_for_data_connection(status);
    if (!conn) {
        close_passive();
        if (status == IoStatus::Timeout) {
            spdlog::error("{} Data connection timeout - client didn't connect", log_tag_);
            reply(425, "Data connection timeout");
        } else {
            reply(425, "Data connection failed");
        }
        return;
    }

    std::vector<uint8_t> content;
    std::vector<uint8_t> chunk(DATA_CHUNK);
    while (true) {
        size_t received = 0;
        status = read_data(*conn, chunk.data(), chunk.size(), received);
        if (status == IoStatus::Ok) {
            content.insert(content.end(), chunk.begin(), chunk.begin() + received);
            continue;
        }
        break;
    }

    conn->close();
    close_passive();

    if (status == IoStatus::Timeout) {
        spdlog::error("{} Data transfer timeout for {}", log_tag_, filename);
        reply(426, "Transfer timeout");
        return;
    }
    if (status != IoStatus::Closed || stop_requested_.load()) {
        spdlog::error("{} Data transfer failed for {}", log_tag_, filename);
        reply(426, "Transfer failed");
        return;
    }

    {
        std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
        if (out) {
            out.write(reinterpret_cast<const char*>(content.data()),
                      static_cast<std::streamsize>(content.size()));
            out.flush();
        }
        if (!out) {
            spdlog::error("{} Failed to save {}", log_tag_, file_path.string());
            reply(550, "Failed to save file");
            return;
        }
    }

    spdlog::info("{} Saved {} ({} bytes)", log_tag_, file_path.string(), content.size());
    reply(226, "Transfer complete");

    if (on_upload_) {
        try {
            on_upload_(file_path.string(), peer_);
        } catch (const std::exception& e) {
            spdlog::error("{} Upload callback failed for {}: {}", log_tag_, filename, e.what());
        }
    }
}

void FtpSession::cmd_list(const std::string&) {
    reply(150, "Opening data connection");
    if (passive_) {
        // Empty listing: accept and close straight away
        IoStatus status = IoStatus::Ok;
        std::unique_ptr<DataConnection> conn = wait_for_data_connection(status);
        if (conn) {
            conn->close();
        }
        close_passive();
    }
    reply(226, "Transfer complete");
}

} // namespace vprinter
