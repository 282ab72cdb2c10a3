// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ftp_channels.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace vprinter {

/// Service account every Bambu printer exposes over FTPS
constexpr const char* FTP_USERNAME = "bblp";

/**
 * @brief Invoked once per completed upload, after 226 was sent
 *
 * @param path Absolute path of the written file
 * @param source_ip Address of the client's control connection
 */
using UploadCallback = std::function<void(const std::string& path, const std::string& source_ip)>;

struct FtpSessionConfig {
    std::string upload_dir;
    std::string username = FTP_USERNAME; ///< Compared case-insensitively
    std::string access_code;             ///< Compared literally
    std::string banner = "Virtual Printer FTP ready";

    std::chrono::milliseconds idle_timeout{std::chrono::minutes(5)};
    std::chrono::milliseconds data_connect_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds data_read_timeout{std::chrono::seconds(60)};

    /// Granularity at which long data waits notice request_stop()
    std::chrono::milliseconds stop_check_interval{250};
};

/**
 * @brief State machine for one FTP control connection
 *
 * Commands are looked up in a static table that records, per command, the
 * session state it needs (known user, login, open passive listener). The
 * precondition is checked before the handler runs, so handlers only contain
 * the command's own logic.
 *
 * States: unauthenticated -> USER ok -> authenticated -> closed. Protocol
 * and data errors are answered with a reply code and never end the session;
 * only QUIT, idle timeout or a broken control connection do.
 *
 * run() executes on the session's own thread. request_stop() may be called
 * from any thread.
 */
class FtpSession {
  public:
    enum class TransferType { Ascii, Binary };

    FtpSession(std::unique_ptr<ControlChannel> control,
               std::shared_ptr<PassiveListenerFactory> listeners, FtpSessionConfig config,
               UploadCallback on_upload);
    ~FtpSession();

    FtpSession(const FtpSession&) = delete;
    FtpSession& operator=(const FtpSession&) = delete;

    /// Send the banner and process commands until the session ends
    void run();

    /// Make run() return soon: wakes the control read and aborts data waits
    void request_stop();

    bool is_authenticated() const {
        return authenticated_;
    }

    const std::string& username() const {
        return username_;
    }

    TransferType transfer_type() const {
        return transfer_type_;
    }

    bool has_passive_listener() const {
        return passive_ != nullptr;
    }

  private:
    enum class Requirement { Nothing, KnownUser, Login };

    using Handler = void (FtpSession::*)(const std::string& arg);

    struct Command {
        Handler handler;
        Requirement requirement;
        bool needs_passive;
    };

    static const std::unordered_map<std::string, Command>& command_table();

    void dispatch(const std::string& line);
    void reply(int code, const std::string& text);
    void reply_raw(const std::string& line);

    bool is_known_user() const;

    /// Wait for the data connection, checking for request_stop() between slices
    std::unique_ptr<DataConnection> wait_for_data_connection(IoStatus& status);
    IoStatus read_data(DataConnection& conn, uint8_t* buf, size_t len, size_t& received);
    void close_passive();

    void cmd_user(const std::string& arg);
    void cmd_pass(const std::string& arg);
    void cmd_syst(const std::string& arg);
    void cmd_feat(const std::string& arg);
    void cmd_opts(const std::string& arg);
    void cmd_pbsz(const std::string& arg);
    void cmd_prot(const std::string& arg);
    void cmd_noop(const std::string& arg);
    void cmd_pwd(const std::string& arg);
    void cmd_cwd(const std::string& arg);
    void cmd_mkd(const std::string& arg);
    void cmd_type(const std::string& arg);
    void cmd_pasv(const std::string& arg);
    void cmd_stor(const std::string& arg);
    void cmd_list(const std::string& arg);
    void cmd_size(const std::string& arg);
    void cmd_quit(const std::string& arg);

    std::unique_ptr<ControlChannel> control_;
    std::shared_ptr<PassiveListenerFactory> listeners_;
    FtpSessionConfig config_;
    UploadCallback on_upload_;
    std::string peer_;
    std::string log_tag_;

    bool authenticated_ = false;
    std::string username_;
    std::string current_dir_ = "/";
    TransferType transfer_type_ = TransferType::Ascii;
    std::unique_ptr<PassiveListener> passive_;

    bool quit_ = false;
    bool control_broken_ = false;
    std::atomic<bool> stop_requested_{false};

    std::mutex control_mutex_;
    bool control_closed_ = false;
};

/**
 * @brief Encode an IPv4 address and port as the PASV tuple
 *
 * ("192.168.1.5", 50123) -> "(192,168,1,5,195,203)"
 */
std::string format_passive_address(const std::string& ipv4, uint16_t port);

} // namespace vprinter
