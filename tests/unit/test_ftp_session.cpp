// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_ftp_session.cpp
 * @brief FTP command state machine driven through scripted channels
 */

#include "ftp_session.h"

#include "../mocks/mock_ftp_channels.h"
#include "../test_helpers/temp_directory.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace vprinter;

namespace {

struct UploadRecord {
    std::string path;
    std::string source_ip;
    size_t replies_before_callback = 0;
};

} // namespace

class FtpSessionFixture {
  protected:
    TempDirectory dir{"vprinter-ftp-session"};
    std::shared_ptr<MockPassiveListenerFactory> factory =
        std::make_shared<MockPassiveListenerFactory>();
    FtpSessionConfig config;
    std::vector<UploadRecord> uploads;
    ScriptedControlChannel* control = nullptr;
    std::unique_ptr<FtpSession> session;

    FtpSessionFixture() {
        config.upload_dir = dir.str();
        config.access_code = "12345678";
        config.data_connect_timeout = std::chrono::milliseconds(60);
        config.data_read_timeout = std::chrono::milliseconds(60);
        config.stop_check_interval = std::chrono::milliseconds(10);
    }

    void make_session(std::unique_ptr<ScriptedControlChannel> channel) {
        control = channel.get();
        session = std::make_unique<FtpSession>(
            std::move(channel), factory, config,
            [this](const std::string& path, const std::string& ip) {
                uploads.push_back({path, ip, control->replies().size()});
            });
    }

    /// Run a script of client lines to completion
    void run(const std::vector<std::string>& lines) {
        make_session(std::make_unique<ScriptedControlChannel>(lines));
        session->run();
    }

    /// Same as run() but logged in first
    void run_logged_in(std::vector<std::string> lines) {
        lines.insert(lines.begin(), {"USER bblp", "PASS 12345678"});
        run(lines);
    }

    const std::vector<std::string>& replies() const {
        return control->replies();
    }

    std::string last_reply() const {
        return replies().empty() ? std::string() : replies().back();
    }
};

// ============================================================================
// Greeting and authentication
// ============================================================================

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: banner is the first reply", "[ftp_session]") {
    run({});

    REQUIRE(replies().size() == 1);
    REQUIRE(replies()[0] == "220 Virtual Printer FTP ready");
    REQUIRE(control->closed());
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: successful login", "[ftp_session][auth]") {
    run({"USER bblp", "PASS 12345678"});

    REQUIRE(replies()[1] == "331 Password required");
    REQUIRE(replies()[2] == "230 Login successful");
    REQUIRE(session->is_authenticated());
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: user name is case-insensitive",
                 "[ftp_session][auth]") {
    run({"USER BBLP", "PASS 12345678"});

    REQUIRE(replies()[1] == "331 Password required");
    REQUIRE(session->is_authenticated());
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: unknown user is rejected",
                 "[ftp_session][auth]") {
    run({"USER admin", "PASS 12345678"});

    REQUIRE(replies()[1] == "530 Invalid user");
    REQUIRE(replies()[2] == "503 Login with USER first");
    REQUIRE_FALSE(session->is_authenticated());
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: PASS before USER needs USER first",
                 "[ftp_session][auth]") {
    run({"PASS 12345678"});

    REQUIRE(replies()[1] == "503 Login with USER first");
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: wrong access code", "[ftp_session][auth]") {
    SECTION("different code") {
        run({"USER bblp", "PASS 87654321"});
    }
    SECTION("access code compare is case-sensitive") {
        config.access_code = "abcdEFGH";
        run({"USER bblp", "PASS ABCDefgh"});
    }

    REQUIRE(last_reply() == "530 Login incorrect");
    REQUIRE_FALSE(session->is_authenticated());
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: USER restarts authentication",
                 "[ftp_session][auth]") {
    run({"USER bblp", "PASS 12345678", "USER bblp", "PWD"});

    REQUIRE(replies()[3] == "331 Password required");
    REQUIRE(last_reply() == "530 Not logged in");
    REQUIRE_FALSE(session->is_authenticated());
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: commands needing login are refused",
                 "[ftp_session][auth]") {
    run({"PWD", "CWD /", "MKD x", "TYPE I", "PASV", "LIST", "SIZE a.3mf", "STOR a.3mf"});

    // banner + one 530 per command
    REQUIRE(replies().size() == 9);
    REQUIRE(control->replies_with(530).size() == 8);
    REQUIRE(factory->state().listeners_opened == 0);
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: pre-login commands are answered",
                 "[ftp_session]") {
    run({"SYST", "NOOP", "PBSZ 0", "PROT P", "OPTS UTF8 ON"});

    REQUIRE(replies()[1] == "215 UNIX Type: L8");
    REQUIRE(replies()[2] == "200 OK");
    REQUIRE(replies()[3] == "200 PBSZ=0");
    REQUIRE(replies()[4] == "200 Protection level set to Private");
    REQUIRE(replies()[5] == "200 UTF8 mode enabled");
}

// ============================================================================
// Command parsing and simple replies
// ============================================================================

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: FEAT is a multi-line reply", "[ftp_session]") {
    run({"FEAT"});

    REQUIRE(replies().size() == 6);
    REQUIRE(replies()[1] == "211-Features:");
    REQUIRE(replies()[2] == " PASV");
    REQUIRE(replies()[3] == " UTF8");
    REQUIRE(replies()[4] == " SIZE");
    REQUIRE(replies()[5] == "211 End");
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: command verbs are case-insensitive",
                 "[ftp_session]") {
    run({"noop", "syst"});

    REQUIRE(replies()[1] == "200 OK");
    REQUIRE(replies()[2] == "215 UNIX Type: L8");
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: unknown command", "[ftp_session]") {
    run({"RETR model.3mf", "dele x"});

    REQUIRE(replies()[1] == "502 Command RETR not implemented");
    REQUIRE(replies()[2] == "502 Command DELE not implemented");
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: PROT and OPTS variants", "[ftp_session]") {
    run({"PROT C", "PROT S", "OPTS MLST type;"});

    REQUIRE(replies()[1] == "536 Protection level C not supported");
    REQUIRE(replies()[2] == "504 Protection level S not supported");
    REQUIRE(replies()[3] == "501 Option not supported");
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: directory commands", "[ftp_session]") {
    run_logged_in({"PWD", "CWD /cache", "MKD cache", "SIZE model.3mf"});

    REQUIRE(replies()[3] == "257 \"/\" is current directory");
    REQUIRE(replies()[4] == "250 Directory changed");
    REQUIRE(replies()[5] == "257 \"cache\" directory created");
    REQUIRE(replies()[6] == "550 File not found");
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: TYPE", "[ftp_session]") {
    SECTION("binary") {
        run_logged_in({"TYPE I"});
        REQUIRE(last_reply() == "200 Type set to Binary");
        REQUIRE(session->transfer_type() == FtpSession::TransferType::Binary);
    }
    SECTION("ascii") {
        run_logged_in({"TYPE I", "TYPE A N"});
        REQUIRE(last_reply() == "200 Type set to ASCII");
        REQUIRE(session->transfer_type() == FtpSession::TransferType::Ascii);
    }
    SECTION("unsupported") {
        run_logged_in({"TYPE E"});
        REQUIRE(last_reply() == "504 Type not supported");
    }
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: QUIT ends the session", "[ftp_session]") {
    run({"QUIT", "NOOP"});

    REQUIRE(replies().size() == 2);
    REQUIRE(last_reply() == "221 Goodbye");
    REQUIRE(control->closed());
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: overlong line gets 500 and session continues",
                 "[ftp_session]") {
    make_session(std::make_unique<ScriptedControlChannel>(std::vector<ScriptedControlChannel::Step>{
        {IoStatus::Overflow, ""}, {IoStatus::Ok, "NOOP"}}));
    session->run();

    REQUIRE(replies()[1] == "500 Line too long");
    REQUIRE(replies()[2] == "200 OK");
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: idle timeout closes the session",
                 "[ftp_session]") {
    make_session(std::make_unique<ScriptedControlChannel>(std::vector<ScriptedControlChannel::Step>{
        {IoStatus::Timeout, ""}, {IoStatus::Ok, "NOOP"}}));
    session->run();

    REQUIRE(replies().size() == 1);
    REQUIRE(control->closed());
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: failed reply write ends the session",
                 "[ftp_session]") {
    auto channel = std::make_unique<ScriptedControlChannel>(std::vector<std::string>{"NOOP"});
    channel->set_fail_writes(true);
    make_session(std::move(channel));
    session->run();

    // Only the banner write was attempted
    REQUIRE(replies().size() == 1);
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: request_stop interrupts the control channel",
                 "[ftp_session]") {
    make_session(std::make_unique<ScriptedControlChannel>(std::vector<std::string>{"NOOP"}));
    session->request_stop();
    REQUIRE(control->interrupted());

    session->run();
    REQUIRE(replies().size() == 1);
}

// ============================================================================
// Passive mode
// ============================================================================

TEST_CASE("format_passive_address encodes host and port", "[ftp_session][pasv]") {
    REQUIRE(format_passive_address("192.168.1.20", 50123) == "(192,168,1,20,195,203)");
    REQUIRE(format_passive_address("127.0.0.1", 256) == "(127,0,0,1,1,0)");
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: PASV advertises the control local address",
                 "[ftp_session][pasv]") {
    run_logged_in({"PASV"});

    REQUIRE(last_reply() == "227 Entering Passive Mode (192,168,1,20,195,203)");
    REQUIRE(session->has_passive_listener());
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: PASV falls back to loopback",
                 "[ftp_session][pasv]") {
    auto channel = std::make_unique<ScriptedControlChannel>(
        std::vector<std::string>{"USER bblp", "PASS 12345678", "PASV"});
    channel->set_local_address("0.0.0.0");
    make_session(std::move(channel));
    session->run();

    REQUIRE(last_reply() == "227 Entering Passive Mode (127,0,0,1,195,203)");
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: second PASV replaces the first listener",
                 "[ftp_session][pasv]") {
    run_logged_in({"PASV", "PASV"});

    REQUIRE(factory->state().listeners_opened == 2);
    // First closed by the second PASV, second by session end
    REQUIRE(factory->state().listeners_closed == 2);
    REQUIRE(last_reply() == "227 Entering Passive Mode (192,168,1,20,195,204)");
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: PASV without a free port",
                 "[ftp_session][pasv]") {
    factory->set_fail_open(true);
    run_logged_in({"PASV", "STOR a.3mf"});

    REQUIRE(replies()[3] == "425 Cannot open data connection");
    REQUIRE(replies()[4] == "425 Use PASV first");
}

// ============================================================================
// STOR
// ============================================================================

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: STOR without PASV", "[ftp_session][stor]") {
    run_logged_in({"STOR model.3mf"});

    REQUIRE(last_reply() == "425 Use PASV first");
    REQUIRE(uploads.empty());
    REQUIRE_FALSE(fs::exists(dir.path() / "model.3mf"));
    REQUIRE(fs::is_empty(dir.path()));
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: STOR saves the file then notifies",
                 "[ftp_session][stor]") {
    factory->plan().chunks = {"PK\x03\x04", std::string(1000, 'x'), "tail"};
    run_logged_in({"TYPE I", "PASV", "STOR model.3mf", "QUIT"});

    auto path = dir.path() / "model.3mf";
    REQUIRE(fs::exists(path));
    REQUIRE(read_text_file(path) == std::string("PK\x03\x04") + std::string(1000, 'x') + "tail");

    REQUIRE(replies()[5] == "150 Opening data connection for model.3mf");
    REQUIRE(replies()[6] == "226 Transfer complete");
    REQUIRE(last_reply() == "221 Goodbye");

    REQUIRE(uploads.size() == 1);
    REQUIRE(uploads[0].path == path.string());
    REQUIRE(uploads[0].source_ip == "10.0.0.5");
    // 226 already sent when the callback ran
    REQUIRE(uploads[0].replies_before_callback == 7);

    REQUIRE(factory->state().connections_closed == 1);
    REQUIRE(factory->state().listeners_closed == 1);
    REQUIRE_FALSE(session->has_passive_listener());
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: empty upload creates an empty file",
                 "[ftp_session][stor]") {
    run_logged_in({"PASV", "STOR empty.gcode"});

    REQUIRE(last_reply() == "226 Transfer complete");
    REQUIRE(fs::file_size(dir.path() / "empty.gcode") == 0);
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: each STOR needs its own PASV",
                 "[ftp_session][stor]") {
    factory->plan().chunks = {"data"};
    run_logged_in({"PASV", "STOR a.3mf", "STOR b.3mf"});

    REQUIRE(last_reply() == "425 Use PASV first");
    REQUIRE(uploads.size() == 1);
    REQUIRE_FALSE(fs::exists(dir.path() / "b.3mf"));
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: STOR keeps uploads inside the upload dir",
                 "[ftp_session][stor]") {
    factory->plan().chunks = {"data"};
    run_logged_in({"PASV", "STOR ../../etc/evil.3mf"});

    REQUIRE(last_reply() == "226 Transfer complete");
    REQUIRE(fs::exists(dir.path() / "evil.3mf"));
    REQUIRE(uploads[0].path == (dir.path() / "evil.3mf").string());
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: STOR rejects unusable names",
                 "[ftp_session][stor]") {
    run_logged_in({"PASV", "STOR ..", "STOR a.3mf"});

    REQUIRE(replies()[4] == "501 Invalid file name");
    // The passive listener was released with the rejected STOR
    REQUIRE(replies()[5] == "425 Use PASV first");
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: data connection never arrives",
                 "[ftp_session][stor]") {
    factory->plan().accept_status = IoStatus::Timeout;
    run_logged_in({"PASV", "STOR late.3mf", "NOOP"});

    REQUIRE(replies()[4] == "150 Opening data connection for late.3mf");
    REQUIRE(replies()[5] == "425 Data connection timeout");
    REQUIRE(last_reply() == "200 OK");
    REQUIRE_FALSE(session->has_passive_listener());
    REQUIRE(uploads.empty());
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: data connection handshake fails",
                 "[ftp_session][stor]") {
    factory->plan().accept_status = IoStatus::Error;
    run_logged_in({"PASV", "STOR bad.3mf"});

    REQUIRE(last_reply() == "425 Data connection failed");
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: stalled transfer times out",
                 "[ftp_session][stor]") {
    factory->plan().chunks = {"partial"};
    factory->plan().final_status = IoStatus::Timeout;
    run_logged_in({"PASV", "STOR stall.3mf"});

    REQUIRE(last_reply() == "426 Transfer timeout");
    REQUIRE_FALSE(fs::exists(dir.path() / "stall.3mf"));
    REQUIRE(uploads.empty());
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: broken transfer is not saved",
                 "[ftp_session][stor]") {
    factory->plan().chunks = {"partial"};
    factory->plan().final_status = IoStatus::Error;
    run_logged_in({"PASV", "STOR broken.3mf"});

    REQUIRE(last_reply() == "426 Transfer failed");
    REQUIRE_FALSE(fs::exists(dir.path() / "broken.3mf"));
    REQUIRE(uploads.empty());
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: unwritable upload dir gives 550",
                 "[ftp_session][stor]") {
    config.upload_dir = (dir.path() / "does" / "not" / "exist").string();
    factory->plan().chunks = {"data"};
    run_logged_in({"PASV", "STOR model.3mf"});

    REQUIRE(last_reply() == "550 Failed to save file");
    REQUIRE(uploads.empty());
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: throwing upload callback is contained",
                 "[ftp_session][stor]") {
    factory->plan().chunks = {"data"};
    auto channel = std::make_unique<ScriptedControlChannel>(std::vector<std::string>{
        "USER bblp", "PASS 12345678", "PASV", "STOR model.3mf", "NOOP"});
    ScriptedControlChannel* raw = channel.get();
    FtpSession throwing(std::move(channel), factory, config,
                        [](const std::string&, const std::string&) {
                            throw std::runtime_error("archive service down");
                        });
    REQUIRE_NOTHROW(throwing.run());

    REQUIRE(raw->replies()[5] == "226 Transfer complete");
    REQUIRE(raw->replies().back() == "200 OK");
    REQUIRE(fs::exists(dir.path() / "model.3mf"));
}

// ============================================================================
// LIST
// ============================================================================

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: LIST without PASV still completes",
                 "[ftp_session][list]") {
    run_logged_in({"LIST"});

    REQUIRE(replies()[3] == "150 Opening data connection");
    REQUIRE(replies()[4] == "226 Transfer complete");
}

TEST_CASE_METHOD(FtpSessionFixture, "FtpSession: LIST serves an empty listing",
                 "[ftp_session][list]") {
    run_logged_in({"PASV", "LIST", "STOR a.3mf"});

    REQUIRE(replies()[5] == "226 Transfer complete");
    REQUIRE(factory->state().connections_accepted == 1);
    REQUIRE(factory->state().connections_closed == 1);
    REQUIRE(last_reply() == "425 Use PASV first");
}
