// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "single_instance.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace hackerai {

namespace {

constexpr int ACCEPT_POLL_MS = 200;
constexpr int CLIENT_READ_TIMEOUT_SEC = 2;
constexpr int ACK_TIMEOUT_SEC = 5;
constexpr const char* ACK = "ok\n";

bool make_address(const std::string& path, sockaddr_un& addr) {
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        return false;
    }
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    return true;
}

void set_recv_timeout(int fd, int seconds) {
    timeval tv{};
    tv.tv_sec = seconds;
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        spdlog::debug("[SingleInstance] SO_RCVTIMEO failed: {}", strerror(errno));
    }
}

bool send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

// Reads up to the first newline (excluded). false on timeout, error or oversize.
bool read_line(int fd, std::string& line, size_t max_bytes) {
    line.clear();
    char buf[1024];
    while (line.size() <= max_bytes) {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return false;
        }
        if (n == 0) {
            // Peer closed without a newline; accept what arrived
            return !line.empty();
        }
        line.append(buf, static_cast<size_t>(n));
        auto nl = line.find('\n');
        if (nl != std::string::npos) {
            line.resize(nl);
            return true;
        }
    }
    return false;
}

} // namespace

const char* single_instance_role_name(SingleInstance::Role role) {
    switch (role) {
    case SingleInstance::Role::None:
        return "none";
    case SingleInstance::Role::Primary:
        return "primary";
    case SingleInstance::Role::Secondary:
        return "secondary";
    case SingleInstance::Role::Failed:
        return "failed";
    }
    return "unknown";
}

SingleInstance::SingleInstance(std::string socket_path) : socket_path_(std::move(socket_path)) {}

SingleInstance::~SingleInstance() {
    // NOTE: Don't use spdlog here - during exit(), spdlog may already be destroyed
    close_all();
}

std::string SingleInstance::default_socket_path() {
    const char* runtime_dir = std::getenv("XDG_RUNTIME_DIR");
    if (runtime_dir && runtime_dir[0] != '\0') {
        struct stat st {};
        if (stat(runtime_dir, &st) == 0 && S_ISDIR(st.st_mode)) {
            return std::string(runtime_dir) + "/" + SOCKET_NAME;
        }
    }
    return std::string("/tmp/") + SOCKET_NAME + "-" + std::to_string(getuid());
}

std::string SingleInstance::encode_message(const std::vector<std::string>& args,
                                           const std::string& cwd) {
    json msg = {{"args", args}, {"cwd", cwd}};
    // Arguments come from the OS and need not be valid UTF-8
    return msg.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

bool SingleInstance::decode_message(const std::string& line, std::vector<std::string>& args,
                                    std::string& cwd) {
    json msg;
    try {
        msg = json::parse(line);
    } catch (const json::exception& e) {
        spdlog::warn("[SingleInstance] Unparseable message: {}", e.what());
        return false;
    }

    if (!msg.is_object() || !msg.contains("args") || !msg["args"].is_array()) {
        spdlog::warn("[SingleInstance] Message has no args array");
        return false;
    }

    std::vector<std::string> decoded;
    for (const auto& arg : msg["args"]) {
        if (!arg.is_string()) {
            spdlog::warn("[SingleInstance] Message has a non-string argument");
            return false;
        }
        decoded.push_back(arg.get<std::string>());
    }

    args = std::move(decoded);
    cwd = msg.contains("cwd") && msg["cwd"].is_string() ? msg["cwd"].get<std::string>() : "";
    return true;
}

bool SingleInstance::try_connect() {
    sockaddr_un addr;
    if (!make_address(socket_path_, addr)) {
        return false;
    }

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return false;
    }
    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(fd);
        return false;
    }

    client_fd_ = fd;
    return true;
}

bool SingleInstance::bind_and_listen() {
    sockaddr_un addr;
    if (!make_address(socket_path_, addr)) {
        spdlog::warn("[SingleInstance] Socket path too long: {}", socket_path_);
        return false;
    }

    // Nobody answered, so any existing file is left over from a crash
    if (unlink(socket_path_.c_str()) == 0) {
        spdlog::debug("[SingleInstance] Removed stale socket {}", socket_path_);
    }

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        spdlog::warn("[SingleInstance] socket() failed: {}", strerror(errno));
        return false;
    }
    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        spdlog::warn("[SingleInstance] bind({}) failed: {}", socket_path_, strerror(errno));
        close(fd);
        return false;
    }
    if (chmod(socket_path_.c_str(), S_IRUSR | S_IWUSR) < 0) {
        spdlog::debug("[SingleInstance] chmod failed: {}", strerror(errno));
    }
    if (listen(fd, 8) < 0) {
        spdlog::warn("[SingleInstance] listen() failed: {}", strerror(errno));
        close(fd);
        unlink(socket_path_.c_str());
        return false;
    }

    listen_fd_ = fd;
    return true;
}

SingleInstance::Role SingleInstance::acquire(ArgsCallback on_args) {
    if (role_ != Role::None) {
        return role_;
    }
    on_args_ = std::move(on_args);

    if (try_connect()) {
        role_ = Role::Secondary;
        spdlog::info("[SingleInstance] Another instance is already running ({})", socket_path_);
        return role_;
    }

    if (!bind_and_listen()) {
        // Another launch may have won the race to bind
        if (try_connect()) {
            role_ = Role::Secondary;
            spdlog::info("[SingleInstance] Another instance started concurrently");
            return role_;
        }
        role_ = Role::Failed;
        spdlog::warn("[SingleInstance] Running without single-instance protection");
        return role_;
    }

    role_ = Role::Primary;
    stop_requested_.store(false);
    accept_thread_ = std::thread(&SingleInstance::accept_loop, this);
    spdlog::info("[SingleInstance] Listening on {}", socket_path_);
    return role_;
}

bool SingleInstance::forward(const std::vector<std::string>& args, const std::string& cwd) {
    if (role_ != Role::Secondary) {
        spdlog::error("[SingleInstance] forward() called as {}", single_instance_role_name(role_));
        return false;
    }
    if (client_fd_ < 0 && !try_connect()) {
        spdlog::error("[SingleInstance] Primary instance no longer reachable");
        return false;
    }

    bool ok = false;
    std::string ack;
    if (!send_all(client_fd_, encode_message(args, cwd))) {
        spdlog::error("[SingleInstance] Failed to send arguments: {}", strerror(errno));
    } else {
        set_recv_timeout(client_fd_, ACK_TIMEOUT_SEC);
        ok = read_line(client_fd_, ack, 16) && ack + "\n" == ACK;
        if (!ok) {
            spdlog::error("[SingleInstance] Primary instance did not acknowledge");
        }
    }

    close(client_fd_);
    client_fd_ = -1;

    if (ok) {
        spdlog::info("[SingleInstance] Forwarded {} argument(s) to running instance",
                     args.size());
    }
    return ok;
}

void SingleInstance::accept_loop() {
    while (!stop_requested_.load()) {
        pollfd pfd{listen_fd_, POLLIN, 0};
        int rc = poll(&pfd, 1, ACCEPT_POLL_MS);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            spdlog::error("[SingleInstance] poll() failed: {}", strerror(errno));
            break;
        }
        if (rc == 0 || stop_requested_.load()) {
            continue;
        }

        int fd = accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno != EINTR && errno != EAGAIN) {
                spdlog::warn("[SingleInstance] accept() failed: {}", strerror(errno));
            }
            continue;
        }
        serve_client(fd);
        close(fd);
    }
}

void SingleInstance::serve_client(int fd) {
    set_recv_timeout(fd, CLIENT_READ_TIMEOUT_SEC);

    std::string line;
    if (!read_line(fd, line, MAX_MESSAGE_BYTES)) {
        spdlog::warn("[SingleInstance] Dropped incomplete message from new instance");
        return;
    }

    std::vector<std::string> args;
    std::string cwd;
    if (!decode_message(line, args, cwd)) {
        return;
    }

    if (!send_all(fd, ACK)) {
        spdlog::debug("[SingleInstance] New instance left before acknowledgement");
    }

    spdlog::debug("[SingleInstance] Received {} argument(s) from new instance", args.size());
    if (!on_args_) {
        return;
    }
    try {
        on_args_(args, cwd);
    } catch (const std::exception& e) {
        spdlog::error("[SingleInstance] Argument callback threw: {}", e.what());
    }
}

void SingleInstance::release() {
    if (role_ == Role::None) {
        return;
    }
    spdlog::debug("[SingleInstance] Releasing ({})", single_instance_role_name(role_));
    close_all();
}

void SingleInstance::close_all() {
    stop_requested_.store(true);
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (listen_fd_ >= 0) {
        close(listen_fd_);
        listen_fd_ = -1;
        unlink(socket_path_.c_str());
    }
    if (client_fd_ >= 0) {
        close(client_fd_);
        client_fd_ = -1;
    }
    role_ = Role::None;
}

} // namespace hackerai
