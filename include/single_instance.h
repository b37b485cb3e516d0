// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file single_instance.h
 * @brief One running shell per user, later launches forward their argv
 *
 * The first process binds a Unix-domain socket in $XDG_RUNTIME_DIR and
 * becomes the primary. A later launch (e.g. the desktop opening a
 * hackerai:// link) finds the socket answering, sends its arguments as one
 * newline-terminated JSON document and exits:
 *
 *   {"args": ["hackerai-desktop", "hackerai://auth?token=..."], "cwd": "/home/u"}
 *
 * The primary acknowledges with "ok\n" and hands the decoded arguments to
 * the callback on its accept thread.
 */

#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace hackerai {

class SingleInstance {
  public:
    using ArgsCallback =
        std::function<void(const std::vector<std::string>& args, const std::string& cwd)>;

    enum class Role {
        None,      ///< acquire() not called yet, or released
        Primary,   ///< Owns the socket and listens
        Secondary, ///< Another process owns the socket
        Failed     ///< Socket unusable, running without single-instance
    };

    static constexpr const char* SOCKET_NAME = "co.hackerai.desktop.sock";
    static constexpr size_t MAX_MESSAGE_BYTES = 64 * 1024;

    explicit SingleInstance(std::string socket_path = default_socket_path());
    ~SingleInstance();

    // Non-copyable
    SingleInstance(const SingleInstance&) = delete;
    SingleInstance& operator=(const SingleInstance&) = delete;

    /**
     * @brief Become primary, or detect that another process already is
     *
     * @param on_args Invoked (on the accept thread) for every forwarded launch
     */
    Role acquire(ArgsCallback on_args);

    /**
     * @brief Secondary only: send args and cwd to the primary
     * @return true once the primary acknowledged
     */
    bool forward(const std::vector<std::string>& args, const std::string& cwd);

    /** @brief Stop listening, close and unlink the socket (idempotent) */
    void release();

    Role role() const {
        return role_;
    }

    const std::string& socket_path() const {
        return socket_path_;
    }

    /** @brief $XDG_RUNTIME_DIR/<SOCKET_NAME>, or /tmp/<SOCKET_NAME>-<uid> */
    static std::string default_socket_path();

    static std::string encode_message(const std::vector<std::string>& args,
                                      const std::string& cwd);
    static bool decode_message(const std::string& line, std::vector<std::string>& args,
                               std::string& cwd);

  private:
    bool try_connect();
    bool bind_and_listen();
    void accept_loop();
    void serve_client(int fd);
    void close_all();

    std::string socket_path_;
    ArgsCallback on_args_;
    Role role_ = Role::None;

    int listen_fd_ = -1;
    int client_fd_ = -1;
    std::thread accept_thread_;
    std::atomic<bool> stop_requested_{false};
};

const char* single_instance_role_name(SingleInstance::Role role);

} // namespace hackerai
