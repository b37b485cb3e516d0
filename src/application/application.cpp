// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file application.cpp
 * @brief Application lifecycle orchestrator
 */

#include "application.h"

#include "app_globals.h"
#include "config.h"
#include "deep_link_handler.h"
#include "deep_link_registrar.h"
#include "hackerai_version.h"
#include "logging_init.h"
#include "main_thread_services.h"
#include "single_instance.h"
#include "system/browser_view.h"
#include "system/update_checker.h"
#include "system/update_scheduler.h"
#include "system/update_service.h"
#include "system/update_throttle.h"
#include "system/zenity_dialog_service.h"
#include "utils/auth_validation.h"
#include "utils/process_exec.h"
#include "utils/url.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <climits>
#include <future>
#include <unistd.h>

namespace hackerai {

namespace {

std::string current_working_dir() {
    char buf[PATH_MAX];
    if (getcwd(buf, sizeof(buf)) == nullptr) {
        return "";
    }
    return buf;
}

// Argument list for logs: deep links carry tokens and are never printed
std::string describe_args(const std::vector<std::string>& args) {
    std::string out;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            out += ' ';
        }
        if (args[i].compare(0, 9, "hackerai:") == 0) {
            out += "<deep link>";
        } else {
            out += args[i];
        }
    }
    return out;
}

} // namespace

Application::Application() = default;

Application::~Application() {
    shutdown();
}

int Application::run(int argc, char** argv) {
    // Initialize minimal logging first so early log calls don't crash
    logging::init_early();

    // Store argv early for restart capability
    app_store_argv(argc, argv);
    m_main_queue.bind_to_current_thread();

    // Phase 1: Parse command line args
    switch (parse_cli_args(argc, argv, m_args)) {
    case CliParseResult::ExitSuccess:
        return 0;
    case CliParseResult::ExitError:
        return 1;
    case CliParseResult::Ok:
        break;
    }

    // Phase 2: Configuration and logging
    init_config();
    init_logging();
    spdlog::info("[Application] Starting HackerAI Desktop {}", version::current());

    // Phase 3: One instance per user
    bool forwarded = false;
    if (!init_single_instance(argc, argv, forwarded)) {
        return forwarded ? 0 : 1;
    }
    app_install_signal_handlers();

    // Phase 4: Desktop integration
    register_deep_link_scheme();

    // Phase 5: Host services and initial view
    init_services();
    open_app_url();
    process_initial_deep_links();

    // Phase 6: Updates
    start_update_scheduler();
    if (m_args.check_updates) {
        start_interactive_update_check();
    }

    int rc = main_loop();

    shutdown();
    return rc;
}

bool Application::init_config() {
    m_config = Config::get_instance();
    std::string path = Config::resolve_config_path(m_args.config_path);
    if (!m_config->init(path)) {
        spdlog::warn("[Application] Config could not be saved to {}, continuing with defaults",
                     path);
    }

    m_data_dir = Config::resolve_data_dir();
    if (m_data_dir.empty()) {
        spdlog::warn("[Application] No app data directory (HOME unset); update checks run on "
                     "every poll");
    }
    return true;
}

bool Application::init_logging() {
    logging::LogConfig log_config;

    // CLI verbosity takes precedence, then config file
    log_config.level = logging::resolve_level(m_args.verbosity, m_config->get_log_level());

    std::string log_dest = m_args.log_dest;
    if (log_dest.empty()) {
        log_dest = m_config->get_log_dest();
    }
    log_config.target = logging::parse_log_target(log_dest);
    log_config.file_path = m_args.log_file;
    log_config.data_dir = m_data_dir;

    logging::init(log_config);
    return true;
}

bool Application::init_single_instance(int argc, char** argv, bool& forwarded) {
    m_instance = std::make_unique<SingleInstance>();

    auto role = m_instance->acquire(
        [this](const std::vector<std::string>& args, const std::string& cwd) {
            // Accept thread: hand over to the main thread
            m_main_queue.post([this, args, cwd] { on_instance_args(args, cwd); });
        });

    if (role != SingleInstance::Role::Secondary) {
        return true;
    }

    std::vector<std::string> args(argv, argv + argc);
    forwarded = m_instance->forward(args, current_working_dir());
    if (!forwarded) {
        spdlog::error("[Application] Could not hand arguments to the running instance");
    }
    return false;
}

void Application::register_deep_link_scheme() {
    if (m_args.no_register) {
        spdlog::debug("[Application] Scheme registration skipped (--no-register)");
        return;
    }
    if (!m_config->is_deep_link_registration_enabled()) {
        spdlog::debug("[Application] Scheme registration disabled in config");
        return;
    }

    DeepLinkRegistrar registrar;
    if (!registrar.register_scheme(app_executable_path())) {
        spdlog::warn("[Application] {}:// links will not reach this app until registration "
                     "succeeds",
                     DEEP_LINK_SCHEME);
    }
}

void Application::init_services() {
    m_view = std::make_unique<BrowserView>(m_config->get_webview_launcher());
    m_dialogs = std::make_unique<ZenityDialogService>();
    if (!tool_available("zenity")) {
        spdlog::warn("[Application] zenity not found, update dialogs will not be shown");
    }

    // Anything that may run off the main thread goes through these
    m_view_proxy = std::make_unique<MainThreadWebView>(*m_view, m_main_queue);
    m_dialogs_proxy = std::make_unique<MainThreadDialogService>(*m_dialogs, m_main_queue);

    m_deep_links = std::make_unique<DeepLinkHandler>(*m_view_proxy);

    m_update_service = std::make_unique<ManifestUpdateService>(m_config->get_update_endpoint(),
                                                               version::current());
    m_update_checker = std::make_unique<UpdateChecker>(*m_update_service, *m_dialogs_proxy, *this);
    m_throttle =
        std::make_unique<UpdateThrottle>(m_data_dir, m_config->get_update_check_interval_sec());
}

void Application::open_app_url() {
    std::string url = m_config->get_app_url();
    auto parsed = parse_url(url);
    if (!parsed || (parsed->scheme != "https" && parsed->scheme != "http")) {
        spdlog::warn("[Application] Invalid app URL '{}', using {}", url, PRODUCTION_ORIGIN);
        url = PRODUCTION_ORIGIN;
    }

    std::string error;
    if (!m_view_proxy->navigate(url, error)) {
        spdlog::error("[Application] Failed to open {}: {}", url, error);
        return;
    }
    spdlog::info("[Application] Opened {}", url);
}

void Application::process_initial_deep_links() {
    std::vector<std::string> args;
    args.reserve(m_args.positionals.size() + 1);
    args.push_back(app_executable_path());
    args.insert(args.end(), m_args.positionals.begin(), m_args.positionals.end());

    int handled = m_deep_links->handle_args(args);
    if (handled > 0) {
        spdlog::debug("[Application] Processed {} deep link(s) from launch arguments", handled);
    }
}

void Application::start_update_scheduler() {
    if (m_args.no_update_check) {
        spdlog::info("[Application] Background update checks disabled (--no-update-check)");
        return;
    }
    if (!m_config->is_updater_enabled()) {
        spdlog::info("[Application] Background update checks disabled in config");
        return;
    }

    auto poll_interval = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::seconds(m_config->get_update_poll_interval_sec()));

    m_scheduler = std::make_unique<UpdateScheduler>(
        *m_throttle, [this] { m_update_checker->check_for_updates(true); }, poll_interval);
    // --check-updates runs its own check on launch; one dialog is enough
    m_scheduler->start(!m_args.check_updates);
}

void Application::start_interactive_update_check() {
    if (!m_update_checker) {
        return;
    }
    if (m_interactive_check_running.exchange(true)) {
        spdlog::info("[Application] Update check already in progress");
        return;
    }
    if (m_interactive_check_thread.joinable()) {
        m_interactive_check_thread.join(); // previous run has finished
    }

    m_interactive_check_thread = std::thread([this] {
        m_throttle->save(UpdateThrottle::now_seconds());
        CheckOutcome outcome = m_update_checker->check_for_updates(false);
        spdlog::debug("[Application] Interactive update check finished: {}",
                      check_outcome_name(outcome));
        m_interactive_check_running.store(false);
    });
}

void Application::on_instance_args(const std::vector<std::string>& args, const std::string& cwd) {
    spdlog::info("[Application] Another launch forwarded {} argument(s)", args.size());
    spdlog::debug("[Application] Forwarded args: [{}] (cwd: {})", describe_args(args), cwd);

    m_deep_links->handle_args(args);

    if (args_contain_flag(args, "--check-updates")) {
        start_interactive_update_check();
    }

    m_view_proxy->focus();
}

void Application::restart() {
    spdlog::info("[Application] Restarting to apply update");
    try {
        m_main_queue.call_sync([this] {
            // The new process must be able to bind the instance socket
            if (m_instance) {
                m_instance->release();
            }
            app_request_restart();
        });
    } catch (const std::future_error& e) {
        spdlog::warn("[Application] Restart requested during shutdown: {}", e.what());
        app_request_quit();
    }
}

int Application::main_loop() {
    spdlog::info("[Application] Entering main loop");
    m_running = true;

    m_main_queue.run_until([] { return app_quit_requested(); });

    m_running = false;
    spdlog::info("[Application] Main loop exited");
    return 0;
}

void Application::shutdown() {
    // Guard against multiple calls (destructor + explicit shutdown)
    if (m_shutdown_complete) {
        return;
    }
    m_shutdown_complete = true;

    spdlog::info("[Application] Shutting down...");

    // Unblock background tasks waiting on a dialog before joining them
    m_main_queue.shutdown();

    if (m_scheduler) {
        m_scheduler->stop();
    }
    if (m_interactive_check_thread.joinable()) {
        m_interactive_check_thread.join();
    }
    if (m_instance) {
        m_instance->release();
    }

    // Reverse order of creation
    m_scheduler.reset();
    m_throttle.reset();
    m_update_checker.reset();
    m_update_service.reset();
    m_deep_links.reset();
    m_dialogs_proxy.reset();
    m_view_proxy.reset();
    m_dialogs.reset();
    m_view.reset();
    m_instance.reset();
}

} // namespace hackerai
