// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "cli_args.h"
#include "host_services.h"
#include "main_thread_queue.h"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace hackerai {

class Config;
class SingleInstance;
class BrowserView;
class ZenityDialogService;
class MainThreadWebView;
class MainThreadDialogService;
class DeepLinkHandler;
class ManifestUpdateService;
class UpdateChecker;
class UpdateThrottle;
class UpdateScheduler;

/**
 * @brief Main application orchestrator
 *
 * Application coordinates all subsystems in the correct order:
 * 1. Early logging, store argv for restart
 * 2. Parse CLI args
 * 3. Load configuration, then initialize logging from it
 * 4. Become the single instance, or forward argv to the running one and exit
 * 5. Register the hackerai:// scheme with the desktop
 * 6. Create host services and open the app URL
 * 7. Route deep links from the initial arguments
 * 8. Start the background update scheduler
 * 9. Run the main-thread queue until quit
 * 10. Shutdown in reverse order
 *
 * Also the IAppControl used by the update flow to restart.
 *
 * Usage:
 *   hackerai::Application app;
 *   return app.run(argc, argv);
 */
class Application : public IAppControl {
  public:
    Application();
    ~Application() override;

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * @brief Run the application
     * @return Exit code (0 = success)
     */
    int run(int argc, char** argv);

    /// IAppControl: release the instance lock and exec a fresh copy
    void restart() override;

  private:
    bool init_config();
    bool init_logging();
    bool init_single_instance(int argc, char** argv, bool& forwarded);
    void register_deep_link_scheme();
    void init_services();
    void open_app_url();
    void process_initial_deep_links();
    void start_update_scheduler();
    void start_interactive_update_check();
    void on_instance_args(const std::vector<std::string>& args, const std::string& cwd);

    int main_loop();
    void shutdown();

    CliArgs m_args;
    Config* m_config = nullptr; // Singleton, not owned
    std::string m_data_dir;

    MainThreadQueue m_main_queue;

    std::unique_ptr<SingleInstance> m_instance;
    std::unique_ptr<BrowserView> m_view;
    std::unique_ptr<ZenityDialogService> m_dialogs;
    std::unique_ptr<MainThreadWebView> m_view_proxy;
    std::unique_ptr<MainThreadDialogService> m_dialogs_proxy;
    std::unique_ptr<DeepLinkHandler> m_deep_links;
    std::unique_ptr<ManifestUpdateService> m_update_service;
    std::unique_ptr<UpdateChecker> m_update_checker;
    std::unique_ptr<UpdateThrottle> m_throttle;
    std::unique_ptr<UpdateScheduler> m_scheduler;

    std::thread m_interactive_check_thread;
    std::atomic<bool> m_interactive_check_running{false};

    bool m_running = false;
    bool m_shutdown_complete = false;
};

} // namespace hackerai
