#pragma once

#include <casement/logger.hpp>

#include <memory>
#include <optional>
#include <string>

#include "../hotkeys/hotkey_registry.hpp"
#include "../platform/platform.hpp"

namespace casement
{

struct ShellConfig
{
    std::string app_name = "Casement";   // tray tooltip, window titles

    // Content source: a non-empty dev server URL wins over the packaged
    // content directory.
    std::string dev_server_url;
    std::string content_dir;

    std::string settings_path;   // empty → JsonSettingsStore::default_path("casement")
    std::string socket_path;     // empty → ipc::default_socket_path()

    LogLevel    log_level = LogLevel::Info;
    std::string log_file;        // empty → console only

    // Unset → read from the settings store / detected from the session.
    std::optional<HotkeyConfig>         hotkeys;
    std::optional<PlatformCapabilities> capabilities;
};

class TrayMenu;

// The desktop shell process: owns the window backend, the registries, the
// message broker and the renderer bridge, and drives them from one event
// loop.
//
//   Shell shell(config);
//   if (!shell.init_runtime()) return 1;
//   while (shell.step(0.05)) {}
//   shell.shutdown_runtime();
class Shell
{
   public:
    explicit Shell(ShellConfig config);
    ~Shell();

    Shell(const Shell&)            = delete;
    Shell& operator=(const Shell&) = delete;

    // Build every subsystem, apply persisted settings, register global
    // hotkeys and open Main. Returns false if the shell cannot run.
    bool init_runtime();

    // One loop iteration, waiting up to `timeout` seconds for window events.
    // Returns false once the shell has quit.
    bool step(double timeout);

    // Runs Session::quit(). Safe to call more than once.
    void quit();

    void shutdown_runtime();

    bool is_quitting() const;

    // Null before init_runtime().
    TrayMenu* tray();

    const ShellConfig& config() const { return config_; }

   private:
    struct Runtime;
    std::unique_ptr<Runtime> runtime_;

    ShellConfig config_;
};

// Ask the shell already listening on `socket_path` to bring Main forward.
// Returns true if one was reached.
bool forward_to_running_instance(const std::string& socket_path);

}   // namespace casement
