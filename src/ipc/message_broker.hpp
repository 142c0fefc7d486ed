#pragma once

#include "../core/settings_store.hpp"
#include "../core/signal.hpp"
#include "../hotkeys/hotkey_registry.hpp"
#include "../platform/platform.hpp"
#include "../window/native_window.hpp"
#include "../window/window_registry.hpp"
#include "payload.hpp"

#include <array>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace casement
{

// One request from a UI surface.
struct Request
{
    WindowId     sender = INVALID_WINDOW;
    std::string  channel;
    ipc::Payload args;
};

// Result of an invoke-style request. Never called for fire-and-forget sends.
using ReplyFn = std::function<void(const ipc::Payload& result)>;

// PDF export collaborator. Completion runs on the event loop thread.
class ExportService
{
   public:
    using Completion = std::function<void(bool ok, const std::string& path_or_error)>;

    virtual ~ExportService() = default;

    virtual void export_pdf(NativeWindow& window, Completion done) = 0;
};

// The state every window mirrors.
struct BroadcastableState
{
    std::string                             theme_preference = "system";
    std::string                             effective_theme  = "dark";
    bool                                    always_on_top    = false;
    int                                     zoom_level       = DEFAULT_ZOOM;
    std::array<HotkeySetting, HOTKEY_COUNT> hotkeys;
};

// Single entry point for requests from UI surfaces.
//
// Every request is checked against an allow-list before anything changes;
// invalid input is logged and dropped without a reply error. Mutations go
// validate → persist → collaborator → broadcast. State changes that start in
// a registry (hotkey, tray, menu) arrive through registry events and take the
// same persist → broadcast path.
class MessageBroker
{
   public:
    using Handler = std::function<void(const Request&, const ReplyFn&)>;

    MessageBroker(WindowRegistry&  windows,
                  HotkeyRegistry&  hotkeys,
                  SettingsStore&   store,
                  DesktopServices& desktop,
                  WindowBackend&   backend);
    ~MessageBroker();

    MessageBroker(const MessageBroker&)            = delete;
    MessageBroker& operator=(const MessageBroker&) = delete;

    // Returns false for a channel outside the dispatch table. Handler
    // exceptions are caught and logged.
    bool dispatch(const Request& request, ReplyFn reply = {});

    bool has_channel(const std::string& channel) const;

    // Deliver to every live window. A failing window is logged and skipped.
    // Returns the number of windows reached.
    size_t broadcast(const std::string& channel, const ipc::Payload& payload);

    // Apply persisted always-on-top and zoom to the registry without
    // announcing them, then load the broadcastable state.
    void initialize();

    void set_export_service(ExportService* service) { export_ = service; }

    // printToPdf action.
    void export_main_to_pdf();

    const BroadcastableState& state() const { return state_; }

    // Reload the in-memory copy from the store.
    void refresh_state();

    // Values used when the store has none, or a read fails.
    static JsonSettingsStore::ValueMap default_settings();

    // Hotkey configuration as persisted, with defaults for anything missing
    // or invalid.
    static HotkeyConfig load_hotkey_config(const SettingsStore& store, bool global_shortcuts_supported);

    static bool is_valid_theme(const std::string& theme);

    // "light" or "dark" for a preference, asking the desktop for "system".
    std::string effective_theme(const std::string& preference) const;

   private:
    void register_handlers();
    void on(const char* channel, Handler handler);

    bool persist(const std::string& key, const SettingValue& value);
    bool read_bool(const std::string& key, bool fallback) const;
    int64_t     read_int(const std::string& key, int64_t fallback) const;
    std::string read_string(const std::string& key, const std::string& fallback) const;

    NativeWindow* sender_window(const Request& request) const;

    // Registry event handlers
    void on_hotkey_enabled_changed(HotkeyId id, bool enabled);
    void on_accelerator_changed(HotkeyId id, const std::string& accelerator);
    void on_always_on_top_changed(bool enabled);
    void on_zoom_level_changed(int level);
    void on_auth_closed();

    // Full id → value maps, sent after any hotkey change.
    void broadcast_hotkeys();
    void broadcast_accelerators();

    // Channel handlers
    void handle_theme_get(const ReplyFn& reply);
    void handle_theme_set(const Request& request);
    void handle_hotkeys_get(const ReplyFn& reply);
    void handle_hotkeys_set(const Request& request);
    void handle_accelerators_get(const ReplyFn& reply);
    void handle_accelerator_set(const Request& request);
    void handle_always_on_top_set(const Request& request);
    void handle_open_settings(const Request& request);
    void handle_open_sign_in(const ReplyFn& reply);
    void handle_quick_entry_submit(const Request& request);

    WindowRegistry&  windows_;
    HotkeyRegistry&  hotkeys_;
    SettingsStore&   store_;
    DesktopServices& desktop_;
    WindowBackend&   backend_;
    ExportService*   export_ = nullptr;

    std::unordered_map<std::string, Handler> handlers_;
    BroadcastableState                       state_;
    std::vector<ReplyFn>                     pending_sign_in_;

    ConnectionId enabled_conn_       = 0;
    ConnectionId accelerator_conn_   = 0;
    ConnectionId always_on_top_conn_ = 0;
    ConnectionId zoom_conn_          = 0;
    ConnectionId auth_conn_          = 0;
};

}   // namespace casement
