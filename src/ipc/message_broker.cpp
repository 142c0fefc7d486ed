#include "message_broker.hpp"

#include <casement/logger.hpp>

#include "../hotkeys/accelerator.hpp"
#include "channels.hpp"

#include <algorithm>
#include <cctype>
#include <exception>

namespace casement
{

namespace ch = ipc::channels;

namespace
{

constexpr const char* KEY_THEME         = "theme";
constexpr const char* KEY_ALWAYS_ON_TOP = "alwaysOnTop";
constexpr const char* KEY_ZOOM_LEVEL    = "zoomLevel";

// Where quick-entry text is sent for a new conversation.
constexpr const char* QUICK_ENTRY_TARGET_URL = "https://gemini.google.com/app";

std::string trim(const std::string& s)
{
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end   = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool setting_equals(const std::optional<SettingValue>& current, const SettingValue& value)
{
    return current && *current == value;
}

}   // namespace

MessageBroker::MessageBroker(WindowRegistry&  windows,
                             HotkeyRegistry&  hotkeys,
                             SettingsStore&   store,
                             DesktopServices& desktop,
                             WindowBackend&   backend)
    : windows_(windows), hotkeys_(hotkeys), store_(store), desktop_(desktop), backend_(backend)
{
    for (HotkeyId id : ALL_HOTKEYS)
        state_.hotkeys[index_of(id)].accelerator = default_accelerator(id);

    register_handlers();

    enabled_conn_ = hotkeys_.enabled_changed.connect([this](HotkeyId id, bool enabled)
                                                     { on_hotkey_enabled_changed(id, enabled); });
    accelerator_conn_ = hotkeys_.accelerator_changed.connect(
        [this](HotkeyId id, const std::string& accelerator) { on_accelerator_changed(id, accelerator); });
    always_on_top_conn_ =
        windows_.always_on_top_changed.connect([this](bool enabled) { on_always_on_top_changed(enabled); });
    zoom_conn_ = windows_.zoom_level_changed.connect([this](int level) { on_zoom_level_changed(level); });
    auth_conn_ = windows_.auth_closed.connect([this]() { on_auth_closed(); });

    CASEMENT_LOG_DEBUG("broker", "Initialized with {} channels", handlers_.size());
}

MessageBroker::~MessageBroker()
{
    hotkeys_.enabled_changed.disconnect(enabled_conn_);
    hotkeys_.accelerator_changed.disconnect(accelerator_conn_);
    windows_.always_on_top_changed.disconnect(always_on_top_conn_);
    windows_.zoom_level_changed.disconnect(zoom_conn_);
    windows_.auth_closed.disconnect(auth_conn_);
}

// ─── Defaults ────────────────────────────────────────────────────────────────

JsonSettingsStore::ValueMap MessageBroker::default_settings()
{
    JsonSettingsStore::ValueMap values;
    values[KEY_THEME]         = std::string("system");
    values[KEY_ALWAYS_ON_TOP] = false;
    values[KEY_ZOOM_LEVEL]    = static_cast<int64_t>(DEFAULT_ZOOM);
    for (HotkeyId id : ALL_HOTKEYS)
    {
        values[enabled_key(id)]     = true;
        values[accelerator_key(id)] = std::string(default_accelerator(id));
    }
    return values;
}

HotkeyConfig MessageBroker::load_hotkey_config(const SettingsStore& store, bool global_shortcuts_supported)
{
    HotkeyConfig cfg               = HotkeyConfig::defaults();
    cfg.global_shortcuts_supported = global_shortcuts_supported;

    for (HotkeyId id : ALL_HOTKEYS)
    {
        try
        {
            if (auto enabled = store.get_bool(enabled_key(id)))
                cfg[id].enabled = *enabled;

            auto acc = store.get_string(accelerator_key(id));
            if (acc && is_valid_accelerator(*acc))
                cfg[id].accelerator = *acc;
            else if (acc)
                CASEMENT_LOG_WARN("broker",
                                  "Stored accelerator '{}' for {} is invalid; using {}",
                                  *acc,
                                  hotkey_name(id),
                                  default_accelerator(id));
        }
        catch (const std::exception& e)
        {
            CASEMENT_LOG_ERROR("broker", "Reading hotkey {} failed: {}", hotkey_name(id), e.what());
        }
    }
    return cfg;
}

bool MessageBroker::is_valid_theme(const std::string& theme)
{
    return theme == "light" || theme == "dark" || theme == "system";
}

std::string MessageBroker::effective_theme(const std::string& preference) const
{
    if (preference == "light" || preference == "dark")
        return preference;
    try
    {
        return desktop_.prefers_dark_theme() ? "dark" : "light";
    }
    catch (const std::exception& e)
    {
        CASEMENT_LOG_ERROR("broker", "Desktop theme query failed: {}", e.what());
        return "dark";
    }
}

// ─── Store access ────────────────────────────────────────────────────────────

bool MessageBroker::persist(const std::string& key, const SettingValue& value)
{
    try
    {
        if (store_.set(key, value))
            return true;
        CASEMENT_LOG_ERROR("broker", "Could not persist {}", key);
    }
    catch (const std::exception& e)
    {
        CASEMENT_LOG_ERROR("broker", "Persisting {} threw: {}", key, e.what());
    }
    return false;
}

bool MessageBroker::read_bool(const std::string& key, bool fallback) const
{
    try
    {
        if (auto v = store_.get_bool(key))
            return *v;
    }
    catch (const std::exception& e)
    {
        CASEMENT_LOG_ERROR("broker", "Reading {} failed: {}", key, e.what());
    }
    return fallback;
}

int64_t MessageBroker::read_int(const std::string& key, int64_t fallback) const
{
    try
    {
        if (auto v = store_.get_int(key))
            return *v;
    }
    catch (const std::exception& e)
    {
        CASEMENT_LOG_ERROR("broker", "Reading {} failed: {}", key, e.what());
    }
    return fallback;
}

std::string MessageBroker::read_string(const std::string& key, const std::string& fallback) const
{
    try
    {
        if (auto v = store_.get_string(key))
            return *v;
    }
    catch (const std::exception& e)
    {
        CASEMENT_LOG_ERROR("broker", "Reading {} failed: {}", key, e.what());
    }
    return fallback;
}

void MessageBroker::refresh_state()
{
    std::string theme = read_string(KEY_THEME, "system");
    if (!is_valid_theme(theme))
        theme = "system";

    state_.theme_preference = theme;
    state_.effective_theme  = effective_theme(theme);
    state_.always_on_top    = read_bool(KEY_ALWAYS_ON_TOP, false);
    state_.zoom_level       = sanitize_zoom(static_cast<double>(read_int(KEY_ZOOM_LEVEL, DEFAULT_ZOOM)));
    for (HotkeyId id : ALL_HOTKEYS)
    {
        auto& hk       = state_.hotkeys[index_of(id)];
        hk.enabled     = read_bool(enabled_key(id), true);
        hk.accelerator = read_string(accelerator_key(id), default_accelerator(id));
    }
}

void MessageBroker::initialize()
{
    refresh_state();
    windows_.initialize_always_on_top(state_.always_on_top);
    windows_.initialize_zoom(state_.zoom_level);
    CASEMENT_LOG_INFO("broker",
                      "Settings applied: theme={} alwaysOnTop={} zoom={}",
                      state_.theme_preference,
                      state_.always_on_top,
                      state_.zoom_level);
}

// ─── Dispatch ────────────────────────────────────────────────────────────────

void MessageBroker::on(const char* channel, Handler handler)
{
    handlers_[channel] = std::move(handler);
}

bool MessageBroker::has_channel(const std::string& channel) const
{
    return handlers_.count(channel) > 0;
}

bool MessageBroker::dispatch(const Request& request, ReplyFn reply)
{
    auto it = handlers_.find(request.channel);
    if (it == handlers_.end())
    {
        CASEMENT_LOG_WARN("broker", "Unknown channel '{}'", request.channel);
        return false;
    }

    CASEMENT_LOG_TRACE("broker", "{} from window {}", request.channel, request.sender);
    try
    {
        it->second(request, reply);
    }
    catch (const std::exception& e)
    {
        CASEMENT_LOG_ERROR("broker", "Handler for {} failed: {}", request.channel, e.what());
    }
    return true;
}

NativeWindow* MessageBroker::sender_window(const Request& request) const
{
    NativeWindow* win = backend_.find_window(request.sender);
    if (!win || win->is_destroyed())
    {
        CASEMENT_LOG_WARN("broker", "{}: sender window {} is gone", request.channel, request.sender);
        return nullptr;
    }
    return win;
}

void MessageBroker::register_handlers()
{
    // ─── Window controls ─────────────────────────────────────────────────────
    on(ch::WINDOW_MINIMIZE,
       [this](const Request& req, const ReplyFn&)
       {
           if (auto* win = sender_window(req))
               win->minimize();
       });

    on(ch::WINDOW_MAXIMIZE,
       [this](const Request& req, const ReplyFn&)
       {
           auto* win = sender_window(req);
           if (!win)
               return;
           if (win->is_maximized())
               win->unmaximize();
           else
               win->maximize();
       });

    on(ch::WINDOW_CLOSE,
       [this](const Request& req, const ReplyFn&)
       {
           if (auto* win = sender_window(req))
               win->close();
       });

    on(ch::WINDOW_IS_MAXIMIZED,
       [this](const Request& req, const ReplyFn& reply)
       {
           bool maximized = false;
           if (auto* win = sender_window(req))
           {
               try
               {
                   maximized = win->is_maximized();
               }
               catch (const std::exception& e)
               {
                   CASEMENT_LOG_ERROR("broker", "is_maximized failed: {}", e.what());
               }
           }
           if (reply)
               reply({{"maximized", maximized}});
       });

    on(ch::WINDOW_SHOW, [this](const Request&, const ReplyFn&) { windows_.restore_from_tray(); });

    // ─── Theme ───────────────────────────────────────────────────────────────
    on(ch::THEME_GET, [this](const Request&, const ReplyFn& reply) { handle_theme_get(reply); });
    on(ch::THEME_SET, [this](const Request& req, const ReplyFn&) { handle_theme_set(req); });

    // ─── Always on top ───────────────────────────────────────────────────────
    on(ch::ALWAYS_ON_TOP_GET,
       [this](const Request&, const ReplyFn& reply)
       {
           if (reply)
               reply({{"enabled", read_bool(KEY_ALWAYS_ON_TOP, false)}});
       });
    on(ch::ALWAYS_ON_TOP_SET, [this](const Request& req, const ReplyFn&) { handle_always_on_top_set(req); });

    // ─── Hotkeys ─────────────────────────────────────────────────────────────
    on(ch::HOTKEYS_GET, [this](const Request&, const ReplyFn& reply) { handle_hotkeys_get(reply); });
    on(ch::HOTKEYS_SET, [this](const Request& req, const ReplyFn&) { handle_hotkeys_set(req); });
    on(ch::HOTKEYS_ACCELERATORS_GET,
       [this](const Request&, const ReplyFn& reply) { handle_accelerators_get(reply); });
    on(ch::HOTKEYS_ACCELERATOR_SET,
       [this](const Request& req, const ReplyFn&) { handle_accelerator_set(req); });

    // ─── Zoom ────────────────────────────────────────────────────────────────
    on(ch::ZOOM_GET,
       [this](const Request&, const ReplyFn& reply)
       {
           if (reply)
               reply({{"level", static_cast<int64_t>(windows_.zoom_level())}});
       });
    on(ch::ZOOM_IN,
       [this](const Request&, const ReplyFn& reply)
       {
           int level = windows_.zoom_in();
           if (reply)
               reply({{"level", static_cast<int64_t>(level)}});
       });
    on(ch::ZOOM_OUT,
       [this](const Request&, const ReplyFn& reply)
       {
           int level = windows_.zoom_out();
           if (reply)
               reply({{"level", static_cast<int64_t>(level)}});
       });

    // ─── App ─────────────────────────────────────────────────────────────────
    on(ch::APP_OPEN_SETTINGS, [this](const Request& req, const ReplyFn&) { handle_open_settings(req); });
    on(ch::APP_OPEN_SIGN_IN, [this](const Request&, const ReplyFn& reply) { handle_open_sign_in(reply); });

    // ─── Quick entry ─────────────────────────────────────────────────────────
    on(ch::QUICK_ENTRY_SUBMIT, [this](const Request& req, const ReplyFn&) { handle_quick_entry_submit(req); });
    on(ch::QUICK_ENTRY_HIDE, [this](const Request&, const ReplyFn&) { windows_.hide_quick_entry(); });
    on(ch::QUICK_ENTRY_CANCEL,
       [this](const Request&, const ReplyFn&)
       {
           windows_.hide_quick_entry();
           CASEMENT_LOG_DEBUG("broker", "Quick entry cancelled");
       });
}

// ─── Broadcast ───────────────────────────────────────────────────────────────

size_t MessageBroker::broadcast(const std::string& channel, const ipc::Payload& payload)
{
    size_t delivered = 0;
    for (NativeWindow* win : backend_.windows())
    {
        if (!win || win->is_destroyed())
            continue;
        try
        {
            win->send(channel, payload);
            ++delivered;
        }
        catch (const std::exception& e)
        {
            CASEMENT_LOG_ERROR("broker", "Broadcasting {} to window {} failed: {}", channel, win->id(), e.what());
        }
    }
    CASEMENT_LOG_DEBUG("broker", "Broadcast {} to {} window(s)", channel, delivered);
    return delivered;
}

// ─── Theme ───────────────────────────────────────────────────────────────────

void MessageBroker::handle_theme_get(const ReplyFn& reply)
{
    std::string preference = "system";
    std::string effective  = "dark";
    try
    {
        auto stored = store_.get_string(KEY_THEME);
        preference  = stored && is_valid_theme(*stored) ? *stored : "system";
        effective   = effective_theme(preference);
    }
    catch (const std::exception& e)
    {
        CASEMENT_LOG_ERROR("broker", "Error getting theme: {}", e.what());
        preference = "system";
        effective  = "dark";
    }
    if (reply)
        reply({{"preference", preference}, {"effectiveTheme", effective}});
}

void MessageBroker::handle_theme_set(const Request& request)
{
    auto theme = ipc::get_string(request.args, "value");
    if (!theme || !is_valid_theme(*theme))
    {
        const ipc::Value* raw = ipc::find_value(request.args, "value");
        CASEMENT_LOG_WARN("broker", "Invalid theme value: {}", raw ? ipc::describe(*raw) : "missing");
        return;
    }

    if (!persist(KEY_THEME, *theme))
        return;

    state_.theme_preference = *theme;
    state_.effective_theme  = effective_theme(*theme);
    CASEMENT_LOG_INFO("broker", "Theme set to: {} (effective: {})", state_.theme_preference, state_.effective_theme);

    broadcast(ch::THEME_CHANGED,
              {{"preference", state_.theme_preference}, {"effectiveTheme", state_.effective_theme}});
}

// ─── Always on top ───────────────────────────────────────────────────────────

void MessageBroker::handle_always_on_top_set(const Request& request)
{
    auto enabled = ipc::get_bool(request.args, "enabled");
    if (!enabled)
    {
        CASEMENT_LOG_WARN("broker", "alwaysOnTop.set needs a boolean 'enabled'");
        return;
    }

    if (!persist(KEY_ALWAYS_ON_TOP, *enabled))
        return;

    // Broadcast happens in on_always_on_top_changed().
    windows_.set_always_on_top(*enabled);
}

void MessageBroker::on_always_on_top_changed(bool enabled)
{
    bool stored = false;
    try
    {
        stored = setting_equals(store_.get(KEY_ALWAYS_ON_TOP), SettingValue(enabled));
    }
    catch (const std::exception& e)
    {
        CASEMENT_LOG_ERROR("broker", "Reading {} failed: {}", KEY_ALWAYS_ON_TOP, e.what());
    }
    if (!stored && !persist(KEY_ALWAYS_ON_TOP, enabled))
        return;

    state_.always_on_top = enabled;
    broadcast(ch::ALWAYS_ON_TOP_CHANGED, {{"enabled", enabled}});
}

// ─── Hotkeys ─────────────────────────────────────────────────────────────────

void MessageBroker::handle_hotkeys_get(const ReplyFn& reply)
{
    ipc::Payload result;
    for (HotkeyId id : ALL_HOTKEYS)
        result[hotkey_name(id)] = read_bool(enabled_key(id), true);
    if (reply)
        reply(result);
}

void MessageBroker::handle_hotkeys_set(const Request& request)
{
    auto name    = ipc::get_string(request.args, "id");
    auto enabled = ipc::get_bool(request.args, "enabled");
    auto id      = name ? hotkey_from_name(*name) : std::nullopt;
    if (!id || !enabled)
    {
        CASEMENT_LOG_WARN("broker", "Invalid hotkeys.set: id={} enabled={}",
                          name ? *name : "missing", enabled ? (*enabled ? "true" : "false") : "missing");
        return;
    }

    if (!persist(enabled_key(*id), *enabled))
        return;

    // A change broadcasts from on_hotkey_enabled_changed(); an unchanged value
    // is still confirmed to every window.
    if (!hotkeys_.set_enabled(*id, *enabled))
    {
        state_.hotkeys[index_of(*id)].enabled = *enabled;
        broadcast_hotkeys();
    }
}

void MessageBroker::on_hotkey_enabled_changed(HotkeyId id, bool enabled)
{
    const std::string key    = enabled_key(id);
    bool              stored = false;
    try
    {
        stored = setting_equals(store_.get(key), SettingValue(enabled));
    }
    catch (const std::exception& e)
    {
        CASEMENT_LOG_ERROR("broker", "Reading {} failed: {}", key, e.what());
    }
    if (!stored && !persist(key, enabled))
        return;

    state_.hotkeys[index_of(id)].enabled = enabled;
    broadcast_hotkeys();
}

void MessageBroker::broadcast_hotkeys()
{
    ipc::Payload map;
    for (HotkeyId id : ALL_HOTKEYS)
        map[hotkey_name(id)] = state_.hotkeys[index_of(id)].enabled;
    broadcast(ch::HOTKEYS_CHANGED, map);
}

void MessageBroker::handle_accelerators_get(const ReplyFn& reply)
{
    ipc::Payload result;
    for (HotkeyId id : ALL_HOTKEYS)
    {
        std::string acc = read_string(accelerator_key(id), default_accelerator(id));
        if (!is_valid_accelerator(acc))
            acc = default_accelerator(id);
        result[hotkey_name(id)] = acc;
    }
    if (reply)
        reply(result);
}

void MessageBroker::handle_accelerator_set(const Request& request)
{
    auto name        = ipc::get_string(request.args, "id");
    auto accelerator = ipc::get_string(request.args, "accelerator");
    auto id          = name ? hotkey_from_name(*name) : std::nullopt;
    if (!id || !accelerator || !is_valid_accelerator(*accelerator))
    {
        CASEMENT_LOG_WARN("broker", "Invalid hotkeys.accelerator.set: id={} accelerator={}",
                          name ? *name : "missing", accelerator ? *accelerator : "missing");
        return;
    }

    if (!persist(accelerator_key(*id), *accelerator))
        return;

    if (!hotkeys_.set_accelerator(*id, *accelerator))
    {
        state_.hotkeys[index_of(*id)].accelerator = *accelerator;
        broadcast_accelerators();
    }
}

void MessageBroker::on_accelerator_changed(HotkeyId id, const std::string& accelerator)
{
    const std::string key    = accelerator_key(id);
    bool              stored = false;
    try
    {
        stored = setting_equals(store_.get(key), SettingValue(accelerator));
    }
    catch (const std::exception& e)
    {
        CASEMENT_LOG_ERROR("broker", "Reading {} failed: {}", key, e.what());
    }
    if (!stored && !persist(key, accelerator))
        return;

    state_.hotkeys[index_of(id)].accelerator = accelerator;
    broadcast_accelerators();
}

void MessageBroker::broadcast_accelerators()
{
    ipc::Payload map;
    for (HotkeyId id : ALL_HOTKEYS)
        map[hotkey_name(id)] = state_.hotkeys[index_of(id)].accelerator;
    broadcast(ch::HOTKEYS_ACCELERATOR_CHANGED, map);
}

// ─── Zoom ────────────────────────────────────────────────────────────────────

void MessageBroker::on_zoom_level_changed(int level)
{
    if (!persist(KEY_ZOOM_LEVEL, static_cast<int64_t>(level)))
        return;
    state_.zoom_level = level;
    broadcast(ch::ZOOM_CHANGED, {{"level", static_cast<int64_t>(level)}});
}

// ─── App ─────────────────────────────────────────────────────────────────────

void MessageBroker::handle_open_settings(const Request& request)
{
    OpenParams        params;
    const ipc::Value* tab = ipc::find_value(request.args, "tab");
    if (tab && !std::holds_alternative<std::monostate>(*tab))
    {
        auto name = ipc::get_string(request.args, "tab");
        if (!name || (*name != "settings" && *name != "about"))
        {
            CASEMENT_LOG_WARN("broker", "Invalid settings tab: {}", ipc::describe(*tab));
            return;
        }
        params.settings_tab = *name;
    }
    windows_.open_or_focus(WindowRole::Settings, params);
}

void MessageBroker::handle_open_sign_in(const ReplyFn& reply)
{
    NativeWindow* auth = windows_.open_auth(std::string(SIGN_IN_URL));
    if (!auth)
    {
        CASEMENT_LOG_ERROR("broker", "Error opening sign-in window");
        if (reply)
            reply({});
        return;
    }
    if (reply)
        pending_sign_in_.push_back(reply);
}

void MessageBroker::on_auth_closed()
{
    auto pending = std::move(pending_sign_in_);
    pending_sign_in_.clear();
    for (const auto& reply : pending)
    {
        try
        {
            reply({});
        }
        catch (const std::exception& e)
        {
            CASEMENT_LOG_ERROR("broker", "Sign-in reply failed: {}", e.what());
        }
    }
}

// ─── Quick entry ─────────────────────────────────────────────────────────────

void MessageBroker::handle_quick_entry_submit(const Request& request)
{
    auto text = ipc::get_string(request.args, "text");
    if (!text)
    {
        CASEMENT_LOG_WARN("broker", "quickEntry.submit needs a string 'text'");
        return;
    }
    std::string trimmed = trim(*text);
    if (trimmed.empty())
    {
        CASEMENT_LOG_DEBUG("broker", "Ignoring empty quick entry");
        return;
    }

    CASEMENT_LOG_INFO("broker", "Quick entry submitted: {}", ipc::describe(ipc::Value(trimmed)));
    windows_.hide_quick_entry();
    windows_.focus_main();

    NativeWindow* main = windows_.window(WindowRole::Main);
    if (!main)
    {
        CASEMENT_LOG_WARN("broker", "No main window to receive quick entry");
        return;
    }
    try
    {
        main->send(ch::CONTENT_NAVIGATE, {{"url", std::string(QUICK_ENTRY_TARGET_URL)}, {"text", trimmed}});
    }
    catch (const std::exception& e)
    {
        CASEMENT_LOG_ERROR("broker", "Delivering quick entry failed: {}", e.what());
    }
}

// ─── Export ──────────────────────────────────────────────────────────────────

void MessageBroker::export_main_to_pdf()
{
    NativeWindow* main = windows_.window(WindowRole::Main);
    if (!main)
    {
        CASEMENT_LOG_WARN("broker", "Export requested without a main window");
        broadcast(ch::EXPORT_PDF_FAILED, {{"error", std::string("no main window")}});
        return;
    }
    if (!export_)
    {
        CASEMENT_LOG_WARN("broker", "No export service configured");
        broadcast(ch::EXPORT_PDF_FAILED, {{"error", std::string("export unavailable")}});
        return;
    }

    CASEMENT_LOG_INFO("broker", "Exporting main window to PDF");
    export_->export_pdf(*main,
                        [this](bool ok, const std::string& detail)
                        {
                            if (ok)
                            {
                                CASEMENT_LOG_INFO("broker", "PDF written to {}", detail);
                                broadcast(ch::EXPORT_PDF_SUCCEEDED, {{"path", detail}});
                            }
                            else
                            {
                                CASEMENT_LOG_ERROR("broker", "PDF export failed: {}", detail);
                                broadcast(ch::EXPORT_PDF_FAILED, {{"error", detail}});
                            }
                        });
}

}   // namespace casement
