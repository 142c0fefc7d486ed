#include "shell.hpp"

#include "../core/settings_store.hpp"
#include "../hotkeys/app_shortcuts.hpp"
#include "../hotkeys/global_shortcuts.hpp"
#include "../ipc/channels.hpp"
#include "../ipc/codec.hpp"
#include "../ipc/message_broker.hpp"
#include "../ipc/renderer_bridge.hpp"
#include "../ipc/transport.hpp"
#include "../window/content_source.hpp"
#include "../window/window_registry.hpp"
#include "session.hpp"
#include "tray_menu.hpp"

#ifdef CASEMENT_USE_GLFW
    #include "../window/glfw_backend.hpp"
#endif

#ifdef CASEMENT_USE_X11
    #include "../hotkeys/x11_global_shortcuts.hpp"
#endif

namespace casement
{

struct Shell::Runtime
{
    PlatformCapabilities                   caps;
    std::unique_ptr<JsonSettingsStore>     store;
    std::unique_ptr<XdgDesktop>            desktop;
    std::unique_ptr<GlobalShortcutBackend> shortcuts;
#ifdef CASEMENT_USE_GLFW
    std::unique_ptr<GlfwBackend> backend;
#endif
    std::unique_ptr<WindowRegistry> windows;
    std::unique_ptr<HotkeyRegistry> hotkeys;
    std::unique_ptr<MessageBroker>  broker;
    std::unique_ptr<RendererBridge> bridge;
    std::unique_ptr<AppShortcuts>   app_shortcuts;
    std::unique_ptr<TrayMenu>       tray;
    std::unique_ptr<Session>        session;
};

Shell::Shell(ShellConfig config) : config_(std::move(config)) {}

Shell::~Shell()
{
    shutdown_runtime();
}

TrayMenu* Shell::tray()
{
    return runtime_ ? runtime_->tray.get() : nullptr;
}

bool Shell::init_runtime()
{
#ifndef CASEMENT_USE_GLFW
    CASEMENT_LOG_CRITICAL("shell", "Built without a window backend (GLFW not found at configure time)");
    return false;
#else
    if (runtime_)
        return true;

    auto rt  = std::make_unique<Runtime>();
    rt->caps = config_.capabilities ? *config_.capabilities : detect_platform_capabilities();
    CASEMENT_LOG_INFO("shell",
                      "Platform: wayland={} global_shortcuts={} tray={}",
                      rt->caps.wayland,
                      rt->caps.global_shortcuts,
                      rt->caps.tray);

    // ─── Settings ────────────────────────────────────────────────────────────
    std::string settings_path =
        config_.settings_path.empty() ? JsonSettingsStore::default_path("casement") : config_.settings_path;
    rt->store = std::make_unique<JsonSettingsStore>(settings_path, MessageBroker::default_settings());
    if (!rt->store->load())
        CASEMENT_LOG_WARN("shell", "Using default settings; {} could not be loaded", settings_path);

    rt->desktop = std::make_unique<XdgDesktop>();

    // ─── Global shortcuts ────────────────────────────────────────────────────
    bool global_supported = false;
#ifdef CASEMENT_USE_X11
    if (rt->caps.global_shortcuts)
    {
        auto x11 = std::make_unique<X11GlobalShortcuts>();
        if (x11->is_available())
        {
            rt->shortcuts    = std::move(x11);
            global_supported = true;
        }
    }
#endif
    if (!rt->shortcuts)
    {
        CASEMENT_LOG_INFO("shell", "Global shortcuts unavailable in this session");
        rt->shortcuts = std::make_unique<UnsupportedGlobalShortcuts>();
    }

    // ─── Windows ─────────────────────────────────────────────────────────────
    rt->backend = std::make_unique<GlfwBackend>();
    if (!rt->backend->init())
        return false;

    ContentSource content = config_.dev_server_url.empty() ? ContentSource::packaged(config_.content_dir)
                                                           : ContentSource::dev_server(config_.dev_server_url);
    CASEMENT_LOG_INFO("shell", "Content: {} ({})", content.base(), content.is_dev() ? "dev" : "packaged");

    rt->windows = std::make_unique<WindowRegistry>(*rt->backend, *rt->desktop, content, rt->caps);

    // ─── Hotkeys ─────────────────────────────────────────────────────────────
    HotkeyConfig hk = config_.hotkeys ? *config_.hotkeys : MessageBroker::load_hotkey_config(*rt->store, global_supported);
    hk.global_shortcuts_supported = hk.global_shortcuts_supported && global_supported;
    rt->hotkeys = std::make_unique<HotkeyRegistry>(*rt->shortcuts, hk);

    // ─── Broker and bridge ───────────────────────────────────────────────────
    rt->broker = std::make_unique<MessageBroker>(*rt->windows, *rt->hotkeys, *rt->store, *rt->desktop, *rt->backend);

    WindowRegistry* windows = rt->windows.get();
    MessageBroker*  broker  = rt->broker.get();
    rt->hotkeys->set_action(HotkeyId::AlwaysOnTop, [windows]() { windows->toggle_always_on_top(); });
    rt->hotkeys->set_action(HotkeyId::BossKey, [windows]() { windows->minimize_main(); });
    rt->hotkeys->set_action(HotkeyId::QuickEntry, [windows]() { windows->toggle_quick_entry(); });
    rt->hotkeys->set_action(HotkeyId::PrintToPdf, [broker]() { broker->export_main_to_pdf(); });

    rt->bridge = std::make_unique<RendererBridge>(*rt->broker, *rt->windows, *rt->backend);
    std::string socket_path = config_.socket_path.empty() ? ipc::default_socket_path() : config_.socket_path;
    if (!rt->bridge->listen(socket_path))
        return false;
    rt->backend->set_surface_link(rt->bridge.get());

    rt->app_shortcuts = std::make_unique<AppShortcuts>(*rt->hotkeys);
    AppShortcuts* app_shortcuts = rt->app_shortcuts.get();
    auto on_key = [app_shortcuts](int key, int action, int mods) { app_shortcuts->on_key(key, action, mods); };
    rt->backend->set_key_handler(on_key);
    rt->bridge->set_key_handler(on_key);

    rt->tray    = std::make_unique<TrayMenu>(*rt->windows, config_.app_name, [this]() { quit(); });
    rt->session = std::make_unique<Session>(*rt->windows, *rt->hotkeys, *rt->broker, *rt->bridge);

    runtime_ = std::move(rt);

    if (!runtime_->session->start())
        return false;

    CASEMENT_LOG_INFO("shell", "{} started", config_.app_name);
    return true;
#endif
}

bool Shell::step(double timeout)
{
#ifdef CASEMENT_USE_GLFW
    if (!runtime_ || runtime_->session->is_quitting())
        return false;

    runtime_->backend->poll_events(timeout);
    runtime_->bridge->poll(0);
    runtime_->shortcuts->dispatch_pending();
    runtime_->backend->process_pending_closes();

    for (pid_t pid : runtime_->desktop->reap_finished())
        CASEMENT_LOG_TRACE("shell", "Opener process {} finished", pid);

    return !runtime_->session->is_quitting();
#else
    (void)timeout;
    return false;
#endif
}

void Shell::quit()
{
    if (runtime_)
        runtime_->session->quit();
}

bool Shell::is_quitting() const
{
    return runtime_ && runtime_->session->is_quitting();
}

void Shell::shutdown_runtime()
{
    if (!runtime_)
        return;

    quit();

#ifdef CASEMENT_USE_GLFW
    runtime_->backend->set_surface_link(nullptr);
    runtime_->backend->set_key_handler({});
#endif
    runtime_->session.reset();
    runtime_->tray.reset();
    runtime_->app_shortcuts.reset();
    runtime_->bridge.reset();
    runtime_->broker.reset();
    runtime_->hotkeys.reset();
    runtime_->windows.reset();
#ifdef CASEMENT_USE_GLFW
    runtime_->backend->process_pending_closes();
    runtime_->backend->shutdown();
#endif
    runtime_.reset();
}

// ─── Single instance ─────────────────────────────────────────────────────────

bool forward_to_running_instance(const std::string& socket_path)
{
    auto conn = ipc::Client::connect(socket_path);
    if (!conn)
        return false;

    ipc::ChannelPayload cp;
    cp.channel = ipc::channels::WINDOW_SHOW;

    ipc::Message msg;
    msg.header.type        = ipc::MessageType::REQ_SEND;
    msg.header.seq         = 1;
    msg.payload            = ipc::encode_channel(cp);
    msg.header.payload_len = static_cast<uint32_t>(msg.payload.size());

    if (!conn->send(msg))
    {
        CASEMENT_LOG_WARN("shell", "A shell listens on {} but did not take the request", socket_path);
        return false;
    }
    CASEMENT_LOG_INFO("shell", "Another instance is running; asked it to show the main window");
    return true;
}

}   // namespace casement
