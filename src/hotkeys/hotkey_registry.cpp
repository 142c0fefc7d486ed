#include "hotkey_registry.hpp"

#include <casement/logger.hpp>

namespace casement
{

HotkeyConfig HotkeyConfig::defaults()
{
    HotkeyConfig cfg;
    for (HotkeyId id : ALL_HOTKEYS)
    {
        cfg[id].enabled     = true;
        cfg[id].accelerator = default_accelerator(id);
    }
    return cfg;
}

HotkeyRegistry::HotkeyRegistry(GlobalShortcutBackend& backend, HotkeyConfig config)
    : backend_(backend), config_(std::move(config))
{
    for (HotkeyId id : ALL_HOTKEYS)
    {
        if (config_[id].accelerator.empty())
            config_[id].accelerator = default_accelerator(id);
    }
}

HotkeyRegistry::~HotkeyRegistry()
{
    unregister_all();
}

void HotkeyRegistry::set_action(HotkeyId id, Action action)
{
    actions_[index_of(id)] = std::move(action);
}

// ─── OS registration ─────────────────────────────────────────────────────────

bool HotkeyRegistry::register_global(HotkeyId id)
{
    auto& slot = registered_[index_of(id)];
    if (slot)
        return true;

    const std::string& text = config_[id].accelerator;
    auto               acc  = parse_accelerator(text);
    if (!acc)
    {
        CASEMENT_LOG_ERROR("hotkeys", "Cannot register {}: invalid accelerator '{}'", hotkey_name(id), text);
        failed_[index_of(id)] = true;
        return false;
    }

    bool ok = false;
    try
    {
        ok = backend_.register_shortcut(*acc, [this, id]() { execute_action(id); });
    }
    catch (const std::exception& e)
    {
        CASEMENT_LOG_ERROR("hotkeys", "Registering {} threw: {}", text, e.what());
        ok = false;
    }

    if (!ok)
    {
        // Another client may hold the same combination.
        CASEMENT_LOG_ERROR("hotkeys", "Failed to register {} for {}", text, hotkey_name(id));
        failed_[index_of(id)] = true;
        return false;
    }

    slot                  = text;
    failed_[index_of(id)] = false;
    CASEMENT_LOG_INFO("hotkeys", "Registered {} for {}", text, hotkey_name(id));
    return true;
}

void HotkeyRegistry::unregister_global(HotkeyId id)
{
    auto& slot = registered_[index_of(id)];
    if (!slot)
        return;

    if (auto acc = parse_accelerator(*slot))
    {
        try
        {
            backend_.unregister_shortcut(*acc);
        }
        catch (const std::exception& e)
        {
            CASEMENT_LOG_ERROR("hotkeys", "Unregistering {} threw: {}", *slot, e.what());
        }
    }
    CASEMENT_LOG_INFO("hotkeys", "Unregistered {} for {}", *slot, hotkey_name(id));
    slot.reset();
}

// ─── State changes ───────────────────────────────────────────────────────────

bool HotkeyRegistry::set_enabled(HotkeyId id, bool enabled)
{
    if (config_[id].enabled == enabled)
        return false;

    config_[id].enabled = enabled;

    if (hotkey_scope(id) == HotkeyScope::Global && config_.global_shortcuts_supported)
    {
        if (enabled)
            register_global(id);
        else
            unregister_global(id);
    }

    CASEMENT_LOG_DEBUG("hotkeys", "{} {}", hotkey_name(id), enabled ? "enabled" : "disabled");
    enabled_changed.emit(id, enabled);
    return true;
}

bool HotkeyRegistry::set_accelerator(HotkeyId id, const std::string& accelerator)
{
    if (config_[id].accelerator == accelerator)
        return false;
    if (!is_valid_accelerator(accelerator))
    {
        CASEMENT_LOG_WARN("hotkeys", "Rejected accelerator '{}' for {}", accelerator, hotkey_name(id));
        return false;
    }

    if (hotkey_scope(id) == HotkeyScope::Global && is_registered(id))
    {
        unregister_global(id);
        config_[id].accelerator = accelerator;
        if (config_[id].enabled)
            register_global(id);
    }
    else
    {
        config_[id].accelerator = accelerator;
    }

    CASEMENT_LOG_DEBUG("hotkeys", "{} accelerator is now {}", hotkey_name(id), accelerator);
    accelerator_changed.emit(id, accelerator);
    return true;
}

void HotkeyRegistry::register_all()
{
    if (!config_.global_shortcuts_supported)
    {
        CASEMENT_LOG_WARN("hotkeys",
                          "Global shortcuts are not reliable in this session; "
                          "bind them in the desktop's keyboard settings instead");
        return;
    }

    for (HotkeyId id : ALL_HOTKEYS)
    {
        if (hotkey_scope(id) == HotkeyScope::Global && config_[id].enabled)
            register_global(id);
    }
}

void HotkeyRegistry::unregister_all()
{
    try
    {
        backend_.unregister_all();
    }
    catch (const std::exception& e)
    {
        CASEMENT_LOG_ERROR("hotkeys", "Releasing global shortcuts threw: {}", e.what());
    }
    for (auto& slot : registered_)
        slot.reset();
    failed_.fill(false);
}

void HotkeyRegistry::execute_action(HotkeyId id)
{
    const auto& action = actions_[index_of(id)];
    if (!action)
    {
        CASEMENT_LOG_WARN("hotkeys", "No action bound to {}", hotkey_name(id));
        return;
    }

    try
    {
        action();
    }
    catch (const std::exception& e)
    {
        CASEMENT_LOG_ERROR("hotkeys", "Action {} failed: {}", hotkey_name(id), e.what());
    }
}

// ─── Queries ─────────────────────────────────────────────────────────────────

bool HotkeyRegistry::is_enabled(HotkeyId id) const
{
    return config_[id].enabled;
}

const std::string& HotkeyRegistry::accelerator(HotkeyId id) const
{
    return config_[id].accelerator;
}

bool HotkeyRegistry::is_registered(HotkeyId id) const
{
    return registered_[index_of(id)].has_value();
}

const std::optional<std::string>& HotkeyRegistry::registered_accelerator(HotkeyId id) const
{
    return registered_[index_of(id)];
}

bool HotkeyRegistry::registration_failed(HotkeyId id) const
{
    return failed_[index_of(id)];
}

}   // namespace casement
