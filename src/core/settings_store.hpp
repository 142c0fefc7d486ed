#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace casement
{

using SettingValue = std::variant<bool, int64_t, std::string>;

// Durable flat key-value store. Implementations may throw from get()/set()
// on I/O trouble; callers in the shell treat any exception as a read or
// write failure.
class SettingsStore
{
   public:
    virtual ~SettingsStore() = default;

    virtual std::optional<SettingValue> get(const std::string& key) const = 0;

    // Returns false when the value could not be made durable.
    virtual bool set(const std::string& key, const SettingValue& value) = 0;

    // Typed reads. Return std::nullopt when the key is missing or holds a
    // value of another type.
    std::optional<bool>        get_bool(const std::string& key) const;
    std::optional<int64_t>     get_int(const std::string& key) const;
    std::optional<std::string> get_string(const std::string& key) const;
};

// Settings kept in a single flat JSON object on disk, e.g.
//
//   {
//     "alwaysOnTop": false,
//     "hotkey.quickEntry.accelerator": "CommandOrControl+Shift+Space",
//     "theme": "system"
//   }
//
// Defaults are layered under whatever the file provides. Every successful
// set() rewrites the whole file.
class JsonSettingsStore : public SettingsStore
{
   public:
    using ValueMap = std::map<std::string, SettingValue>;

    explicit JsonSettingsStore(std::string path, ValueMap defaults = {});

    JsonSettingsStore(const JsonSettingsStore&)            = delete;
    JsonSettingsStore& operator=(const JsonSettingsStore&) = delete;

    // Read the file. Missing file: defaults only, returns true.
    // Unreadable or malformed file: logged, defaults only, returns false.
    bool load();

    bool save() const;

    std::optional<SettingValue> get(const std::string& key) const override;
    bool                        set(const std::string& key, const SettingValue& value) override;

    // Drop every stored value and rewrite the file with the defaults.
    bool reset();

    const std::string& path() const { return path_; }
    const ValueMap&    values() const { return values_; }

    std::string serialize() const;

    // Parse a flat JSON object. Returns std::nullopt on malformed input or
    // on nested objects/arrays.
    static std::optional<ValueMap> deserialize(const std::string& json);

    // $XDG_CONFIG_HOME/<app>/settings.json, falling back to ~/.config.
    static std::string default_path(const std::string& app_name);

   private:
    std::string path_;
    ValueMap    defaults_;
    ValueMap    values_;
};

}   // namespace casement
