#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace casement::ipc
{

// A single argument or broadcast field. monostate is "null / absent".
using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;

// Flat named arguments of a request or broadcast.
using Payload = std::map<std::string, Value>;

inline const Value* find_value(const Payload& payload, const std::string& key)
{
    auto it = payload.find(key);
    return it == payload.end() ? nullptr : &it->second;
}

inline std::optional<bool> get_bool(const Payload& payload, const std::string& key)
{
    const Value* v = find_value(payload, key);
    if (v && std::holds_alternative<bool>(*v))
        return std::get<bool>(*v);
    return std::nullopt;
}

inline std::optional<int64_t> get_int(const Payload& payload, const std::string& key)
{
    const Value* v = find_value(payload, key);
    if (v && std::holds_alternative<int64_t>(*v))
        return std::get<int64_t>(*v);
    return std::nullopt;
}

// Integers are widened; anything else is absent.
inline std::optional<double> get_number(const Payload& payload, const std::string& key)
{
    const Value* v = find_value(payload, key);
    if (!v)
        return std::nullopt;
    if (std::holds_alternative<double>(*v))
        return std::get<double>(*v);
    if (std::holds_alternative<int64_t>(*v))
        return static_cast<double>(std::get<int64_t>(*v));
    return std::nullopt;
}

inline std::optional<std::string> get_string(const Payload& payload, const std::string& key)
{
    const Value* v = find_value(payload, key);
    if (v && std::holds_alternative<std::string>(*v))
        return std::get<std::string>(*v);
    return std::nullopt;
}

// Short human-readable rendering for log lines.
std::string describe(const Value& value);

}   // namespace casement::ipc
