#include "payload.hpp"

#include <type_traits>

namespace casement::ipc
{

std::string describe(const Value& value)
{
    return std::visit(
        [](const auto& v) -> std::string
        {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>)
                return "null";
            else if constexpr (std::is_same_v<T, bool>)
                return v ? "true" : "false";
            else if constexpr (std::is_same_v<T, std::string>)
            {
                // Truncate so user text never floods the log.
                if (v.size() > 50)
                    return "\"" + v.substr(0, 50) + "...\"";
                return "\"" + v + "\"";
            }
            else
                return std::to_string(v);
        },
        value);
}

}   // namespace casement::ipc
