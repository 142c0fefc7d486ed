#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace casement
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5
};

// Process-wide logger. Every subsystem logs through the CASEMENT_LOG_* macros
// with a short category ("window", "hotkeys", "broker", ...).
class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
    };

    using LogSink = std::function<void(const LogEntry&)>;
    using SinkId  = uint32_t;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    // Returns a handle usable with remove_sink().
    SinkId add_sink(LogSink sink);
    void   remove_sink(SinkId id);
    void   clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex                        mutex_;
    LogLevel                                  min_level_ = LogLevel::Info;
    std::vector<std::pair<SinkId, LogSink>>   sinks_;
    SinkId                                    next_sink_id_ = 1;

    template <typename T>
    static std::string arg_to_string(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::string>)
            return v;
        else if constexpr (std::is_same_v<D, std::string_view>)
            return std::string(v);
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
        {
            const char* p = v;
            return p ? std::string(p) : std::string("(null)");
        }
        else if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else if constexpr (std::is_same_v<D, char>)
            return std::string(1, v);
        else
            return std::to_string(v);
    }

    static std::string format_message(std::string_view format, auto&&... args)
    {
        std::string result(format);
        if constexpr (sizeof...(args) > 0)
        {
            size_t search_from  = 0;
            auto   replace_next = [&](auto&& arg)
            {
                auto pos = result.find("{}", search_from);
                if (pos == std::string::npos)
                    return;
                std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
                result.replace(pos, 2, text);
                search_from = pos + text.size();
            };
            (replace_next(std::forward<decltype(args)>(args)), ...);
        }
        return result;
    }

   public:
    static std::string             level_to_string(LogLevel level);
    static std::optional<LogLevel> level_from_string(std::string_view name);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);
};

template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level))
        return;

    try
    {
        std::string formatted = format_message(format, std::forward<Args>(args)...);
        log(level, category, formatted);
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "logger", std::string("Format error: ") + e.what());
    }
}

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();
}   // namespace sinks

#define CASEMENT_LOG_AT(lvl, category, ...)                                                  \
    do                                                                                       \
    {                                                                                        \
        if (::casement::Logger::instance().is_enabled(lvl))                                  \
        {                                                                                    \
            ::casement::Logger::instance().log_formatted(lvl, category, __VA_ARGS__);        \
        }                                                                                    \
    } while (0)

#define CASEMENT_LOG_TRACE(category, ...) \
    CASEMENT_LOG_AT(::casement::LogLevel::Trace, category, __VA_ARGS__)
#define CASEMENT_LOG_DEBUG(category, ...) \
    CASEMENT_LOG_AT(::casement::LogLevel::Debug, category, __VA_ARGS__)
#define CASEMENT_LOG_INFO(category, ...) \
    CASEMENT_LOG_AT(::casement::LogLevel::Info, category, __VA_ARGS__)
#define CASEMENT_LOG_WARN(category, ...) \
    CASEMENT_LOG_AT(::casement::LogLevel::Warning, category, __VA_ARGS__)
#define CASEMENT_LOG_ERROR(category, ...) \
    CASEMENT_LOG_AT(::casement::LogLevel::Error, category, __VA_ARGS__)
#define CASEMENT_LOG_CRITICAL(category, ...) \
    CASEMENT_LOG_AT(::casement::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace casement
