#pragma once

#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <vector>

namespace vesper
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

class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
        std::string                           file;
        int                                   line;
        std::string                           function;
        std::thread::id                       thread;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel         level,
             std::string_view category,
             std::string_view message,
             std::string_view file     = "",
             int              line     = 0,
             std::string_view function = "");

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

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;

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
        else if constexpr (std::is_enum_v<D>)
            return std::to_string(static_cast<std::underlying_type_t<D>>(v));
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
                if (pos != std::string::npos)
                {
                    auto text = arg_to_string(std::forward<decltype(arg)>(arg));
                    result.replace(pos, 2, text);
                    search_from = pos + text.size();
                }
            };
            (replace_next(std::forward<decltype(args)>(args)), ...);
        }
        return result;
    }

   public:
    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

    // Accepts "trace", "debug", "info", "warn"/"warning", "error", "critical"
    // (case-insensitive).
    static std::optional<LogLevel> parse_level(std::string_view text);
};

// Template definitions must be in the header
template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level))
    {
        return;
    }

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

#define VESPER_LOG_TRACE(category, ...)                                           \
    do                                                                            \
    {                                                                             \
        if (::vesper::Logger::instance().is_enabled(::vesper::LogLevel::Trace))   \
        {                                                                         \
            ::vesper::Logger::instance().log_formatted(::vesper::LogLevel::Trace, \
                                                       category,                  \
                                                       __VA_ARGS__);              \
        }                                                                         \
    } while (0)

#define VESPER_LOG_DEBUG(category, ...)                                           \
    do                                                                            \
    {                                                                             \
        if (::vesper::Logger::instance().is_enabled(::vesper::LogLevel::Debug))   \
        {                                                                         \
            ::vesper::Logger::instance().log_formatted(::vesper::LogLevel::Debug, \
                                                       category,                  \
                                                       __VA_ARGS__);              \
        }                                                                         \
    } while (0)

#define VESPER_LOG_INFO(category, ...)                                           \
    do                                                                           \
    {                                                                            \
        if (::vesper::Logger::instance().is_enabled(::vesper::LogLevel::Info))   \
        {                                                                        \
            ::vesper::Logger::instance().log_formatted(::vesper::LogLevel::Info, \
                                                       category,                 \
                                                       __VA_ARGS__);             \
        }                                                                        \
    } while (0)

#define VESPER_LOG_WARN(category, ...)                                              \
    do                                                                              \
    {                                                                               \
        if (::vesper::Logger::instance().is_enabled(::vesper::LogLevel::Warning))   \
        {                                                                           \
            ::vesper::Logger::instance().log_formatted(::vesper::LogLevel::Warning, \
                                                       category,                    \
                                                       __VA_ARGS__);                \
        }                                                                           \
    } while (0)

#define VESPER_LOG_ERROR(category, ...)                                           \
    do                                                                            \
    {                                                                             \
        if (::vesper::Logger::instance().is_enabled(::vesper::LogLevel::Error))   \
        {                                                                         \
            ::vesper::Logger::instance().log_formatted(::vesper::LogLevel::Error, \
                                                       category,                  \
                                                       __VA_ARGS__);              \
        }                                                                         \
    } while (0)

#define VESPER_LOG_CRITICAL(category, ...)                                           \
    do                                                                               \
    {                                                                                \
        if (::vesper::Logger::instance().is_enabled(::vesper::LogLevel::Critical))   \
        {                                                                            \
            ::vesper::Logger::instance().log_formatted(::vesper::LogLevel::Critical, \
                                                       category,                     \
                                                       __VA_ARGS__);                 \
        }                                                                            \
    } while (0)

#define VESPER_LOG_DEBUG_HERE(category, ...) \
    VESPER_LOG_DEBUG(category, __VA_ARGS__ " [{}:{}:{}]", __FILE__, __LINE__, __FUNCTION__)

#define VESPER_LOG_WARN_HERE(category, ...) \
    VESPER_LOG_WARN(category, __VA_ARGS__ " [{}:{}:{}]", __FILE__, __LINE__, __FUNCTION__)

#define VESPER_LOG_ERROR_HERE(category, ...) \
    VESPER_LOG_ERROR(category, __VA_ARGS__ " [{}:{}:{}]", __FILE__, __LINE__, __FUNCTION__)

}   // namespace vesper
