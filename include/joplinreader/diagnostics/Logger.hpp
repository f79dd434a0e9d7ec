#ifndef INCLUDE_JOPLINREADER_DIAGNOSTICS_LOGGER_HPP
#define INCLUDE_JOPLINREADER_DIAGNOSTICS_LOGGER_HPP

#include <cstdint>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace joplinreader::diagnostics
{

enum class LogLevel : std::uint8_t
{
    Debug,
    Info,
    Warn,
    Error,
};

[[nodiscard]] constexpr std::string_view levelTag(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Debug:
        return "[DEBUG]";
    case LogLevel::Info:
        return "[INFO] ";
    case LogLevel::Warn:
        return "[WARN] ";
    case LogLevel::Error:
        return "[ERROR]";
    }
    return "[?]    ";
}

// Process-wide logger. Lines below the configured level are dropped.
class Logger final
{
public:
    using Sink = std::function<void(LogLevel, std::string_view)>;

    Logger() = delete;

    // Sets the level and, when `logFilePath` is non-empty, appends timestamped lines to that file as well.
    static void init(LogLevel level, const std::string& logFilePath = "");
    [[nodiscard]] static LogLevel level() noexcept;

    // Replaces the stderr output. The sink receives the bare message, without timestamp or tag, and is called
    // without the logger lock held.
    static void setSink(Sink sink);
    static void resetSink();

    static void log(LogLevel level, std::string_view message);

    static void debug(std::string_view message)
    {
        log(LogLevel::Debug, message);
    }
    static void info(std::string_view message)
    {
        log(LogLevel::Info, message);
    }
    static void warn(std::string_view message)
    {
        log(LogLevel::Warn, message);
    }
    static void error(std::string_view message)
    {
        log(LogLevel::Error, message);
    }

private:
    static LogLevel s_level;
    static std::ofstream s_file;
    static Sink s_sink;
    static std::mutex s_mutex;
};

} // namespace joplinreader::diagnostics

#endif // INCLUDE_JOPLINREADER_DIAGNOSTICS_LOGGER_HPP
