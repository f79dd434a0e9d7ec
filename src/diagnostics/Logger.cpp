#include "joplinreader/diagnostics/Logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <utility>

namespace joplinreader::diagnostics
{

LogLevel Logger::s_level{ LogLevel::Info };
std::ofstream Logger::s_file{};
Logger::Sink Logger::s_sink{};
std::mutex Logger::s_mutex{};

void Logger::init(LogLevel level, const std::string& logFilePath)
{
    const std::lock_guard<std::mutex> lock{ s_mutex };
    s_level = level;
    if (s_file.is_open())
    {
        s_file.close();
    }
    if (!logFilePath.empty())
    {
        s_file.open(logFilePath, std::ios::app);
    }
}

LogLevel Logger::level() noexcept
{
    const std::lock_guard<std::mutex> lock{ s_mutex };
    return s_level;
}

void Logger::setSink(Sink sink)
{
    const std::lock_guard<std::mutex> lock{ s_mutex };
    s_sink = std::move(sink);
}

void Logger::resetSink()
{
    const std::lock_guard<std::mutex> lock{ s_mutex };
    s_sink = nullptr;
}

void Logger::log(LogLevel level, std::string_view message)
{
    const auto now{ std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()) };
    std::tm local{};
#if defined(_WIN32)
    ::localtime_s(&local, &now);
#else
    ::localtime_r(&now, &local);
#endif

    Sink sink{};
    {
        const std::lock_guard<std::mutex> lock{ s_mutex };
        if (level < s_level)
        {
            return;
        }
        if (s_file.is_open())
        {
            s_file << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << ' ' << levelTag(level) << ' ' << message << '\n';
            s_file.flush();
        }
        if (!s_sink)
        {
            std::cerr << std::put_time(&local, "%H:%M:%S") << ' ' << levelTag(level) << ' ' << message << '\n';
            return;
        }
        sink = s_sink;
    }
    // Called unlocked: a sink may log or swap the sink itself.
    sink(level, message);
}

} // namespace joplinreader::diagnostics
