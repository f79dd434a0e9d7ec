#ifndef INCLUDE_JOPLINREADER_CORE_NOTEBOOKOPTIONS_HPP
#define INCLUDE_JOPLINREADER_CORE_NOTEBOOKOPTIONS_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace joplinreader::core
{

struct NotebookOptions final
{
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::seconds;
    using NowProvider = std::function<TimePoint()>;

    // Cached note content older than this is reloaded on the next read.
    Duration refreshInterval{};
    // Key files live next to the items as "<key id><extension>".
    std::string keyFileExtension;
    // Empty means NotebookOptions::Clock::now.
    NowProvider now;
};

[[nodiscard]] NotebookOptions defaultNotebookOptions();

// Splits "<key id>,<passphrase>" at the first comma. nullopt if there is no comma.
[[nodiscard]] std::optional<std::pair<std::string_view, std::string_view>>
parsePasswordEntry(std::string_view entry) noexcept;

} // namespace joplinreader::core

#endif // INCLUDE_JOPLINREADER_CORE_NOTEBOOKOPTIONS_HPP
