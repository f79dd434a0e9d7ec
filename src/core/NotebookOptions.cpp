#include "joplinreader/core/NotebookOptions.hpp"

namespace joplinreader::core
{

NotebookOptions defaultNotebookOptions()
{
    constexpr std::chrono::hours kDefaultRefreshInterval{ 12 };

    return NotebookOptions{
        .refreshInterval = kDefaultRefreshInterval,
        .keyFileExtension = ".md",
        .now = NotebookOptions::Clock::now,
    };
}

std::optional<std::pair<std::string_view, std::string_view>> parsePasswordEntry(std::string_view entry) noexcept
{
    const auto comma{ entry.find(',') };
    if (comma == std::string_view::npos)
    {
        return std::nullopt;
    }
    return std::pair{ entry.substr(0U, comma), entry.substr(comma + 1U) };
}

} // namespace joplinreader::core
