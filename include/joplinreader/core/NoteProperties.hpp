#ifndef INCLUDE_JOPLINREADER_CORE_NOTEPROPERTIES_HPP
#define INCLUDE_JOPLINREADER_CORE_NOTEPROPERTIES_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace joplinreader::core
{

using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

// Decoded key/value block of an item. std::less<> allows lookups by string_view.
using PropertyMap = std::map<std::string, std::string, std::less<>>;

// Parses "%Y-%m-%dT%H:%M:%S%.fZ". The fraction is optional and truncated to milliseconds.
[[nodiscard]] std::optional<Timestamp> parseTimestamp(std::string_view text) noexcept;

// Inverse of parseTimestamp, always with a three digit fraction ("2021-01-01T00:00:00.000Z").
[[nodiscard]] std::string formatTimestamp(Timestamp ts);

// Typed view of a note's properties. Every field is independently optional: a missing key and a value that
// fails to parse both leave the field empty.
struct NoteProperties final
{
    std::optional<std::string> title;
    std::optional<std::string> body;
    std::optional<Timestamp> createdTime;
    std::optional<float> altitude;
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<std::string> author;
    std::optional<std::string> sourceUrl;
    std::optional<bool> isTodo;
    std::optional<bool> todoDue;
    std::optional<bool> todoCompleted;
    std::optional<std::string> source;
    std::optional<std::string> sourceApplication;
    std::optional<std::string> applicationData;
    std::optional<std::int32_t> order;
    std::optional<Timestamp> userCreatedTime;
    std::optional<Timestamp> userUpdatedTime;
    std::optional<std::string> markupLanguage;
    std::optional<bool> isShared;
};

// Unknown keys are ignored.
[[nodiscard]] NoteProperties notePropertiesFromMap(const PropertyMap& properties);

} // namespace joplinreader::core

#endif // INCLUDE_JOPLINREADER_CORE_NOTEPROPERTIES_HPP
