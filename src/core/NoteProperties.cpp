#include "joplinreader/core/NoteProperties.hpp"

#include "joplinreader/core/TextEncoding.hpp"
#include <array>
#include <charconv>
#include <functional>
#include <system_error>

namespace joplinreader::core
{
namespace
{

constexpr std::size_t g_kMaxFractionDigits{ 9U };
constexpr std::int64_t g_kMillisDigits{ 3 };

[[nodiscard]] std::optional<std::int64_t> takeDigits(std::string_view& text, std::size_t count) noexcept
{
    if (text.size() < count)
    {
        return std::nullopt;
    }
    std::int64_t value{};
    for (std::size_t i{}; i < count; ++i)
    {
        const char c{ text[i] };
        if (c < '0' || c > '9')
        {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    text.remove_prefix(count);
    return value;
}

[[nodiscard]] bool takeLiteral(std::string_view& text, char expected) noexcept
{
    if (text.empty() || text.front() != expected)
    {
        return false;
    }
    text.remove_prefix(1U);
    return true;
}

void appendPadded(std::string& out, std::int64_t value, std::size_t width)
{
    auto digits{ std::to_string(value) };
    if (digits.size() < width)
    {
        out.append(width - digits.size(), '0');
    }
    out.append(digits);
}

// Strict numeric parse: surrounding whitespace is trimmed, anything else left over is a failure.
template <class T> [[nodiscard]] std::optional<T> parseNumber(std::string_view text) noexcept
{
    const auto trimmed{ trim(text) };
    T value{};
    const auto* first{ trimmed.data() };
    const auto* last{ trimmed.data() + trimmed.size() };
    const auto [ptr, ec]{ std::from_chars(first, last, value) };
    if (ec != std::errc{} || ptr != last || trimmed.empty())
    {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::optional<bool> parseFlag(std::string_view text) noexcept
{
    const auto value{ parseNumber<std::int8_t>(text) };
    if (!value)
    {
        return std::nullopt;
    }
    return *value == 1;
}

using FieldSetter = std::function<void(NoteProperties&, std::string_view)>;

struct FieldBinding final
{
    std::string_view key;
    FieldSetter apply;
};

[[nodiscard]] FieldSetter textField(std::optional<std::string> NoteProperties::*field)
{
    return [field](NoteProperties& p, std::string_view v) { p.*field = std::string{ v }; };
}

[[nodiscard]] FieldSetter timestampField(std::optional<Timestamp> NoteProperties::*field)
{
    return [field](NoteProperties& p, std::string_view v) { p.*field = parseTimestamp(v); };
}

template <class T> [[nodiscard]] FieldSetter numberField(std::optional<T> NoteProperties::*field)
{
    return [field](NoteProperties& p, std::string_view v) { p.*field = parseNumber<T>(v); };
}

[[nodiscard]] FieldSetter flagField(std::optional<bool> NoteProperties::*field)
{
    return [field](NoteProperties& p, std::string_view v) { p.*field = parseFlag(v); };
}

[[nodiscard]] const std::array<FieldBinding, 19>& fieldBindings()
{
    static const std::array<FieldBinding, 19> bindings{ {
        { "title", textField(&NoteProperties::title) },
        { "body", textField(&NoteProperties::body) },
        { "created_time", timestampField(&NoteProperties::createdTime) },
        { "altitude", numberField<float>(&NoteProperties::altitude) },
        { "latitude", numberField<double>(&NoteProperties::latitude) },
        { "longitude", numberField<double>(&NoteProperties::longitude) },
        { "author", textField(&NoteProperties::author) },
        { "source_url", textField(&NoteProperties::sourceUrl) },
        { "is_todo", flagField(&NoteProperties::isTodo) },
        { "todo_due", flagField(&NoteProperties::todoDue) },
        { "todo_completed", flagField(&NoteProperties::todoCompleted) },
        { "source", textField(&NoteProperties::source) },
        { "source_application", textField(&NoteProperties::sourceApplication) },
        { "application_data", textField(&NoteProperties::applicationData) },
        { "order", numberField<std::int32_t>(&NoteProperties::order) },
        { "user_created_time", timestampField(&NoteProperties::userCreatedTime) },
        { "user_updated_time", timestampField(&NoteProperties::userUpdatedTime) },
        { "markup_language", textField(&NoteProperties::markupLanguage) },
        { "is_shared", flagField(&NoteProperties::isShared) },
    } };
    return bindings;
}

} // namespace

std::optional<Timestamp> parseTimestamp(std::string_view text) noexcept
{
    using namespace std::chrono;

    const auto year{ takeDigits(text, 4U) };
    if (!year || !takeLiteral(text, '-'))
    {
        return std::nullopt;
    }
    const auto month{ takeDigits(text, 2U) };
    if (!month || !takeLiteral(text, '-'))
    {
        return std::nullopt;
    }
    const auto day{ takeDigits(text, 2U) };
    if (!day || !takeLiteral(text, 'T'))
    {
        return std::nullopt;
    }
    const auto hour{ takeDigits(text, 2U) };
    if (!hour || !takeLiteral(text, ':'))
    {
        return std::nullopt;
    }
    const auto minute{ takeDigits(text, 2U) };
    if (!minute || !takeLiteral(text, ':'))
    {
        return std::nullopt;
    }
    const auto second{ takeDigits(text, 2U) };
    if (!second)
    {
        return std::nullopt;
    }

    std::int64_t millis{};
    if (takeLiteral(text, '.'))
    {
        std::size_t digits{};
        while (digits < text.size() && text[digits] >= '0' && text[digits] <= '9')
        {
            ++digits;
        }
        if (digits == 0U || digits > g_kMaxFractionDigits)
        {
            return std::nullopt;
        }
        for (std::size_t i{}; i < static_cast<std::size_t>(g_kMillisDigits); ++i)
        {
            millis = millis * 10 + ((i < digits) ? (text[i] - '0') : 0);
        }
        text.remove_prefix(digits);
    }

    if (!takeLiteral(text, 'Z') || !text.empty())
    {
        return std::nullopt;
    }

    const year_month_day date{ std::chrono::year{ static_cast<int>(*year) },
                               std::chrono::month{ static_cast<unsigned>(*month) },
                               std::chrono::day{ static_cast<unsigned>(*day) } };
    if (!date.ok() || *hour > 23 || *minute > 59 || *second > 59)
    {
        return std::nullopt;
    }

    return Timestamp{ sys_days{ date } + hours{ *hour } + minutes{ *minute } + seconds{ *second } +
                      milliseconds{ millis } };
}

std::string formatTimestamp(Timestamp ts)
{
    using namespace std::chrono;

    const auto dayPoint{ floor<days>(ts) };
    const year_month_day date{ dayPoint };
    const hh_mm_ss time{ ts - dayPoint };

    std::string out{};
    appendPadded(out, static_cast<int>(date.year()), 4U);
    out.push_back('-');
    appendPadded(out, static_cast<unsigned>(date.month()), 2U);
    out.push_back('-');
    appendPadded(out, static_cast<unsigned>(date.day()), 2U);
    out.push_back('T');
    appendPadded(out, time.hours().count(), 2U);
    out.push_back(':');
    appendPadded(out, time.minutes().count(), 2U);
    out.push_back(':');
    appendPadded(out, time.seconds().count(), 2U);
    out.push_back('.');
    appendPadded(out, time.subseconds().count(), static_cast<std::size_t>(g_kMillisDigits));
    out.push_back('Z');
    return out;
}

NoteProperties notePropertiesFromMap(const PropertyMap& properties)
{
    NoteProperties out{};
    for (const auto& binding : fieldBindings())
    {
        if (const auto it{ properties.find(binding.key) }; it != properties.end())
        {
            binding.apply(out, it->second);
        }
    }
    return out;
}

} // namespace joplinreader::core
