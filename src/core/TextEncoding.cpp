#include "joplinreader/core/TextEncoding.hpp"

#include "HexDigits.hpp"
#include <cstdint>

namespace joplinreader::core
{
namespace
{

constexpr char g_kEscape{ '%' };
constexpr char g_kUnicodeMarker{ 'u' };
constexpr std::size_t g_kAsciiEscapeDigits{ 2U };
constexpr std::size_t g_kUnicodeEscapeDigits{ 4U };
constexpr std::string_view g_kReplacementCharacter{ "\xEF\xBF\xBD" };

[[nodiscard]] constexpr bool isSpace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

[[nodiscard]] bool hasHexDigitsAt(std::string_view text, std::size_t pos, std::size_t count) noexcept
{
    if (pos + count > text.size())
    {
        return false;
    }
    for (std::size_t i{}; i < count; ++i)
    {
        if (!detail::hexDigitValue(text[pos + i]))
        {
            return false;
        }
    }
    return true;
}

void appendLatin1(std::string& out, std::uint32_t codePoint)
{
    constexpr std::uint32_t kAsciiLimit{ 0x80U };
    constexpr std::uint32_t kLeadTwoBytes{ 0xC0U };
    constexpr std::uint32_t kContinuation{ 0x80U };
    constexpr std::uint32_t kSixBitMask{ 0x3FU };
    constexpr std::uint32_t kSixBits{ 6U };

    if (codePoint < kAsciiLimit)
    {
        out.push_back(static_cast<char>(codePoint));
        return;
    }
    out.push_back(static_cast<char>(kLeadTwoBytes | (codePoint >> kSixBits)));
    out.push_back(static_cast<char>(kContinuation | (codePoint & kSixBitMask)));
}

struct Utf8Step final
{
    bool valid{ false };
    std::size_t consumed{ 1U };
};

// Length of the UTF-8 sequence starting at `pos`. For an invalid sequence `consumed` is the length of its
// maximal valid prefix (at least one byte), which is what gets replaced by a single U+FFFD.
[[nodiscard]] Utf8Step utf8StepAt(std::string_view s, std::size_t pos) noexcept
{
    const auto lead{ static_cast<std::uint8_t>(s[pos]) };
    std::size_t length{ 0U };
    std::uint8_t low{ 0x80U };
    std::uint8_t high{ 0xBFU };

    if (lead < 0x80U)
    {
        return Utf8Step{ true, 1U };
    }
    if (lead >= 0xC2U && lead <= 0xDFU)
    {
        length = 2U;
    }
    else if (lead >= 0xE0U && lead <= 0xEFU)
    {
        length = 3U;
        if (lead == 0xE0U)
        {
            low = 0xA0U;
        }
        else if (lead == 0xEDU)
        {
            high = 0x9FU;
        }
    }
    else if (lead >= 0xF0U && lead <= 0xF4U)
    {
        length = 4U;
        if (lead == 0xF0U)
        {
            low = 0x90U;
        }
        else if (lead == 0xF4U)
        {
            high = 0x8FU;
        }
    }
    else
    {
        return Utf8Step{ false, 1U };
    }

    for (std::size_t k{ 1U }; k < length; ++k)
    {
        if (pos + k >= s.size())
        {
            return Utf8Step{ false, k };
        }
        const auto byte{ static_cast<std::uint8_t>(s[pos + k]) };
        const std::uint8_t lo{ (k == 1U) ? low : static_cast<std::uint8_t>(0x80U) };
        const std::uint8_t hi{ (k == 1U) ? high : static_cast<std::uint8_t>(0xBFU) };
        if (byte < lo || byte > hi)
        {
            return Utf8Step{ false, k };
        }
    }
    return Utf8Step{ true, length };
}

[[nodiscard]] std::string toUtf8Lossy(std::string_view bytes)
{
    std::string out{};
    out.reserve(bytes.size());
    std::size_t pos{};
    while (pos < bytes.size())
    {
        const auto step{ utf8StepAt(bytes, pos) };
        if (step.valid)
        {
            out.append(bytes.substr(pos, step.consumed));
        }
        else
        {
            out.append(g_kReplacementCharacter);
        }
        pos += step.consumed;
    }
    return out;
}

} // namespace

std::string_view trim(std::string_view s) noexcept
{
    while (!s.empty() && isSpace(s.front()))
    {
        s.remove_prefix(1U);
    }
    while (!s.empty() && isSpace(s.back()))
    {
        s.remove_suffix(1U);
    }
    return s;
}

std::vector<std::string_view> splitLines(std::string_view text)
{
    std::vector<std::string_view> lines{};
    std::size_t start{};
    while (start < text.size())
    {
        const std::size_t end{ text.find('\n', start) };
        const std::size_t stop{ (end == std::string_view::npos) ? text.size() : end };
        auto line{ text.substr(start, stop - start) };
        if (!line.empty() && line.back() == '\r')
        {
            line.remove_suffix(1U);
        }
        lines.push_back(line);
        if (end == std::string_view::npos)
        {
            break;
        }
        start = end + 1U;
    }
    return lines;
}

std::optional<std::pair<std::string_view, std::string_view>> splitKeyValue(std::string_view line) noexcept
{
    const std::size_t colon{ line.find(':') };
    if (colon == std::string_view::npos)
    {
        return std::nullopt;
    }
    return std::pair{ trim(line.substr(0U, colon)), trim(line.substr(colon + 1U)) };
}

bool isAscii(std::string_view s) noexcept
{
    for (const char c : s)
    {
        if (static_cast<unsigned char>(c) >= 0x80U)
        {
            return false;
        }
    }
    return true;
}

bool isValidUtf8(std::string_view s) noexcept
{
    std::size_t pos{};
    while (pos < s.size())
    {
        const auto step{ utf8StepAt(s, pos) };
        if (!step.valid)
        {
            return false;
        }
        pos += step.consumed;
    }
    return true;
}

std::string cleanEncodedAscii(std::string_view text)
{
    std::string out{};
    out.reserve(text.size());
    std::size_t pos{};
    while (pos < text.size())
    {
        if (text[pos] == g_kEscape && hasHexDigitsAt(text, pos + 1U, g_kAsciiEscapeDigits))
        {
            const auto value{ detail::parseHex(text.substr(pos + 1U, g_kAsciiEscapeDigits)) };
            appendLatin1(out, *value);
            pos += 1U + g_kAsciiEscapeDigits;
            continue;
        }
        out.push_back(text[pos]);
        ++pos;
    }
    return out;
}

std::string cleanEncodedUnicode(std::string_view text)
{
    std::string out{};
    out.reserve(text.size());
    std::size_t pos{};
    while (pos < text.size())
    {
        if (text[pos] == g_kEscape && pos + 1U < text.size() && text[pos + 1U] == g_kUnicodeMarker &&
            hasHexDigitsAt(text, pos + 2U, g_kUnicodeEscapeDigits))
        {
            pos += 2U + g_kUnicodeEscapeDigits;
            continue;
        }
        out.push_back(text[pos]);
        ++pos;
    }
    return out;
}

std::string cleanLegacyEscapes(std::string_view text)
{
    return cleanEncodedUnicode(cleanEncodedAscii(text));
}

std::string percentDecode(std::string_view text)
{
    std::string bytes{};
    bytes.reserve(text.size());
    std::size_t pos{};
    while (pos < text.size())
    {
        if (text[pos] == g_kEscape && hasHexDigitsAt(text, pos + 1U, g_kAsciiEscapeDigits))
        {
            const auto value{ detail::parseHex(text.substr(pos + 1U, g_kAsciiEscapeDigits)) };
            bytes.push_back(static_cast<char>(*value));
            pos += 1U + g_kAsciiEscapeDigits;
            continue;
        }
        bytes.push_back(text[pos]);
        ++pos;
    }
    return toUtf8Lossy(bytes);
}

} // namespace joplinreader::core
