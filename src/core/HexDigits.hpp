#ifndef JOPLINREADER_SRC_CORE_HEXDIGITS_HPP
#define JOPLINREADER_SRC_CORE_HEXDIGITS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace joplinreader::core::detail
{

constexpr std::uint32_t g_kHexRadix{ 16U };
constexpr std::uint32_t g_kNibbleMask{ 0x0FU };
constexpr std::uint32_t g_kBitsPerNibble{ 4U };

[[nodiscard]] constexpr std::optional<std::uint32_t> hexDigitValue(char c) noexcept
{
    if (c >= '0' && c <= '9')
    {
        return static_cast<std::uint32_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f')
    {
        return static_cast<std::uint32_t>(c - 'a') + 10U;
    }
    if (c >= 'A' && c <= 'F')
    {
        return static_cast<std::uint32_t>(c - 'A') + 10U;
    }
    return std::nullopt;
}

// Strict: every character must be a hex digit. Widths used on the wire are at most 6 digits.
[[nodiscard]] constexpr std::optional<std::uint32_t> parseHex(std::string_view digits) noexcept
{
    if (digits.empty() || digits.size() > 2U * sizeof(std::uint32_t))
    {
        return std::nullopt;
    }
    std::uint32_t value{ 0U };
    for (const char c : digits)
    {
        const auto nibble{ hexDigitValue(c) };
        if (!nibble)
        {
            return std::nullopt;
        }
        value = (value << g_kBitsPerNibble) | *nibble;
    }
    return value;
}

// Lowercase, zero padded to `width` digits. Values that do not fit are truncated to the low digits.
inline void appendHex(std::string& out, std::uint32_t value, std::size_t width)
{
    constexpr std::string_view kDigits{ "0123456789abcdef" };
    const std::size_t start{ out.size() };
    out.append(width, '0');
    for (std::size_t i{ width }; i > 0U; --i)
    {
        out[start + i - 1U] = kDigits[value & g_kNibbleMask];
        value >>= g_kBitsPerNibble;
    }
}

} // namespace joplinreader::core::detail

#endif // JOPLINREADER_SRC_CORE_HEXDIGITS_HPP
