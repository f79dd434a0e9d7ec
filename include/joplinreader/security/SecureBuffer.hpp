#ifndef INCLUDE_JOPLINREADER_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_JOPLINREADER_SECURITY_SECUREBUFFER_HPP

#include "joplinreader/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace joplinreader::security
{

// Raw output of the cipher before it is validated as text.
using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;

// Passphrases and unlocked master keys. Master keys are opaque text (Joplin
// stores them as hex) and are handed to the cipher as a password.
using SecureString = std::vector<char, ZeroAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    if (s.empty())
    {
        return {};
    }
    return std::string_view{ s.data(), s.size() };
}

[[nodiscard]] inline std::string_view asStringView(const SecureBuffer& b) noexcept
{
    if (b.empty())
    {
        return {};
    }
    return std::string_view{ reinterpret_cast<const char*>(b.data()), b.size() };
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureString& s) noexcept
{
    return std::as_bytes(std::span{ s });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureBuffer& b) noexcept
{
    return std::as_bytes(std::span{ b });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return std::as_bytes(std::span<const char>{ s.data(), s.size() });
}

// Moves validated plaintext into a SecureString without an intermediate std::string.
[[nodiscard]] inline SecureString toSecureString(const SecureBuffer& b)
{
    const auto text{ asStringView(b) };
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(text.begin(), text.end());
}

inline void secureRelease(SecureBuffer& b) noexcept
{
    secureWipe(std::as_writable_bytes(std::span{ b }));
    SecureBuffer temp{};
    b.swap(temp);
}

inline void secureRelease(SecureString& s) noexcept
{
    secureWipe(std::as_writable_bytes(std::span{ s }));
    SecureString temp{};
    s.swap(temp);
}

} // namespace joplinreader::security

#endif // INCLUDE_JOPLINREADER_SECURITY_SECUREBUFFER_HPP
