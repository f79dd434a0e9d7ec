#ifndef INCLUDE_JOPLINREADER_SECURITY_SECURERANDOM_HPP
#define INCLUDE_JOPLINREADER_SECURITY_SECURERANDOM_HPP

#include <cstdint>
#include <span>

namespace joplinreader::security
{

// Fills `out` from the OS CSPRNG. Returns false if the kernel could not supply enough bytes.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

} // namespace joplinreader::security

#endif // INCLUDE_JOPLINREADER_SECURITY_SECURERANDOM_HPP
