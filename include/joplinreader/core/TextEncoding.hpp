#ifndef INCLUDE_JOPLINREADER_CORE_TEXTENCODING_HPP
#define INCLUDE_JOPLINREADER_CORE_TEXTENCODING_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace joplinreader::core
{

// ASCII whitespace only; item files never use other separators.
[[nodiscard]] std::string_view trim(std::string_view s) noexcept;

// Splits on '\n' and drops one trailing '\r' per line. A trailing newline does not produce an empty last line.
[[nodiscard]] std::vector<std::string_view> splitLines(std::string_view text);

// Splits "key:value" at the first colon and trims both halves. nullopt if the line has no colon.
[[nodiscard]] std::optional<std::pair<std::string_view, std::string_view>> splitKeyValue(std::string_view line) noexcept;

[[nodiscard]] bool isAscii(std::string_view s) noexcept;
[[nodiscard]] bool isValidUtf8(std::string_view s) noexcept;

// Replaces every "%XX" with the character U+00XX, encoded as UTF-8.
[[nodiscard]] std::string cleanEncodedAscii(std::string_view text);

// Removes every "%uXXXX". The UTF-16 code unit is dropped, not reconstructed: the legacy producer's exact
// semantics are unknown and the surrounding text matters more than the escaped character.
[[nodiscard]] std::string cleanEncodedUnicode(std::string_view text);

// cleanEncodedAscii followed by cleanEncodedUnicode, as applied to every decrypted chunk.
[[nodiscard]] std::string cleanLegacyEscapes(std::string_view text);

// Standard percent-decoding. Malformed escapes are kept literally and invalid UTF-8 in the decoded bytes is
// replaced with U+FFFD.
[[nodiscard]] std::string percentDecode(std::string_view text);

} // namespace joplinreader::core

#endif // INCLUDE_JOPLINREADER_CORE_TEXTENCODING_HPP
