#include "joplinreader/core/EncryptionHeader.hpp"

#include "HexDigits.hpp"
#include "joplinreader/core/TextEncoding.hpp"
#include <optional>

namespace joplinreader::core
{
namespace
{

// Consumes up to `width` characters. Returns nullopt if the input ran out first.
class FieldCursor final
{
public:
    explicit FieldCursor(std::string_view text) noexcept : m_text(text)
    {
    }

    [[nodiscard]] std::optional<std::string_view> take(std::size_t width) noexcept
    {
        const std::size_t available{ m_text.size() - m_offset };
        const std::size_t count{ (available < width) ? available : width };
        const auto field{ m_text.substr(m_offset, count) };
        m_offset += count;
        if (field.size() != width)
        {
            return std::nullopt;
        }
        return field;
    }

private:
    std::string_view m_text;
    std::size_t m_offset{ 0U };
};

} // namespace

ReaderResult<EncryptionHeader> parseEncryptionHeader(std::string_view cipherText)
{
    FieldCursor cursor{ cipherText };

    const auto identifier{ cursor.take(g_kIdentifierChars) };
    if (!identifier)
    {
        return ReaderError::FormatError;
    }
    if (*identifier != g_kEnvelopeIdentifier)
    {
        return ReaderError::FormatError;
    }

    const auto versionField{ cursor.take(g_kVersionChars) };
    if (!versionField)
    {
        return ReaderError::FormatError;
    }
    const auto version{ detail::parseHex(*versionField) };
    if (!version || *version != g_kEnvelopeVersion)
    {
        return ReaderError::FormatError;
    }

    const auto lengthField{ cursor.take(g_kLengthChars) };
    if (!lengthField)
    {
        return ReaderError::FormatError;
    }
    // Only the method + key id layout exists, so anything but 34 is unsupported rather than merely unusual.
    const auto length{ detail::parseHex(*lengthField) };
    if (!length || *length != g_kEnvelopeMetadataLength)
    {
        return ReaderError::FormatError;
    }

    const auto methodField{ cursor.take(g_kMethodChars) };
    if (!methodField)
    {
        return ReaderError::FormatError;
    }
    const auto methodCode{ detail::parseHex(*methodField) };
    if (!methodCode)
    {
        return ReaderError::FormatError;
    }
    const auto method{ encryptionMethodFromCode(static_cast<std::uint8_t>(*methodCode)) };
    if (method == EncryptionMethod::Undefined)
    {
        return ReaderError::FormatError;
    }

    // 32 characters are 32 bytes only for ASCII; anything wider would be cut mid-sequence.
    const auto masterKeyId{ cursor.take(g_kMasterKeyIdChars) };
    if (!masterKeyId || !isAscii(*masterKeyId))
    {
        return ReaderError::FormatError;
    }

    EncryptionHeader header{};
    header.version = static_cast<std::uint8_t>(*version);
    header.declaredLength = *length;
    header.method = method;
    header.masterKeyId = std::string{ *masterKeyId };
    return header;
}

std::string encodeEncryptionHeader(const EncryptionHeader& header)
{
    if (header.version != g_kEnvelopeVersion || header.declaredLength != g_kEnvelopeMetadataLength ||
        header.method == EncryptionMethod::Undefined || header.masterKeyId.size() != g_kMasterKeyIdChars ||
        !isAscii(header.masterKeyId))
    {
        return {};
    }

    std::string out{};
    out.reserve(g_kEnvelopeHeaderChars);
    out.append(g_kEnvelopeIdentifier);
    detail::appendHex(out, header.version, g_kVersionChars);
    detail::appendHex(out, header.declaredLength, g_kLengthChars);
    detail::appendHex(out, static_cast<std::uint32_t>(header.method), g_kMethodChars);
    out.append(header.masterKeyId);
    return out;
}

} // namespace joplinreader::core
