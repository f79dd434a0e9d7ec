#include "joplinreader/core/ChunkedDecryptor.hpp"

#include "HexDigits.hpp"
#include "joplinreader/core/TextEncoding.hpp"
#include <exception>
#include <optional>

namespace joplinreader::core
{
namespace
{

constexpr std::uint32_t g_kMaxChunkLength{ 0xFFFFFFU };

constexpr char g_kEscape{ '%' };
constexpr char g_kUnicodeMarker{ 'u' };
// "%25u0041": cleanEncodedAscii turns it into "%u0041", which cleanEncodedUnicode then removes.
constexpr std::size_t g_kMaxEscapeChars{ 8U };

[[nodiscard]] constexpr bool isUtf8Continuation(char c) noexcept
{
    return (static_cast<unsigned char>(c) & 0xC0U) == 0x80U;
}

[[nodiscard]] bool hexDigitsAt(std::string_view text, std::size_t pos, std::size_t count) noexcept
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

// Length of the legacy escape starting at `pos`, 0 if there is none.
[[nodiscard]] std::size_t escapeLengthAt(std::string_view text, std::size_t pos) noexcept
{
    if (text[pos] != g_kEscape)
    {
        return 0U;
    }
    const auto unicodeAt{ [text](std::size_t at) {
        return at < text.size() && text[at] == g_kUnicodeMarker && hexDigitsAt(text, at + 1U, 4U);
    } };
    if (unicodeAt(pos + 1U))
    {
        return 6U;
    }
    if (!hexDigitsAt(text, pos + 1U, 2U))
    {
        return 0U;
    }
    if (text.substr(pos + 1U, 2U) == "25" && unicodeAt(pos + 3U))
    {
        return g_kMaxEscapeChars;
    }
    return 3U;
}

// First escape in [offset, end) that runs past `end`.
[[nodiscard]] std::optional<std::size_t> straddlingEscape(std::string_view text, std::size_t offset,
                                                          std::size_t end) noexcept
{
    const std::size_t first{ (end - offset > g_kMaxEscapeChars - 1U) ? end - (g_kMaxEscapeChars - 1U) : offset };
    for (std::size_t pos{ first }; pos < end; ++pos)
    {
        if (pos + escapeLengthAt(text, pos) > end)
        {
            return pos;
        }
    }
    return std::nullopt;
}

// End of the next piece: at most `chunkChars` bytes, moved back so that neither a UTF-8 sequence nor a legacy
// escape is cut. Cleanup runs per chunk, so a split escape would survive decryption. A piece is only longer
// than `chunkChars` when a single code point or escape does not fit.
[[nodiscard]] std::size_t pieceEnd(std::string_view text, std::size_t offset, std::size_t chunkChars) noexcept
{
    const std::size_t limit{ (text.size() - offset < chunkChars) ? text.size() : offset + chunkChars };
    std::size_t end{ limit };
    while (end > offset && end < text.size() && isUtf8Continuation(text[end]))
    {
        --end;
    }
    if (end > offset && end < text.size())
    {
        if (const auto escape{ straddlingEscape(text, offset, end) })
        {
            end = *escape;
        }
    }
    if (end == offset)
    {
        end = limit;
        while (end < text.size() && isUtf8Continuation(text[end]))
        {
            ++end;
        }
        if (const auto escape{ straddlingEscape(text, offset, end) })
        {
            end = *escape + escapeLengthAt(text, *escape);
        }
    }
    return end;
}

[[nodiscard]] ReaderResult<std::string> decryptChunk(std::string_view chunk,
                                                     const joplinreader::security::SecureString& masterKey,
                                                     joplinreader::crypto::ICipher& cipher)
{
    try
    {
        auto plainOpt{ cipher.decrypt(chunk, joplinreader::security::asBytes(masterKey)) };
        if (!plainOpt)
        {
            return ReaderError::DecryptionError;
        }

        const auto text{ joplinreader::security::asStringView(*plainOpt) };
        if (!isValidUtf8(text))
        {
            joplinreader::security::secureRelease(*plainOpt);
            return ReaderError::DecryptionError;
        }

        auto cleaned{ cleanLegacyEscapes(text) };
        joplinreader::security::secureRelease(*plainOpt);
        return cleaned;
    }
    catch (const std::exception&)
    {
        return ReaderError::DecryptionError;
    }
}

} // namespace

ReaderResult<std::string> decryptChunks(std::string_view chunkStream,
                                        const joplinreader::security::SecureString& masterKey,
                                        joplinreader::crypto::ICipher& cipher)
{
    std::string joined{};
    std::size_t offset{};

    while (chunkStream.size() - offset >= g_kChunkLengthChars)
    {
        const auto length{ detail::parseHex(chunkStream.substr(offset, g_kChunkLengthChars)) };
        if (!length)
        {
            return ReaderError::FormatError;
        }
        offset += g_kChunkLengthChars;

        if (chunkStream.size() - offset < *length)
        {
            return ReaderError::UnexpectedEndOfNote;
        }
        const auto chunk{ chunkStream.substr(offset, *length) };
        offset += *length;

        auto textOrErr{ decryptChunk(chunk, masterKey, cipher) };
        if (std::holds_alternative<ReaderError>(textOrErr))
        {
            return std::get<ReaderError>(textOrErr);
        }
        joined.append(std::get<std::string>(textOrErr));
    }

    return percentDecode(joined);
}

ReaderResult<std::string> decryptEnvelope(std::string_view cipherText,
                                          const joplinreader::security::SecureString& masterKey,
                                          joplinreader::crypto::ICipher& cipher)
{
    const auto headerOrErr{ parseEncryptionHeader(cipherText) };
    if (std::holds_alternative<ReaderError>(headerOrErr))
    {
        return std::get<ReaderError>(headerOrErr);
    }
    return decryptChunks(cipherText.substr(g_kEnvelopeHeaderChars), masterKey, cipher);
}

joplinreader::crypto::SjclParams sjclParamsFor(EncryptionMethod method) noexcept
{
    switch (method)
    {
    case EncryptionMethod::Sjcl:
    case EncryptionMethod::Sjcl3:
        return { .iterations = 1000U, .keyBits = 128U, .tagBits = 64U };
    case EncryptionMethod::Sjcl2:
    case EncryptionMethod::Sjcl4:
        return { .iterations = 10000U, .keyBits = 256U, .tagBits = 64U };
    case EncryptionMethod::Sjcl1a:
        return { .iterations = 101U, .keyBits = 256U, .tagBits = 64U };
    case EncryptionMethod::Undefined:
        break;
    }
    return {};
}

ReaderResult<std::string> encryptChunks(const EncryptionHeader& header, std::string_view plainText,
                                        const joplinreader::security::SecureString& masterKey,
                                        joplinreader::crypto::ICipher& cipher, std::size_t chunkChars)
{
    auto out{ encodeEncryptionHeader(header) };
    if (out.empty() || chunkChars == 0U)
    {
        return ReaderError::FormatError;
    }

    const auto params{ sjclParamsFor(header.method) };
    for (std::size_t offset{}; offset < plainText.size();)
    {
        const std::size_t end{ pieceEnd(plainText, offset, chunkChars) };
        const auto piece{ plainText.substr(offset, end - offset) };
        offset = end;
        std::string encrypted{};
        try
        {
            encrypted = cipher.encrypt(joplinreader::security::asBytes(piece),
                                       joplinreader::security::asBytes(masterKey), params);
        }
        catch (const std::exception&)
        {
            return ReaderError::DecryptionError;
        }

        if (encrypted.size() > g_kMaxChunkLength)
        {
            return ReaderError::FormatError;
        }
        detail::appendHex(out, static_cast<std::uint32_t>(encrypted.size()), g_kChunkLengthChars);
        out.append(encrypted);
    }
    return out;
}

} // namespace joplinreader::core
