#ifndef INCLUDE_JOPLINREADER_CORE_ENCRYPTIONHEADER_HPP
#define INCLUDE_JOPLINREADER_CORE_ENCRYPTIONHEADER_HPP

#include "joplinreader/core/ReaderError.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace joplinreader::core
{

// Wire layout: "JED" | version (2 hex) | length (6 hex) | method (2 hex) | master key id (32 chars).
constexpr std::string_view g_kEnvelopeIdentifier{ "JED" };
constexpr std::size_t g_kIdentifierChars{ 3U };
constexpr std::size_t g_kVersionChars{ 2U };
constexpr std::size_t g_kLengthChars{ 6U };
constexpr std::size_t g_kMethodChars{ 2U };
constexpr std::size_t g_kMasterKeyIdChars{ 32U };

constexpr std::uint8_t g_kEnvelopeVersion{ 1U };
constexpr std::uint32_t g_kEnvelopeMetadataLength{ static_cast<std::uint32_t>(g_kMethodChars + g_kMasterKeyIdChars) };
constexpr std::size_t g_kEnvelopeHeaderChars{ g_kIdentifierChars + g_kVersionChars + g_kLengthChars +
                                              g_kEnvelopeMetadataLength };

static_assert(g_kEnvelopeMetadataLength == 34U);
static_assert(g_kEnvelopeHeaderChars == 45U);

enum class EncryptionMethod : std::uint8_t
{
    Undefined = 0x0,
    Sjcl = 0x1,
    Sjcl2 = 0x2,
    Sjcl3 = 0x3,
    Sjcl4 = 0x4,
    Sjcl1a = 0x5,
};

[[nodiscard]] constexpr EncryptionMethod encryptionMethodFromCode(std::uint8_t code) noexcept
{
    switch (code)
    {
    case 0x1:
        return EncryptionMethod::Sjcl;
    case 0x2:
        return EncryptionMethod::Sjcl2;
    case 0x3:
        return EncryptionMethod::Sjcl3;
    case 0x4:
        return EncryptionMethod::Sjcl4;
    case 0x5:
        return EncryptionMethod::Sjcl1a;
    default:
        return EncryptionMethod::Undefined;
    }
}

struct EncryptionHeader final
{
    std::uint8_t version{ g_kEnvelopeVersion };
    std::uint32_t declaredLength{ g_kEnvelopeMetadataLength };
    EncryptionMethod method{ EncryptionMethod::Undefined };
    std::string masterKeyId;

    friend bool operator==(const EncryptionHeader&, const EncryptionHeader&) = default;
};

// Parses the 45-character prefix of an `encryption_cipher_text` value.
// Every field is read to its full width before it is validated, so a short input is always a FormatError
// about the header size rather than a complaint about whichever field ran out.
[[nodiscard]] ReaderResult<EncryptionHeader> parseEncryptionHeader(std::string_view cipherText);

// Returns an empty string if the header could not be parsed back (unknown method, wrong key id width, version
// or length out of range).
[[nodiscard]] std::string encodeEncryptionHeader(const EncryptionHeader& header);

} // namespace joplinreader::core

#endif // INCLUDE_JOPLINREADER_CORE_ENCRYPTIONHEADER_HPP
