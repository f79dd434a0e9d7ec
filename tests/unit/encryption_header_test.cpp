#include "joplinreader/core/EncryptionHeader.hpp"

#include <array>
#include <gtest/gtest.h>
#include <string>
#include <variant>

namespace
{

using joplinreader::core::EncryptionHeader;
using joplinreader::core::EncryptionMethod;
using joplinreader::core::ReaderError;

constexpr const char* kKeyId{ "0123456789abcdef0123456789abcdef" };

[[nodiscard]] std::string header(std::string_view version, std::string_view length, std::string_view method)
{
    std::string out{ "JED" };
    out += version;
    out += length;
    out += method;
    out += kKeyId;
    return out;
}

void expectFormatError(std::string_view text)
{
    const auto result{ joplinreader::core::parseEncryptionHeader(text) };
    ASSERT_TRUE(std::holds_alternative<ReaderError>(result)) << text;
    EXPECT_EQ(std::get<ReaderError>(result), ReaderError::FormatError) << text;
}

} // namespace

TEST(EncryptionHeader, ParsesWellFormedHeader)
{
    const auto result{ joplinreader::core::parseEncryptionHeader(header("01", "000022", "02")) };
    ASSERT_TRUE(std::holds_alternative<EncryptionHeader>(result));

    const auto& h{ std::get<EncryptionHeader>(result) };
    EXPECT_EQ(h.version, 1U);
    EXPECT_EQ(h.declaredLength, 34U);
    EXPECT_EQ(h.method, EncryptionMethod::Sjcl2);
    EXPECT_EQ(h.masterKeyId, kKeyId);
}

TEST(EncryptionHeader, IgnoresTrailingChunkData)
{
    const auto result{ joplinreader::core::parseEncryptionHeader(header("01", "000022", "05") + "00000aabcdefghij") };
    ASSERT_TRUE(std::holds_alternative<EncryptionHeader>(result));
    EXPECT_EQ(std::get<EncryptionHeader>(result).method, EncryptionMethod::Sjcl1a);
}

TEST(EncryptionHeader, HeaderIsFortyFiveCharacters)
{
    EXPECT_EQ(header("01", "000022", "01").size(), joplinreader::core::g_kEnvelopeHeaderChars);
}

TEST(EncryptionHeader, EncodeThenParseGivesSameHeaderForEveryMethod)
{
    constexpr std::array kMethods{ EncryptionMethod::Sjcl, EncryptionMethod::Sjcl2, EncryptionMethod::Sjcl3,
                                   EncryptionMethod::Sjcl4, EncryptionMethod::Sjcl1a };
    for (const auto method : kMethods)
    {
        EncryptionHeader h{};
        h.method = method;
        h.masterKeyId = kKeyId;

        const auto encoded{ joplinreader::core::encodeEncryptionHeader(h) };
        ASSERT_EQ(encoded.size(), joplinreader::core::g_kEnvelopeHeaderChars);

        const auto parsed{ joplinreader::core::parseEncryptionHeader(encoded) };
        ASSERT_TRUE(std::holds_alternative<EncryptionHeader>(parsed));
        EXPECT_EQ(std::get<EncryptionHeader>(parsed), h);
    }
}

TEST(EncryptionHeader, EncodesLowercaseHexFields)
{
    EncryptionHeader h{};
    h.method = EncryptionMethod::Sjcl4;
    h.masterKeyId = kKeyId;
    EXPECT_EQ(joplinreader::core::encodeEncryptionHeader(h), header("01", "000022", "04"));
}

TEST(EncryptionHeader, RejectsWrongIdentifier)
{
    auto text{ header("01", "000022", "01") };
    text[2] = 'X';
    expectFormatError(text);
}

TEST(EncryptionHeader, RejectsUnsupportedVersion)
{
    expectFormatError(header("02", "000022", "01"));
    expectFormatError(header("00", "000022", "01"));
    expectFormatError(header("0x", "000022", "01"));
}

TEST(EncryptionHeader, RejectsAnyLengthOtherThan34)
{
    expectFormatError(header("01", "000021", "01"));
    expectFormatError(header("01", "000023", "01"));
    expectFormatError(header("01", "00002g", "01"));
}

TEST(EncryptionHeader, RejectsUndefinedMethod)
{
    expectFormatError(header("01", "000022", "00"));
    expectFormatError(header("01", "000022", "06"));
    expectFormatError(header("01", "000022", "ff"));
    expectFormatError(header("01", "000022", "zz"));
}

TEST(EncryptionHeader, RejectsNonAsciiMasterKeyId)
{
    // 32 bytes, but only 31 characters
    std::string text{ "JED0100002202" };
    text += "0123456789abcdef0123456789abcd\xC3\xA9";
    ASSERT_EQ(text.size(), joplinreader::core::g_kEnvelopeHeaderChars);
    expectFormatError(text);

    // a multi-byte character cut by the 32-byte field
    std::string cut{ "JED0100002202" };
    cut += "0123456789abcdef0123456789abcde\xC3\xA9";
    expectFormatError(cut);

    EncryptionHeader h{};
    h.method = EncryptionMethod::Sjcl2;
    h.masterKeyId = "0123456789abcdef0123456789abcd\xC3\xA9";
    EXPECT_EQ(joplinreader::core::encodeEncryptionHeader(h), "");
}

TEST(EncryptionHeader, RejectsShortInputUniformly)
{
    const auto full{ header("01", "000022", "01") };
    for (std::size_t len{}; len < full.size(); ++len)
    {
        expectFormatError(std::string_view{ full }.substr(0U, len));
    }
}

TEST(EncryptionHeader, EncodeRejectsInvalidHeaders)
{
    EncryptionHeader h{};
    h.method = EncryptionMethod::Sjcl;
    h.masterKeyId = "short";
    EXPECT_TRUE(joplinreader::core::encodeEncryptionHeader(h).empty());

    h.masterKeyId = kKeyId;
    h.method = EncryptionMethod::Undefined;
    EXPECT_TRUE(joplinreader::core::encodeEncryptionHeader(h).empty());

    h.method = EncryptionMethod::Sjcl;
    h.declaredLength = 35U;
    EXPECT_TRUE(joplinreader::core::encodeEncryptionHeader(h).empty());
}

TEST(EncryptionHeader, MethodCodesMapToClosedSet)
{
    EXPECT_EQ(joplinreader::core::encryptionMethodFromCode(1U), EncryptionMethod::Sjcl);
    EXPECT_EQ(joplinreader::core::encryptionMethodFromCode(5U), EncryptionMethod::Sjcl1a);
    EXPECT_EQ(joplinreader::core::encryptionMethodFromCode(0U), EncryptionMethod::Undefined);
    EXPECT_EQ(joplinreader::core::encryptionMethodFromCode(7U), EncryptionMethod::Undefined);
}
