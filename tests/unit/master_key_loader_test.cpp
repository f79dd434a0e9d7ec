#include "joplinreader/core/MasterKeyLoader.hpp"
#include "test_utils/FakeCipher.hpp"
#include "test_utils/InMemoryItemStore.hpp"

#include <gtest/gtest.h>
#include <string>
#include <variant>

namespace
{

using joplinreader::core::MasterKey;
using joplinreader::core::ReaderError;
using joplinreader::test_utils::FakeCipher;
using joplinreader::test_utils::InMemoryItemStore;

constexpr const char* kKeyId{ "4a2b8e6f0c1d3e5a7b9c0d2e4f6a8b0c" };
constexpr const char* kPassphrase{ "correct horse battery staple" };
constexpr const char* kKeyMaterial{ "9e1f3c5a7b9d0e2f4a6c8e0b1d3f5a7c" };

class MasterKeyLoaderTest : public ::testing::Test
{
protected:
    InMemoryItemStore store{};
    FakeCipher cipher{};
    std::filesystem::path keyPath{ std::filesystem::path{ "/sync" } / (std::string{ kKeyId } + ".md") };

    void putKeyFile(std::string_view id, std::string_view content)
    {
        std::string text{};
        text += "id: ";
        text += id;
        text += "\ncreated_time: 2020-01-01T00:00:00.000Z\nencryption_method: 4\ncontent: ";
        text += content;
        text += "\ntype_: 9";
        store.put(keyPath, text);
    }

    [[nodiscard]] joplinreader::core::ReaderResult<MasterKey> load(std::string_view passphrase)
    {
        const auto secret{ joplinreader::security::secureStringFrom(passphrase) };
        return joplinreader::core::loadMasterKey(store, keyPath, kKeyId, secret, cipher);
    }
};

} // namespace

TEST_F(MasterKeyLoaderTest, UnlocksKeyWithPassphrase)
{
    putKeyFile(kKeyId, FakeCipher::seal(kKeyMaterial, kPassphrase));

    const auto result{ load(kPassphrase) };
    ASSERT_TRUE(std::holds_alternative<MasterKey>(result));
    EXPECT_EQ(joplinreader::security::asStringView(std::get<MasterKey>(result)), kKeyMaterial);
    EXPECT_EQ(cipher.decryptCalls, 1);
}

TEST_F(MasterKeyLoaderTest, IdMismatchIsReportedBeforeDecryption)
{
    putKeyFile("ffffffffffffffffffffffffffffffff", FakeCipher::seal(kKeyMaterial, kPassphrase));

    const auto result{ load(kPassphrase) };
    ASSERT_TRUE(std::holds_alternative<ReaderError>(result));
    EXPECT_EQ(std::get<ReaderError>(result), ReaderError::KeyIdMismatch);
    EXPECT_EQ(cipher.decryptCalls, 0);
}

TEST_F(MasterKeyLoaderTest, WrongPassphraseIsDecryptionError)
{
    putKeyFile(kKeyId, FakeCipher::seal(kKeyMaterial, kPassphrase));

    const auto result{ load("wrong") };
    ASSERT_TRUE(std::holds_alternative<ReaderError>(result));
    EXPECT_EQ(std::get<ReaderError>(result), ReaderError::DecryptionError);
}

TEST_F(MasterKeyLoaderTest, MissingFieldsAreFormatErrors)
{
    store.put(keyPath, "content: " + FakeCipher::seal(kKeyMaterial, kPassphrase) + "\ntype_: 9");
    auto result{ load(kPassphrase) };
    ASSERT_TRUE(std::holds_alternative<ReaderError>(result));
    EXPECT_EQ(std::get<ReaderError>(result), ReaderError::FormatError);

    store.put(keyPath, std::string{ "id: " } + kKeyId + "\ntype_: 9");
    result = load(kPassphrase);
    ASSERT_TRUE(std::holds_alternative<ReaderError>(result));
    EXPECT_EQ(std::get<ReaderError>(result), ReaderError::FormatError);
    EXPECT_EQ(cipher.decryptCalls, 0);
}

TEST_F(MasterKeyLoaderTest, UnreadableFileIsIoError)
{
    auto result{ load(kPassphrase) };
    ASSERT_TRUE(std::holds_alternative<ReaderError>(result));
    EXPECT_EQ(std::get<ReaderError>(result), ReaderError::IoError);

    putKeyFile(kKeyId, FakeCipher::seal(kKeyMaterial, kPassphrase));
    store.failReadsOf(keyPath);
    result = load(kPassphrase);
    ASSERT_TRUE(std::holds_alternative<ReaderError>(result));
    EXPECT_EQ(std::get<ReaderError>(result), ReaderError::IoError);
}

TEST_F(MasterKeyLoaderTest, LastOccurrenceOfAFieldWins)
{
    std::string text{ "id: ffffffffffffffffffffffffffffffff\n" };
    text += "content: garbage\n";
    text += std::string{ "id: " } + kKeyId + "\n";
    text += "content: " + FakeCipher::seal(kKeyMaterial, kPassphrase) + "\n";
    store.put(keyPath, text);

    const auto result{ load(kPassphrase) };
    ASSERT_TRUE(std::holds_alternative<MasterKey>(result));
    EXPECT_EQ(joplinreader::security::asStringView(std::get<MasterKey>(result)), kKeyMaterial);
}

TEST_F(MasterKeyLoaderTest, NonUtf8KeyIsRejected)
{
    putKeyFile(kKeyId, FakeCipher::seal("\xC3\x28", kPassphrase));

    const auto result{ load(kPassphrase) };
    ASSERT_TRUE(std::holds_alternative<ReaderError>(result));
    EXPECT_EQ(std::get<ReaderError>(result), ReaderError::DecryptionError);
}

TEST_F(MasterKeyLoaderTest, CipherExceptionBecomesDecryptionError)
{
    putKeyFile(kKeyId, FakeCipher::seal(kKeyMaterial, kPassphrase));
    cipher.throwOnDecrypt = true;

    const auto result{ load(kPassphrase) };
    ASSERT_TRUE(std::holds_alternative<ReaderError>(result));
    EXPECT_EQ(std::get<ReaderError>(result), ReaderError::DecryptionError);
}
