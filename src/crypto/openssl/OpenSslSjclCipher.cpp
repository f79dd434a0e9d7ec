#include "joplinreader/crypto/providers/OpenSslSjclCipherFactory.hpp"
#include "joplinreader/security/SecureBuffer.hpp"
#include "joplinreader/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <nlohmann/json.hpp>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace joplinreader::crypto::providers
{
namespace
{

constexpr std::int64_t g_kEnvelopeVersion{ 1 };
constexpr std::string_view g_kMode{ "ccm" };
constexpr std::string_view g_kCipherName{ "aes" };
// SJCL refuses anything at or below this.
constexpr std::int64_t g_kMinIterations{ 100 };
constexpr std::size_t g_kSaltBytes{ 8U };
constexpr std::size_t g_kIvBytes{ 16U };
constexpr std::size_t g_kMinIvBytes{ 8U };
constexpr std::size_t g_kMaxIvBytes{ 16U };
// CCM nonce is 15 - L bytes, with the length field L between 2 and 8.
constexpr std::size_t g_kCcmBlockMinusFlags{ 15U };
constexpr std::size_t g_kCcmMinLengthField{ 2U };
constexpr std::size_t g_kCcmMaxComputedLengthField{ 4U };

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

using Bytes = std::vector<std::uint8_t>;

struct Envelope final
{
    std::uint32_t iterations{};
    std::uint32_t keyBits{};
    std::uint32_t tagBits{};
    Bytes iv;
    Bytes salt;
    Bytes adata;
    Bytes cipherText;
};

[[nodiscard]] bool isSupportedKeyBits(std::int64_t bits) noexcept
{
    return bits == 128 || bits == 192 || bits == 256;
}

[[nodiscard]] bool isSupportedTagBits(std::int64_t bits) noexcept
{
    return bits == 64 || bits == 96 || bits == 128;
}

[[nodiscard]] const EVP_CIPHER* aesCcmFor(std::uint32_t keyBits) noexcept
{
    switch (keyBits)
    {
    case 128U:
        return EVP_aes_128_ccm();
    case 192U:
        return EVP_aes_192_ccm();
    case 256U:
        return EVP_aes_256_ccm();
    default:
        return nullptr;
    }
}

// Accepts unpadded input, as SJCL does.
[[nodiscard]] std::optional<Bytes> decodeBase64(std::string_view text)
{
    std::string padded{ text };
    while ((padded.size() % 4U) != 0U)
    {
        padded.push_back('=');
    }
    if (padded.empty())
    {
        return Bytes{};
    }
    if (padded.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        return std::nullopt;
    }

    Bytes out(padded.size() / 4U * 3U);
    const int written{ EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(padded.data()),
                                       static_cast<int>(padded.size())) };
    if (written < 0)
    {
        return std::nullopt;
    }

    std::size_t padding{};
    for (auto it{ padded.rbegin() }; it != padded.rend() && *it == '='; ++it)
    {
        ++padding;
    }
    if (padding > 2U || padding > static_cast<std::size_t>(written))
    {
        return std::nullopt;
    }
    out.resize(static_cast<std::size_t>(written) - padding);
    return out;
}

[[nodiscard]] std::string encodeBase64(std::span<const std::uint8_t> bytes)
{
    if (bytes.empty())
    {
        return {};
    }
    if (bytes.size() > static_cast<std::size_t>(std::numeric_limits<int>::max() / 4 * 3))
    {
        throw std::invalid_argument("encodeBase64: input too large");
    }
    std::string out(((bytes.size() + 2U) / 3U) * 4U + 1U, '\0');
    const int written{ EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), bytes.data(),
                                       static_cast<int>(bytes.size())) };
    if (written < 0)
    {
        throw std::runtime_error("encodeBase64: EVP_EncodeBlock failed");
    }
    out.resize(static_cast<std::size_t>(written));
    return out;
}

[[nodiscard]] std::optional<std::int64_t> integerField(const nlohmann::json& doc, const char* name)
{
    const auto it{ doc.find(name) };
    if (it == doc.end() || !it->is_number_integer())
    {
        return std::nullopt;
    }
    return it->get<std::int64_t>();
}

[[nodiscard]] std::optional<std::string> stringField(const nlohmann::json& doc, const char* name)
{
    const auto it{ doc.find(name) };
    if (it == doc.end() || !it->is_string())
    {
        return std::nullopt;
    }
    return it->get<std::string>();
}

[[nodiscard]] std::optional<Envelope> parseEnvelope(std::string_view text)
{
    const nlohmann::json doc = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object())
    {
        return std::nullopt;
    }

    const auto version{ integerField(doc, "v") };
    const auto iterations{ integerField(doc, "iter") };
    const auto keyBits{ integerField(doc, "ks") };
    const auto tagBits{ integerField(doc, "ts") };
    const auto mode{ stringField(doc, "mode") };
    const auto cipherName{ stringField(doc, "cipher") };
    const auto iv{ stringField(doc, "iv") };
    const auto salt{ stringField(doc, "salt") };
    const auto cipherText{ stringField(doc, "ct") };
    if (!version || !iterations || !keyBits || !tagBits || !mode || !cipherName || !iv || !salt || !cipherText)
    {
        return std::nullopt;
    }
    if (*version != g_kEnvelopeVersion || *mode != g_kMode || *cipherName != g_kCipherName)
    {
        return std::nullopt;
    }
    if (*iterations <= g_kMinIterations || *iterations > std::numeric_limits<std::int32_t>::max() ||
        !isSupportedKeyBits(*keyBits) || !isSupportedTagBits(*tagBits))
    {
        return std::nullopt;
    }

    Envelope env{};
    env.iterations = static_cast<std::uint32_t>(*iterations);
    env.keyBits = static_cast<std::uint32_t>(*keyBits);
    env.tagBits = static_cast<std::uint32_t>(*tagBits);

    auto ivBytes{ decodeBase64(*iv) };
    auto saltBytes{ decodeBase64(*salt) };
    auto ctBytes{ decodeBase64(*cipherText) };
    if (!ivBytes || !saltBytes || !ctBytes)
    {
        return std::nullopt;
    }
    if (ivBytes->size() < g_kMinIvBytes || ivBytes->size() > g_kMaxIvBytes)
    {
        return std::nullopt;
    }
    env.iv = std::move(*ivBytes);
    env.salt = std::move(*saltBytes);
    env.cipherText = std::move(*ctBytes);

    if (const auto adata{ stringField(doc, "adata") }; adata)
    {
        auto adataBytes{ decodeBase64(*adata) };
        if (!adataBytes)
        {
            return std::nullopt;
        }
        env.adata = std::move(*adataBytes);
    }
    return env;
}

// Same length-field choice as SJCL: the smallest L in [2, 4] that can encode the message length, raised so that
// the nonce never exceeds the IV.
[[nodiscard]] std::size_t ccmNonceBytes(std::size_t ivBytes, std::size_t messageBytes) noexcept
{
    std::size_t lengthField{ g_kCcmMinLengthField };
    while (lengthField < g_kCcmMaxComputedLengthField &&
           (static_cast<std::uint64_t>(messageBytes) >> (8U * lengthField)) != 0U)
    {
        ++lengthField;
    }
    if (ivBytes < g_kCcmBlockMinusFlags && lengthField < g_kCcmBlockMinusFlags - ivBytes)
    {
        lengthField = g_kCcmBlockMinusFlags - ivBytes;
    }
    return g_kCcmBlockMinusFlags - lengthField;
}

class OpenSslSjclCipher final : public joplinreader::crypto::ICipher
{
public:
    OpenSslSjclCipher() : m_pbkdf2{ EVP_KDF_fetch(nullptr, "PBKDF2", nullptr), &EVP_KDF_free }
    {
    }

    [[nodiscard]] std::optional<joplinreader::security::SecureBuffer>
    decrypt(std::string_view envelope, std::span<const std::byte> password) override
    {
        const auto env{ parseEnvelope(envelope) };
        if (!env)
        {
            return std::nullopt;
        }

        const std::size_t tagBytes{ env->tagBits / 8U };
        if (env->cipherText.size() < tagBytes ||
            env->cipherText.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()) ||
            env->adata.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
        {
            return std::nullopt;
        }
        const std::size_t messageBytes{ env->cipherText.size() - tagBytes };
        const std::size_t nonceBytes{ ccmNonceBytes(env->iv.size(), messageBytes) };

        auto key{ deriveKey(password, env->salt, env->iterations, env->keyBits / 8U) };

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("decrypt: EVP_CIPHER_CTX_new failed");
        }
        if (EVP_DecryptInit_ex(ctx.get(), aesCcmFor(env->keyBits), nullptr, nullptr, nullptr) != 1)
        {
            throw std::runtime_error("decrypt: EVP_DecryptInit_ex failed");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_CCM_SET_IVLEN, static_cast<int>(nonceBytes), nullptr) != 1)
        {
            throw std::runtime_error("decrypt: set ivlen failed");
        }

        std::vector<std::uint8_t> tag(env->cipherText.end() - static_cast<std::ptrdiff_t>(tagBytes),
                                      env->cipherText.end());
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_CCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) != 1)
        {
            throw std::runtime_error("decrypt: set tag failed");
        }
        if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), env->iv.data()) != 1)
        {
            throw std::runtime_error("decrypt: set key/nonce failed");
        }
        joplinreader::security::secureRelease(key);

        int len{ 0 };
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, nullptr, static_cast<int>(messageBytes)) != 1)
        {
            throw std::runtime_error("decrypt: set message length failed");
        }
        if (!env->adata.empty() &&
            EVP_DecryptUpdate(ctx.get(), nullptr, &len, env->adata.data(), static_cast<int>(env->adata.size())) != 1)
        {
            throw std::runtime_error("decrypt: add aad failed");
        }

        // CCM needs non-null buffers even for an empty message.
        std::array<std::uint8_t, 1U> emptyIn{};
        joplinreader::security::SecureBuffer plainText{};
        plainText.resize(messageBytes == 0U ? 1U : messageBytes);
        const auto* ctPtr{ messageBytes == 0U ? emptyIn.data() : env->cipherText.data() };

        int outLen{ 0 };
        if (EVP_DecryptUpdate(ctx.get(), plainText.data(), &outLen, ctPtr, static_cast<int>(messageBytes)) <= 0)
        {
            joplinreader::security::secureRelease(plainText);
            return std::nullopt;
        }
        if (outLen < 0 || static_cast<std::size_t>(outLen) != messageBytes)
        {
            joplinreader::security::secureRelease(plainText);
            return std::nullopt;
        }
        plainText.resize(messageBytes);
        return plainText;
    }

    [[nodiscard]] std::string encrypt(std::span<const std::byte> plainText, std::span<const std::byte> password,
                                      const joplinreader::crypto::SjclParams& params) override
    {
        if (password.empty())
        {
            throw std::invalid_argument("encrypt: empty password");
        }
        if (static_cast<std::int64_t>(params.iterations) <= g_kMinIterations ||
            params.iterations > static_cast<std::uint32_t>(std::numeric_limits<std::int32_t>::max()) ||
            !isSupportedKeyBits(params.keyBits) || !isSupportedTagBits(params.tagBits))
        {
            throw std::invalid_argument("encrypt: unsupported SJCL parameters");
        }
        if (plainText.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
        {
            throw std::invalid_argument("encrypt: plainText too large");
        }

        std::array<std::uint8_t, g_kSaltBytes> salt{};
        std::array<std::uint8_t, g_kIvBytes> iv{};
        if (!joplinreader::security::secureRandomFill(salt) || !joplinreader::security::secureRandomFill(iv))
        {
            throw std::runtime_error("encrypt: CSPRNG failure");
        }

        const std::size_t tagBytes{ params.tagBits / 8U };
        const std::size_t nonceBytes{ ccmNonceBytes(iv.size(), plainText.size()) };
        auto key{ deriveKey(password, salt, params.iterations, params.keyBits / 8U) };

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("encrypt: EVP_CIPHER_CTX_new failed");
        }
        if (EVP_EncryptInit_ex(ctx.get(), aesCcmFor(params.keyBits), nullptr, nullptr, nullptr) != 1)
        {
            throw std::runtime_error("encrypt: EVP_EncryptInit_ex failed");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_CCM_SET_IVLEN, static_cast<int>(nonceBytes), nullptr) != 1)
        {
            throw std::runtime_error("encrypt: set ivlen failed");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_CCM_SET_TAG, static_cast<int>(tagBytes), nullptr) != 1)
        {
            throw std::runtime_error("encrypt: set tag length failed");
        }
        if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1)
        {
            throw std::runtime_error("encrypt: set key/nonce failed");
        }
        joplinreader::security::secureRelease(key);

        int len{ 0 };
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, nullptr, static_cast<int>(plainText.size())) != 1)
        {
            throw std::runtime_error("encrypt: set message length failed");
        }

        std::array<std::uint8_t, 1U> emptyIn{};
        Bytes cipherText(plainText.size() + tagBytes + 1U);
        const auto* ptPtr{ plainText.empty() ? emptyIn.data()
                                             : reinterpret_cast<const unsigned char*>(plainText.data()) };
        int outLen{ 0 };
        if (EVP_EncryptUpdate(ctx.get(), cipherText.data(), &outLen, ptPtr, static_cast<int>(plainText.size())) != 1)
        {
            throw std::runtime_error("encrypt: encrypt update failed");
        }
        if (outLen < 0 || static_cast<std::size_t>(outLen) != plainText.size())
        {
            throw std::runtime_error("encrypt: invalid output length");
        }
        int finalLen{ 0 };
        if (EVP_EncryptFinal_ex(ctx.get(), cipherText.data() + outLen, &finalLen) != 1 || finalLen != 0)
        {
            throw std::runtime_error("encrypt: encrypt final failed");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_CCM_GET_TAG, static_cast<int>(tagBytes),
                                cipherText.data() + plainText.size()) != 1)
        {
            throw std::runtime_error("encrypt: get tag failed");
        }
        cipherText.resize(plainText.size() + tagBytes);

        nlohmann::ordered_json doc{};
        doc["iv"] = encodeBase64(iv);
        doc["v"] = g_kEnvelopeVersion;
        doc["iter"] = params.iterations;
        doc["ks"] = params.keyBits;
        doc["ts"] = params.tagBits;
        doc["mode"] = std::string{ g_kMode };
        doc["adata"] = "";
        doc["cipher"] = std::string{ g_kCipherName };
        doc["salt"] = encodeBase64(salt);
        doc["ct"] = encodeBase64(cipherText);
        return doc.dump();
    }

private:
    [[nodiscard]] joplinreader::security::SecureBuffer deriveKey(std::span<const std::byte> password,
                                                                 std::span<const std::uint8_t> salt,
                                                                 std::uint32_t iterations, std::size_t keyBytes) const
    {
        if (!m_pbkdf2)
        {
            throw std::runtime_error("deriveKey: OpenSSL PBKDF2 not available");
        }

        EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(m_pbkdf2.get()), &EVP_KDF_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("deriveKey: EVP_KDF_CTX_new failed");
        }

        // OSSL_PARAM wants non-const pointers; hand it private copies.
        joplinreader::security::SecureBuffer passwordCopy{};
        passwordCopy.resize(password.size());
        if (!password.empty())
        {
            std::memcpy(passwordCopy.data(), password.data(), password.size());
        }
        Bytes saltCopy(salt.begin(), salt.end());
        std::array<char, 7U> digest{ "SHA256" };
        unsigned int iter{ iterations };
        // SJCL salts are 8 bytes and iteration counts may be as low as 101, below SP 800-132 minimums.
        int pkcs5Mode{ 1 };

        OSSL_PARAM params[]{
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, passwordCopy.data(), passwordCopy.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
            OSSL_PARAM_construct_uint(OSSL_KDF_PARAM_ITER, &iter),
            OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, digest.data(), 0U),
            OSSL_PARAM_construct_int(OSSL_KDF_PARAM_PKCS5, &pkcs5Mode),
            OSSL_PARAM_construct_end(),
        };

        joplinreader::security::SecureBuffer out{};
        out.resize(keyBytes);
        if (EVP_KDF_derive(ctx.get(), out.data(), out.size(), params) <= 0)
        {
            throw std::runtime_error("deriveKey: EVP_KDF_derive failed");
        }
        return out;
    }

    EvpKdfPtr m_pbkdf2;
};

} // namespace

[[nodiscard]] std::unique_ptr<joplinreader::crypto::ICipher> makeOpenSslSjclCipher()
{
    return std::make_unique<OpenSslSjclCipher>();
}

} // namespace joplinreader::crypto::providers
