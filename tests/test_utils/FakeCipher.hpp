#ifndef JOPLINREADER_TESTS_TEST_UTILS_FAKECIPHER_HPP
#define JOPLINREADER_TESTS_TEST_UTILS_FAKECIPHER_HPP

#include "joplinreader/crypto/ICipher.hpp"
#include "joplinreader/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace joplinreader::test_utils
{

// Reversible stand-in for the SJCL cipher: "FAKE" + hex(password) + "." + hex(plaintext).
// Output is pure ASCII and a wrong password fails decryption, which is all the core relies on.
class FakeCipher final : public joplinreader::crypto::ICipher
{
public:
    [[nodiscard]] std::optional<joplinreader::security::SecureBuffer>
    decrypt(std::string_view envelope, std::span<const std::byte> password) override
    {
        ++decryptCalls;
        if (throwOnDecrypt)
        {
            throw std::runtime_error("fake cipher failure");
        }
        if (!envelope.starts_with(kMagic))
        {
            return std::nullopt;
        }
        envelope.remove_prefix(kMagic.size());
        const auto dot{ envelope.find('.') };
        if (dot == std::string_view::npos || envelope.substr(0U, dot) != hex(password))
        {
            return std::nullopt;
        }

        const auto body{ envelope.substr(dot + 1U) };
        if ((body.size() % 2U) != 0U)
        {
            return std::nullopt;
        }
        joplinreader::security::SecureBuffer out{};
        for (std::size_t i{}; i < body.size(); i += 2U)
        {
            const int hi{ nibble(body[i]) };
            const int lo{ nibble(body[i + 1U]) };
            if (hi < 0 || lo < 0)
            {
                return std::nullopt;
            }
            out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
        }
        return out;
    }

    [[nodiscard]] std::string encrypt(std::span<const std::byte> plainText, std::span<const std::byte> password,
                                      const joplinreader::crypto::SjclParams& params) override
    {
        ++encryptCalls;
        lastParams = params;
        if (password.empty())
        {
            throw std::invalid_argument("encrypt: empty password");
        }
        std::string out{ kMagic };
        out += hex(password);
        out.push_back('.');
        out += hex(plainText);
        return out;
    }

    [[nodiscard]] static std::string seal(std::string_view plainText, std::string_view password)
    {
        FakeCipher cipher{};
        return cipher.encrypt(joplinreader::security::asBytes(plainText), joplinreader::security::asBytes(password),
                              {});
    }

    int decryptCalls{ 0 };
    int encryptCalls{ 0 };
    bool throwOnDecrypt{ false };
    std::optional<joplinreader::crypto::SjclParams> lastParams;

private:
    static constexpr std::string_view kMagic{ "FAKE" };

    [[nodiscard]] static std::string hex(std::span<const std::byte> bytes)
    {
        constexpr char kHex[] = "0123456789abcdef";
        std::string out{};
        for (const auto b : bytes)
        {
            const auto v{ static_cast<std::uint8_t>(b) };
            out.push_back(kHex[v >> 4U]);
            out.push_back(kHex[v & 0x0FU]);
        }
        return out;
    }

    [[nodiscard]] static int nibble(char c) noexcept
    {
        if (c >= '0' && c <= '9')
        {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f')
        {
            return c - 'a' + 10;
        }
        return -1;
    }
};

} // namespace joplinreader::test_utils

#endif // JOPLINREADER_TESTS_TEST_UTILS_FAKECIPHER_HPP
