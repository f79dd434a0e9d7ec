#ifndef INCLUDE_JOPLINREADER_CRYPTO_ICIPHER_HPP
#define INCLUDE_JOPLINREADER_CRYPTO_ICIPHER_HPP

#include "joplinreader/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace joplinreader::crypto
{

// Parameters of an SJCL "convenience" envelope (AES-CCM keyed by PBKDF2-HMAC-SHA256 of a password).
struct SjclParams final
{
    std::uint32_t iterations{ 10000U };
    std::uint32_t keyBits{ 256U };
    std::uint32_t tagBits{ 64U };
};

class ICipher
{
public:
    ICipher() = default;
    ICipher(const ICipher&) = delete;
    ICipher& operator=(const ICipher&) = delete;
    ICipher(ICipher&&) = delete;
    ICipher& operator=(ICipher&&) = delete;
    virtual ~ICipher() = default;

    // Decrypts one self-describing envelope (a key file's `content` or one chunk of a note) with a password.
    // Returns std::nullopt for any decryption failure: malformed envelope, unsupported parameters or
    // authentication failure. Internal backend failures may throw std::runtime_error.
    [[nodiscard]] virtual std::optional<joplinreader::security::SecureBuffer>
    decrypt(std::string_view envelope, std::span<const std::byte> password) = 0;

    // Produces an envelope that `decrypt` accepts with the same password.
    // Contract violations (unsupported params, empty password) throw std::invalid_argument.
    [[nodiscard]] virtual std::string encrypt(std::span<const std::byte> plainText, std::span<const std::byte> password,
                                              const SjclParams& params) = 0;
};

} // namespace joplinreader::crypto

#endif // INCLUDE_JOPLINREADER_CRYPTO_ICIPHER_HPP
