#ifndef INCLUDE_JOPLINREADER_CORE_CHUNKEDDECRYPTOR_HPP
#define INCLUDE_JOPLINREADER_CORE_CHUNKEDDECRYPTOR_HPP

#include "joplinreader/core/EncryptionHeader.hpp"
#include "joplinreader/core/ReaderError.hpp"
#include "joplinreader/crypto/ICipher.hpp"
#include "joplinreader/security/SecureBuffer.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace joplinreader::core
{

constexpr std::size_t g_kChunkLengthChars{ 6U };
// Plaintext characters per chunk written by `encryptChunks` (Joplin's producer uses the same size).
constexpr std::size_t g_kDefaultChunkChars{ 5000U };

// Decrypts the chunk stream that follows the 45-character envelope header.
// Chunks are processed strictly in stream order; fewer than 6 remaining characters end the stream cleanly,
// a chunk shorter than its declared length is UnexpectedEndOfNote. Each chunk must decrypt to UTF-8 and is
// passed through cleanLegacyEscapes before concatenation; the joined text is percent-decoded once.
[[nodiscard]] ReaderResult<std::string> decryptChunks(std::string_view chunkStream,
                                                      const joplinreader::security::SecureString& masterKey,
                                                      joplinreader::crypto::ICipher& cipher);

// Validates the header of a full `encryption_cipher_text` value, then decrypts the chunks after it.
[[nodiscard]] ReaderResult<std::string> decryptEnvelope(std::string_view cipherText,
                                                        const joplinreader::security::SecureString& masterKey,
                                                        joplinreader::crypto::ICipher& cipher);

[[nodiscard]] joplinreader::crypto::SjclParams sjclParamsFor(EncryptionMethod method) noexcept;

// Writes header + length-prefixed chunks of at most `chunkChars` plaintext bytes each. Pieces never split a
// UTF-8 sequence or a legacy escape, so every chunk decrypts to valid text and cleans up on its own.
// Returns FormatError for a header that encodeEncryptionHeader rejects or a chunk too long for 6 hex digits.
[[nodiscard]] ReaderResult<std::string> encryptChunks(const EncryptionHeader& header, std::string_view plainText,
                                                      const joplinreader::security::SecureString& masterKey,
                                                      joplinreader::crypto::ICipher& cipher,
                                                      std::size_t chunkChars = g_kDefaultChunkChars);

} // namespace joplinreader::core

#endif // INCLUDE_JOPLINREADER_CORE_CHUNKEDDECRYPTOR_HPP
