#ifndef INCLUDE_JOPLINREADER_CORE_MASTERKEYLOADER_HPP
#define INCLUDE_JOPLINREADER_CORE_MASTERKEYLOADER_HPP

#include "joplinreader/core/ReaderError.hpp"
#include "joplinreader/crypto/ICipher.hpp"
#include "joplinreader/security/SecureBuffer.hpp"
#include "joplinreader/storage/IItemStore.hpp"
#include <filesystem>
#include <string_view>

namespace joplinreader::core
{

// Unlocked master key. Opaque text used as the password for chunk decryption.
using MasterKey = joplinreader::security::SecureString;

// Reads a key file (`id:` and `content:` lines, last occurrence wins), checks its id against `keyId` and
// unlocks `content` with `passphrase`.
//  - IoError: the file cannot be read
//  - FormatError: `id` or `content` is missing
//  - KeyIdMismatch: the file belongs to another key (checked before any decryption)
//  - DecryptionError: wrong passphrase, corrupt content or a key that is not UTF-8
[[nodiscard]] ReaderResult<MasterKey> loadMasterKey(const joplinreader::storage::IItemStore& store,
                                                    const std::filesystem::path& keyPath, std::string_view keyId,
                                                    const joplinreader::security::SecureString& passphrase,
                                                    joplinreader::crypto::ICipher& cipher);

} // namespace joplinreader::core

#endif // INCLUDE_JOPLINREADER_CORE_MASTERKEYLOADER_HPP
