#include "joplinreader/core/MasterKeyLoader.hpp"

#include "joplinreader/core/TextEncoding.hpp"
#include <exception>
#include <optional>
#include <string>

namespace joplinreader::core
{
namespace
{

constexpr std::string_view g_kIdKey{ "id" };
constexpr std::string_view g_kContentKey{ "content" };

struct KeyFileFields final
{
    std::optional<std::string_view> id;
    std::optional<std::string_view> content;
};

[[nodiscard]] KeyFileFields scanKeyFile(std::string_view text)
{
    KeyFileFields fields{};
    for (const auto line : splitLines(text))
    {
        const auto kv{ splitKeyValue(line) };
        if (!kv)
        {
            continue;
        }
        if (kv->first == g_kIdKey)
        {
            fields.id = kv->second;
        }
        else if (kv->first == g_kContentKey)
        {
            fields.content = kv->second;
        }
    }
    return fields;
}

} // namespace

ReaderResult<MasterKey> loadMasterKey(const joplinreader::storage::IItemStore& store,
                                      const std::filesystem::path& keyPath, std::string_view keyId,
                                      const joplinreader::security::SecureString& passphrase,
                                      joplinreader::crypto::ICipher& cipher)
{
    std::string text{};
    try
    {
        text = store.readItem(keyPath);
    }
    catch (const std::exception&)
    {
        return ReaderError::IoError;
    }

    const auto fields{ scanKeyFile(text) };
    if (!fields.id || !fields.content)
    {
        return ReaderError::FormatError;
    }
    if (*fields.id != keyId)
    {
        return ReaderError::KeyIdMismatch;
    }

    try
    {
        auto plainOpt{ cipher.decrypt(*fields.content, joplinreader::security::asBytes(passphrase)) };
        if (!plainOpt)
        {
            return ReaderError::DecryptionError;
        }
        if (!isValidUtf8(joplinreader::security::asStringView(*plainOpt)))
        {
            joplinreader::security::secureRelease(*plainOpt);
            return ReaderError::DecryptionError;
        }

        auto key{ joplinreader::security::toSecureString(*plainOpt) };
        joplinreader::security::secureRelease(*plainOpt);
        return key;
    }
    catch (const std::exception&)
    {
        return ReaderError::DecryptionError;
    }
}

} // namespace joplinreader::core
