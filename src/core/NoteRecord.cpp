#include "joplinreader/core/NoteRecord.hpp"

#include "joplinreader/core/ChunkedDecryptor.hpp"
#include "joplinreader/core/EncryptionHeader.hpp"
#include "joplinreader/core/ItemCodec.hpp"
#include "joplinreader/core/TextEncoding.hpp"
#include "joplinreader/diagnostics/Logger.hpp"
#include <charconv>
#include <exception>
#include <system_error>
#include <utility>

namespace joplinreader::core
{
namespace
{

constexpr std::string_view g_kIdKey{ "id" };
constexpr std::string_view g_kParentIdKey{ "parent_id" };
constexpr std::string_view g_kEncryptionAppliedKey{ "encryption_applied" };
constexpr std::string_view g_kCipherTextKey{ "encryption_cipher_text" };
constexpr std::string_view g_kUpdatedTimeKey{ "updated_time" };

[[nodiscard]] std::optional<std::string_view> lookup(const PropertyMap& properties, std::string_view key)
{
    const auto it{ properties.find(key) };
    if (it == properties.end())
    {
        return std::nullopt;
    }
    return std::string_view{ it->second };
}

[[nodiscard]] std::optional<std::int8_t> parseSmallInt(std::string_view text) noexcept
{
    std::int8_t value{};
    const auto* last{ text.data() + text.size() };
    const auto [ptr, ec]{ std::from_chars(text.data(), last, value) };
    if (ec != std::errc{} || ptr != last || text.empty())
    {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] ReaderResult<std::string> readText(const joplinreader::storage::IItemStore& store,
                                                 const std::filesystem::path& path)
{
    try
    {
        return store.readItem(path);
    }
    catch (const std::exception&)
    {
        return ReaderError::IoError;
    }
}

} // namespace

ReaderResult<NoteMetadata> scanNoteMetadata(const std::filesystem::path& path, std::string_view text)
{
    const auto blockOrErr{ scanPropertyBlock(splitLines(text)) };
    if (std::holds_alternative<ReaderError>(blockOrErr))
    {
        return std::get<ReaderError>(blockOrErr);
    }
    const auto& properties{ std::get<PropertyBlock>(blockOrErr).properties };

    const auto typeOrErr{ itemTypeOf(properties) };
    if (std::holds_alternative<ReaderError>(typeOrErr))
    {
        return std::get<ReaderError>(typeOrErr);
    }

    const auto id{ lookup(properties, g_kIdKey) };
    const auto applied{ lookup(properties, g_kEncryptionAppliedKey) };
    if (!id || id->empty() || !applied)
    {
        return ReaderError::FormatError;
    }
    const auto appliedFlag{ parseSmallInt(*applied) };
    if (!appliedFlag)
    {
        return ReaderError::FormatError;
    }

    NoteMetadata meta{};
    meta.path = path;
    meta.id = std::string{ *id };
    meta.type = std::get<ItemType>(typeOrErr);
    meta.encryptionApplied = (*appliedFlag == 1);
    if (const auto parent{ lookup(properties, g_kParentIdKey) })
    {
        meta.parentId = std::string{ *parent };
    }
    if (const auto updated{ lookup(properties, g_kUpdatedTimeKey) })
    {
        meta.updatedTime = parseTimestamp(*updated);
    }

    if (meta.encryptionApplied)
    {
        const auto cipherText{ lookup(properties, g_kCipherTextKey) };
        if (!cipherText)
        {
            return ReaderError::FormatError;
        }
        const auto headerOrErr{ parseEncryptionHeader(*cipherText) };
        if (std::holds_alternative<ReaderError>(headerOrErr))
        {
            return std::get<ReaderError>(headerOrErr);
        }
        meta.encryptionKeyId = std::get<EncryptionHeader>(headerOrErr).masterKeyId;
    }
    return meta;
}

NoteRecord::NoteRecord(NoteMetadata metadata, const joplinreader::storage::IItemStore& store,
                       joplinreader::crypto::ICipher& cipher, const NotebookOptions& options)
    : m_metadata(std::move(metadata)), m_store(&store), m_cipher(&cipher), m_options(options)
{
    if (!m_options.now)
    {
        m_options.now = NotebookOptions::Clock::now;
    }
}

ReaderResult<NoteRecord> NoteRecord::index(const std::filesystem::path& path,
                                           const joplinreader::storage::IItemStore& store,
                                           joplinreader::crypto::ICipher& cipher, const NotebookOptions& options)
{
    const auto textOrErr{ readText(store, path) };
    if (std::holds_alternative<ReaderError>(textOrErr))
    {
        return std::get<ReaderError>(textOrErr);
    }

    auto metaOrErr{ scanNoteMetadata(path, std::get<std::string>(textOrErr)) };
    if (std::holds_alternative<ReaderError>(metaOrErr))
    {
        return std::get<ReaderError>(metaOrErr);
    }
    return NoteRecord{ std::move(std::get<NoteMetadata>(metaOrErr)), store, cipher, options };
}

bool NoteRecord::isStale() const
{
    if (!m_lastRead)
    {
        return true;
    }
    return (m_options.now() - *m_lastRead) >= m_options.refreshInterval;
}

ReaderResult<NoteProperties> NoteRecord::load(const MasterKey* masterKey) const
{
    const auto textOrErr{ readText(*m_store, m_metadata.path) };
    if (std::holds_alternative<ReaderError>(textOrErr))
    {
        return std::get<ReaderError>(textOrErr);
    }
    const auto& text{ std::get<std::string>(textOrErr) };

    if (!m_metadata.encryptionApplied)
    {
        return decodeNoteProperties(text);
    }

    if (masterKey == nullptr)
    {
        return ReaderError::NoEncryptionKey;
    }

    const auto blockOrErr{ scanPropertyBlock(splitLines(text)) };
    if (std::holds_alternative<ReaderError>(blockOrErr))
    {
        return std::get<ReaderError>(blockOrErr);
    }
    const auto cipherText{ lookup(std::get<PropertyBlock>(blockOrErr).properties, g_kCipherTextKey) };
    if (!cipherText)
    {
        return ReaderError::FormatError;
    }
    if (!isAscii(*cipherText))
    {
        return ReaderError::DecryptionError;
    }

    const auto plainOrErr{ decryptEnvelope(*cipherText, *masterKey, *m_cipher) };
    if (std::holds_alternative<ReaderError>(plainOrErr))
    {
        return std::get<ReaderError>(plainOrErr);
    }
    return decodeNoteProperties(std::get<std::string>(plainOrErr));
}

ReaderResult<std::string> NoteRecord::read(const MasterKey* masterKey)
{
    if (isStale())
    {
        joplinreader::diagnostics::Logger::debug("note " + m_metadata.id + ": loading content");

        auto loaded{ load(masterKey) };
        if (std::holds_alternative<ReaderError>(loaded))
        {
            return std::get<ReaderError>(loaded);
        }
        m_properties = std::move(std::get<NoteProperties>(loaded));
        m_lastRead = m_options.now();
    }

    if (!m_properties.body)
    {
        return ReaderError::NoText;
    }
    return *m_properties.body;
}

} // namespace joplinreader::core
