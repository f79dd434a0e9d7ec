#ifndef INCLUDE_JOPLINREADER_CORE_NOTERECORD_HPP
#define INCLUDE_JOPLINREADER_CORE_NOTERECORD_HPP

#include "joplinreader/core/ItemType.hpp"
#include "joplinreader/core/MasterKeyLoader.hpp"
#include "joplinreader/core/NoteProperties.hpp"
#include "joplinreader/core/NotebookOptions.hpp"
#include "joplinreader/core/ReaderError.hpp"
#include "joplinreader/crypto/ICipher.hpp"
#include "joplinreader/storage/IItemStore.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace joplinreader::core
{

// Plaintext metadata of an item, available without decrypting anything.
struct NoteMetadata final
{
    std::filesystem::path path;
    std::string id;
    ItemType type{ ItemType::Undefined };
    bool encryptionApplied{ false };
    std::optional<std::string> parentId;
    // Master key id from the envelope header; set iff encryptionApplied.
    std::optional<std::string> encryptionKeyId;
    std::optional<Timestamp> updatedTime;
};

// Scans an item's trailing property block for the metadata fields. `id`, `type_` and `encryption_applied` are
// required. For encrypted items the envelope header is parsed here, so a malformed one fails indexing.
[[nodiscard]] ReaderResult<NoteMetadata> scanNoteMetadata(const std::filesystem::path& path, std::string_view text);

class NoteRecord final
{
public:
    using TimePoint = NotebookOptions::TimePoint;

    // Reads the file once for its metadata. Content is loaded lazily by `read`.
    [[nodiscard]] static ReaderResult<NoteRecord> index(const std::filesystem::path& path,
                                                        const joplinreader::storage::IItemStore& store,
                                                        joplinreader::crypto::ICipher& cipher,
                                                        const NotebookOptions& options);

    // Returns the note body, reloading it from the store when it was never loaded or the cached copy is at
    // least `refreshInterval` old. `masterKey` is required for encrypted items. A failed reload leaves the
    // previous cache untouched. NoText if the decoded item has no body (non-note items).
    [[nodiscard]] ReaderResult<std::string> read(const MasterKey* masterKey);

    [[nodiscard]] const NoteMetadata& metadata() const noexcept
    {
        return m_metadata;
    }
    [[nodiscard]] const NoteProperties& properties() const noexcept
    {
        return m_properties;
    }
    [[nodiscard]] std::optional<TimePoint> lastReadTime() const noexcept
    {
        return m_lastRead;
    }

private:
    NoteRecord(NoteMetadata metadata, const joplinreader::storage::IItemStore& store,
               joplinreader::crypto::ICipher& cipher, const NotebookOptions& options);

    [[nodiscard]] bool isStale() const;
    [[nodiscard]] ReaderResult<NoteProperties> load(const MasterKey* masterKey) const;

    NoteMetadata m_metadata;
    const joplinreader::storage::IItemStore* m_store{ nullptr };
    joplinreader::crypto::ICipher* m_cipher{ nullptr };
    NotebookOptions m_options;
    std::optional<TimePoint> m_lastRead;
    NoteProperties m_properties;
};

} // namespace joplinreader::core

#endif // INCLUDE_JOPLINREADER_CORE_NOTERECORD_HPP
