#ifndef INCLUDE_JOPLINREADER_CORE_NOTEBOOK_HPP
#define INCLUDE_JOPLINREADER_CORE_NOTEBOOK_HPP

#include "joplinreader/core/MasterKeyLoader.hpp"
#include "joplinreader/core/NoteRecord.hpp"
#include "joplinreader/core/NotebookOptions.hpp"
#include "joplinreader/core/ReaderError.hpp"
#include "joplinreader/crypto/ICipher.hpp"
#include "joplinreader/storage/IItemStore.hpp"
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace joplinreader::core
{

// Read-only view of a Joplin sync directory. The cipher and store must outlive the notebook.
class Notebook final
{
public:
    Notebook(const Notebook&) = delete;
    Notebook& operator=(const Notebook&) = delete;
    Notebook(Notebook&&) noexcept = default;
    Notebook& operator=(Notebook&&) noexcept = default;
    ~Notebook() = default;

    // `passwords` holds "<key id>,<passphrase>" entries. A key whose file is missing fails the whole open with
    // NoEncryptionKey; a key that cannot be unlocked is skipped. Items that fail to index are skipped too.
    // IoError if the directory cannot be listed.
    [[nodiscard]] static ReaderResult<Notebook> open(const std::filesystem::path& dir,
                                                     const std::vector<std::string>& passwords,
                                                     joplinreader::crypto::ICipher& cipher,
                                                     const joplinreader::storage::IItemStore& store,
                                                     const NotebookOptions& options = defaultNotebookOptions());

    // NotFound for an unknown id, NoEncryptionKey if the note's master key was not unlocked.
    [[nodiscard]] ReaderResult<std::string> readNote(std::string_view id);

    [[nodiscard]] ReaderResult<NoteMetadata> getNote(std::string_view id) const;

    // Typed properties cached by the last successful read. NotFound for an unknown id.
    [[nodiscard]] ReaderResult<NoteProperties> properties(std::string_view id) const;

    [[nodiscard]] std::vector<std::string> noteIds() const;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool hasMasterKey(std::string_view keyId) const;

private:
    Notebook() = default;

    // MasterKey storage wipes itself on release.
    std::map<std::string, MasterKey, std::less<>> m_masterKeys;
    std::map<std::string, NoteRecord, std::less<>> m_notes;
};

} // namespace joplinreader::core

#endif // INCLUDE_JOPLINREADER_CORE_NOTEBOOK_HPP
