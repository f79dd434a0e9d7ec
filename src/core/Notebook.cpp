#include "joplinreader/core/Notebook.hpp"

#include "joplinreader/diagnostics/Logger.hpp"
#include "joplinreader/security/SecureBuffer.hpp"
#include <exception>
#include <utility>

namespace joplinreader::core
{
namespace
{

using joplinreader::diagnostics::Logger;

[[nodiscard]] std::string describeFailure(std::string_view what, const std::filesystem::path& path, ReaderError error)
{
    std::string out{ what };
    out.append(" ");
    out.append(path.string());
    out.append(": ");
    out.append(describe(error));
    return out;
}

// A key id names a file inside the sync directory and nothing else.
[[nodiscard]] bool isPlainKeyId(std::string_view keyId) noexcept
{
    return !keyId.empty() && keyId != "." && keyId != ".." && keyId.find_first_of("/\\") == std::string_view::npos;
}

} // namespace

ReaderResult<Notebook> Notebook::open(const std::filesystem::path& dir, const std::vector<std::string>& passwords,
                                      joplinreader::crypto::ICipher& cipher,
                                      const joplinreader::storage::IItemStore& store, const NotebookOptions& options)
{
    Notebook notebook{};

    for (const auto& entry : passwords)
    {
        const auto parsed{ parsePasswordEntry(entry) };
        if (!parsed)
        {
            Logger::warn("ignoring password entry without a key id");
            continue;
        }
        const auto& [keyId, passphraseText] = *parsed;
        if (!isPlainKeyId(keyId))
        {
            Logger::warn("ignoring password entry with an unusable key id");
            continue;
        }

        const auto keyPath{ dir / (std::string{ keyId } + options.keyFileExtension) };
        if (!store.itemExists(keyPath))
        {
            Logger::error(describeFailure("missing key file", keyPath, ReaderError::NoEncryptionKey));
            return ReaderError::NoEncryptionKey;
        }

        auto passphrase{ joplinreader::security::secureStringFrom(passphraseText) };
        auto keyOrErr{ loadMasterKey(store, keyPath, keyId, passphrase, cipher) };
        joplinreader::security::secureRelease(passphrase);
        if (std::holds_alternative<ReaderError>(keyOrErr))
        {
            Logger::warn(describeFailure("skipping key", keyPath, std::get<ReaderError>(keyOrErr)));
            continue;
        }
        notebook.m_masterKeys.insert_or_assign(std::string{ keyId }, std::move(std::get<MasterKey>(keyOrErr)));
    }

    std::vector<std::filesystem::path> items{};
    try
    {
        items = store.listItems(dir);
    }
    catch (const std::exception& e)
    {
        Logger::error(e.what());
        return ReaderError::IoError;
    }

    for (const auto& path : items)
    {
        if (notebook.hasMasterKey(path.stem().string()))
        {
            continue;
        }

        auto recordOrErr{ NoteRecord::index(path, store, cipher, options) };
        if (std::holds_alternative<ReaderError>(recordOrErr))
        {
            Logger::warn(describeFailure("skipping item", path, std::get<ReaderError>(recordOrErr)));
            continue;
        }

        auto& record{ std::get<NoteRecord>(recordOrErr) };
        auto id{ record.metadata().id };
        if (notebook.m_notes.contains(id))
        {
            Logger::warn("skipping item " + path.string() + ": duplicate id " + id);
            continue;
        }
        notebook.m_notes.emplace(std::move(id), std::move(record));
    }

    Logger::info("indexed " + std::to_string(notebook.m_notes.size()) + " items, " +
                 std::to_string(notebook.m_masterKeys.size()) + " master keys");
    return notebook;
}

ReaderResult<std::string> Notebook::readNote(std::string_view id)
{
    const auto it{ m_notes.find(id) };
    if (it == m_notes.end())
    {
        return ReaderError::NotFound;
    }
    auto& record{ it->second };

    if (!record.metadata().encryptionApplied)
    {
        return record.read(nullptr);
    }

    const auto& keyId{ record.metadata().encryptionKeyId };
    if (!keyId)
    {
        return ReaderError::NoEncryptionKey;
    }
    const auto key{ m_masterKeys.find(*keyId) };
    if (key == m_masterKeys.end())
    {
        return ReaderError::NoEncryptionKey;
    }
    return record.read(&key->second);
}

ReaderResult<NoteMetadata> Notebook::getNote(std::string_view id) const
{
    const auto it{ m_notes.find(id) };
    if (it == m_notes.end())
    {
        return ReaderError::NotFound;
    }
    return it->second.metadata();
}

ReaderResult<NoteProperties> Notebook::properties(std::string_view id) const
{
    const auto it{ m_notes.find(id) };
    if (it == m_notes.end())
    {
        return ReaderError::NotFound;
    }
    return it->second.properties();
}

std::vector<std::string> Notebook::noteIds() const
{
    std::vector<std::string> out{};
    out.reserve(m_notes.size());
    for (const auto& [id, record] : m_notes)
    {
        out.push_back(id);
    }
    return out;
}

std::size_t Notebook::size() const noexcept
{
    return m_notes.size();
}

bool Notebook::hasMasterKey(std::string_view keyId) const
{
    return m_masterKeys.find(keyId) != m_masterKeys.end();
}

} // namespace joplinreader::core
