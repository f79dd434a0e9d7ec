#ifndef INCLUDE_JOPLINREADER_STORAGE_IITEMSTORE_HPP
#define INCLUDE_JOPLINREADER_STORAGE_IITEMSTORE_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace joplinreader::storage
{

// Read-only access to a synchronised Joplin directory: one text file per item.
class IItemStore
{
public:
    IItemStore() = default;
    IItemStore(const IItemStore&) = delete;
    IItemStore& operator=(const IItemStore&) = delete;
    IItemStore(IItemStore&&) = delete;
    IItemStore& operator=(IItemStore&&) = delete;
    virtual ~IItemStore() = default;

    // Regular files directly inside `dir`, sorted by path. Throws ItemReadError if `dir` cannot be listed.
    [[nodiscard]] virtual std::vector<std::filesystem::path> listItems(const std::filesystem::path& dir) const = 0;

    [[nodiscard]] virtual bool itemExists(const std::filesystem::path& path) const = 0;

    // Whole file contents. Throws ItemNotFound for a missing file and ItemReadError for any other failure.
    [[nodiscard]] virtual std::string readItem(const std::filesystem::path& path) const = 0;
};

} // namespace joplinreader::storage

#endif // INCLUDE_JOPLINREADER_STORAGE_IITEMSTORE_HPP
