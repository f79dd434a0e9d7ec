#include "joplinreader/storage/StorageErrors.hpp"
#include "joplinreader/storage/filesystem/FilesystemItemStoreFactory.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace joplinreader::storage::filesystem
{
namespace
{

class FilesystemItemStore final : public joplinreader::storage::IItemStore
{
public:
    [[nodiscard]] std::vector<std::filesystem::path> listItems(const std::filesystem::path& dir) const override
    {
        std::error_code ec{};
        std::filesystem::directory_iterator it{ dir, ec };
        if (ec)
        {
            throw ItemReadError{ "storage: failed to list directory: " + dir.string() };
        }

        std::vector<std::filesystem::path> out{};
        for (const std::filesystem::directory_iterator end{}; it != end; it.increment(ec))
        {
            if (ec)
            {
                throw ItemReadError{ "storage: failed to list directory: " + dir.string() };
            }
            std::error_code typeEc{};
            if (it->is_regular_file(typeEc) && !typeEc)
            {
                out.push_back(it->path());
            }
        }
        if (ec)
        {
            throw ItemReadError{ "storage: failed to list directory: " + dir.string() };
        }

        std::sort(out.begin(), out.end());
        return out;
    }

    [[nodiscard]] bool itemExists(const std::filesystem::path& path) const override
    {
        std::error_code ec{};
        return std::filesystem::is_regular_file(path, ec) && !ec;
    }

    [[nodiscard]] std::string readItem(const std::filesystem::path& path) const override
    {
        if (!itemExists(path))
        {
            throw ItemNotFound{ "storage: item not found: " + path.string() };
        }

        std::ifstream in{ path, std::ios::binary };
        if (!in)
        {
            throw ItemReadError{ "storage: failed to open item: " + path.string() };
        }

        std::ostringstream buffer{};
        buffer << in.rdbuf();
        if (in.bad() || buffer.bad())
        {
            throw ItemReadError{ "storage: failed to read item: " + path.string() };
        }
        return buffer.str();
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<joplinreader::storage::IItemStore> makeFilesystemItemStore()
{
    return std::make_unique<FilesystemItemStore>();
}

} // namespace joplinreader::storage::filesystem
