#include "joplinreader/storage/StorageErrors.hpp"
#include "joplinreader/storage/filesystem/FilesystemItemStoreFactory.hpp"
#include "test_utils/TestUtils.hpp"

#include <filesystem>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include <string>

namespace
{

class FilesystemItemStoreTest : public ::testing::Test
{
protected:
    joplinreader::test_utils::ScratchDir dir{ "store_" };
    std::unique_ptr<joplinreader::storage::IItemStore> store{
        joplinreader::storage::filesystem::makeFilesystemItemStore()
    };

    [[nodiscard]] const std::filesystem::path& root() const
    {
        return dir.path();
    }
};

} // namespace

TEST_F(FilesystemItemStoreTest, ListsRegularFilesSorted)
{
    dir.write("b.md", "b");
    dir.write("a.md", "a");
    dir.write("c.txt", "c");
    std::filesystem::create_directory(root() / "resources");
    dir.write(std::filesystem::path{ "resources" } / "nested.md", "n");

    EXPECT_THAT(store->listItems(root()),
                ::testing::ElementsAre(root() / "a.md", root() / "b.md", root() / "c.txt"));
}

TEST_F(FilesystemItemStoreTest, ReadsBytesVerbatim)
{
    const std::string text{ "Title\r\n\r\nbody \xC3\xA9\n\nid: x\ntype_: 1" };
    dir.write("n.md", text);

    EXPECT_TRUE(store->itemExists(root() / "n.md"));
    EXPECT_EQ(store->readItem(root() / "n.md"), text);
}

TEST_F(FilesystemItemStoreTest, MissingItemThrowsItemNotFound)
{
    EXPECT_FALSE(store->itemExists(root() / "absent.md"));
    EXPECT_THROW((void)store->readItem(root() / "absent.md"), joplinreader::storage::ItemNotFound);
}

TEST_F(FilesystemItemStoreTest, DirectoryIsNotAnItem)
{
    std::filesystem::create_directory(root() / "sub");
    EXPECT_FALSE(store->itemExists(root() / "sub"));
}

TEST_F(FilesystemItemStoreTest, MissingDirectoryThrowsItemReadError)
{
    EXPECT_THROW((void)store->listItems(root() / "nope"), joplinreader::storage::ItemReadError);
}
