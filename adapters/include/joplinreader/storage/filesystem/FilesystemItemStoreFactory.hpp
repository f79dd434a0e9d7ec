#ifndef INCLUDE_JOPLINREADER_STORAGE_FILESYSTEM_FILESYSTEMITEMSTOREFACTORY_HPP
#define INCLUDE_JOPLINREADER_STORAGE_FILESYSTEM_FILESYSTEMITEMSTOREFACTORY_HPP

#include "joplinreader/storage/IItemStore.hpp"
#include <memory>

namespace joplinreader::storage::filesystem
{

[[nodiscard]] std::unique_ptr<joplinreader::storage::IItemStore> makeFilesystemItemStore();

} // namespace joplinreader::storage::filesystem

#endif // INCLUDE_JOPLINREADER_STORAGE_FILESYSTEM_FILESYSTEMITEMSTOREFACTORY_HPP
