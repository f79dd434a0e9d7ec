#ifndef INCLUDE_JOPLINREADER_STORAGE_STORAGEERRORS_HPP
#define INCLUDE_JOPLINREADER_STORAGE_STORAGEERRORS_HPP

#include <stdexcept>

namespace joplinreader::storage
{

class ItemNotFound final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class ItemReadError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace joplinreader::storage

#endif // INCLUDE_JOPLINREADER_STORAGE_STORAGEERRORS_HPP
