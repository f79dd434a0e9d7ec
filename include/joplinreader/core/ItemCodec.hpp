#ifndef INCLUDE_JOPLINREADER_CORE_ITEMCODEC_HPP
#define INCLUDE_JOPLINREADER_CORE_ITEMCODEC_HPP

#include "joplinreader/core/ItemType.hpp"
#include "joplinreader/core/NoteProperties.hpp"
#include "joplinreader/core/ReaderError.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace joplinreader::core
{

// Joplin item text is "title\n\nbody\n\nkey: value\n...". The body may itself contain blank lines and colons, so
// the only reliable split point is the last blank line: the text is scanned from the end.

struct PropertyBlock final
{
    PropertyMap properties;
    // Lines above the property block, in reading order.
    std::vector<std::string_view> bodyLines;
};

// Backward pass only: collects the trailing key/value block (first occurrence in reading order wins) and the
// lines above it. A non-blank property line without a colon is a FormatError.
[[nodiscard]] ReaderResult<PropertyBlock> scanPropertyBlock(const std::vector<std::string_view>& lines);

// Reads the `type_` property. FormatError if it is missing or not an integer.
[[nodiscard]] ReaderResult<ItemType> itemTypeOf(const PropertyMap& properties);

// Full decode: property block, required `type_`, then `title` from the first body line and, for notes, `body`
// from the lines after the blank separator.
[[nodiscard]] ReaderResult<PropertyMap> deserializeItem(const std::vector<std::string_view>& lines);
[[nodiscard]] ReaderResult<PropertyMap> deserializeItem(std::string_view text);

// deserializeItem followed by the typed conversion. Individual malformed fields become empty.
[[nodiscard]] ReaderResult<NoteProperties> decodeNoteProperties(std::string_view text);

// "title\n\nbody\n\nkey: value..." with properties in map order.
[[nodiscard]] std::string serializeItem(std::string_view title, std::string_view body,
                                        const PropertyMap& properties);

} // namespace joplinreader::core

#endif // INCLUDE_JOPLINREADER_CORE_ITEMCODEC_HPP
