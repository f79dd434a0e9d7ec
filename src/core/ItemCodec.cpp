#include "joplinreader/core/ItemCodec.hpp"

#include "joplinreader/core/TextEncoding.hpp"
#include <algorithm>
#include <charconv>
#include <iterator>
#include <system_error>
#include <utility>

namespace joplinreader::core
{
namespace
{

constexpr std::string_view g_kTypeKey{ "type_" };
constexpr std::string_view g_kTitleKey{ "title" };
constexpr std::string_view g_kBodyKey{ "body" };

enum class ScanState : std::uint8_t
{
    Properties,
    Body,
};

[[nodiscard]] std::string joinLines(std::vector<std::string_view>::const_iterator first,
                                    std::vector<std::string_view>::const_iterator last)
{
    std::string out{};
    for (auto it{ first }; it != last; ++it)
    {
        if (it != first)
        {
            out.push_back('\n');
        }
        out.append(*it);
    }
    return out;
}

} // namespace

ReaderResult<PropertyBlock> scanPropertyBlock(const std::vector<std::string_view>& lines)
{
    PropertyBlock block{};
    auto state{ ScanState::Properties };
    auto bodyEnd{ lines.rend() };

    for (auto it{ lines.rbegin() }; it != lines.rend(); ++it)
    {
        if (trim(*it).empty())
        {
            state = ScanState::Body;
            bodyEnd = std::next(it);
            break;
        }

        const auto kv{ splitKeyValue(*it) };
        if (!kv)
        {
            return ReaderError::FormatError;
        }
        // Walking backwards: an earlier line overwrites a later duplicate.
        block.properties.insert_or_assign(std::string{ kv->first }, std::string{ kv->second });
    }

    if (state == ScanState::Body)
    {
        block.bodyLines.assign(lines.begin(), bodyEnd.base());
    }
    return block;
}

ReaderResult<ItemType> itemTypeOf(const PropertyMap& properties)
{
    const auto it{ properties.find(g_kTypeKey) };
    if (it == properties.end())
    {
        return ReaderError::FormatError;
    }

    const auto& text{ it->second };
    std::int32_t code{};
    const auto* last{ text.data() + text.size() };
    const auto [ptr, ec]{ std::from_chars(text.data(), last, code) };
    if (ec != std::errc{} || ptr != last || text.empty())
    {
        return ReaderError::FormatError;
    }
    return itemTypeFromCode(code);
}

ReaderResult<PropertyMap> deserializeItem(const std::vector<std::string_view>& lines)
{
    auto blockOrErr{ scanPropertyBlock(lines) };
    if (std::holds_alternative<ReaderError>(blockOrErr))
    {
        return std::get<ReaderError>(blockOrErr);
    }
    auto& block{ std::get<PropertyBlock>(blockOrErr) };

    const auto typeOrErr{ itemTypeOf(block.properties) };
    if (std::holds_alternative<ReaderError>(typeOrErr))
    {
        return std::get<ReaderError>(typeOrErr);
    }

    auto bodyBegin{ block.bodyLines.cbegin() };
    if (bodyBegin != block.bodyLines.cend())
    {
        block.properties.insert_or_assign(std::string{ g_kTitleKey }, std::string{ trim(*bodyBegin) });
        ++bodyBegin;
        // blank separator after the title
        if (bodyBegin != block.bodyLines.cend())
        {
            ++bodyBegin;
        }
    }

    if (std::get<ItemType>(typeOrErr) == ItemType::Note)
    {
        block.properties.insert_or_assign(std::string{ g_kBodyKey }, joinLines(bodyBegin, block.bodyLines.cend()));
    }
    return std::move(block.properties);
}

ReaderResult<PropertyMap> deserializeItem(std::string_view text)
{
    return deserializeItem(splitLines(text));
}

ReaderResult<NoteProperties> decodeNoteProperties(std::string_view text)
{
    const auto mapOrErr{ deserializeItem(text) };
    if (std::holds_alternative<ReaderError>(mapOrErr))
    {
        return std::get<ReaderError>(mapOrErr);
    }
    return notePropertiesFromMap(std::get<PropertyMap>(mapOrErr));
}

std::string serializeItem(std::string_view title, std::string_view body, const PropertyMap& properties)
{
    std::string out{ title };
    out.append("\n\n");
    if (!body.empty())
    {
        out.append(body);
        out.append("\n\n");
    }

    bool first{ true };
    for (const auto& [key, value] : properties)
    {
        if (!first)
        {
            out.push_back('\n');
        }
        first = false;
        out.append(key);
        out.append(": ");
        out.append(value);
    }
    return out;
}

} // namespace joplinreader::core
