#ifndef INCLUDE_JOPLINREADER_CORE_ITEMTYPE_HPP
#define INCLUDE_JOPLINREADER_CORE_ITEMTYPE_HPP

#include <cstdint>

namespace joplinreader::core
{

// Joplin item type ids (`type_` property). Codes outside the table decode to Undefined.
enum class ItemType : std::uint8_t
{
    Undefined = 0,
    Note = 1,
    Folder = 2,
    Setting = 3,
    Resource = 4,
    Tag = 5,
    NoteTag = 6,
    Search = 7,
    Alarm = 8,
    MasterKeyItem = 9,
    ItemChange = 10,
    NoteResource = 11,
    ResourceLocalState = 12,
    Revision = 13,
    Migration = 14,
    SmartFilter = 15,
    Command = 16,
};

[[nodiscard]] constexpr ItemType itemTypeFromCode(std::int32_t code) noexcept
{
    constexpr std::int32_t kFirstKnown{ static_cast<std::int32_t>(ItemType::Note) };
    constexpr std::int32_t kLastKnown{ static_cast<std::int32_t>(ItemType::Command) };
    if (code < kFirstKnown || code > kLastKnown)
    {
        return ItemType::Undefined;
    }
    return static_cast<ItemType>(code);
}

} // namespace joplinreader::core

#endif // INCLUDE_JOPLINREADER_CORE_ITEMTYPE_HPP
