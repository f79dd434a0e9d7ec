#ifndef INCLUDE_JOPLINREADER_CORE_READERERROR_HPP
#define INCLUDE_JOPLINREADER_CORE_READERERROR_HPP

#include <cstdint>
#include <string_view>
#include <variant>

namespace joplinreader::core
{

enum class ReaderError : std::uint8_t
{
    IoError,
    FormatError,
    KeyIdMismatch,
    NoEncryptionKey,
    DecryptionError,
    UnexpectedEndOfNote,
    NotFound,
    NoText,
};

template <class T> using ReaderResult = std::variant<T, ReaderError>;

[[nodiscard]] constexpr std::string_view describe(ReaderError error) noexcept
{
    switch (error)
    {
    case ReaderError::IoError:
        return "failed to read item file";
    case ReaderError::FormatError:
        return "invalid item format";
    case ReaderError::KeyIdMismatch:
        return "key file id does not match the requested key id";
    case ReaderError::NoEncryptionKey:
        return "encryption key not loaded";
    case ReaderError::DecryptionError:
        return "failed to decrypt";
    case ReaderError::UnexpectedEndOfNote:
        return "unexpected end of note";
    case ReaderError::NotFound:
        return "note not found";
    case ReaderError::NoText:
        return "no text found";
    }
    return "unknown error";
}

template <class T> [[nodiscard]] constexpr bool isError(const ReaderResult<T>& result) noexcept
{
    return std::holds_alternative<ReaderError>(result);
}

} // namespace joplinreader::core

#endif // INCLUDE_JOPLINREADER_CORE_READERERROR_HPP
