#ifndef INCLUDE_JOPLINREADER_SECURITY_SECUREMEMORY_HPP
#define INCLUDE_JOPLINREADER_SECURITY_SECUREMEMORY_HPP

#include <cstddef>
#include <memory>
#include <span>
#include <type_traits>

namespace joplinreader::security
{

void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(buffer));
}

// std::allocator that wipes every block before handing it back to the heap.
// Backs the containers holding passphrases, master keys and decrypted chunks.
template <class T> class ZeroAllocator
{
public:
    using value_type = T;
    using is_always_equal = std::true_type;

    ZeroAllocator() noexcept = default;
    template <class U> ZeroAllocator(const ZeroAllocator<U>& /*other*/) noexcept
    {
    }

    [[nodiscard]] T* allocate(std::size_t n)
    {
        // std::allocator throws std::bad_array_new_length for oversized requests.
        return (n == 0U) ? nullptr : std::allocator<T>{}.allocate(n);
    }

    void deallocate(T* p, std::size_t n) noexcept
    {
        if (p == nullptr)
        {
            return;
        }
        secureWipe(std::as_writable_bytes(std::span<T>{ p, n }));
        std::allocator<T>{}.deallocate(p, n);
    }

    template <class U> friend bool operator==(const ZeroAllocator& /*lhs*/, const ZeroAllocator<U>& /*rhs*/) noexcept
    {
        return true;
    }
};

} // namespace joplinreader::security

#endif // INCLUDE_JOPLINREADER_SECURITY_SECUREMEMORY_HPP
