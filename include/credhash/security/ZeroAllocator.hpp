#ifndef INCLUDE_CREDHASH_SECURITY_ZEROALLOCATOR_HPP
#define INCLUDE_CREDHASH_SECURITY_ZEROALLOCATOR_HPP

#include "credhash/security/MemoryWiper.hpp"
#include <cstddef>
#include <memory>
#include <span>
#include <type_traits>

namespace credhash::security
{

// std::allocator that zeroes each block on release. Backs every container that
// holds a password copy, derived key bytes or the Argon2 work area.
template <typename T> class ZeroAllocator
{
public:
    using value_type = T;
    using is_always_equal = std::true_type;

    ZeroAllocator() noexcept = default;

    template <typename U> constexpr ZeroAllocator(const ZeroAllocator<U>& /*other*/) noexcept // NOLINT
    {
    }

    [[nodiscard]] T* allocate(std::size_t n)
    {
        return std::allocator<T>{}.allocate(n);
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

    template <typename U> [[nodiscard]] constexpr bool operator==(const ZeroAllocator<U>& /*other*/) const noexcept
    {
        return true;
    }
};

} // namespace credhash::security

#endif // INCLUDE_CREDHASH_SECURITY_ZEROALLOCATOR_HPP
