/*
 * scell_object.hpp
 *
 * Object-lifetime helpers for storage that manages T manually.
 */

#ifndef SCELL_OBJECT_HPP_
#define SCELL_OBJECT_HPP_

#include <new>
#include <type_traits>
#include <utility>

#include "scell_tools.hpp" // SCELL_FORCEINLINE

namespace scell::detail {

template<class U>
SCELL_FORCEINLINE void destroy_at(U* p) noexcept
{
    if constexpr (!std::is_trivially_destructible_v<U>) {
        p->~U();
    }
}

// Placement-new into raw storage. The returned pointer is laundered because
// the same bytes may have held an earlier U.
template<class U, class... Args>
SCELL_FORCEINLINE U* construct_at(void* where, Args&&... args)
    noexcept(std::is_nothrow_constructible_v<U, Args&&...>)
{
    static_assert(std::is_constructible_v<U, Args&&...>,
                  "[scell::detail::construct_at]: U must be constructible from Args...");
    return std::launder(::new (where) U(std::forward<Args>(args)...));
}

} // namespace scell::detail

#endif /* SCELL_OBJECT_HPP_ */
