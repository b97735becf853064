/*
 * scell_slot.hpp
 *
 *  Created on: 30 Nov. 2025
 *      Author: Shpegun60
 *
 * optional_slot<T>: manually managed "absent | present(T)" storage.
 *
 * - Raw alignas(T) bytes plus a presence flag.
 * - The default constructor is constexpr and never runs T's constructor, so a
 *   slot can be constant-initialized even when T is not a literal type.
 * - Trivially destructible: a present value is NOT destroyed when the slot
 *   goes away. Slots live in static storage for the whole program; callers
 *   that need the value destroyed do it through reset().
 * - No synchronization. static_cell<T> is the gated owner.
 *
 * Contract:
 * - get():      Precondition: has_value().
 * - try_get():  returns nullptr when absent.
 * - emplace():  destroys the current value (if any), then constructs a new one.
 *               If T's constructor throws the slot is left absent.
 * - reset():    destroys the current value (if any); slot becomes absent.
 */

#ifndef SCELL_SLOT_HPP_
#define SCELL_SLOT_HPP_

#include <cstddef>                 // std::byte
#include <new>                     // std::launder
#include <type_traits>
#include <utility>                 // std::forward

#include "scell_object.hpp"        // ::scell::detail::destroy_at / construct_at
#include "scell_tools.hpp"         // SCELL_FORCEINLINE, SCELL_ASSERT

namespace scell {

template<class T>
class optional_slot
{
    static_assert(std::is_object_v<T>, "[scell::optional_slot]: T must be an object type.");
    static_assert(!std::is_array_v<T>, "[scell::optional_slot]: arrays are not supported; wrap them in a struct.");
    static_assert(!std::is_const_v<T> && !std::is_volatile_v<T>,
                  "[scell::optional_slot]: T must not be cv-qualified.");

public:
    using value_type      = T;
    using pointer         = T*;
    using const_pointer   = const T*;
    using reference       = T&;
    using const_reference = const T&;

    constexpr optional_slot() noexcept = default;

    optional_slot(const optional_slot&) = delete;
    optional_slot& operator=(const optional_slot&) = delete;
    optional_slot(optional_slot&&) = delete;
    optional_slot& operator=(optional_slot&&) = delete;

    // ------------------------------------------------------------------------------------------
    // State
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] SCELL_FORCEINLINE bool has_value() const noexcept { return engaged_; }

    // ------------------------------------------------------------------------------------------
    // Access
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] SCELL_FORCEINLINE pointer try_get() noexcept {
        return engaged_ ? ptr_() : nullptr;
    }

    [[nodiscard]] SCELL_FORCEINLINE const_pointer try_get() const noexcept {
        return engaged_ ? ptr_() : nullptr;
    }

    [[nodiscard]] SCELL_FORCEINLINE reference get() noexcept {
        SCELL_ASSERT(engaged_ && "optional_slot::get() on an empty slot");
        return *ptr_();
    }

    [[nodiscard]] SCELL_FORCEINLINE const_reference get() const noexcept {
        SCELL_ASSERT(engaged_ && "optional_slot::get() on an empty slot");
        return *ptr_();
    }

    // ------------------------------------------------------------------------------------------
    // Modifiers
    // ------------------------------------------------------------------------------------------
    template<class... Args>
    reference emplace(Args&&... args) noexcept(std::is_nothrow_constructible_v<T, Args&&...>) {
        static_assert(std::is_constructible_v<T, Args&&...>,
                      "[scell::optional_slot]: T must be constructible from Args...");
        reset();

        T* p = ::scell::detail::construct_at<T>(static_cast<void*>(storage_), std::forward<Args>(args)...);
        engaged_ = true;
        return *p;
    }

    void reset() noexcept {
        if (engaged_) {
            engaged_ = false;
            ::scell::detail::destroy_at(ptr_());
        }
    }

private:
    [[nodiscard]] SCELL_FORCEINLINE pointer ptr_() noexcept {
        return std::launder(reinterpret_cast<pointer>(storage_));
    }

    [[nodiscard]] SCELL_FORCEINLINE const_pointer ptr_() const noexcept {
        return std::launder(reinterpret_cast<const_pointer>(storage_));
    }

private:
    alignas(T) std::byte storage_[sizeof(T)]{};
    bool engaged_{false};
};

} // namespace scell

#endif /* SCELL_SLOT_HPP_ */
