/*
 * static_cell.hpp
 *
 *  Created on: 30 Nov. 2025
 *      Author: Shpegun60
 *
 * static_cell<T>: a statically-declared, lazily-initialized slot shared between
 * the main line and interrupt handlers.
 *
 * - Constructed empty, in a constant-evaluation context:
 *       constinit static scell::static_cell<Uart> g_uart;
 *   T's constructor never runs at startup, so T may be a peripheral handle that
 *   is neither constexpr-constructible nor copyable.
 * - Every member that touches the value takes a const cs::token&, and a token
 *   only exists inside scell::cs::with(). Forgetting the critical section is a
 *   compile error.
 * - The value is reachable only inside the caller's callable. Nothing returns a
 *   reference into the storage, so no view outlives the critical section.
 * - Trivially destructible: the value lives until the program ends and is never
 *   destroyed at exit.
 *
 * Contract:
 * - init(cs, v):              present(v). Replaces any previous value.
 * - emplace(cs, args...):     present(T(args...)) built in place. Replaces any previous value.
 * - borrow(cs, f, g):         f(const T&) if present, else g().
 * - borrow_mut(cs, f, g):     f(T&) if present, else g().
 * - has_value(cs):            true once init()/emplace() succeeded.
 *
 * Re-initialization:
 * - init()/emplace() on a present cell destroys the previous value first (its
 *   destructor runs exactly once), then constructs the new value in the same
 *   storage. If T's constructor throws, the cell is left empty.
 * - There is no way back to empty otherwise.
 *
 * Callables:
 * - f and g must be stateless: a function pointer or a lambda without captures.
 *   A stateless callable cannot hold the token or a reference into the cell,
 *   so it cannot use the same proof to open a second view. Capturing callables
 *   are rejected at overload resolution.
 * - f and g must return the same type R. R must not be a reference.
 *
 * Borrow conflicts:
 * - The only way to reach the cell again from inside f is a nested
 *   scell::cs::with(). The cell counts its live views:
 *       borrow     inside borrow      -> allowed (shared views)
 *       borrow_mut inside any view    -> conflict
 *       any view   inside borrow_mut  -> conflict
 *       init/emplace inside any view  -> conflict
 * - On conflict: SCELL_ASSERT fires. If it returns, SCELL_ENABLE_EXCEPTIONS=1
 *   throws scell::borrow_error; otherwise the access is refused: borrow() and
 *   borrow_mut() return g(), init()/emplace() leave the cell unchanged.
 */

#ifndef SCELL_STATIC_CELL_HPP_
#define SCELL_STATIC_CELL_HPP_

#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>                     // std::forward, std::move

#include "base/scell_error.hpp"        // ::scell::detail::borrow_conflict, borrow_error
#include "base/scell_macro.hpp"        // SCELL_DELETE_COPY_MOVE
#include "base/scell_slot.hpp"         // ::scell::optional_slot
#include "base/scell_tools.hpp"        // SCELL_FORCEINLINE, SCELL_UNLIKELY
#include "critical_section.hpp"        // ::scell::cs::token

namespace scell {

namespace detail {

/* Helper trait: stateless callable.
 *   - function pointer / function reference, or
 *   - class type without data members (capture-less lambda, empty functor).
 */
template<class F, class D = std::decay_t<F>>
inline constexpr bool is_stateless_callable_v =
    std::is_empty_v<D> ||
    (std::is_pointer_v<D> && std::is_function_v<std::remove_pointer_t<D>>);

/* Helper trait: (present, absent) pair usable on a view of type View. */
template<class Present, class Absent, class View, typename = void>
struct is_borrow_pair : std::false_type {};

template<class Present, class Absent, class View>
struct is_borrow_pair<
    Present, Absent, View,
    std::void_t<std::invoke_result_t<Present&, View>, std::invoke_result_t<Absent&>>>
    : std::bool_constant<is_stateless_callable_v<Present> &&
                         is_stateless_callable_v<Absent> &&
                         std::is_same_v<std::invoke_result_t<Present&, View>,
                                        std::invoke_result_t<Absent&>> &&
                         !std::is_reference_v<std::invoke_result_t<Present&, View>>> {};

template<class Present, class Absent, class View>
inline constexpr bool is_borrow_pair_v = is_borrow_pair<Present, Absent, View>::value;

} // namespace detail

template<class F>
inline constexpr bool is_stateless_callable_v = detail::is_stateless_callable_v<F>;

template<class T>
class static_cell
{
    static_assert(std::is_object_v<T> && !std::is_array_v<T>,
                  "[scell::static_cell]: T must be a non-array object type.");
    static_assert(!std::is_const_v<T> && !std::is_volatile_v<T>,
                  "[scell::static_cell]: T must not be cv-qualified.");

    // 0 -> no view, >0 -> number of shared views, kWriting -> one exclusive view.
    using view_count = std::int16_t;

    static constexpr view_count kWriting   = view_count{-1};
    static constexpr view_count kMaxShared = std::numeric_limits<view_count>::max();

public:
    // ------------------------------------------------------------------------------------------
    // Type Definitions
    // ------------------------------------------------------------------------------------------
    using value_type      = T;
    using token_type      = ::scell::cs::token;
    using reference       = T&;
    using const_reference = const T&;

    // ------------------------------------------------------------------------------------------
    // Construction
    // ------------------------------------------------------------------------------------------
    constexpr static_cell() noexcept = default;

    SCELL_DELETE_COPY_MOVE(static_cell);

    // ------------------------------------------------------------------------------------------
    // Initialization
    // ------------------------------------------------------------------------------------------
    void init(const token_type& cs, T value) {
        static_assert(std::is_move_constructible_v<T>,
                      "[scell::static_cell]: init() needs a move-constructible T; use emplace().");
        emplace(cs, std::move(value));
    }

    template<class... Args>
    void emplace(const token_type&, Args&&... args) {
        static_assert(std::is_constructible_v<T, Args&&...>,
                      "[scell::static_cell]: T must be constructible from Args...");

        if (SCELL_UNLIKELY(views_ != 0)) {
            ::scell::detail::borrow_conflict("[scell::static_cell]: init while the value is borrowed");
            return;
        }

        // T's constructor may re-enter the cell through a nested critical section.
        const write_scope scope(views_);
        (void)slot_.emplace(std::forward<Args>(args)...);
    }

    // ------------------------------------------------------------------------------------------
    // State
    // ------------------------------------------------------------------------------------------
    [[nodiscard]] SCELL_FORCEINLINE bool has_value(const token_type&) const noexcept {
        return slot_.has_value();
    }

    // ------------------------------------------------------------------------------------------
    // Access
    // ------------------------------------------------------------------------------------------
    template<class Present, class Absent,
             typename = std::enable_if_t<detail::is_borrow_pair_v<Present, Absent, const_reference>>>
    decltype(auto) borrow(const token_type&, Present present, Absent absent) const {
        if (SCELL_UNLIKELY(views_ == kWriting || views_ == kMaxShared)) {
            ::scell::detail::borrow_conflict("[scell::static_cell]: borrow while mutably borrowed");
            return absent();
        }

        if (!slot_.has_value()) {
            return absent();
        }

        const read_scope scope(views_);
        return present(slot_.get());
    }

    template<class Present, class Absent,
             typename = std::enable_if_t<detail::is_borrow_pair_v<Present, Absent, reference>>>
    decltype(auto) borrow_mut(const token_type&, Present present, Absent absent) {
        if (SCELL_UNLIKELY(views_ != 0)) {
            ::scell::detail::borrow_conflict("[scell::static_cell]: borrow_mut while already borrowed");
            return absent();
        }

        if (!slot_.has_value()) {
            return absent();
        }

        const write_scope scope(views_);
        return present(slot_.get());
    }

private:
    // RAII view bookkeeping. Restores the counter even when a callable throws.
    class read_scope {
    public:
        explicit SCELL_FORCEINLINE read_scope(view_count& views) noexcept : views_(views) { ++views_; }
        SCELL_FORCEINLINE ~read_scope() noexcept { --views_; }

        SCELL_DELETE_COPY_MOVE(read_scope);

    private:
        view_count& views_;
    };

    class write_scope {
    public:
        explicit SCELL_FORCEINLINE write_scope(view_count& views) noexcept : views_(views) { views_ = kWriting; }
        SCELL_FORCEINLINE ~write_scope() noexcept { views_ = 0; }

        SCELL_DELETE_COPY_MOVE(write_scope);

    private:
        view_count& views_;
    };

private:
    optional_slot<T> slot_{};
    mutable view_count views_{0};
};

} // namespace scell

#endif /* SCELL_STATIC_CELL_HPP_ */
