/*
 * critical_section.hpp
 *
 * Critical-section facade that issues exclusivity proofs.
 *
 * - cs::token is the proof. It has no public constructor and cannot be copied
 *   or moved: the only token that exists is the one critical_section<B>::with()
 *   creates on its own stack frame, alive exactly while the caller's function runs.
 * - critical_section<Backend>::with(f):
 *       state = Backend::acquire();
 *       f(token);
 *       Backend::release(state);     // on every exit path, including exceptions
 *   and returns whatever f returns (void, values and references alike).
 * - cs::with(f) uses cs::default_backend (SCELL_CS_BACKEND).
 *
 * Nesting:
 * - with() may be nested. Each level gets its own token; exclusion is held
 *   until the outermost level returns (backends follow save/restore).
 * - Nesting does NOT give a second view of a static_cell that is already
 *   borrowed: the cell rejects it (see static_cell.hpp, "borrow conflicts").
 *
 * Usage:
 *   constinit static scell::static_cell<Led> g_led;
 *
 *   scell::cs::with([](const scell::cs::token& cs) {
 *       g_led.emplace(cs, GPIOB, 5u);
 *   });
 */

#ifndef SCELL_CRITICAL_SECTION_HPP_
#define SCELL_CRITICAL_SECTION_HPP_

#include <functional>                  // std::invoke
#include <type_traits>
#include <utility>                     // std::declval, std::forward

#include "base/scell_cs_backend.hpp"   // ::scell::cs::default_backend and friends
#include "base/scell_macro.hpp"        // SCELL_DELETE_COPY_MOVE, SCELL_STATIC_CLASS
#include "base/scell_tools.hpp"        // SCELL_FORCEINLINE

namespace scell::cs {

template<class Backend>
class critical_section;

/* ------------------------------ token ------------------------------
 * Proof that the holder runs inside a critical section.
 * Only critical_section<B> can create one.
 * ------------------------------------------------------------------- */
class token {
    template<class> friend class critical_section;

    token() noexcept = default;

public:
    ~token() = default;

    SCELL_DELETE_COPY_MOVE(token);
};

namespace detail {

/* Helper trait: detect a critical-section backend.
 * Requirements:
 *   - B::state_type (trivially copyable)
 *   - static B::state_type B::acquire() noexcept
 *   - static void B::release(B::state_type) noexcept
 */
template<typename B, typename = void>
struct is_cs_backend : std::false_type {};

template<typename B>
struct is_cs_backend<
    B, std::void_t<typename B::state_type,
                   decltype(B::acquire()),
                   decltype(B::release(std::declval<typename B::state_type>()))>>
    : std::bool_constant<std::is_same_v<decltype(B::acquire()), typename B::state_type> &&
                         std::is_trivially_copyable_v<typename B::state_type> &&
                         noexcept(B::acquire()) &&
                         noexcept(B::release(std::declval<typename B::state_type>()))> {};

} // namespace detail

template<typename B>
inline constexpr bool is_cs_backend_v = detail::is_cs_backend<B>::value;

/* ------------------------- critical_section -------------------------
 * critical_section<Backend>: one exclusion domain.
 * ------------------------------------------------------------------- */
template<class Backend>
class critical_section {
    static_assert(is_cs_backend_v<Backend>,
                  "[scell::cs::critical_section]: Backend must provide state_type, "
                  "acquire() noexcept and release(state_type) noexcept");

    SCELL_STATIC_CLASS(critical_section);

public:
    using backend_type = Backend;
    using state_type   = typename Backend::state_type;

    template<class F>
    static decltype(auto) with(F&& f) {
        static_assert(std::is_invocable_v<F&&, const token&>,
                      "[scell::cs::critical_section]: f must be callable as f(const scell::cs::token&)");

        const restore_guard guard(Backend::acquire());
        const token proof{};
        return std::invoke(std::forward<F>(f), proof);
    }

private:
    class restore_guard {
    public:
        explicit SCELL_FORCEINLINE restore_guard(const state_type state) noexcept : state_(state) {}
        SCELL_FORCEINLINE ~restore_guard() noexcept { Backend::release(state_); }

        SCELL_DELETE_COPY_MOVE(restore_guard);

    private:
        state_type state_;
    };
};

/* ------------------------------ with ------------------------------
 * Run f(const token&) inside the default exclusion domain.
 * ------------------------------------------------------------------- */
template<class F>
SCELL_FORCEINLINE decltype(auto) with(F&& f) {
    return critical_section<default_backend>::with(std::forward<F>(f));
}

} // namespace scell::cs

#endif /* SCELL_CRITICAL_SECTION_HPP_ */
