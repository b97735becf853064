/*
 * scell_tools.hpp
 *
 *  Created on: 30 Nov. 2025
 *      Author: Shpegun60
 *
 * Tiny portability helpers for inlining attributes and branch hints.
 * - Zero dependencies, header-only, safe for inclusion from multiple TUs.
 * - Provides a single token for "force inline" and "no inline".
 *
 * Usage:
 *   SCELL_FORCEINLINE int add(int a, int b) { return a + b; }
 *   SCELL_NOINLINE void hot_boundary() {  ...  }
 *
 * Notes:
 * - For GCC/Clang, 'always_inline' is honored only if the function body
 *   is visible. Keep the definition in the header if you expect inlining.
 * - For IAR, true force-inlining requires a pragma; we expose a helper
 *   SCELL_IAR_FORCE_INLINE() that you can place immediately before the function.
 */

#ifndef SCELL_TOOLS_HPP_
#define SCELL_TOOLS_HPP_

#include "scell_config.hpp"

// ============================================================================
// ASSERT Macro
// ============================================================================
#ifndef SCELL_ASSERT
#  define SCELL_ASSERT(x)
#endif /* SCELL_ASSERT */

/* ---------------------------------------------------------------------------
 * SCELL_FORCEINLINE: "strong" inlining hint for headers
 * - One macro that maps to the compiler's force-inline attribute.
 * - For IAR, define a helper pragma macro that can be placed before the
 *   next function if you truly need to force it.
 * ------------------------------------------------------------------------- */
#ifndef SCELL_FORCEINLINE
  /* MSVC or clang-cl */
#  if defined(_MSC_VER)
#    define SCELL_FORCEINLINE __forceinline
  /* Clang/GCC style (Clang also defines __GNUC__, so check __clang__ first) */
#  elif defined(__clang__) || defined(__GNUC__)
#    define SCELL_FORCEINLINE inline __attribute__((always_inline))
  /* IAR: cannot truly force without pragma; provide 'inline' and a helper. */
#  elif defined(__ICCARM__) || defined(__IAR_SYSTEMS_ICC__)
#    define SCELL_FORCEINLINE inline
#    ifndef SCELL_IAR_FORCE_INLINE
       /* Put this macro immediately before the function to request forcing. */
#      define SCELL_IAR_FORCE_INLINE() _Pragma("inline=forced")
#    endif
  /* ARMCC (armcc/armcc5), non-clang front-end */
#  elif defined(__ARMCC_VERSION) && !defined(__clang__)
#    define SCELL_FORCEINLINE __forceinline
  /* Fallback: at least hint 'inline' */
#  else
#    define SCELL_FORCEINLINE inline
#  endif
#endif /* SCELL_FORCEINLINE */

/* ---------------------------------------------------------------------------
 * SCELL_NOINLINE: prevent inlining
 * - Keeps cold paths (borrow conflicts) out of the critical section body.
 * - On IAR the pragma applies to the next function only; place the macro
 *   directly before the function definition.
 * ------------------------------------------------------------------------- */
#ifndef SCELL_NOINLINE
#  if defined(_MSC_VER)
#    define SCELL_NOINLINE __declspec(noinline)
#  elif defined(__clang__) || defined(__GNUC__)
#    define SCELL_NOINLINE __attribute__((noinline))
#  elif defined(__ICCARM__) || defined(__IAR_SYSTEMS_ICC__)
     /* Applies to the next function definition only. */
#    define SCELL_NOINLINE _Pragma("inline=never")
#  else
     /* Unknown toolchain: degrade gracefully. */
#    define SCELL_NOINLINE
#  endif
#endif /* SCELL_NOINLINE */

/* ---------------------------------------------------------------------------
 * Local fallbacks for branch prediction hints.
 * Separate guards prevent losing SCELL_UNLIKELY if SCELL_LIKELY is predefined.
 * ------------------------------------------------------------------------- */
#ifndef SCELL_LIKELY
#  if defined(__clang__) || defined(__GNUC__)
#    define SCELL_LIKELY(x)   __builtin_expect(!!(x), 1)
#  else
#    define SCELL_LIKELY(x)   (x)
#  endif
#endif /* SCELL_LIKELY */

#ifndef SCELL_UNLIKELY
#  if defined(__clang__) || defined(__GNUC__)
#    define SCELL_UNLIKELY(x) __builtin_expect(!!(x), 0)
#  else
#    define SCELL_UNLIKELY(x) (x)
#  endif
#endif /* SCELL_UNLIKELY */

// ============================================================================
// Exceptions helpers
// ============================================================================

// Optional sanity check: if user forces 1 but compiler clearly has no exceptions,
// fail at compile-time instead of pretending everything is fine.
#if SCELL_ENABLE_EXCEPTIONS
#  if !defined(__cpp_exceptions) && !defined(__EXCEPTIONS) && \
		!(defined(_MSC_VER) && defined(_CPPUNWIND))
#    error "SCELL_ENABLE_EXCEPTIONS=1 but compiler appears to have exceptions disabled"
#  endif
#endif /* SCELL_ENABLE_EXCEPTIONS */


#endif /* SCELL_TOOLS_HPP_ */
