/*
 * scell_cs_backend.hpp
 *
 *  Created on: 30 Nov. 2025
 *      Author: Shpegun60
 *
 * Exclusion backends for scell::cs::critical_section<Backend>.
 *
 * A backend is a static class with:
 *   using state_type = ...;                      // trivially copyable
 *   static state_type acquire() noexcept;        // enter exclusion, save previous state
 *   static void release(state_type) noexcept;    // restore the state saved by acquire()
 *
 * Nesting contract:
 *   acquire()/release() pairs nest in LIFO order. The inner release() restores
 *   the state saved by the inner acquire(), so exclusion lasts until the
 *   outermost release().
 *
 * Backends:
 *   - avr_backend      : AVR. Saves SREG, then cli. Release writes SREG back.
 *   - cortex_m_backend : ARMv6-M/v7-M/v8-M. Saves PRIMASK, then cpsid i.
 *                        Release executes cpsie i only if PRIMASK was clear.
 *   - host_backend     : desktop builds and tests. One process-wide std::mutex,
 *                        thread-local "held" flag makes nested acquire a no-op.
 *   - custom_backend   : forwards to user-provided C hooks
 *                          scell_cs_state_t scell_cs_acquire(void);
 *                          void scell_cs_release(scell_cs_state_t);
 *
 * default_backend is selected by SCELL_CS_BACKEND (see scell_config.hpp).
 */

#ifndef SCELL_CS_BACKEND_HPP_
#define SCELL_CS_BACKEND_HPP_

#include <cstdint>

#include "scell_macro.hpp"         // SCELL_STATIC_CLASS
#include "scell_tools.hpp"         // SCELL_FORCEINLINE

/* --------------------------------------------------------------------
 * Target detection
 * -------------------------------------------------------------------- */
#if defined(__AVR__)
#  define SCELL_TARGET_AVR 1
#else
#  define SCELL_TARGET_AVR 0
#endif /* __AVR__ */

/* ARM M-profile only: A-profile cores also define __arm__ and must not match. */
#if (defined(__ARM_ARCH_PROFILE) && (__ARM_ARCH_PROFILE == 'M')) || \
    defined(__ARM_ARCH_6M__) || defined(__ARM_ARCH_7M__) || defined(__ARM_ARCH_7EM__) || \
    defined(__ARM_ARCH_8M_BASE__) || defined(__ARM_ARCH_8M_MAIN__) || defined(__ARM_ARCH_8_1M_MAIN__)
#  define SCELL_TARGET_CORTEX_M 1
#else
#  define SCELL_TARGET_CORTEX_M 0
#endif /* ARM M-profile */

#if SCELL_CS_BACKEND == SCELL_CS_BACKEND_AUTO
#  if SCELL_TARGET_AVR
#    define SCELL_CS_SELECTED SCELL_CS_BACKEND_AVR
#  elif SCELL_TARGET_CORTEX_M
#    define SCELL_CS_SELECTED SCELL_CS_BACKEND_CORTEX_M
#  else
#    define SCELL_CS_SELECTED SCELL_CS_BACKEND_HOST
#  endif
#else
#  define SCELL_CS_SELECTED SCELL_CS_BACKEND
#endif /* SCELL_CS_BACKEND == SCELL_CS_BACKEND_AUTO */

#if (SCELL_CS_SELECTED == SCELL_CS_BACKEND_AVR) && !SCELL_TARGET_AVR
#  error "SCELL_CS_BACKEND selects avr_backend but the target is not AVR"
#endif
#if (SCELL_CS_SELECTED == SCELL_CS_BACKEND_CORTEX_M) && !SCELL_TARGET_CORTEX_M
#  error "SCELL_CS_BACKEND selects cortex_m_backend but the target is not ARM M-profile"
#endif

/* Host backend needs <mutex>; bare-metal toolchains usually do not ship it. */
#if !SCELL_TARGET_AVR && !SCELL_TARGET_CORTEX_M
#  define SCELL_HAS_HOST_BACKEND 1
#  include <mutex>
#else
#  define SCELL_HAS_HOST_BACKEND 0
#endif

#if (SCELL_CS_SELECTED == SCELL_CS_BACKEND_HOST) && !SCELL_HAS_HOST_BACKEND
#  error "SCELL_CS_BACKEND selects host_backend on a bare-metal target"
#endif

/* --------------------------------------------------------------------
 * Custom backend hooks (C linkage, provided by the application)
 * -------------------------------------------------------------------- */
typedef SCELL_CS_STATE_TYPE scell_cs_state_t;

extern "C" {
scell_cs_state_t scell_cs_acquire(void);
void scell_cs_release(scell_cs_state_t state);
}

namespace scell::cs {

#if SCELL_TARGET_AVR
struct avr_backend {
    SCELL_STATIC_CLASS(avr_backend);

public:
    using state_type = std::uint8_t;

    static SCELL_FORCEINLINE state_type acquire() noexcept {
        std::uint8_t sreg;
        __asm__ __volatile__("in %0, __SREG__\n\t"
                             "cli"
                             : "=r"(sreg)
                             :
                             : "memory");
        return sreg;
    }

    static SCELL_FORCEINLINE void release(const state_type sreg) noexcept {
        __asm__ __volatile__("out __SREG__, %0" : : "r"(sreg) : "memory");
    }
};
#endif /* SCELL_TARGET_AVR */

#if SCELL_TARGET_CORTEX_M
struct cortex_m_backend {
    SCELL_STATIC_CLASS(cortex_m_backend);

public:
    using state_type = std::uint32_t;

    static SCELL_FORCEINLINE state_type acquire() noexcept {
        std::uint32_t primask;
        __asm__ __volatile__("mrs %0, primask\n\t"
                             "cpsid i"
                             : "=r"(primask)
                             :
                             : "memory");
        return primask;
    }

    static SCELL_FORCEINLINE void release(const state_type primask) noexcept {
        // PRIMASK bit 0 set -> interrupts were already masked by an outer section.
        if ((primask & 1u) == 0u) {
            __asm__ __volatile__("cpsie i" : : : "memory");
        }
    }
};
#endif /* SCELL_TARGET_CORTEX_M */

#if SCELL_HAS_HOST_BACKEND
struct host_backend {
    SCELL_STATIC_CLASS(host_backend);

public:
    // true -> this acquire() took the mutex and its release() must drop it.
    using state_type = bool;

    static state_type acquire() noexcept {
        if (held_) {
            return false;
        }
        mutex_.lock();
        held_ = true;
        return true;
    }

    static void release(const state_type owner) noexcept {
        if (owner) {
            held_ = false;
            mutex_.unlock();
        }
    }

    // Whether the calling thread is inside a host critical section.
    [[nodiscard]] static bool is_held() noexcept { return held_; }

private:
    static inline std::mutex mutex_{};
    static inline thread_local bool held_{false};
};
#endif /* SCELL_HAS_HOST_BACKEND */

struct custom_backend {
    SCELL_STATIC_CLASS(custom_backend);

public:
    using state_type = scell_cs_state_t;

    static SCELL_FORCEINLINE state_type acquire() noexcept { return ::scell_cs_acquire(); }

    static SCELL_FORCEINLINE void release(const state_type state) noexcept { ::scell_cs_release(state); }
};

#if SCELL_CS_SELECTED == SCELL_CS_BACKEND_AVR
using default_backend = avr_backend;
#elif SCELL_CS_SELECTED == SCELL_CS_BACKEND_CORTEX_M
using default_backend = cortex_m_backend;
#elif SCELL_CS_SELECTED == SCELL_CS_BACKEND_HOST
using default_backend = host_backend;
#else
using default_backend = custom_backend;
#endif /* SCELL_CS_SELECTED */

} // namespace scell::cs

#endif /* SCELL_CS_BACKEND_HPP_ */
