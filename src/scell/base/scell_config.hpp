/*
 * scell_config.hpp
 *
 *  Created on: 30 Nov. 2025
 *      Author: Shpegun60
 */

#ifndef SCELL_CONFIG_HPP_
#define SCELL_CONFIG_HPP_

/*
 * static_cell settings
 * Build toggles:
 *   - SCELL_CS_BACKEND (default: 0)
 *       0 -> auto-detect from the target (AVR, ARM M-profile, otherwise host)
 *       1 -> host_backend     (std::mutex, desktop builds and tests)
 *       2 -> avr_backend      (SREG save + cli / SREG restore)
 *       3 -> cortex_m_backend (PRIMASK save + cpsid i / cpsie i)
 *       4 -> custom_backend   (user provides scell_cs_acquire/scell_cs_release)
 *
 *   - SCELL_CS_STATE_TYPE (default: unsigned long)
 *       State type passed between scell_cs_acquire() and scell_cs_release()
 *       when SCELL_CS_BACKEND == 4.
 */
#ifndef SCELL_CS_BACKEND
#  define SCELL_CS_BACKEND 0
#endif /* SCELL_CS_BACKEND */

#define SCELL_CS_BACKEND_AUTO     0
#define SCELL_CS_BACKEND_HOST     1
#define SCELL_CS_BACKEND_AVR      2
#define SCELL_CS_BACKEND_CORTEX_M 3
#define SCELL_CS_BACKEND_CUSTOM   4

#if (SCELL_CS_BACKEND < 0) || (SCELL_CS_BACKEND > 4)
#  error "SCELL_CS_BACKEND must be in [0..4]"
#endif

#ifndef SCELL_CS_STATE_TYPE
#  define SCELL_CS_STATE_TYPE unsigned long
#endif /* SCELL_CS_STATE_TYPE */


// assert ------------------------
#ifndef SCELL_ASSERT
#  define SCELL_ASSERT(x)
#endif /* SCELL_ASSERT */


// ============================================================================
// Exceptions configuration
// ============================================================================
//
// Single switch:
//   - SCELL_ENABLE_EXCEPTIONS == 0 : a borrow conflict is refused silently
//                                    (after SCELL_ASSERT).
//   - SCELL_ENABLE_EXCEPTIONS == 1 : a borrow conflict throws scell::borrow_error.
//
// Default: 0 (no exceptions).
//

#ifndef SCELL_ENABLE_EXCEPTIONS
#  define SCELL_ENABLE_EXCEPTIONS 0
#endif /* SCELL_ENABLE_EXCEPTIONS */


#endif /* SCELL_CONFIG_HPP_ */
