/*
 * scell_error.hpp
 *
 * Error type thrown on borrow conflicts when SCELL_ENABLE_EXCEPTIONS == 1.
 */

#ifndef SCELL_ERROR_HPP_
#define SCELL_ERROR_HPP_

#include "scell_tools.hpp"

#if SCELL_ENABLE_EXCEPTIONS
#  include <stdexcept>
#endif /* SCELL_ENABLE_EXCEPTIONS */

namespace scell {

#if SCELL_ENABLE_EXCEPTIONS
class borrow_error : public std::logic_error {
public:
    using std::logic_error::logic_error;
};
#endif /* SCELL_ENABLE_EXCEPTIONS */

namespace detail {

// Cold path of every conflicting access. Returns only when the access must be
// refused (assertions off, exceptions off).
SCELL_NOINLINE inline void borrow_conflict(const char* what)
{
    SCELL_ASSERT(false && what);
#if SCELL_ENABLE_EXCEPTIONS
    throw ::scell::borrow_error(what);
#else
    (void)what;
#endif /* SCELL_ENABLE_EXCEPTIONS */
}

} // namespace detail
} // namespace scell

#endif /* SCELL_ERROR_HPP_ */
