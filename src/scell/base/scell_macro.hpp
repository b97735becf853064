/*
 * scell_macro.hpp
 *
 * Macros for working with design patterns
 * Version: 2.1
 */

#ifndef SCELL_MACRO_HPP_
#define SCELL_MACRO_HPP_

// Helper macro for deleting copy/move operations
#define SCELL_DELETE_COPY_MOVE(ClassName)         			\
    ClassName(ClassName&) = delete;          				\
    ClassName(const ClassName&) = delete;          			\
    ClassName& operator=(ClassName&&) = delete;				\
    ClassName& operator=(const ClassName&) = delete; 		\
    ClassName(ClassName&&) = delete;               			\
    static_assert(true, "Require semicolon after macro")

/**
* @brief Creates a static class without instances
* @param ClassName -  Class name
*
* Usage example:
* struct host_backend {
*     SCELL_STATIC_CLASS(host_backend);
* public:
*     static state_type acquire() noexcept;
* };
*/
#define SCELL_STATIC_CLASS(ClassName)                    	\
private:												\
	ClassName() = delete;                          		\
    ~ClassName() = delete;                         		\
    SCELL_DELETE_COPY_MOVE(ClassName);            		\
    static_assert(true, "Require semicolon after macro")

#endif /* SCELL_MACRO_HPP_ */
