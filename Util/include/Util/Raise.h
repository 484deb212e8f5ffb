
#ifndef UTIL_RAISE_H_
#define UTIL_RAISE_H_

#include "Compiler.h"
#include <utility>

/**
 * @brief Throws an exception of type `E`, constructed from `args`.
 * Keeping the throw out of line keeps the callers' hot paths small.
 *
 * @param args The constructor arguments of the exception.
 */
template <class E, class... Args>
[[noreturn]]
REGVM_COLD_CODE void Raise(Args &&...args) {
	throw E{std::forward<Args>(args)...};
}

#endif
