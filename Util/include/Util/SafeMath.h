
#ifndef UTIL_SAFE_MATH_H_
#define UTIL_SAFE_MATH_H_

#include "Compiler.h"
#include "Raise.h"

#include <limits>
#include <type_traits>
#include <utility>

/**
 * @brief Adds `amount` to `value` in place. If the result would not be
 * representable in `T`, `value` is left untouched and an exception of type
 * `E` constructed from `args` is thrown instead.
 *
 * @param value The counter to advance.
 * @param amount The amount to add.
 * @param args The constructor arguments of the exception.
 */
template <class E, class T, class... Args>
REGVM_FORCE_INLINE void SafeAdd(T &value, T amount, Args &&...args) {
	static_assert(std::is_unsigned<T>::value, "SafeAdd requires an unsigned counter");

	if (value > std::numeric_limits<T>::max() - amount) {
		Raise<E>(std::forward<Args>(args)...);
	}

	value = static_cast<T>(value + amount);
}

/**
 * @brief Increments `value` by one, throwing `E` on overflow.
 *
 * @param value The counter to advance.
 * @param args The constructor arguments of the exception.
 */
template <class E, class T, class... Args>
REGVM_FORCE_INLINE void SafeIncrement(T &value, Args &&...args) {
	SafeAdd<E>(value, static_cast<T>(1), std::forward<Args>(args)...);
}

#endif
