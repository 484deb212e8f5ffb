
#include "RegexError.h"

#include <QtDebug>
#include <QtGlobal>

#include <cstdio>

namespace RegVM {

/**
 * @brief RegexError constructor.
 *
 * @param fmt Format string for the error message.
 * @param ... Variable arguments for the format string.
 */
RegexError::RegexError(const char *fmt, ...) {
	va_list ap;
	va_start(ap, fmt);
	format(fmt, ap);
	va_end(ap);
}

/**
 * @brief Formats the error message. Every caller passes a string constant
 * as the format.
 *
 * @param fmt Format string for the error message.
 * @param ap Arguments for the format string.
 */
void RegexError::format(const char *fmt, va_list ap) {
	char buf[1024];
	QT_WARNING_PUSH
	QT_WARNING_DISABLE_GCC("-Wformat-security")
	QT_WARNING_DISABLE_GCC("-Wformat-nonliteral")
	QT_WARNING_DISABLE_CLANG("-Wformat-security")
	QT_WARNING_DISABLE_CLANG("-Wformat-nonliteral")
	vsnprintf(buf, sizeof(buf), fmt, ap);
	QT_WARNING_POP
	error_ = buf;
}

/**
 * @brief Returns the error message.
 *
 * @return The error message string.
 */
const char *RegexError::what() const noexcept {
	return error_.c_str();
}

/**
 * @brief ParseError constructor.
 *
 * @param kind What is wrong with the pattern.
 * @param position Offset into the pattern where the problem was detected.
 * @param fmt Format string for the error message.
 * @param ... Variable arguments for the format string.
 */
ParseError::ParseError(Kind kind, size_t position, const char *fmt, ...)
	: kind_(kind), position_(position) {
	va_list ap;
	va_start(ap, fmt);
	format(fmt, ap);
	va_end(ap);
}

/**
 * @brief CodeGenError constructor.
 *
 * @param kind What went wrong while generating code.
 * @param fmt Format string for the error message.
 * @param ... Variable arguments for the format string.
 */
CodeGenError::CodeGenError(Kind kind, const char *fmt, ...)
	: kind_(kind) {
	va_list ap;
	va_start(ap, fmt);
	format(fmt, ap);
	va_end(ap);
}

/**
 * @brief EvalError constructor.
 *
 * @param kind Why the match could not be determined.
 * @param fmt Format string for the error message.
 * @param ... Variable arguments for the format string.
 */
EvalError::EvalError(Kind kind, const char *fmt, ...)
	: kind_(kind) {
	va_list ap;
	va_start(ap, fmt);
	format(fmt, ap);
	va_end(ap);
}

/**
 * @brief Logs an internal error of the engine.
 *
 * @param str The error message string.
 */
void ReportError(const char *str) {
	qCritical("regvm: Internal error processing regular expression (%s)", str);
}

}
