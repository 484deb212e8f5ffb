
#ifndef REGEX_ERROR_H_
#define REGEX_ERROR_H_

#include "Util/Compiler.h"

#include <cstdarg>
#include <cstddef>
#include <exception>
#include <string>

namespace RegVM {

/**
 * Base of every error the engine throws. Catch this to handle parse,
 * code generation and evaluation failures alike.
 */
class RegexError : public std::exception {
public:
	RegexError(const char *fmt, ...);

public:
	const char *what() const noexcept override;

protected:
	RegexError() = default;
	void format(const char *fmt, va_list ap);

private:
	std::string error_;
};

// Malformed pattern text.
class ParseError final : public RegexError {
public:
	enum Kind {
		UnbalancedParen,
		MissingOperand,
		InvalidEscape,
		EmptyAlternative,
		NestingTooDeep,
	};

public:
	ParseError(Kind kind, size_t position, const char *fmt, ...);

public:
	Kind kind() const noexcept { return kind_; }
	size_t position() const noexcept { return position_; }

private:
	Kind kind_;
	size_t position_;
};

// Failure to turn a syntax tree into a program. Only PcOverflow can be
// caused by input; the patch failures indicate a bug in the generator.
class CodeGenError final : public RegexError {
public:
	enum Kind {
		PcOverflow,
		OrPatchFailed,
		StarPatchFailed,
		PlusPatchFailed,
		QuestionPatchFailed,
	};

public:
	CodeGenError(Kind kind, const char *fmt, ...);

public:
	Kind kind() const noexcept { return kind_; }

private:
	Kind kind_;
};

// The match could not be determined.
class EvalError final : public RegexError {
public:
	enum Kind {
		InvalidPc,
		PcOverflow,
		SpOverflow,
		StepLimitExceeded,
	};

public:
	EvalError(Kind kind, const char *fmt, ...);

public:
	Kind kind() const noexcept { return kind_; }

private:
	Kind kind_;
};

REGVM_COLD_CODE
void ReportError(const char *str);

}

#endif
