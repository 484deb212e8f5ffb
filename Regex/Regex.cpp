/*------------------------------------------------------------------------*
 * 'compile', 'match' and 'describe' -- the public face of the engine.
 *
 * A pattern goes through three stages:
 *
 *   parse()     pattern text -> syntax tree           (Parser.cpp)
 *   generate()  syntax tree  -> program               (Compile.cpp)
 *   evaluate()  program + input -> match / no match   (Execute.cpp)
 *
 * The syntax tree only lives for the duration of a compile. A program is
 * immutable once generated and may be evaluated against any number of
 * inputs, from any number of threads.
 *
 * The supported syntax is deliberately small: literal characters,
 * grouping with (), alternation with |, and the repetition operators *, +
 * and ?. A backslash escapes an operator or introduces one of the control
 * escapes \a \b \e \f \n \r \t \v.
 *------------------------------------------------------------------------*/

#include "Regex.h"
#include "Compile.h"
#include "Decompile.h"
#include "Parser.h"

#include <ostream>

namespace RegVM {

/**
 * @brief Compiles a pattern into a program.
 *
 * @param pattern The pattern text.
 * @return The program. ParseError or CodeGenError is thrown on failure.
 */
std::shared_ptr<const Program> compile(std::string_view pattern) {
	const Node tree = parse(pattern);
	return std::make_shared<Program>(generate(tree));
}

/**
 * @brief Compiles `pattern` and evaluates it against `text`.
 *
 * @param pattern The pattern text.
 * @param text The input text.
 * @param strategy The execution strategy.
 * @return `true` if the pattern matches all of `text`.
 */
bool match(std::string_view pattern, std::string_view text, Strategy strategy) {
	EvalOptions options;
	options.strategy = strategy;
	return match(pattern, text, options);
}

/**
 * @brief Compiles `pattern` and evaluates it against `text`.
 *
 * @param pattern The pattern text.
 * @param text The input text.
 * @param options Execution strategy, anchoring and step budget.
 * @return `true` if the pattern matches `text`.
 */
bool match(std::string_view pattern, std::string_view text, const EvalOptions &options) {
	const std::shared_ptr<const Program> program = compile(pattern);
	return evaluate(*program, text, options);
}

/**
 * @brief Writes the pattern, its syntax tree and the disassembled program
 * to `os`. Debugging aid only.
 *
 * @param pattern The pattern text.
 * @param os The stream to write to.
 */
void describe(std::string_view pattern, std::ostream &os) {
	const Node tree       = parse(pattern);
	const Program program = generate(tree);

	os << "expr: " << pattern << '\n';
	os << "tree: " << dumpTree(tree) << '\n';
	os << '\n';

	for (const std::string &line : disassemble(program)) {
		os << line << '\n';
	}
}

}
