
#include "Parser.h"
#include "Constants.h"
#include "Reader.h"
#include "RegexError.h"
#include "Util/Raise.h"

#include <algorithm>
#include <utility>
#include <vector>

namespace RegVM {
namespace {

/**
 * @brief Recognize escaped literal characters (prefixed with backslash),
 *        and translates them into the corresponding character.
 *
 * @param ch The character following the backslash.
 * @return The proper character value or '\0' if not a valid literal
 *         escape.
 */
constexpr char LiteralEscape(char ch) noexcept {

	constexpr char valid_escape[] = {
		'a', 'b', 'e', 'f', 'n', 'r', 't', 'v', '(', ')', '-', '[', ']', '<',
		'>', '{', '}', '.', '\\', '|', '^', '$', '*', '+', '?', '&'};

	constexpr char value[] = {
		'\a', '\b', 0x1B, // Escape character in ASCII character set.
		'\f', '\n', '\r', '\t', '\v', '(', ')', '-', '[', ']', '<', '>', '{',
		'}', '.', '\\', '|', '^', '$', '*', '+', '?', '&'};

	for (size_t i = 0; i != sizeof(valid_escape); ++i) {
		if (ch == valid_escape[i]) {
			return value[i];
		}
	}

	return '\0';
}

constexpr bool isQuantifier(char ch) noexcept {
	return ch == '*' || ch == '+' || ch == '?';
}

// A subtree together with its height, so that the height never has to be
// recomputed by walking the tree.
struct Parsed {
	Node node;
	size_t depth;
};

/*
 * Recursive descent over the grammar
 *
 *   expr     := sequence ( '|' sequence )*
 *   sequence := factor*
 *   factor   := primary [ '*' | '+' | '?' ]
 *   primary  := literal | '(' expr ')'
 *
 * with a single character of lookahead.
 */
class Parser {
public:
	explicit Parser(std::string_view pattern) noexcept
		: reader_(pattern) {
	}

public:
	Node parse() {
		Parsed tree = expr();

		// expr() only stops early in front of a ')'
		if (!reader_.eof()) {
			Raise<ParseError>(ParseError::UnbalancedParen, reader_.index(), "unmatched ')' at offset %zu", reader_.index());
		}

		return std::move(tree.node);
	}

private:
	Parsed expr() {

		const size_t start        = reader_.index();
		std::vector<Parsed> first = sequence();

		if (!reader_.next_is('|')) {
			if (!first.empty()) {
				return makeSequence(std::move(first));
			}

			if (groupDepth_ != 0) {
				Raise<ParseError>(ParseError::EmptyAlternative, start, "empty group at offset %zu", start);
			}

			// the empty pattern
			return Parsed{SeqNode{}, 1};
		}

		if (first.empty()) {
			Raise<ParseError>(ParseError::EmptyAlternative, reader_.index(), "'|' at offset %zu has an empty left operand", reader_.index());
		}

		std::vector<Parsed> branches;
		branches.push_back(makeSequence(std::move(first)));

		while (reader_.next_is('|')) {
			const size_t bar = reader_.index();
			reader_.read();

			std::vector<Parsed> next = sequence();
			if (next.empty()) {
				Raise<ParseError>(ParseError::EmptyAlternative, reader_.index(), "'|' at offset %zu has an empty right operand", bar);
			}

			branches.push_back(makeSequence(std::move(next)));
		}

		return makeAlternation(branches, 0, branches.size());
	}

	std::vector<Parsed> sequence() {
		std::vector<Parsed> factors;

		while (!reader_.eof() && !reader_.next_is('|') && !reader_.next_is(')')) {
			factors.push_back(factor());
		}

		return factors;
	}

	Parsed factor() {
		Parsed atom = primary();

		if (reader_.eof() || !isQuantifier(reader_.peek())) {
			return atom;
		}

		const char op      = reader_.read();
		const size_t depth = atom.depth + 1;
		checkDepth(depth);

		if (!reader_.eof() && isQuantifier(reader_.peek())) {
			Raise<ParseError>(ParseError::MissingOperand, reader_.index(), "nested quantifiers, %c%c at offset %zu", op, reader_.peek(), reader_.index());
		}

		switch (op) {
		case '*':
			return Parsed{StarNode{std::move(atom.node)}, depth};
		case '+':
			return Parsed{PlusNode{std::move(atom.node)}, depth};
		default:
			return Parsed{QuestionNode{std::move(atom.node)}, depth};
		}
	}

	Parsed primary() {
		const size_t pos = reader_.index();
		const char ch    = reader_.read();

		switch (ch) {
		case '(':
			{
				if (++groupDepth_ > MaxNestingDepth) {
					Raise<ParseError>(ParseError::NestingTooDeep, pos, "groups nested more than %zu deep", MaxNestingDepth);
				}

				Parsed inner = expr();

				if (!reader_.match(')')) {
					Raise<ParseError>(ParseError::UnbalancedParen, pos, "missing ')' for '(' at offset %zu", pos);
				}

				--groupDepth_;
				return inner;
			}
		case '*':
		case '+':
		case '?':
			Raise<ParseError>(ParseError::MissingOperand, pos, "%c at offset %zu follows nothing", ch, pos);
		case '\\':
			return Parsed{CharNode{escape(pos)}, 1};
		default:
			return Parsed{CharNode{ch}, 1};
		}
	}

	char escape(size_t pos) {
		if (reader_.eof()) {
			Raise<ParseError>(ParseError::InvalidEscape, pos, "trailing \\ at offset %zu", pos);
		}

		const char ch      = reader_.read();
		const char literal = LiteralEscape(ch);
		if (literal == '\0') {
			Raise<ParseError>(ParseError::InvalidEscape, pos, "\\%c at offset %zu is an invalid escape", ch, pos);
		}

		return literal;
	}

	Parsed makeSequence(std::vector<Parsed> factors) {
		if (factors.size() == 1) {
			return std::move(factors.front());
		}

		size_t depth = 0;
		SeqNode seq;
		seq.nodes.reserve(factors.size());

		for (Parsed &item : factors) {
			depth = std::max(depth, item.depth);
			seq.nodes.push_back(std::move(item.node));
		}

		checkDepth(depth + 1);
		return Parsed{std::move(seq), depth + 1};
	}

	/**
	 * @brief Joins branches[first, last) into a balanced tree of OrNodes, so
	 * that n branches add only log2(n) levels to the tree. An in order walk
	 * still visits the branches left to right, which is the order in which
	 * they are tried.
	 *
	 * @param branches The parsed branches, in pattern order.
	 * @param first The first branch to join.
	 * @param last One past the last branch to join.
	 * @return The alternation.
	 */
	Parsed makeAlternation(std::vector<Parsed> &branches, size_t first, size_t last) {
		if (last - first == 1) {
			return std::move(branches[first]);
		}

		const size_t middle = first + (last - first + 1) / 2;

		Parsed left        = makeAlternation(branches, first, middle);
		Parsed right       = makeAlternation(branches, middle, last);
		const size_t depth = std::max(left.depth, right.depth) + 1;
		checkDepth(depth);

		return Parsed{OrNode{std::move(left.node), std::move(right.node)}, depth};
	}

	void checkDepth(size_t depth) const {
		if (depth > MaxNestingDepth) {
			Raise<ParseError>(ParseError::NestingTooDeep, reader_.index(), "expression nested more than %zu deep", MaxNestingDepth);
		}
	}

private:
	Reader reader_;
	size_t groupDepth_ = 0;
};

}

/**
 * @brief Parses a pattern into a syntax tree.
 *
 * @param pattern The pattern text.
 * @return The syntax tree. The empty pattern yields an empty SeqNode.
 */
Node parse(std::string_view pattern) {
	Parser parser(pattern);
	return parser.parse();
}

}
