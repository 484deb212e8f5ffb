
#include "Constants.h"
#include "Decompile.h"
#include "Parser.h"
#include "RegexError.h"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

using namespace RegVM;

namespace {

std::string tree(std::string_view pattern) {
	return dumpTree(parse(pattern));
}

void expectParseError(std::string_view pattern, ParseError::Kind kind, size_t position) {
	try {
		parse(pattern);
		ADD_FAILURE() << "no ParseError for \"" << pattern << "\"";
	} catch (const ParseError &e) {
		EXPECT_EQ(e.kind(), kind) << "pattern \"" << pattern << "\": " << e.what();
		EXPECT_EQ(e.position(), position) << "pattern \"" << pattern << "\": " << e.what();
	}
}

std::string alternatives(size_t count) {
	std::string pattern = "a";
	for (size_t i = 1; i < count; ++i) {
		pattern += "|a";
	}
	return pattern;
}

}

TEST(ParserTest, SingleCharacter) {
	const Node node = parse("a");

	const CharNode *ch = boost::get<CharNode>(&node);
	ASSERT_NE(ch, nullptr);
	EXPECT_EQ(ch->ch, 'a');
}

TEST(ParserTest, Concatenation) {
	const Node node = parse("abc");

	const SeqNode *seq = boost::get<SeqNode>(&node);
	ASSERT_NE(seq, nullptr);
	ASSERT_EQ(seq->nodes.size(), 3u);

	const char expected[] = {'a', 'b', 'c'};
	for (size_t i = 0; i < 3; ++i) {
		const CharNode *ch = boost::get<CharNode>(&seq->nodes[i]);
		ASSERT_NE(ch, nullptr);
		EXPECT_EQ(ch->ch, expected[i]);
	}
}

TEST(ParserTest, Alternation) {
	const Node node = parse("ab|c");

	const OrNode *alt = boost::get<OrNode>(&node);
	ASSERT_NE(alt, nullptr);
	EXPECT_NE(boost::get<SeqNode>(&alt->left), nullptr);
	EXPECT_NE(boost::get<CharNode>(&alt->right), nullptr);
}

TEST(ParserTest, AlternationKeepsBranchOrder) {
	EXPECT_EQ(tree("a|b|c"), "(or (or (char 'a') (char 'b')) (char 'c'))");
}

TEST(ParserTest, QuantifiersBindTighterThanConcatenation) {
	EXPECT_EQ(tree("ab*"), "(seq (char 'a') (star (char 'b')))");
	EXPECT_EQ(tree("ab+c"), "(seq (char 'a') (plus (char 'b')) (char 'c'))");
	EXPECT_EQ(tree("a?b"), "(seq (question (char 'a')) (char 'b'))");
}

TEST(ParserTest, ConcatenationBindsTighterThanAlternation) {
	EXPECT_EQ(tree("ab|cd"), "(or (seq (char 'a') (char 'b')) (seq (char 'c') (char 'd')))");
}

TEST(ParserTest, GroupsProduceNoNode) {
	EXPECT_EQ(tree("(a)"), "(char 'a')");
	EXPECT_EQ(tree("((a))"), "(char 'a')");
	EXPECT_EQ(tree("(ab)+"), "(plus (seq (char 'a') (char 'b')))");
	EXPECT_EQ(tree("a(b|c)d"), "(seq (char 'a') (or (char 'b') (char 'c')) (char 'd'))");
}

TEST(ParserTest, QuantifiedGroups) {
	EXPECT_EQ(tree("((a*)*)*"), "(star (star (star (char 'a'))))");
	EXPECT_EQ(tree("(a?)+"), "(plus (question (char 'a')))");
}

TEST(ParserTest, EmptyPattern) {
	const Node node = parse("");

	const SeqNode *seq = boost::get<SeqNode>(&node);
	ASSERT_NE(seq, nullptr);
	EXPECT_TRUE(seq->nodes.empty());
	EXPECT_EQ(dumpTree(node), "(seq)");
}

TEST(ParserTest, OtherCharactersAreLiterals) {
	EXPECT_EQ(tree("a.b"), "(seq (char 'a') (char '.') (char 'b'))");
	EXPECT_EQ(tree("[x]"), "(seq (char '[') (char 'x') (char ']'))");
	EXPECT_EQ(tree(" "), "(char ' ')");
}

TEST(ParserTest, Escapes) {
	EXPECT_EQ(tree("\\*"), "(char '*')");
	EXPECT_EQ(tree("\\(\\)"), "(seq (char '(') (char ')'))");
	EXPECT_EQ(tree("\\|"), "(char '|')");
	EXPECT_EQ(tree("\\\\"), "(char '\\\\')");
	EXPECT_EQ(tree("\\n"), "(char '\\x0a')");
	EXPECT_EQ(tree("\\t"), "(char '\\x09')");
	EXPECT_EQ(tree("\\e"), "(char '\\x1b')");
	EXPECT_EQ(tree("a\\+*"), "(seq (char 'a') (star (char '+')))");
}

TEST(ParserTest, UnbalancedParen) {
	expectParseError("(ab", ParseError::UnbalancedParen, 0);
	expectParseError("a(b(c)", ParseError::UnbalancedParen, 1);
	expectParseError("ab)", ParseError::UnbalancedParen, 2);
	expectParseError(")", ParseError::UnbalancedParen, 0);
}

TEST(ParserTest, MissingOperand) {
	expectParseError("*a", ParseError::MissingOperand, 0);
	expectParseError("+", ParseError::MissingOperand, 0);
	expectParseError("a|?", ParseError::MissingOperand, 2);
	expectParseError("(*)", ParseError::MissingOperand, 1);
}

TEST(ParserTest, NestedQuantifiersAreRejected) {
	expectParseError("a**", ParseError::MissingOperand, 2);
	expectParseError("a+?", ParseError::MissingOperand, 2);
	expectParseError("(ab)*+", ParseError::MissingOperand, 5);
}

TEST(ParserTest, EmptyAlternative) {
	expectParseError("|a", ParseError::EmptyAlternative, 0);
	expectParseError("a|", ParseError::EmptyAlternative, 2);
	expectParseError("a||b", ParseError::EmptyAlternative, 2);
	expectParseError("(|a)", ParseError::EmptyAlternative, 1);
	expectParseError("(a|)", ParseError::EmptyAlternative, 3);
	expectParseError("|", ParseError::EmptyAlternative, 0);
}

TEST(ParserTest, EmptyGroup) {
	expectParseError("()", ParseError::EmptyAlternative, 1);
	expectParseError("a()*", ParseError::EmptyAlternative, 2);
}

TEST(ParserTest, InvalidEscape) {
	expectParseError("\\q", ParseError::InvalidEscape, 0);
	expectParseError("ab\\", ParseError::InvalidEscape, 2);
	expectParseError("a\\1", ParseError::InvalidEscape, 1);
}

TEST(ParserTest, GroupNestingLimit) {
	const std::string ok = std::string(MaxNestingDepth, '(') + "a" + std::string(MaxNestingDepth, ')');
	EXPECT_EQ(tree(ok), "(char 'a')");

	const std::string deep = std::string(MaxNestingDepth + 1, '(') + "a" + std::string(MaxNestingDepth + 1, ')');
	expectParseError(deep, ParseError::NestingTooDeep, MaxNestingDepth);
}

TEST(ParserTest, AlternationIsBalanced) {
	EXPECT_EQ(tree("a|b|c|d"), "(or (or (char 'a') (char 'b')) (or (char 'c') (char 'd')))");
	EXPECT_EQ(tree("a|b|c|d|e"), "(or (or (or (char 'a') (char 'b')) (char 'c')) (or (char 'd') (char 'e')))");
}

TEST(ParserTest, ManyAlternatives) {
	const Node node = parse(alternatives(5000));
	EXPECT_NE(boost::get<OrNode>(&node), nullptr);
}

TEST(ParserTest, TreeDepthLimit) {
	auto nestedStars = [](size_t count) {
		std::string pattern = std::string(count, '(') + "a";
		for (size_t i = 0; i < count; ++i) {
			pattern += ")*";
		}
		return pattern;
	};

	// each starred group adds a level on top of the character
	EXPECT_NO_THROW(parse(nestedStars(MaxNestingDepth - 1)));

	try {
		parse(nestedStars(MaxNestingDepth));
		ADD_FAILURE() << "no ParseError for a tree deeper than " << MaxNestingDepth;
	} catch (const ParseError &e) {
		EXPECT_EQ(e.kind(), ParseError::NestingTooDeep);
	}
}

TEST(ParserTest, ErrorsCarryAMessage) {
	try {
		parse("a||b");
		ADD_FAILURE() << "no ParseError";
	} catch (const RegexError &e) {
		EXPECT_NE(std::string(e.what()), "");
	}
}
