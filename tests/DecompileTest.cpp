
#include "Compile.h"
#include "Decompile.h"
#include "Parser.h"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace RegVM;

namespace {

std::vector<std::string> listing(std::string_view pattern) {
	return disassemble(generate(parse(pattern)));
}

}

TEST(DecompileTest, DisassembleStar) {
	const std::vector<std::string> expected = {
		"0000: split 0001, 0003",
		"0001: char 'a'",
		"0002: jmp 0000",
		"0003: match",
	};

	EXPECT_EQ(listing("a*"), expected);
}

TEST(DecompileTest, DisassembleAlternation) {
	const std::vector<std::string> expected = {
		"0000: split 0001, 0004",
		"0001: char 'a'",
		"0002: char 'b'",
		"0003: jmp 0005",
		"0004: char 'c'",
		"0005: match",
	};

	EXPECT_EQ(listing("ab|c"), expected);
}

TEST(DecompileTest, DisassembleEmptyPattern) {
	const std::vector<std::string> expected = {"0000: match"};
	EXPECT_EQ(listing(""), expected);
}

TEST(DecompileTest, DisassembleEmptyProgram) {
	EXPECT_TRUE(disassemble(Program()).empty());
}

TEST(DecompileTest, AddressesWiderThanFourDigits) {
	const std::vector<std::string> lines = listing(std::string(10000, 'a'));
	ASSERT_EQ(lines.size(), 10001u);
	EXPECT_EQ(lines[9999], "9999: char 'a'");
	EXPECT_EQ(lines[10000], "10000: match");
}

TEST(DecompileTest, QuotedCharacters) {
	const std::vector<std::string> expected = {
		"0000: char '\\\\'",
		"0001: char '\\''",
		"0002: char '\\x0a'",
		"0003: char ' '",
		"0004: match",
	};

	std::vector<Instruction> code = {OpChar{'\\'}, OpChar{'\''}, OpChar{'\n'}, OpChar{' '}, OpMatch{}};
	EXPECT_EQ(disassemble(Program(std::move(code))), expected);
}

TEST(DecompileTest, HighCharacters) {
	std::vector<Instruction> code = {OpChar{'\xe9'}};
	const std::vector<std::string> lines = disassemble(Program(std::move(code)));

	ASSERT_EQ(lines.size(), 1u);
	EXPECT_EQ(lines[0], "0000: char '\\xe9'");
}

TEST(DecompileTest, DumpTree) {
	EXPECT_EQ(dumpTree(parse("a(b|c)*d+e?")), "(seq (char 'a') (star (or (char 'b') (char 'c'))) (plus (char 'd')) (question (char 'e')))");
}

TEST(DecompileTest, DumpSingleNodes) {
	EXPECT_EQ(dumpTree(CharNode{'x'}), "(char 'x')");
	EXPECT_EQ(dumpTree(SeqNode{}), "(seq)");
	EXPECT_EQ(dumpTree(StarNode{CharNode{'x'}}), "(star (char 'x'))");
}
