
#include "Decompile.h"

#include <cstdio>

namespace RegVM {
namespace {

/**
 * @brief Quotes a character for display, escaping anything that is not
 * printable ASCII.
 *
 * @param ch The character.
 * @return The quoted character.
 */
std::string quote(char ch) {
	const auto uch = static_cast<unsigned char>(ch);

	if (ch == '\\' || ch == '\'') {
		return std::string{'\'', '\\', ch, '\''};
	}

	if (uch < 0x20 || uch > 0x7e) {
		char buf[8];
		snprintf(buf, sizeof(buf), "'\\x%02x'", uch);
		return buf;
	}

	return std::string{'\'', ch, '\''};
}

class TreePrinter : public boost::static_visitor<> {
public:
	explicit TreePrinter(std::string &out)
		: out_(out) {
	}

public:
	void operator()(const CharNode &node) const {
		out_ += "(char ";
		out_ += quote(node.ch);
		out_ += ')';
	}

	void operator()(const OrNode &node) const {
		out_ += "(or ";
		boost::apply_visitor(*this, node.left);
		out_ += ' ';
		boost::apply_visitor(*this, node.right);
		out_ += ')';
	}

	void operator()(const SeqNode &node) const {
		out_ += "(seq";
		for (const Node &child : node.nodes) {
			out_ += ' ';
			boost::apply_visitor(*this, child);
		}
		out_ += ')';
	}

	void operator()(const StarNode &node) const {
		unary("star", node.node);
	}

	void operator()(const PlusNode &node) const {
		unary("plus", node.node);
	}

	void operator()(const QuestionNode &node) const {
		unary("question", node.node);
	}

private:
	void unary(const char *name, const Node &child) const {
		out_ += '(';
		out_ += name;
		out_ += ' ';
		boost::apply_visitor(*this, child);
		out_ += ')';
	}

private:
	std::string &out_;
};

class InstructionPrinter : public boost::static_visitor<std::string> {
public:
	std::string operator()(const OpChar &op) const {
		return "char " + quote(op.ch);
	}

	std::string operator()(const OpMatch &) const {
		return "match";
	}

	std::string operator()(const OpJump &op) const {
		char buf[32];
		snprintf(buf, sizeof(buf), "jmp %04u", static_cast<unsigned int>(op.target));
		return buf;
	}

	std::string operator()(const OpSplit &op) const {
		char buf[32];
		snprintf(buf, sizeof(buf), "split %04u, %04u", static_cast<unsigned int>(op.first), static_cast<unsigned int>(op.second));
		return buf;
	}
};

}

/**
 * @brief Renders a syntax tree as an S-expression, for example
 * "(seq (char 'a') (star (char 'b')))".
 *
 * @param tree The syntax tree.
 * @return The rendered tree.
 */
std::string dumpTree(const Node &tree) {
	std::string out;
	TreePrinter printer(out);
	boost::apply_visitor(printer, tree);
	return out;
}

/**
 * @brief Produces a listing of a program, one line per instruction:
 * the zero padded address followed by the mnemonic and its operands.
 *
 * @param program The program.
 * @return The listing.
 */
std::vector<std::string> disassemble(const Program &program) {
	std::vector<std::string> results;
	results.reserve(program.size());

	InstructionPrinter printer;
	size_t pc = 0;

	for (const Instruction &inst : program) {
		char addr[32];
		snprintf(addr, sizeof(addr), "%04zu: ", pc++);
		results.push_back(addr + boost::apply_visitor(printer, inst));
	}

	return results;
}

}
