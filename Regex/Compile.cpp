
#include "Compile.h"
#include "Constants.h"
#include "RegexError.h"
#include "Util/Raise.h"
#include "Util/SafeMath.h"

#include <utility>
#include <vector>

namespace RegVM {
namespace {

/*
 * Emits code for a syntax tree. Instructions are appended to a growable
 * buffer and `pc_` always names the slot the next instruction will occupy.
 * Forward references are emitted as placeholders and patched once the
 * code they refer to has been generated:
 *
 *   e1|e2          e*              e+              e?
 *
 *      split L1,L2 L1: split L2,L3 L1: e           split L1,L2
 *   L1: e1         L2: e               split L1,L2 L1: e
 *      jmp L3          jmp L1      L2:             L2:
 *   L2: e2         L3:
 *   L3:
 */
class Generator : public boost::static_visitor<> {
public:
	Program generate(const Node &tree) {
		boost::apply_visitor(*this, tree);
		emit(OpMatch{});
		return Program(std::move(code_));
	}

public:
	void operator()(const CharNode &node) {
		emit(OpChar{node.ch});
	}

	void operator()(const OrNode &node) {
		const Address split = emit(OpSplit{0, 0});
		placeholder<OpSplit>(split, CodeGenError::OrPatchFailed).first = pc_;

		boost::apply_visitor(*this, node.left);

		const Address jump = emit(OpJump{0});
		placeholder<OpSplit>(split, CodeGenError::OrPatchFailed).second = pc_;

		boost::apply_visitor(*this, node.right);

		placeholder<OpJump>(jump, CodeGenError::OrPatchFailed).target = pc_;
	}

	void operator()(const SeqNode &node) {
		for (const Node &child : node.nodes) {
			boost::apply_visitor(*this, child);
		}
	}

	void operator()(const StarNode &node) {
		const Address split = emit(OpSplit{0, 0});
		placeholder<OpSplit>(split, CodeGenError::StarPatchFailed).first = pc_;

		boost::apply_visitor(*this, node.node);

		emit(OpJump{split});
		placeholder<OpSplit>(split, CodeGenError::StarPatchFailed).second = pc_;
	}

	void operator()(const PlusNode &node) {
		const Address body = pc_;

		boost::apply_visitor(*this, node.node);

		const Address split = emit(OpSplit{body, 0});
		placeholder<OpSplit>(split, CodeGenError::PlusPatchFailed).second = pc_;
	}

	void operator()(const QuestionNode &node) {
		const Address split = emit(OpSplit{0, 0});
		placeholder<OpSplit>(split, CodeGenError::QuestionPatchFailed).first = pc_;

		boost::apply_visitor(*this, node.node);

		placeholder<OpSplit>(split, CodeGenError::QuestionPatchFailed).second = pc_;
	}

private:
	/**
	 * @brief Appends an instruction and advances the program counter.
	 *
	 * @param inst The instruction to append.
	 * @return The address of the appended instruction.
	 */
	Address emit(const Instruction &inst) {
		const Address addr = pc_;
		SafeIncrement<CodeGenError>(pc_, CodeGenError::PcOverflow, "program exceeds %zu instructions", MaxProgramSize);
		code_.push_back(inst);
		return addr;
	}

	/**
	 * @brief Looks up a previously emitted placeholder so that its operands
	 * can be patched. The returned reference is only valid until the next
	 * call to emit().
	 *
	 * @param addr The address the placeholder was emitted at.
	 * @param kind The error to raise if the placeholder is not there.
	 * @return The placeholder instruction.
	 */
	template <class Op>
	Op &placeholder(Address addr, CodeGenError::Kind kind) {
		Op *op = nullptr;
		if (addr < code_.size()) {
			op = boost::get<Op>(&code_[addr]);
		}

		if (!op) {
			ReportError("patch target missing");
			Raise<CodeGenError>(kind, "no placeholder to patch at %04u", static_cast<unsigned int>(addr));
		}

		return *op;
	}

private:
	std::vector<Instruction> code_;
	Address pc_ = 0;
};

}

/**
 * @brief Generates the program for a syntax tree, terminated by a single
 * Match instruction.
 *
 * @param tree The syntax tree.
 * @return The program.
 */
Program generate(const Node &tree) {
	Generator generator;
	return generator.generate(tree);
}

}
