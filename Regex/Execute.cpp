
#include "Execute.h"
#include "RegexError.h"
#include "Util/Compiler.h"
#include "Util/Raise.h"
#include "Util/SafeMath.h"

#include <QtDebug>

#include <cstddef>
#include <limits>
#include <utility>
#include <vector>

namespace RegVM {
namespace {

/**
 * @brief Fetches the instruction at `pc`.
 *
 * @param program The program being executed.
 * @param pc The program counter.
 * @return The instruction. EvalError is thrown if `pc` is outside of the
 * program, which a program produced by generate() never does.
 */
REGVM_FORCE_INLINE const Instruction &fetch(const Program &program, size_t pc) {
	const Instruction *inst = program.at(pc);
	if (!inst) {
		Raise<EvalError>(EvalError::InvalidPc, "program counter %zu is outside of the program (%zu instructions)", pc, program.size());
	}

	return *inst;
}

/*----------------------------------------------------------------------*
 * Backtracker
 *
 * Depth first execution. Rather than recursing on every split, the
 * alternative not taken is pushed onto an explicit stack as an
 * (address, position) frame, and popped when the current path fails. So
 * the first branch of a split is always fully explored before the second
 * one is tried, and the native stack depth does not depend on the input.
 *
 * Zero width loops (e.g. "(a?)*") would otherwise cycle forever without
 * consuming input. Every address entered on the current path is marked
 * with the input position it was entered at. The position never decreases
 * along a path, so entering an address which is already marked with the
 * current position closes a cycle that consumed nothing, and the path is
 * dead. Marks belong to the path, not to the search: each one is recorded
 * on a trail, and a frame remembers how long the trail was when it was
 * pushed. Popping the frame undoes every mark made after that point, so
 * the resumed path sees exactly the marks of its own prefix.
 *
 * Only cycles are cut. Distinct paths through the same state are still
 * explored separately, so the worst case stays exponential and the step
 * budget is what bounds it.
 *----------------------------------------------------------------------*/
class Backtracker {
private:
	static constexpr size_t Unmarked = std::numeric_limits<size_t>::max();

	struct Frame {
		size_t pc;
		size_t sp;
		size_t trail;
	};

	struct Mark {
		size_t pc;
		size_t previous;
	};

public:
	Backtracker(const Program &program, std::string_view input, const EvalOptions &options)
		: program_(program), input_(input), options_(options), marks_(program.size(), Unmarked) {
	}

public:
	bool run() {
		stack_.push_back(Frame{0, 0, 0});

		while (!stack_.empty()) {
			const Frame frame = stack_.back();
			stack_.pop_back();

			rewind(frame.trail);

			if (thread(frame.pc, frame.sp)) {
				return true;
			}
		}

		return false;
	}

private:
	bool thread(size_t pc, size_t sp) {

		for (;;) {
			step();

			const Instruction &inst = fetch(program_, pc);

			if (marks_[pc] == sp) {
				return false;
			}

			trail_.push_back(Mark{pc, marks_[pc]});
			marks_[pc] = sp;

			if (const OpChar *opChar = boost::get<OpChar>(&inst)) {
				if (sp >= input_.size() || input_[sp] != opChar->ch) {
					return false;
				}

				SafeIncrement<EvalError>(pc, EvalError::PcOverflow, "program counter overflow");
				SafeIncrement<EvalError>(sp, EvalError::SpOverflow, "input position overflow");
			} else if (boost::get<OpMatch>(&inst)) {
				return options_.anchoring == Anchoring::Prefix || sp == input_.size();
			} else if (const OpJump *opJump = boost::get<OpJump>(&inst)) {
				pc = opJump->target;
			} else if (const OpSplit *opSplit = boost::get<OpSplit>(&inst)) {
				stack_.push_back(Frame{opSplit->second, sp, trail_.size()});
				pc = opSplit->first;
			}
		}
	}

	// Undoes the marks made since the trail was `length` entries long.
	void rewind(size_t length) noexcept {
		while (trail_.size() > length) {
			const Mark &mark = trail_.back();
			marks_[mark.pc]  = mark.previous;
			trail_.pop_back();
		}
	}

	void step() {
		if (options_.stepLimit == 0) {
			return;
		}

		if (++steps_ > options_.stepLimit) {
			qWarning("regvm: backtracking gave up after %zu steps", options_.stepLimit);
			Raise<EvalError>(EvalError::StepLimitExceeded, "step limit of %zu exceeded", options_.stepLimit);
		}
	}

private:
	const Program &program_;
	std::string_view input_;
	const EvalOptions &options_;
	std::vector<size_t> marks_;
	std::vector<Mark> trail_;
	std::vector<Frame> stack_;
	size_t steps_ = 0;
};

/*----------------------------------------------------------------------*
 * ThreadList
 *
 * The set of program counters alive at one input position. A sparse set:
 * O(1) insertion, membership test and clear, and iteration in insertion
 * order.
 *----------------------------------------------------------------------*/
class ThreadList {
public:
	explicit ThreadList(size_t capacity)
		: dense_(capacity), sparse_(capacity) {
	}

public:
	bool contains(size_t pc) const noexcept {
		const size_t i = sparse_[pc];
		return i < size_ && dense_[i] == pc;
	}

	bool insert(size_t pc) noexcept {
		if (contains(pc)) {
			return false;
		}

		sparse_[pc]     = size_;
		dense_[size_++] = pc;
		return true;
	}

	void clear() noexcept {
		size_ = 0;
	}

	bool empty() const noexcept {
		return size_ == 0;
	}

	std::vector<size_t>::const_iterator begin() const noexcept {
		return dense_.begin();
	}

	std::vector<size_t>::const_iterator end() const noexcept {
		return dense_.begin() + static_cast<std::ptrdiff_t>(size_);
	}

private:
	std::vector<size_t> dense_;
	std::vector<size_t> sparse_;
	size_t size_ = 0;
};

/*----------------------------------------------------------------------*
 * ParallelSimulator
 *
 * Breadth first execution. All threads advance over the input in lock
 * step; a thread list never holds the same program counter twice, so the
 * work per input character is bounded by the size of the program and
 * zero width loops collapse into a single entry.
 *----------------------------------------------------------------------*/
class ParallelSimulator {
public:
	ParallelSimulator(const Program &program, std::string_view input, const EvalOptions &options)
		: program_(program), input_(input), options_(options), current_(program.size()), next_(program.size()) {
	}

public:
	bool run() {
		addThread(current_, 0);

		size_t sp = 0;
		for (;;) {
			if (options_.anchoring == Anchoring::Prefix && accepting(current_)) {
				return true;
			}

			if (sp == input_.size() || current_.empty()) {
				break;
			}

			const char ch = input_[sp];
			next_.clear();

			for (size_t pc : current_) {
				const OpChar *op = boost::get<OpChar>(&program_[pc]);
				if (op && op->ch == ch) {
					SafeIncrement<EvalError>(pc, EvalError::PcOverflow, "program counter overflow");
					addThread(next_, pc);
				}
			}

			std::swap(current_, next_);
			SafeIncrement<EvalError>(sp, EvalError::SpOverflow, "input position overflow");
		}

		return sp == input_.size() && accepting(current_);
	}

private:
	/**
	 * @brief Adds `pc` and everything reachable from it without consuming
	 * input to `list`. Jumps and splits are followed immediately, so only
	 * the Char and Match entries of a list ever run.
	 *
	 * @param list The thread list to add to.
	 * @param pc The program counter to start from.
	 */
	void addThread(ThreadList &list, size_t pc) {
		pending_.push_back(pc);

		while (!pending_.empty()) {
			pc = pending_.back();
			pending_.pop_back();

			const Instruction &inst = fetch(program_, pc);

			if (!list.insert(pc)) {
				continue;
			}

			if (const OpJump *opJump = boost::get<OpJump>(&inst)) {
				pending_.push_back(opJump->target);
			} else if (const OpSplit *opSplit = boost::get<OpSplit>(&inst)) {
				pending_.push_back(opSplit->second);
				pending_.push_back(opSplit->first);
			}
		}
	}

	bool accepting(const ThreadList &list) const {
		for (size_t pc : list) {
			if (boost::get<OpMatch>(&program_[pc])) {
				return true;
			}
		}

		return false;
	}

private:
	const Program &program_;
	std::string_view input_;
	const EvalOptions &options_;
	ThreadList current_;
	ThreadList next_;
	std::vector<size_t> pending_;
};

}

/**
 * @brief Runs a program against an input.
 *
 * @param program The program to execute.
 * @param input The input text.
 * @param options Execution strategy, anchoring and step budget.
 * @return `true` if the program accepts the input, `false` otherwise.
 * EvalError is thrown if the result could not be determined.
 */
bool evaluate(const Program &program, std::string_view input, const EvalOptions &options) {
	switch (options.strategy) {
	case Strategy::Backtracking:
		{
			Backtracker backtracker(program, input, options);
			return backtracker.run();
		}
	case Strategy::Parallel:
		{
			ParallelSimulator simulator(program, input, options);
			return simulator.run();
		}
	}

	Q_UNREACHABLE();
}

/**
 * @brief Runs a program against an input with default anchoring and no
 * step budget.
 *
 * @param program The program to execute.
 * @param input The input text.
 * @param strategy The execution strategy.
 * @return `true` if the program accepts the input, `false` otherwise.
 */
bool evaluate(const Program &program, std::string_view input, Strategy strategy) {
	EvalOptions options;
	options.strategy = strategy;
	return evaluate(program, input, options);
}

}
