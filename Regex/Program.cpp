
#include "Program.h"

#include <utility>

namespace RegVM {

/**
 * @brief Freezes a generated instruction sequence into a program.
 *
 * @param code The instructions, addressed by their index.
 */
Program::Program(std::vector<Instruction> code) noexcept
	: code_(std::move(code)) {
}

/**
 * @brief Bounds checked instruction access.
 *
 * @param pc The address of the instruction.
 * @return The instruction at `pc`, or nullptr if `pc` is out of range.
 */
const Instruction *Program::at(size_t pc) const noexcept {
	if (pc >= code_.size()) {
		return nullptr;
	}

	return &code_[pc];
}

const Instruction &Program::operator[](size_t pc) const noexcept {
	return code_[pc];
}

size_t Program::size() const noexcept {
	return code_.size();
}

bool Program::empty() const noexcept {
	return code_.empty();
}

Program::const_iterator Program::begin() const noexcept {
	return code_.begin();
}

Program::const_iterator Program::end() const noexcept {
	return code_.end();
}

bool Program::operator==(const Program &rhs) const {
	return code_ == rhs.code_;
}

bool Program::operator!=(const Program &rhs) const {
	return !(*this == rhs);
}

}
