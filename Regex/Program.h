
#ifndef PROGRAM_H_
#define PROGRAM_H_

#include "Instruction.h"

#include <cstddef>
#include <vector>

namespace RegVM {

/**
 * A compiled pattern: an immutable sequence of instructions addressed by
 * index. Safe to evaluate from several threads at once.
 */
class Program {
public:
	using const_iterator = std::vector<Instruction>::const_iterator;

public:
	Program() = default;
	explicit Program(std::vector<Instruction> code) noexcept;
	Program(const Program &)            = default;
	Program(Program &&)                 = default;
	Program &operator=(const Program &) = default;
	Program &operator=(Program &&)      = default;
	~Program()                          = default;

public:
	const Instruction *at(size_t pc) const noexcept;
	const Instruction &operator[](size_t pc) const noexcept;
	size_t size() const noexcept;
	bool empty() const noexcept;
	const_iterator begin() const noexcept;
	const_iterator end() const noexcept;

public:
	bool operator==(const Program &rhs) const;
	bool operator!=(const Program &rhs) const;

private:
	std::vector<Instruction> code_;
};

}

#endif
