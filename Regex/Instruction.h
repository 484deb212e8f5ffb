
#ifndef INSTRUCTION_H_
#define INSTRUCTION_H_

#include "Constants.h"

#include <boost/variant.hpp>

namespace RegVM {

// Consume one input character equal to `ch`, otherwise fail this path.
struct OpChar {
	char ch;
};

// Accept.
struct OpMatch {
};

// Continue at `target`.
struct OpJump {
	Address target;
};

// Continue at `first`; if that path fails, continue at `second` from the
// same input position.
struct OpSplit {
	Address first;
	Address second;
};

using Instruction = boost::variant<OpChar, OpMatch, OpJump, OpSplit>;

inline bool operator==(const OpChar &lhs, const OpChar &rhs) noexcept {
	return lhs.ch == rhs.ch;
}

inline bool operator==(const OpMatch &, const OpMatch &) noexcept {
	return true;
}

inline bool operator==(const OpJump &lhs, const OpJump &rhs) noexcept {
	return lhs.target == rhs.target;
}

inline bool operator==(const OpSplit &lhs, const OpSplit &rhs) noexcept {
	return lhs.first == rhs.first && lhs.second == rhs.second;
}

}

#endif
