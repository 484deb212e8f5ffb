
#ifndef EXECUTE_H_
#define EXECUTE_H_

#include "Anchoring.h"
#include "Program.h"
#include "Strategy.h"

#include <cstddef>
#include <string_view>

namespace RegVM {

struct EvalOptions {
	Strategy strategy   = Strategy::Parallel;
	Anchoring anchoring = Anchoring::Full;
	size_t stepLimit    = 0; // Backtracking only, 0 means unlimited.
};

bool evaluate(const Program &program, std::string_view input, const EvalOptions &options);
bool evaluate(const Program &program, std::string_view input, Strategy strategy);

}

#endif
