
#ifndef CONSTANTS_H_
#define CONSTANTS_H_

#include <cstddef>
#include <cstdint>
#include <limits>

namespace RegVM {

// An instruction address, i.e. an index into a program.
using Address = uint16_t;

/* The program counter has to be able to name the slot following the last
   instruction, so a program can hold one instruction less than there are
   addresses. */
constexpr size_t MaxProgramSize = std::numeric_limits<Address>::max();

/* Upper bound for both the nesting of groups and the depth of the syntax
   tree. Parsing, code generation and the tree dump all recurse over the
   tree, so this is what keeps them off the end of the stack. */
constexpr size_t MaxNestingDepth = 2000;

}

#endif
