
#ifndef DECOMPILE_H_
#define DECOMPILE_H_

#include "Ast.h"
#include "Program.h"

#include <string>
#include <vector>

namespace RegVM {

std::string dumpTree(const Node &tree);
std::vector<std::string> disassemble(const Program &program);

}

#endif
