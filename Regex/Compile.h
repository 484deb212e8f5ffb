
#ifndef COMPILE_H_
#define COMPILE_H_

#include "Ast.h"
#include "Program.h"

namespace RegVM {

Program generate(const Node &tree);

}

#endif
