
#ifndef PARSER_H_
#define PARSER_H_

#include "Ast.h"

#include <string_view>

namespace RegVM {

Node parse(std::string_view pattern);

}

#endif
