
#ifndef REGEX_H_
#define REGEX_H_

#include "Constants.h"
#include "Execute.h"
#include "Program.h"
#include "RegexError.h"

#include <iosfwd>
#include <memory>
#include <string_view>

namespace RegVM {

std::shared_ptr<const Program> compile(std::string_view pattern);

bool match(std::string_view pattern, std::string_view text, Strategy strategy);
bool match(std::string_view pattern, std::string_view text, const EvalOptions &options);

void describe(std::string_view pattern, std::ostream &os);

}

#endif
