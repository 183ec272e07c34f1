#pragma once

#include <string>
#include <string_view>

#include "types.hpp"

namespace scb {

// .py .rs .c .h .cpp .hpp .css
ExtensionSet defaultExtensions();

// "PY" -> ".py", ".Cpp" -> ".cpp"; empty input stays empty
std::string normalizeExtension(std::string_view extension);

// Comma and/or whitespace separated list, e.g. "py, .Cpp h"
ExtensionSet parseExtensionList(std::string_view list);

// "build" -> active rule, "!build" -> inactive rule
FilterRule parseFilterRule(std::string_view text);

} // namespace scb
