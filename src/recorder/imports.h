#pragma once
#ifndef TESTSIEVE_IMPORTS_H
#define TESTSIEVE_IMPORTS_H

#include <string>
#include <vector>

namespace testsieve {

// One import statement found in source.
//   import a.b as x, c    -> {"a.b", 0, {}}, {"c", 0, {}}
//   from ..pkg import y   -> {"pkg", 2, {"y"}}
//   from . import z       -> {"", 1, {"z"}}
struct ImportStatement {
    std::string module;
    int level = 0;
    std::vector<std::string> names;
};

// Every import statement in the source, at any nesting depth. String
// literals and comments are skipped. Malformed statements are ignored.
std::vector<ImportStatement> scan_imports(const std::string& source);

}  // namespace testsieve

#endif  // TESTSIEVE_IMPORTS_H
