#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace archcheck::core {

// Glob matching over '/'-separated relative paths.
//   *      any run of characters except '/'
//   **     any run of characters including '/'; "**/" also matches zero directories
//   ?      one character except '/'
//   [a-z]  character class, "[!x]" / "[^x]" negated
//   {a,b}  alternation (expanded before matching, may nest)
// A pattern without '/' is matched against the basename only ("*.ts" matches "src/a.ts").
[[nodiscard]] bool glob_match(std::string_view pattern, std::string_view path);

// Expands "{a,b}" alternations into the full list of plain patterns.
[[nodiscard]] std::vector<std::string> expand_braces(std::string_view pattern);

}  // namespace archcheck::core
