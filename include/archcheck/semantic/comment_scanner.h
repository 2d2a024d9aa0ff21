#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace archcheck::semantic {

// Byte range [begin, end) of one comment, delimiters included.
struct CommentSpan {
  std::size_t begin{0};
  std::size_t end{0};
};

// Lexes comments while skipping string literals. '#' line comments for script languages
// (".py", ".rb", ".sh", ...); "//" and "/* */" for everything else.
[[nodiscard]] std::vector<CommentSpan> find_comments(std::string_view content,
                                                     std::string_view extension);

// Copy of content with every comment byte except '\n' replaced by ' '.
// Offsets and line numbers are preserved.
[[nodiscard]] std::string blank_comments(std::string_view content,
                                         const std::vector<CommentSpan>& spans);

// Offset of the first byte that is neither whitespace nor inside a comment;
// content.size() for comment-only files.
[[nodiscard]] std::size_t first_code_offset(std::string_view content,
                                            const std::vector<CommentSpan>& spans);

}  // namespace archcheck::semantic
