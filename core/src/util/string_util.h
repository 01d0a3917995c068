#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ovsql::util {

/// Joins parts with a separator.
std::string join(const std::vector<std::string>& parts, const std::string& separator);
/// Prefixes every line of `text` (including the first) with `width` spaces.
/// Empty lines stay empty so generated SQL carries no trailing whitespace.
std::string indent_lines(const std::string& text, size_t width);
/// Converts a byte offset into 1-based line and column numbers.
void line_col_at(const std::string& text, size_t byte, size_t& line, size_t& col);

}  // namespace ovsql::util
