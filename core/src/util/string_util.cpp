#include "string_util.h"

namespace ovsql::util {

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i != 0) out += separator;
    out += parts[i];
  }
  return out;
}

std::string indent_lines(const std::string& text, size_t width) {
  const std::string pad(width, ' ');
  std::string out;
  out.reserve(text.size() + width * 4);
  bool at_line_start = true;
  for (char c : text) {
    if (at_line_start && c != '\n') {
      out += pad;
    }
    out.push_back(c);
    at_line_start = (c == '\n');
  }
  return out;
}

void line_col_at(const std::string& text, size_t byte, size_t& line, size_t& col) {
  line = 1;
  col = 1;
  for (size_t i = 0; i < byte && i < text.size(); ++i) {
    if (text[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
}

}  // namespace ovsql::util
