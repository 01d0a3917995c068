#include "ovsql/diagnostics.h"

#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>

#include <nlohmann/json.hpp>

#include "ovsql/dialect.h"
#include "ovsql/errors.h"
#include "ovsql/ovsql.h"
#include "../util/string_util.h"

namespace ovsql {

namespace {

bool is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

DiagnosticSpan span_from_bytes(const std::string& query, size_t byte_start, size_t byte_end) {
  DiagnosticSpan span;
  const size_t size = query.size();
  if (size == 0) {
    return span;
  }
  span.byte_start = std::min(byte_start, size - 1);
  span.byte_end = std::min(std::max(byte_end, span.byte_start + 1), size);
  util::line_col_at(query, span.byte_start, span.start_line, span.start_col);
  util::line_col_at(query, span.byte_end, span.end_line, span.end_col);
  return span;
}

// Extends a span starting at `.name` or `name` over the identifier.
size_t identifier_end(const std::string& query, size_t start) {
  size_t end = start;
  if (end < query.size() && query[end] == '.') ++end;
  while (end < query.size() && is_ident_char(query[end])) ++end;
  return std::max(end, start + 1);
}

std::string severity_name(DiagnosticSeverity severity) {
  switch (severity) {
    case DiagnosticSeverity::Error:
      return "ERROR";
    case DiagnosticSeverity::Warning:
      return "WARNING";
    case DiagnosticSeverity::Note:
      return "NOTE";
  }
  return "ERROR";
}

// Text of 1-based line `number`, without its line terminator.
std::string source_line(const std::string& query, size_t number) {
  size_t begin = 0;
  for (size_t line = 1; line < number; ++line) {
    const size_t nl = query.find('\n', begin);
    if (nl == std::string::npos) break;
    begin = nl + 1;
  }
  const size_t nl = query.find('\n', begin);
  std::string text = query.substr(begin, nl == std::string::npos ? std::string::npos : nl - begin);
  if (!text.empty() && text.back() == '\r') text.pop_back();
  return text;
}

/// Renders the ` --> line L, col C` header, the source line and a caret run under the span.
/// Multi-line spans underline one column; a caret run never extends past end of line + 1.
std::string render_code_frame(const std::string& query, const DiagnosticSpan& span) {
  if (query.empty()) return "";
  const std::string text = source_line(query, span.start_line);
  const size_t column = span.start_col == 0 ? 0 : span.start_col - 1;
  if (column > text.size()) return "";
  size_t width = 1;
  if (span.end_line == span.start_line && span.end_col > span.start_col) {
    width = span.end_col - span.start_col;
  }
  const size_t available = text.size() > column ? text.size() - column : 1;
  if (column + width > text.size() + 1) width = available;

  const std::string number = std::to_string(span.start_line);
  const std::string gutter(number.size(), ' ');
  return " --> line " + number + ", col " + std::to_string(span.start_col) + "\n" +
         gutter + " |\n" +
         number + " | " + text + "\n" +
         gutter + " | " + std::string(column, ' ') + std::string(width, '^');
}

bool expects_only(const Diagnostic& d, const char* token) {
  return d.expected.size() == 1 && d.expected.front() == token;
}

/// Adds a note pointing at the unmatched opener before `error_byte`.
void add_opener_note(Diagnostic& d, const std::string& query, size_t error_byte, char open,
                     char close) {
  int depth = 0;
  for (size_t i = std::min(error_byte, query.size()); i > 0; --i) {
    const char c = query[i - 1];
    if (c == close) ++depth;
    if (c != open) continue;
    if (depth > 0) {
      --depth;
      continue;
    }
    DiagnosticRelated related;
    related.message = std::string("'") + open + "' opened here";
    related.span = span_from_bytes(query, i - 1, i);
    d.related.push_back(std::move(related));
    return;
  }
}

void set_syntax_code_help(Diagnostic& d, const std::string& query, size_t error_byte) {
  d.code = "OVQ-SYN-0001";
  d.help = "Statements look like `node[key=value](south,west,north,east)->.name;` and end with ';'.";
  if (d.message.rfind("Unterminated", 0) == 0 || d.message.rfind("Unexpected", 0) == 0) {
    d.code = "OVQ-SYN-0002";
    d.help = "Close the string or comment, or remove the stray character.";
    return;
  }
  if (expects_only(d, "')'")) {
    d.code = "OVQ-SYN-0003";
    d.help = "Close the open parenthesis before continuing.";
    add_opener_note(d, query, error_byte, '(', ')');
    return;
  }
  if (expects_only(d, "']'")) {
    d.code = "OVQ-SYN-0004";
    d.help = "Close the open bracket before continuing.";
    add_opener_note(d, query, error_byte, '[', ']');
    return;
  }
  if (expects_only(d, "';'")) {
    d.code = "OVQ-SYN-0005";
    d.help = "Terminate every statement with ';'.";
    return;
  }
}

void set_semantic_code_help(Diagnostic& d) {
  d.code = "OVQ-SEM-0999";
  d.help = "Review the failing statement.";
  if (d.message.rfind("Unbound set", 0) == 0) {
    d.code = "OVQ-SEM-0101";
    d.help = "Assign the set with `->.name` in an earlier statement before reading it.";
    return;
  }
  if (d.message.find("does not hold areas") != std::string::npos) {
    d.code = "OVQ-SEM-0201";
    d.help = "Fill the set with an area query first, e.g. `area[name=\"...\"]->.a;`.";
    return;
  }
}

nlohmann::ordered_json span_to_json(const DiagnosticSpan& span) {
  return nlohmann::ordered_json{{"start_line", span.start_line}, {"start_col", span.start_col},
                                {"end_line", span.end_line},     {"end_col", span.end_col},
                                {"byte_start", span.byte_start}, {"byte_end", span.byte_end}};
}

}  // namespace

Diagnostic make_syntax_diagnostic(const std::string& query,
                                  const std::string& parser_message,
                                  size_t error_byte,
                                  const std::vector<std::string>& expected) {
  Diagnostic d;
  d.severity = DiagnosticSeverity::Error;
  d.message = parser_message;
  d.expected = expected;
  d.span = span_from_bytes(query, error_byte, error_byte + 1);
  set_syntax_code_help(d, query, error_byte);
  d.snippet = render_code_frame(query, d.span);
  return d;
}

Diagnostic make_semantic_diagnostic(const std::string& query,
                                    const std::string& message,
                                    size_t error_byte) {
  Diagnostic d;
  d.severity = DiagnosticSeverity::Error;
  d.message = message;
  d.span = span_from_bytes(query, error_byte, identifier_end(query, error_byte));
  set_semantic_code_help(d);
  d.snippet = render_code_frame(query, d.span);
  return d;
}

Diagnostic make_config_diagnostic(const std::string& message) {
  Diagnostic d;
  d.severity = DiagnosticSeverity::Error;
  d.code = "OVQ-CFG-0001";
  d.message = message;
  d.help = "Use one of: " + util::join(supported_dialects(), ", ") + ".";
  return d;
}

Diagnostic diagnose_failure(const std::string& query, const Error& error) {
  if (const auto* syntax = dynamic_cast<const SyntaxError*>(&error)) {
    return make_syntax_diagnostic(query, syntax->what(), syntax->position(), syntax->expected());
  }
  if (dynamic_cast<const UnsupportedDialectError*>(&error) != nullptr) {
    return make_config_diagnostic(error.what());
  }
  return make_semantic_diagnostic(query, error.what(), error.position());
}

std::string render_diagnostics_text(const std::vector<Diagnostic>& diagnostics) {
  std::ostringstream out;
  for (size_t i = 0; i < diagnostics.size(); ++i) {
    const auto& d = diagnostics[i];
    out << severity_name(d.severity) << "[" << d.code << "]: " << d.message << "\n";
    if (!d.snippet.empty()) out << d.snippet << "\n";
    if (!d.expected.empty()) out << "expected: " << util::join(d.expected, ", ") << "\n";
    for (const auto& related : d.related) {
      out << "note: " << related.message
          << " (line " << related.span.start_line << ", col " << related.span.start_col << ")\n";
    }
    out << "help: " << d.help << "\n";
    if (i + 1 < diagnostics.size()) out << "\n";
  }
  return out.str();
}

std::string render_diagnostics_json(const std::vector<Diagnostic>& diagnostics) {
  nlohmann::ordered_json out = nlohmann::ordered_json::array();
  for (const auto& d : diagnostics) {
    nlohmann::ordered_json item = nlohmann::ordered_json::object();
    item["severity"] = severity_name(d.severity);
    item["code"] = d.code;
    item["message"] = d.message;
    item["help"] = d.help;
    item["expected"] = d.expected;
    item["span"] = span_to_json(d.span);
    item["snippet"] = d.snippet;
    nlohmann::ordered_json related = nlohmann::ordered_json::array();
    for (const auto& note : d.related) {
      related.push_back(nlohmann::ordered_json{{"message", note.message}, {"span", span_to_json(note.span)}});
    }
    item["related"] = std::move(related);
    out.push_back(std::move(item));
  }
  // WHY: queries are arbitrary bytes; invalid UTF-8 in a message must not abort the dump.
  return out.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

bool has_error_diagnostics(const std::vector<Diagnostic>& diagnostics) {
  for (const auto& d : diagnostics) {
    if (d.severity == DiagnosticSeverity::Error) return true;
  }
  return false;
}

std::vector<Diagnostic> lint_query(const std::string& query, const std::string& dialect_name) {
  std::vector<Diagnostic> out;
  std::unique_ptr<Dialect> dialect;
  try {
    dialect = make_dialect(dialect_name);
    compile_query(query, *dialect);
  } catch (const Error& error) {
    out.push_back(diagnose_failure(query, error));
  }
  return out;
}

}  // namespace ovsql
