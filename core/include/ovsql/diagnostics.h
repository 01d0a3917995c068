#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ovsql {

class Error;

/// Classifies diagnostic urgency for lint output and compile failures.
/// MUST remain stable for text/JSON outputs and tests.
enum class DiagnosticSeverity {
  Error,
  Warning,
  Note,
};

/// Describes a source span in both byte offsets and line/column coordinates.
/// MUST use 1-based line/column values; byte offsets are 0-based.
struct DiagnosticSpan {
  size_t start_line = 1;
  size_t start_col = 1;
  size_t end_line = 1;
  size_t end_col = 1;
  size_t byte_start = 0;
  size_t byte_end = 0;
};

/// Holds an additional location tied to the primary diagnostic.
struct DiagnosticRelated {
  std::string message;
  DiagnosticSpan span;
};

/// Structured query diagnostic for syntax and binding validation.
/// MUST include a stable code and actionable help.
struct Diagnostic {
  DiagnosticSeverity severity = DiagnosticSeverity::Error;
  std::string code;
  std::string message;
  std::string help;
  std::vector<std::string> expected;
  DiagnosticSpan span;
  std::string snippet;
  std::vector<DiagnosticRelated> related;
};

/// Builds a syntax diagnostic anchored at a byte position.
/// MUST return deterministic code/help mappings for known parser errors.
Diagnostic make_syntax_diagnostic(const std::string& query,
                                  const std::string& parser_message,
                                  size_t error_byte,
                                  const std::vector<std::string>& expected = {});
/// Builds a diagnostic for binding and filter applicability errors.
Diagnostic make_semantic_diagnostic(const std::string& query,
                                    const std::string& message,
                                    size_t error_byte);
/// Builds a configuration diagnostic (unknown dialect and similar); not tied to the query text.
Diagnostic make_config_diagnostic(const std::string& message);

/// Maps a compiler exception to a diagnostic.
Diagnostic diagnose_failure(const std::string& query, const Error& error);

/// Renders diagnostics in a human-readable multi-block text format.
/// MUST be deterministic for stable golden tests.
std::string render_diagnostics_text(const std::vector<Diagnostic>& diagnostics);
/// Renders diagnostics as a JSON array with stable key order.
std::string render_diagnostics_json(const std::vector<Diagnostic>& diagnostics);
bool has_error_diagnostics(const std::vector<Diagnostic>& diagnostics);

/// Parses and compiles without emitting SQL and returns diagnostics.
/// MUST return an empty list for valid queries.
std::vector<Diagnostic> lint_query(const std::string& query, const std::string& dialect_name);

}  // namespace ovsql
