#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ovsql/dialect.h"
#include "ovsql/errors.h"

namespace ovsql {

/// Compiler settings that do not come from the query text.
struct CompileOptions {
  /// SRID of the geometry stored in the backend views; query literals are WGS84.
  int srid = 4326;
};

/// Output of one compilation: SQL statements in execution order.
/// MUST contain one terminal SELECT per `out` statement of the query.
struct SqlScript {
  std::vector<std::string> statements;
  std::optional<int64_t> timeout;
  std::optional<std::string> output_format;

  /// Joins statements with blank lines, terminated by a newline.
  std::string to_string() const;
};

/// Parses and lowers a query for `dialect`.
/// MUST be atomic: throws SyntaxError, UnboundNameError or FilterApplicabilityError
/// without returning any partial SQL.
SqlScript compile_query(const std::string& query,
                        const Dialect& dialect,
                        const CompileOptions& options = CompileOptions{});

/// Convenience entry point selecting the dialect by name.
/// Throws UnsupportedDialectError before touching the query.
std::string translate_query(const std::string& query,
                            const std::string& dialect_name,
                            const CompileOptions& options = CompileOptions{});

/// Parses the query and returns its AST as pretty-printed JSON.
/// Throws SyntaxError on invalid input.
std::string dump_query_ast(const std::string& query);

}  // namespace ovsql
