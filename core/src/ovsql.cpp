#include "ovsql/ovsql.h"

#include "compiler/compiler.h"
#include "lang/ast_json.h"
#include "lang/query_parser.h"

namespace ovsql {

namespace {

Request parse_or_throw(const std::string& query) {
  ParseResult parsed = parse_request(query);
  if (!parsed.request.has_value()) {
    const ParseError& error = *parsed.error;
    throw SyntaxError(error.message, error.position, error.line, error.column, error.expected);
  }
  return std::move(*parsed.request);
}

}  // namespace

std::string SqlScript::to_string() const {
  std::string out;
  for (size_t i = 0; i < statements.size(); ++i) {
    if (i != 0) out += "\n\n";
    out += statements[i];
  }
  if (!out.empty()) out += "\n";
  return out;
}

SqlScript compile_query(const std::string& query, const Dialect& dialect,
                        const CompileOptions& options) {
  const Request request = parse_or_throw(query);
  Compiler compiler(dialect, options);
  return compiler.compile(request);
}

std::string translate_query(const std::string& query, const std::string& dialect_name,
                            const CompileOptions& options) {
  std::unique_ptr<Dialect> dialect = make_dialect(dialect_name);
  return compile_query(query, *dialect, options).to_string();
}

std::string dump_query_ast(const std::string& query) {
  const nlohmann::ordered_json ast = request_to_json(parse_or_throw(query));
  return ast.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace) + "\n";
}

}  // namespace ovsql
