#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../query_parser.h"
#include "lexer.h"

namespace ovsql {

/// Recursive-descent parser over the lexer's token stream.
/// MUST stop at the first error and MUST keep the first error's location.
/// Every parse_* method returns false after recording an error.
class Parser {
 public:
  explicit Parser(const std::string& input);
  ParseResult parse();

 private:
  bool parse_settings(Request& request);
  bool parse_statement(Statement& stmt, bool in_union);
  bool parse_entity_query(Statement& stmt);
  bool parse_traverse(Statement& stmt);
  bool parse_union(Statement& stmt);
  bool parse_emit(Statement& stmt);
  /// Parses `.name` into `input`; the caller has checked for the dot.
  bool parse_input(std::optional<std::string>& input, Span& span);
  bool parse_assign(Statement& stmt);
  bool parse_set_name(std::string& out);
  bool parse_selector(Selector& selector);
  bool parse_selector_text(std::string& out, bool& is_number, const char* what);
  bool parse_filter(Filter& filter);
  bool parse_bbox(Filter& filter);
  bool parse_poly(Filter& filter);
  bool parse_id_list(Filter& filter);
  bool parse_number(NumberLiteral& out, const char* what);
  bool parse_id(int64_t& out);

  void advance();
  bool consume(TokenType type, const std::string& message, const std::string& expected);
  /// Records an error at the current token; lexical errors take precedence.
  bool set_error(const std::string& message, std::vector<std::string> expected = {});
  bool set_error_at(size_t position, const std::string& message,
                    std::vector<std::string> expected = {});

  static bool is_kind_token(TokenType type);
  static bool is_traverse_token(TokenType type);

  const std::string& input_;
  Lexer lexer_;
  Token current_;
  size_t last_end_ = 0;
  std::optional<ParseError> error_;
};

}  // namespace ovsql
