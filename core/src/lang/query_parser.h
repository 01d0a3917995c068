#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "ast.h"

namespace ovsql {

/// Parser failure with the location and the token kinds that would have been accepted.
struct ParseError {
  std::string message;
  size_t position = 0;
  size_t line = 1;
  size_t column = 1;
  std::vector<std::string> expected;
};

struct ParseResult {
  std::optional<Request> request;
  std::optional<ParseError> error;
};

/// Parses a full request. Exactly one of `request` and `error` is set.
ParseResult parse_request(const std::string& input);

/// Renders a request as canonical query text that parses back to an equal AST.
std::string to_query_text(const Request& request);
std::string to_query_text(const Statement& statement);

}  // namespace ovsql
