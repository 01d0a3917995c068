#pragma once

#include <string>

#include "tokens.h"

namespace ovsql {

/// Tokenizes query input into a stream for the parser.
/// MUST be deterministic and MUST not skip meaningful characters.
/// Inputs are query strings; outputs are tokens with position metadata.
class Lexer {
 public:
  /// Constructs a lexer over a stable input string reference.
  /// MUST NOT outlive the referenced input buffer.
  explicit Lexer(const std::string& input);
  /// Produces the next token from the input stream.
  /// MUST advance the cursor and MUST return End at input exhaustion.
  Token next();

 private:
  /// Lexes a single- or double-quoted string.
  /// MUST decode only the matching quote and backslash escapes; other escapes stay verbatim.
  Token lex_string();
  /// Lexes an unquoted word and maps exact keyword spellings.
  Token lex_word(size_t start);
  /// Lexes an integer or float; digits running into word characters become a word.
  Token lex_number();
  /// Skips whitespace, `// line` and `/* block */` comments.
  /// MUST record a sticky error for an unterminated block comment.
  void skip_ws_and_comments();
  char advance_char();
  bool has_error() const;
  Token make_token(TokenType type, const std::string& text, size_t start_pos) const;
  /// Records the first lexical error for deferred reporting through tokens.
  void set_error(const std::string& message, size_t position);
  bool at(size_t offset, char c) const;
  static bool is_word_char(char c);
  static TokenType keyword_type(const std::string& word);

  const std::string& input_;
  size_t pos_ = 0;
  bool has_error_ = false;
  std::string error_message_;
  size_t error_position_ = 0;
};

}  // namespace ovsql
