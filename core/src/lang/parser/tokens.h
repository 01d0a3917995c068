#pragma once

#include <cstddef>
#include <string>

namespace ovsql {

/// Enumerates lexical tokens produced by the query lexer.
/// MUST remain consistent with parser expectations and keyword mapping.
/// Keywords are case-sensitive and still usable wherever an unquoted word is accepted.
enum class TokenType {
  Word,
  String,
  Integer,
  Float,
  LBracket,
  RBracket,
  LParen,
  RParen,
  Comma,
  Colon,
  Semicolon,
  Dot,
  Equal,
  NotEqual,
  Tilde,
  NotTilde,
  Bang,
  Arrow,
  Less,
  LessLess,
  Greater,
  GreaterGreater,
  End,
  Invalid,
  KeywordOut,
  KeywordTimeout,
  KeywordNode,
  KeywordWay,
  KeywordRelation,
  KeywordRel,
  KeywordArea,
  KeywordNwr,
  KeywordPoly,
  KeywordId,
  KeywordAround,
  KeywordIds,
  KeywordSkel,
  KeywordBody,
  KeywordTags,
  KeywordMeta,
  KeywordGeom,
  KeywordCenter,
  KeywordBb
};

/// Represents a single token with source text and position metadata.
/// MUST track byte positions to support precise error reporting.
/// `length` is the number of source bytes covered, which differs from `text` for strings.
struct Token {
  TokenType type;
  std::string text;
  size_t pos = 0;
  size_t length = 0;
};

/// Returns true for tokens the grammar accepts as an unquoted word.
inline bool is_word_token(TokenType type) {
  return type == TokenType::Word || type >= TokenType::KeywordOut;
}

}  // namespace ovsql
