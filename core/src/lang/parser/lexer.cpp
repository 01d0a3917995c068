#include "lexer.h"

#include <cctype>
#include <cstdio>

namespace ovsql {

namespace {

// Byte length of the well-formed UTF-8 sequence at `pos`, or 0 when the bytes there are not one.
size_t utf8_sequence_length(const std::string& s, size_t pos) {
  const unsigned char lead = static_cast<unsigned char>(s[pos]);
  size_t length = 0;
  if (lead < 0x80) return 1;
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
  } else {
    return 0;
  }
  if (pos + length > s.size()) return 0;
  for (size_t i = 1; i < length; ++i) {
    if ((static_cast<unsigned char>(s[pos + i]) & 0xC0) != 0x80) return 0;
  }
  return length;
}

// Names the offending input in an error message: the whole character, or the raw byte in hex.
std::string describe_unexpected(const std::string& s, size_t pos) {
  const size_t length = utf8_sequence_length(s, pos);
  const unsigned char byte = static_cast<unsigned char>(s[pos]);
  if (length == 0 || (length == 1 && !std::isprint(byte))) {
    char hex[8];
    std::snprintf(hex, sizeof(hex), "0x%02X", static_cast<unsigned>(byte));
    return std::string("Unexpected byte ") + hex;
  }
  return "Unexpected character '" + s.substr(pos, length) + "'";
}

}  // namespace

Lexer::Lexer(const std::string& input) : input_(input) {}

Token Lexer::next() {
  skip_ws_and_comments();
  if (has_error()) {
    return make_token(TokenType::Invalid, error_message_, error_position_);
  }
  if (pos_ >= input_.size()) {
    return make_token(TokenType::End, "", pos_);
  }

  size_t start = pos_;
  char c = input_[pos_];
  switch (c) {
    case '[':
      advance_char();
      return make_token(TokenType::LBracket, "[", start);
    case ']':
      advance_char();
      return make_token(TokenType::RBracket, "]", start);
    case '(':
      advance_char();
      return make_token(TokenType::LParen, "(", start);
    case ')':
      advance_char();
      return make_token(TokenType::RParen, ")", start);
    case ',':
      advance_char();
      return make_token(TokenType::Comma, ",", start);
    case ':':
      advance_char();
      return make_token(TokenType::Colon, ":", start);
    case ';':
      advance_char();
      return make_token(TokenType::Semicolon, ";", start);
    case '.':
      advance_char();
      return make_token(TokenType::Dot, ".", start);
    case '=':
      advance_char();
      return make_token(TokenType::Equal, "=", start);
    case '~':
      advance_char();
      return make_token(TokenType::Tilde, "~", start);
    default:
      break;
  }
  if (c == '!') {
    advance_char();
    if (at(0, '=')) {
      advance_char();
      return make_token(TokenType::NotEqual, "!=", start);
    }
    if (at(0, '~')) {
      advance_char();
      return make_token(TokenType::NotTilde, "!~", start);
    }
    return make_token(TokenType::Bang, "!", start);
  }
  if (c == '<') {
    advance_char();
    if (at(0, '<')) {
      advance_char();
      return make_token(TokenType::LessLess, "<<", start);
    }
    return make_token(TokenType::Less, "<", start);
  }
  if (c == '>') {
    advance_char();
    if (at(0, '>')) {
      advance_char();
      return make_token(TokenType::GreaterGreater, ">>", start);
    }
    return make_token(TokenType::Greater, ">", start);
  }
  if (c == '-') {
    if (at(1, '>')) {
      advance_char();
      advance_char();
      return make_token(TokenType::Arrow, "->", start);
    }
    if (pos_ + 1 < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_ + 1]))) {
      return lex_number();
    }
  }
  if (c == '\'' || c == '"') {
    return lex_string();
  }
  if (std::isdigit(static_cast<unsigned char>(c))) {
    return lex_number();
  }
  if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
    return lex_word(start);
  }

  set_error(describe_unexpected(input_, start), start);
  return make_token(TokenType::Invalid, error_message_, error_position_);
}

Token Lexer::lex_string() {
  size_t start = pos_;
  char quote = advance_char();
  std::string out;
  while (pos_ < input_.size()) {
    char c = advance_char();
    if (c == quote) {
      Token token = make_token(TokenType::String, out, start);
      token.length = pos_ - start;
      return token;
    }
    if (c == '\\' && pos_ < input_.size()) {
      char escaped = input_[pos_];
      if (escaped == quote || escaped == '\\') {
        out.push_back(advance_char());
        continue;
      }
      // WHY: regex patterns such as "\d" must reach SQL unchanged.
      out.push_back(c);
      continue;
    }
    out.push_back(c);
  }
  set_error("Unterminated string literal", start);
  return make_token(TokenType::Invalid, error_message_, error_position_);
}

Token Lexer::lex_word(size_t start) {
  while (pos_ < input_.size() && is_word_char(input_[pos_])) {
    if (input_[pos_] == '-' && at(1, '>')) break;
    advance_char();
  }
  std::string word = input_.substr(start, pos_ - start);
  return make_token(keyword_type(word), word, start);
}

Token Lexer::lex_number() {
  size_t start = pos_;
  bool negative = false;
  if (input_[pos_] == '-') {
    negative = true;
    advance_char();
  }
  while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) {
    advance_char();
  }
  if (at(0, '.') && pos_ + 1 < input_.size() &&
      std::isdigit(static_cast<unsigned char>(input_[pos_ + 1]))) {
    advance_char();
    while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) {
      advance_char();
    }
    return make_token(TokenType::Float, input_.substr(start, pos_ - start), start);
  }
  if (!negative && pos_ < input_.size() && is_word_char(input_[pos_]) &&
      !(input_[pos_] == '-' && at(1, '>'))) {
    // WHY: unquoted values such as `2nd` or `2020-01` are words, not numbers.
    return lex_word(start);
  }
  return make_token(TokenType::Integer, input_.substr(start, pos_ - start), start);
}

void Lexer::skip_ws_and_comments() {
  while (true) {
    size_t before = pos_;
    while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
      advance_char();
    }
    if (at(0, '/') && at(1, '/')) {
      while (pos_ < input_.size() && input_[pos_] != '\n') {
        advance_char();
      }
      continue;
    }
    if (at(0, '/') && at(1, '*')) {
      size_t start = pos_;
      advance_char();
      advance_char();
      bool closed = false;
      while (pos_ < input_.size()) {
        if (at(0, '*') && at(1, '/')) {
          advance_char();
          advance_char();
          closed = true;
          break;
        }
        advance_char();
      }
      if (!closed) {
        set_error("Unterminated block comment", start);
        return;
      }
      continue;
    }
    if (pos_ == before) {
      break;
    }
  }
}

char Lexer::advance_char() { return input_[pos_++]; }

bool Lexer::has_error() const { return has_error_; }

Token Lexer::make_token(TokenType type, const std::string& text, size_t start_pos) const {
  size_t length = pos_ > start_pos ? pos_ - start_pos : 0;
  if (type == TokenType::Invalid || type == TokenType::End) length = 0;
  return Token{type, text, start_pos, length};
}

void Lexer::set_error(const std::string& message, size_t position) {
  if (has_error_) return;
  has_error_ = true;
  error_message_ = message;
  error_position_ = position;
}

bool Lexer::at(size_t offset, char c) const {
  return pos_ + offset < input_.size() && input_[pos_ + offset] == c;
}

bool Lexer::is_word_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

TokenType Lexer::keyword_type(const std::string& word) {
  if (word == "out") return TokenType::KeywordOut;
  if (word == "timeout") return TokenType::KeywordTimeout;
  if (word == "node") return TokenType::KeywordNode;
  if (word == "way") return TokenType::KeywordWay;
  if (word == "relation") return TokenType::KeywordRelation;
  if (word == "rel") return TokenType::KeywordRel;
  if (word == "area") return TokenType::KeywordArea;
  if (word == "nwr") return TokenType::KeywordNwr;
  if (word == "poly") return TokenType::KeywordPoly;
  if (word == "id") return TokenType::KeywordId;
  if (word == "around") return TokenType::KeywordAround;
  if (word == "ids") return TokenType::KeywordIds;
  if (word == "skel") return TokenType::KeywordSkel;
  if (word == "body") return TokenType::KeywordBody;
  if (word == "tags") return TokenType::KeywordTags;
  if (word == "meta") return TokenType::KeywordMeta;
  if (word == "geom") return TokenType::KeywordGeom;
  if (word == "center") return TokenType::KeywordCenter;
  if (word == "bb") return TokenType::KeywordBb;
  return TokenType::Word;
}

}  // namespace ovsql
