#include "parser_internal.h"

#include <cctype>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace ovsql {

namespace {

// Same shape as the lexer's numbers: -?digits(.digits)?
bool is_number_text(const std::string& text) {
  size_t i = 0;
  if (i < text.size() && text[i] == '-') ++i;
  size_t digits = 0;
  while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
    ++i;
    ++digits;
  }
  if (digits == 0) return false;
  if (i == text.size()) return true;
  if (text[i] != '.') return false;
  ++i;
  size_t fraction = 0;
  while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
    ++i;
    ++fraction;
  }
  return fraction > 0 && i == text.size();
}

}  // namespace

/// Parses `[key]`, `[!key]`, `[key op value]` and `[key ~ value, i]`.
/// MUST keep the value's lexical form and whether it was written as a number.
bool Parser::parse_selector(Selector& selector) {
  selector.span.start = current_.pos;
  advance();
  if (current_.type == TokenType::Bang) {
    selector.negated = true;
    advance();
  }
  bool key_is_number = false;
  if (!parse_selector_text(selector.key, key_is_number, "Expected tag key in selector")) {
    return false;
  }
  switch (current_.type) {
    case TokenType::Equal:
      selector.op = Selector::Op::Equal;
      break;
    case TokenType::NotEqual:
      selector.op = Selector::Op::NotEqual;
      break;
    case TokenType::Tilde:
      selector.op = Selector::Op::Regex;
      break;
    case TokenType::NotTilde:
      selector.op = Selector::Op::NotRegex;
      break;
    case TokenType::RBracket:
      selector.op = Selector::Op::Exists;
      advance();
      selector.span.end = last_end_;
      return true;
    default:
      return set_error("Expected ] or comparison operator in selector",
                       {"']'", "'='", "'!='", "'~'", "'!~'"});
  }
  advance();
  if (!parse_selector_text(selector.value, selector.value_is_number,
                           "Expected value after selector operator")) {
    return false;
  }
  if (current_.type == TokenType::Comma) {
    if (selector.op != Selector::Op::Regex && selector.op != Selector::Op::NotRegex) {
      return set_error("Case-insensitive flag is only valid after ~ or !~", {"']'"});
    }
    advance();
    if (current_.type != TokenType::Word || current_.text != "i") {
      return set_error("Expected i after , in selector", {"'i'"});
    }
    selector.case_insensitive = true;
    advance();
  }
  if (!consume(TokenType::RBracket, "Expected ] to close selector", "']'")) return false;
  selector.span.end = last_end_;
  return true;
}

bool Parser::parse_selector_text(std::string& out, bool& is_number, const char* what) {
  is_number = false;
  if (current_.type == TokenType::String || is_word_token(current_.type)) {
    out = current_.text;
    advance();
    return true;
  }
  if (current_.type == TokenType::Integer || current_.type == TokenType::Float) {
    out = current_.text;
    is_number = true;
    advance();
    return true;
  }
  return set_error(what, {"string", "word", "number"});
}

/// Parses one parenthesized filter.
/// `(N)` and `(id:N,...)` share the Ids form; a lone number followed by `,` starts a bbox.
bool Parser::parse_filter(Filter& filter) {
  filter.span.start = current_.pos;
  advance();
  bool ok = false;
  switch (current_.type) {
    case TokenType::Integer:
    case TokenType::Float: {
      Token first = current_;
      advance();
      if (first.type == TokenType::Integer && current_.type == TokenType::RParen) {
        filter.kind = Filter::Kind::Ids;
        int64_t id = 0;
        std::istringstream in(first.text);
        if (first.text[0] == '-' || !(in >> id) || !in.eof()) {
          return set_error_at(first.pos, "Expected non-negative id", {"integer"});
        }
        filter.ids.push_back(id);
        ok = true;
        break;
      }
      filter.kind = Filter::Kind::Bbox;
      filter.south = NumberLiteral{first.text, std::strtod(first.text.c_str(), nullptr)};
      ok = parse_bbox(filter);
      break;
    }
    case TokenType::KeywordPoly:
      advance();
      ok = parse_poly(filter);
      break;
    case TokenType::KeywordId:
      advance();
      ok = parse_id_list(filter);
      break;
    case TokenType::KeywordArea: {
      filter.kind = Filter::Kind::Area;
      advance();
      if (current_.type == TokenType::Dot) {
        advance();
        if (!parse_set_name(filter.set)) return false;
      }
      ok = true;
      break;
    }
    case TokenType::KeywordAround: {
      filter.kind = Filter::Kind::Around;
      advance();
      if (current_.type == TokenType::Dot) {
        advance();
        if (!parse_set_name(filter.set)) return false;
      }
      if (!consume(TokenType::Colon, "Expected : before around radius", "':'")) return false;
      if (current_.type == TokenType::Integer || current_.type == TokenType::Float) {
        if (current_.text[0] == '-') return set_error("Around radius must not be negative");
      }
      ok = parse_number(filter.radius, "Expected radius in around filter");
      break;
    }
    default:
      return set_error("Expected filter", {"number", "'poly'", "'id'", "'area'", "'around'"});
  }
  if (!ok) return false;
  if (!consume(TokenType::RParen, "Expected ) to close filter", "')'")) return false;
  filter.span.end = last_end_;
  return true;
}

bool Parser::parse_bbox(Filter& filter) {
  if (!consume(TokenType::Comma, "Expected , in bounding box", "','")) return false;
  if (!parse_number(filter.west, "Expected west bound in bounding box")) return false;
  if (!consume(TokenType::Comma, "Expected , in bounding box", "','")) return false;
  if (!parse_number(filter.north, "Expected north bound in bounding box")) return false;
  if (!consume(TokenType::Comma, "Expected , in bounding box", "','")) return false;
  return parse_number(filter.east, "Expected east bound in bounding box");
}

/// Parses `poly:"lat lon lat lon ..."` into (lat, lon) pairs.
/// MUST report malformed coordinate lists at the string itself.
bool Parser::parse_poly(Filter& filter) {
  filter.kind = Filter::Kind::Poly;
  if (!consume(TokenType::Colon, "Expected : after poly", "':'")) return false;
  if (current_.type != TokenType::String) {
    return set_error("Expected quoted coordinate list after poly:", {"string"});
  }
  const Token coords = current_;
  std::istringstream in(coords.text);
  std::vector<std::string> parts;
  std::string part;
  while (in >> part) {
    if (!is_number_text(part)) {
      return set_error_at(coords.pos, "Invalid coordinate '" + part + "' in polygon");
    }
    parts.push_back(part);
  }
  if (parts.size() % 2 != 0) {
    return set_error_at(coords.pos, "Polygon coordinates must come in lat lon pairs");
  }
  if (parts.size() < 6) {
    return set_error_at(coords.pos, "Polygon needs at least 3 points");
  }
  for (size_t i = 0; i < parts.size(); i += 2) {
    LatLon point;
    point.lat = NumberLiteral{parts[i], std::strtod(parts[i].c_str(), nullptr)};
    point.lon = NumberLiteral{parts[i + 1], std::strtod(parts[i + 1].c_str(), nullptr)};
    filter.poly.push_back(std::move(point));
  }
  advance();
  return true;
}

bool Parser::parse_id_list(Filter& filter) {
  filter.kind = Filter::Kind::Ids;
  if (!consume(TokenType::Colon, "Expected : after id", "':'")) return false;
  while (true) {
    int64_t id = 0;
    if (!parse_id(id)) return false;
    filter.ids.push_back(id);
    if (current_.type != TokenType::Comma) return true;
    advance();
  }
}

bool Parser::parse_number(NumberLiteral& out, const char* what) {
  if (current_.type != TokenType::Integer && current_.type != TokenType::Float) {
    return set_error(what, {"number"});
  }
  out.text = current_.text;
  out.value = std::strtod(current_.text.c_str(), nullptr);
  advance();
  return true;
}

/// Parses an unsigned 64-bit integer token.
/// MUST reject negative and out-of-range values instead of wrapping.
bool Parser::parse_id(int64_t& out) {
  if (current_.type != TokenType::Integer || current_.text[0] == '-') {
    return set_error("Expected non-negative integer", {"integer"});
  }
  std::istringstream in(current_.text);
  if (!(in >> out) || !in.eof()) {
    return set_error("Integer out of range", {"integer"});
  }
  advance();
  return true;
}

}  // namespace ovsql
