#include "parser_internal.h"

#include <cctype>
#include <utility>

#include "../../util/string_util.h"

namespace ovsql {

namespace {

// Largest timeout whose millisecond value fits a 32-bit backend setting.
constexpr int64_t kMaxTimeoutSeconds = 2147483;

const std::vector<std::string>& statement_starts() {
  static const std::vector<std::string> kStarts = {
      "'node'", "'way'", "'relation'", "'rel'", "'area'", "'nwr'", "'('", "'.'",
      "'out'",  "'<'",   "'<<'",       "'>'",   "'>>'"};
  return kStarts;
}

EntityKind kind_from_token(TokenType type) {
  switch (type) {
    case TokenType::KeywordNode:
      return EntityKind::Node;
    case TokenType::KeywordWay:
      return EntityKind::Way;
    case TokenType::KeywordRelation:
    case TokenType::KeywordRel:
      return EntityKind::Relation;
    case TokenType::KeywordArea:
      return EntityKind::Area;
    default:
      return EntityKind::Any;
  }
}

}  // namespace

Parser::Parser(const std::string& input) : input_(input), lexer_(input) {
  current_ = lexer_.next();
}

ParseResult Parser::parse() {
  Request request;
  request.span.start = current_.pos;
  if (current_.type == TokenType::LBracket) {
    if (!parse_settings(request)) return ParseResult{std::nullopt, error_};
  }
  while (current_.type != TokenType::End) {
    Statement stmt;
    if (!parse_statement(stmt, false)) return ParseResult{std::nullopt, error_};
    if (!consume(TokenType::Semicolon, "Expected ; after statement", "';'")) {
      return ParseResult{std::nullopt, error_};
    }
    request.statements.push_back(std::move(stmt));
  }
  if (request.statements.empty()) {
    set_error("Expected at least one statement", statement_starts());
    return ParseResult{std::nullopt, error_};
  }
  request.span.end = last_end_;
  return ParseResult{std::move(request), std::nullopt};
}

/// Parses `[out:fmt][timeout:N];`.
/// MUST reject repeated settings so the canonical text stays unambiguous.
bool Parser::parse_settings(Request& request) {
  while (current_.type == TokenType::LBracket) {
    advance();
    if (current_.type == TokenType::KeywordOut) {
      if (request.output_format.has_value()) return set_error("Duplicate setting 'out'");
      advance();
      if (!consume(TokenType::Colon, "Expected : after out", "':'")) return false;
      if (!is_word_token(current_.type)) {
        return set_error("Expected output format name", {"word"});
      }
      request.output_format = current_.text;
      advance();
    } else if (current_.type == TokenType::KeywordTimeout) {
      if (request.timeout.has_value()) return set_error("Duplicate setting 'timeout'");
      advance();
      if (!consume(TokenType::Colon, "Expected : after timeout", "':'")) return false;
      const size_t seconds_pos = current_.pos;
      int64_t seconds = 0;
      if (!parse_id(seconds)) return false;
      if (seconds > kMaxTimeoutSeconds) {
        return set_error_at(seconds_pos,
                            "Timeout out of range (at most " + std::to_string(kMaxTimeoutSeconds) +
                                " seconds)",
                            {"integer"});
      }
      request.timeout = seconds;
    } else {
      return set_error("Unknown setting", {"'out'", "'timeout'"});
    }
    if (!consume(TokenType::RBracket, "Expected ] to close setting", "']'")) return false;
  }
  return consume(TokenType::Semicolon, "Expected ; after settings", "';'");
}

bool Parser::parse_statement(Statement& stmt, bool in_union) {
  stmt.span.start = current_.pos;
  bool ok = false;
  if (is_kind_token(current_.type)) {
    ok = parse_entity_query(stmt);
  } else if (current_.type == TokenType::LParen) {
    ok = parse_union(stmt);
  } else if (current_.type == TokenType::Dot || current_.type == TokenType::KeywordOut ||
             is_traverse_token(current_.type)) {
    if (current_.type == TokenType::Dot) {
      if (!parse_input(stmt.input, stmt.input_span)) return false;
    }
    if (current_.type == TokenType::KeywordOut) {
      if (in_union) return set_error("out is not allowed inside a union");
      ok = parse_emit(stmt);
    } else if (is_traverse_token(current_.type)) {
      ok = parse_traverse(stmt);
    } else {
      return set_error("Expected out or a recursion operator after set name",
                       {"'out'", "'<'", "'<<'", "'>'", "'>>'"});
    }
  } else {
    return set_error("Expected statement", statement_starts());
  }
  if (!ok) return false;
  stmt.span.end = last_end_;
  return true;
}

bool Parser::parse_entity_query(Statement& stmt) {
  stmt.kind = Statement::Kind::EntityQuery;
  stmt.entity = kind_from_token(current_.type);
  advance();
  if (current_.type == TokenType::Dot) {
    if (!parse_input(stmt.input, stmt.input_span)) return false;
  }
  while (current_.type == TokenType::LBracket) {
    Selector selector;
    if (!parse_selector(selector)) return false;
    stmt.selectors.push_back(std::move(selector));
  }
  while (current_.type == TokenType::LParen) {
    Filter filter;
    if (!parse_filter(filter)) return false;
    stmt.filters.push_back(std::move(filter));
  }
  return parse_assign(stmt);
}

bool Parser::parse_traverse(Statement& stmt) {
  stmt.kind = Statement::Kind::Traverse;
  switch (current_.type) {
    case TokenType::Less:
      stmt.direction = Statement::Direction::ParentOne;
      break;
    case TokenType::LessLess:
      stmt.direction = Statement::Direction::ParentAll;
      break;
    case TokenType::Greater:
      stmt.direction = Statement::Direction::ChildOne;
      break;
    default:
      stmt.direction = Statement::Direction::ChildAll;
      break;
  }
  advance();
  return parse_assign(stmt);
}

/// Parses `( member; member; ... )` with an optional assignment.
/// MUST reject an empty union and `out` inside members.
bool Parser::parse_union(Statement& stmt) {
  stmt.kind = Statement::Kind::Union;
  advance();
  if (current_.type == TokenType::RParen) {
    return set_error("Union needs at least one statement", statement_starts());
  }
  while (current_.type != TokenType::RParen) {
    if (current_.type == TokenType::End) {
      return set_error("Expected ) to close union", {"')'"});
    }
    Statement member;
    if (!parse_statement(member, true)) return false;
    if (!consume(TokenType::Semicolon, "Expected ; after union member", "';'")) return false;
    stmt.members.push_back(std::move(member));
  }
  advance();
  return parse_assign(stmt);
}

bool Parser::parse_emit(Statement& stmt) {
  stmt.kind = Statement::Kind::Emit;
  advance();
  bool has_geometry = false;
  bool has_detail = false;
  while (true) {
    Statement::Geometry geometry = Statement::Geometry::None;
    std::optional<Statement::Detail> detail;
    switch (current_.type) {
      case TokenType::KeywordGeom:
        geometry = Statement::Geometry::Full;
        break;
      case TokenType::KeywordCenter:
        geometry = Statement::Geometry::Center;
        break;
      case TokenType::KeywordBb:
        geometry = Statement::Geometry::Bbox;
        break;
      case TokenType::KeywordIds:
        detail = Statement::Detail::Ids;
        break;
      case TokenType::KeywordSkel:
        detail = Statement::Detail::Skel;
        break;
      case TokenType::KeywordBody:
        detail = Statement::Detail::Body;
        break;
      case TokenType::KeywordTags:
        detail = Statement::Detail::Tags;
        break;
      case TokenType::KeywordMeta:
        detail = Statement::Detail::Meta;
        break;
      default:
        return true;
    }
    if (detail.has_value()) {
      if (has_detail) return set_error("Duplicate detail modifier in out");
      has_detail = true;
      stmt.detail = *detail;
    } else {
      if (has_geometry) return set_error("Duplicate geometry modifier in out");
      has_geometry = true;
      stmt.geometry = geometry;
    }
    advance();
  }
}

bool Parser::parse_input(std::optional<std::string>& input, Span& span) {
  span.start = current_.pos;
  advance();
  std::string name;
  if (!parse_set_name(name)) return false;
  input = std::move(name);
  span.end = last_end_;
  return true;
}

bool Parser::parse_assign(Statement& stmt) {
  if (current_.type != TokenType::Arrow) return true;
  advance();
  if (!consume(TokenType::Dot, "Expected . after ->", "'.'")) return false;
  std::string name;
  if (!parse_set_name(name)) return false;
  stmt.assign = std::move(name);
  return true;
}

bool Parser::parse_set_name(std::string& out) {
  bool valid = is_word_token(current_.type) && !current_.text.empty() &&
               !std::isdigit(static_cast<unsigned char>(current_.text[0]));
  for (char c : current_.text) {
    // WHY: set names become SQL relation names, so '-' is not allowed here.
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') valid = false;
  }
  if (!valid) {
    return set_error("Expected set name after '.'", {"identifier"});
  }
  out = current_.text;
  advance();
  return true;
}

void Parser::advance() {
  last_end_ = current_.pos + current_.length;
  current_ = lexer_.next();
}

bool Parser::consume(TokenType type, const std::string& message, const std::string& expected) {
  if (current_.type != type) {
    return set_error(message, {expected});
  }
  advance();
  return true;
}

bool Parser::set_error(const std::string& message, std::vector<std::string> expected) {
  if (current_.type == TokenType::Invalid) {
    return set_error_at(current_.pos, current_.text);
  }
  return set_error_at(current_.pos, message, std::move(expected));
}

bool Parser::set_error_at(size_t position, const std::string& message,
                          std::vector<std::string> expected) {
  if (error_.has_value()) return false;
  ParseError error;
  error.message = message;
  error.position = position;
  error.expected = std::move(expected);
  util::line_col_at(input_, position, error.line, error.column);
  error_ = std::move(error);
  return false;
}

bool Parser::is_kind_token(TokenType type) {
  return type == TokenType::KeywordNode || type == TokenType::KeywordWay ||
         type == TokenType::KeywordRelation || type == TokenType::KeywordRel ||
         type == TokenType::KeywordArea || type == TokenType::KeywordNwr;
}

bool Parser::is_traverse_token(TokenType type) {
  return type == TokenType::Less || type == TokenType::LessLess ||
         type == TokenType::Greater || type == TokenType::GreaterGreater;
}

ParseResult parse_request(const std::string& input) {
  Parser parser(input);
  return parser.parse();
}

}  // namespace ovsql
