#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ovsql/entity.h"

namespace ovsql {

struct Span {
  size_t start = 0;
  size_t end = 0;
};

/// Numeric literal as written; SQL generation reuses `text` to avoid reformatting.
struct NumberLiteral {
  std::string text;
  double value = 0.0;
};

struct Selector {
  enum class Op {
    Exists,
    Equal,
    NotEqual,
    Regex,
    NotRegex
  } op = Op::Exists;
  std::string key;
  bool negated = false;
  // `,i` suffix; only meaningful for Regex/NotRegex.
  bool case_insensitive = false;
  std::string value;
  bool value_is_number = false;
  Span span;
};

struct LatLon {
  NumberLiteral lat;
  NumberLiteral lon;
};

struct Filter {
  enum class Kind {
    Bbox,
    Poly,
    Ids,
    Area,
    Around
  } kind = Kind::Ids;
  // Bbox: south, west, north, east in source order.
  NumberLiteral south;
  NumberLiteral west;
  NumberLiteral north;
  NumberLiteral east;
  std::vector<LatLon> poly;
  std::vector<int64_t> ids;
  // Area/Around: referenced binding, "_" for the default set.
  std::string set = "_";
  NumberLiteral radius;
  Span span;
};

struct Statement {
  enum class Kind {
    EntityQuery,
    Traverse,
    Union,
    Emit
  } kind = Kind::EntityQuery;
  enum class Direction {
    ParentOne,
    ParentAll,
    ChildOne,
    ChildAll
  };
  enum class Geometry {
    None,
    Full,
    Center,
    Bbox
  };
  enum class Detail {
    Ids,
    Skel,
    Body,
    Tags,
    Meta
  };

  EntityKind entity = EntityKind::Any;
  // `.name` before the statement; "_" names the default set explicitly.
  std::optional<std::string> input;
  std::vector<Selector> selectors;
  std::vector<Filter> filters;
  Direction direction = Direction::ChildOne;
  std::vector<Statement> members;
  Geometry geometry = Geometry::None;
  Detail detail = Detail::Body;
  std::optional<std::string> assign;
  Span span;
  Span input_span;
};

struct Request {
  std::optional<std::string> output_format;
  std::optional<int64_t> timeout;
  std::vector<Statement> statements;
  Span span;
};

// Structural equality; spans are ignored so reparsed canonical text compares equal.
inline bool operator==(const NumberLiteral& a, const NumberLiteral& b) {
  return a.text == b.text;
}
inline bool operator!=(const NumberLiteral& a, const NumberLiteral& b) { return !(a == b); }

inline bool operator==(const Selector& a, const Selector& b) {
  return a.op == b.op && a.key == b.key && a.negated == b.negated &&
         a.case_insensitive == b.case_insensitive && a.value == b.value &&
         a.value_is_number == b.value_is_number;
}

inline bool operator==(const LatLon& a, const LatLon& b) {
  return a.lat == b.lat && a.lon == b.lon;
}

inline bool operator==(const Filter& a, const Filter& b) {
  if (a.kind != b.kind) return false;
  switch (a.kind) {
    case Filter::Kind::Bbox:
      return a.south == b.south && a.west == b.west && a.north == b.north && a.east == b.east;
    case Filter::Kind::Poly:
      return a.poly == b.poly;
    case Filter::Kind::Ids:
      return a.ids == b.ids;
    case Filter::Kind::Area:
      return a.set == b.set;
    case Filter::Kind::Around:
      return a.set == b.set && a.radius == b.radius;
  }
  return false;
}

inline bool operator==(const Statement& a, const Statement& b) {
  if (a.kind != b.kind || a.input != b.input || a.assign != b.assign) return false;
  switch (a.kind) {
    case Statement::Kind::EntityQuery:
      return a.entity == b.entity && a.selectors == b.selectors && a.filters == b.filters;
    case Statement::Kind::Traverse:
      return a.direction == b.direction;
    case Statement::Kind::Union:
      return a.members == b.members;
    case Statement::Kind::Emit:
      return a.geometry == b.geometry && a.detail == b.detail;
  }
  return false;
}
inline bool operator!=(const Statement& a, const Statement& b) { return !(a == b); }

inline bool operator==(const Request& a, const Request& b) {
  return a.output_format == b.output_format && a.timeout == b.timeout &&
         a.statements == b.statements;
}
inline bool operator!=(const Request& a, const Request& b) { return !(a == b); }

}  // namespace ovsql
