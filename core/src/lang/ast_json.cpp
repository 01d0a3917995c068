#include "ast_json.h"

namespace ovsql {

namespace {

using json = nlohmann::ordered_json;

const char* selector_op_name(Selector::Op op) {
  switch (op) {
    case Selector::Op::Exists:
      return "exists";
    case Selector::Op::Equal:
      return "equal";
    case Selector::Op::NotEqual:
      return "not_equal";
    case Selector::Op::Regex:
      return "regex";
    case Selector::Op::NotRegex:
      return "not_regex";
  }
  return "exists";
}

const char* direction_name(Statement::Direction direction) {
  switch (direction) {
    case Statement::Direction::ParentOne:
      return "parent";
    case Statement::Direction::ParentAll:
      return "parent_all";
    case Statement::Direction::ChildOne:
      return "child";
    case Statement::Direction::ChildAll:
      return "child_all";
  }
  return "child";
}

const char* geometry_name(Statement::Geometry geometry) {
  switch (geometry) {
    case Statement::Geometry::None:
      return "none";
    case Statement::Geometry::Full:
      return "geom";
    case Statement::Geometry::Center:
      return "center";
    case Statement::Geometry::Bbox:
      return "bb";
  }
  return "none";
}

const char* detail_name(Statement::Detail detail) {
  switch (detail) {
    case Statement::Detail::Ids:
      return "ids";
    case Statement::Detail::Skel:
      return "skel";
    case Statement::Detail::Body:
      return "body";
    case Statement::Detail::Tags:
      return "tags";
    case Statement::Detail::Meta:
      return "meta";
  }
  return "body";
}

// Numbers keep their lexical text next to the parsed value.
json number_to_json(const NumberLiteral& number) {
  return json{{"text", number.text}, {"value", number.value}};
}

json selector_to_json(const Selector& selector) {
  json out = json::object();
  out["key"] = selector.key;
  out["op"] = selector_op_name(selector.op);
  out["negated"] = selector.negated;
  if (selector.op != Selector::Op::Exists) {
    out["value"] = selector.value;
    out["value_is_number"] = selector.value_is_number;
    out["case_insensitive"] = selector.case_insensitive;
  }
  return out;
}

json filter_to_json(const Filter& filter) {
  json out = json::object();
  switch (filter.kind) {
    case Filter::Kind::Bbox:
      out["type"] = "bbox";
      out["south"] = number_to_json(filter.south);
      out["west"] = number_to_json(filter.west);
      out["north"] = number_to_json(filter.north);
      out["east"] = number_to_json(filter.east);
      break;
    case Filter::Kind::Poly: {
      out["type"] = "poly";
      json points = json::array();
      for (const auto& point : filter.poly) {
        points.push_back(json{{"lat", number_to_json(point.lat)}, {"lon", number_to_json(point.lon)}});
      }
      out["points"] = std::move(points);
      break;
    }
    case Filter::Kind::Ids:
      out["type"] = "ids";
      out["ids"] = filter.ids;
      break;
    case Filter::Kind::Area:
      out["type"] = "area";
      out["set"] = filter.set;
      break;
    case Filter::Kind::Around:
      out["type"] = "around";
      out["set"] = filter.set;
      out["radius"] = number_to_json(filter.radius);
      break;
  }
  return out;
}

json statement_to_json(const Statement& stmt) {
  json out = json::object();
  switch (stmt.kind) {
    case Statement::Kind::EntityQuery: {
      out["type"] = "query";
      out["entity"] = entity_keyword(stmt.entity);
      json selectors = json::array();
      for (const auto& selector : stmt.selectors) selectors.push_back(selector_to_json(selector));
      out["selectors"] = std::move(selectors);
      json filters = json::array();
      for (const auto& filter : stmt.filters) filters.push_back(filter_to_json(filter));
      out["filters"] = std::move(filters);
      break;
    }
    case Statement::Kind::Traverse:
      out["type"] = "recurse";
      out["direction"] = direction_name(stmt.direction);
      break;
    case Statement::Kind::Union: {
      out["type"] = "union";
      json members = json::array();
      for (const auto& member : stmt.members) members.push_back(statement_to_json(member));
      out["members"] = std::move(members);
      break;
    }
    case Statement::Kind::Emit:
      out["type"] = "out";
      out["geometry"] = geometry_name(stmt.geometry);
      out["detail"] = detail_name(stmt.detail);
      break;
  }
  out["input"] = stmt.input.has_value() ? json(*stmt.input) : json(nullptr);
  out["assign"] = stmt.assign.has_value() ? json(*stmt.assign) : json(nullptr);
  out["span"] = json{{"start", stmt.span.start}, {"end", stmt.span.end}};
  return out;
}

}  // namespace

json request_to_json(const Request& request) {
  json out = json::object();
  out["output_format"] = request.output_format.has_value() ? json(*request.output_format) : json(nullptr);
  out["timeout"] = request.timeout.has_value() ? json(*request.timeout) : json(nullptr);
  json statements = json::array();
  for (const auto& stmt : request.statements) statements.push_back(statement_to_json(stmt));
  out["statements"] = std::move(statements);
  return out;
}

}  // namespace ovsql
