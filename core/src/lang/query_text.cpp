#include "query_parser.h"

#include <sstream>

namespace ovsql {

namespace {

std::string quote(const std::string& text) {
  std::string out = "\"";
  for (char c : text) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

const char* selector_op_text(Selector::Op op) {
  switch (op) {
    case Selector::Op::Equal:
      return "=";
    case Selector::Op::NotEqual:
      return "!=";
    case Selector::Op::Regex:
      return "~";
    case Selector::Op::NotRegex:
      return "!~";
    case Selector::Op::Exists:
      break;
  }
  return "";
}

const char* direction_text(Statement::Direction direction) {
  switch (direction) {
    case Statement::Direction::ParentOne:
      return "<";
    case Statement::Direction::ParentAll:
      return "<<";
    case Statement::Direction::ChildOne:
      return ">";
    case Statement::Direction::ChildAll:
      return ">>";
  }
  return ">";
}

const char* detail_text(Statement::Detail detail) {
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

const char* geometry_text(Statement::Geometry geometry) {
  switch (geometry) {
    case Statement::Geometry::Full:
      return "geom";
    case Statement::Geometry::Center:
      return "center";
    case Statement::Geometry::Bbox:
      return "bb";
    case Statement::Geometry::None:
      break;
  }
  return "";
}

void write_selector(std::ostringstream& out, const Selector& selector) {
  out << '[';
  if (selector.negated) out << '!';
  out << quote(selector.key);
  if (selector.op != Selector::Op::Exists) {
    out << selector_op_text(selector.op);
    out << (selector.value_is_number ? selector.value : quote(selector.value));
    if (selector.case_insensitive) out << ",i";
  }
  out << ']';
}

void write_set_suffix(std::ostringstream& out, const std::string& set) {
  if (set != "_") out << '.' << set;
}

void write_filter(std::ostringstream& out, const Filter& filter) {
  out << '(';
  switch (filter.kind) {
    case Filter::Kind::Bbox:
      out << filter.south.text << ',' << filter.west.text << ',' << filter.north.text << ','
          << filter.east.text;
      break;
    case Filter::Kind::Poly: {
      out << "poly:\"";
      for (size_t i = 0; i < filter.poly.size(); ++i) {
        if (i != 0) out << ' ';
        out << filter.poly[i].lat.text << ' ' << filter.poly[i].lon.text;
      }
      out << '"';
      break;
    }
    case Filter::Kind::Ids:
      if (filter.ids.size() == 1) {
        out << filter.ids[0];
        break;
      }
      out << "id:";
      for (size_t i = 0; i < filter.ids.size(); ++i) {
        if (i != 0) out << ',';
        out << filter.ids[i];
      }
      break;
    case Filter::Kind::Area:
      out << "area";
      write_set_suffix(out, filter.set);
      break;
    case Filter::Kind::Around:
      out << "around";
      write_set_suffix(out, filter.set);
      out << ':' << filter.radius.text;
      break;
  }
  out << ')';
}

void write_statement(std::ostringstream& out, const Statement& stmt) {
  switch (stmt.kind) {
    case Statement::Kind::EntityQuery:
      out << entity_keyword(stmt.entity);
      if (stmt.input.has_value()) out << '.' << *stmt.input;
      for (const auto& selector : stmt.selectors) write_selector(out, selector);
      for (const auto& filter : stmt.filters) write_filter(out, filter);
      break;
    case Statement::Kind::Traverse:
      if (stmt.input.has_value()) out << '.' << *stmt.input << ' ';
      out << direction_text(stmt.direction);
      break;
    case Statement::Kind::Union:
      out << '(';
      for (size_t i = 0; i < stmt.members.size(); ++i) {
        if (i != 0) out << ' ';
        write_statement(out, stmt.members[i]);
        out << ';';
      }
      out << ')';
      break;
    case Statement::Kind::Emit:
      if (stmt.input.has_value()) out << '.' << *stmt.input << ' ';
      out << "out";
      if (stmt.detail != Statement::Detail::Body) out << ' ' << detail_text(stmt.detail);
      if (stmt.geometry != Statement::Geometry::None) out << ' ' << geometry_text(stmt.geometry);
      break;
  }
  if (stmt.assign.has_value()) out << "->." << *stmt.assign;
}

}  // namespace

std::string to_query_text(const Statement& statement) {
  std::ostringstream out;
  write_statement(out, statement);
  return out.str();
}

std::string to_query_text(const Request& request) {
  std::ostringstream out;
  if (request.output_format.has_value() || request.timeout.has_value()) {
    if (request.output_format.has_value()) out << "[out:" << *request.output_format << ']';
    if (request.timeout.has_value()) out << "[timeout:" << *request.timeout << ']';
    out << ";\n";
  }
  for (const auto& stmt : request.statements) {
    write_statement(out, stmt);
    out << ";\n";
  }
  return out.str();
}

}  // namespace ovsql
