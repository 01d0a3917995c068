#include "compiler.h"

#include "../util/string_util.h"

namespace ovsql {

namespace {

std::string set_label(const std::string& set) { return set == "_" ? "_" : "." + set; }

// Closes the ring when the last point does not repeat the first.
std::string polygon_wkt(const std::vector<LatLon>& points) {
  std::vector<std::string> coords;
  coords.reserve(points.size() + 1);
  for (const auto& point : points) {
    coords.push_back(point.lon.text + " " + point.lat.text);
  }
  if (!(points.front() == points.back())) {
    coords.push_back(coords.front());
  }
  return "POLYGON((" + util::join(coords, ", ") + "))";
}

}  // namespace

/// Lowers a tag selector against `table`.
/// Values are compared as string literals of their lexical form; `[k=""]` means the key is absent.
std::string Compiler::selector_predicate(const Selector& selector, const std::string& table) const {
  const std::string exists = dialect_.tag_exists(table, selector.key);
  const std::string value = dialect_.tag_value(table, selector.key);
  const std::string literal = dialect_.escape_literal(selector.value);
  std::string predicate;
  switch (selector.op) {
    case Selector::Op::Exists:
      return selector.negated ? "NOT " + exists : exists;
    case Selector::Op::Equal:
      if (selector.value.empty()) {
        return selector.negated ? exists : "NOT " + exists;
      }
      predicate = "(" + exists + " AND " + value + " = " + literal + ")";
      break;
    case Selector::Op::NotEqual:
      predicate = "(NOT " + exists + " OR " + value + " != " + literal + ")";
      break;
    case Selector::Op::Regex:
      predicate = "(" + exists + " AND " +
                  dialect_.regex_match(value, selector.value, selector.case_insensitive, false) + ")";
      break;
    case Selector::Op::NotRegex:
      predicate = "(NOT " + exists + " OR " +
                  dialect_.regex_match(value, selector.value, selector.case_insensitive, true) + ")";
      break;
  }
  return selector.negated ? "NOT " + predicate : predicate;
}

std::string Compiler::filter_predicate(const Filter& filter, const std::string& table,
                                       const BindingEnv& env) {
  const std::string geom = table + ".geom";
  switch (filter.kind) {
    case Filter::Kind::Bbox: {
      // Query order is (south, west, north, east); envelopes take (west, south, east, north).
      const std::string envelope = dialect_.make_envelope(filter.west.text, filter.south.text,
                                                          filter.east.text, filter.north.text);
      return "ST_Intersects(" + geom + ", " +
             dialect_.transform_from_wgs84(envelope, options_.srid) + ")";
    }
    case Filter::Kind::Poly:
      return "ST_Intersects(" + geom + ", " +
             dialect_.transform_from_wgs84(dialect_.make_polygon(polygon_wkt(filter.poly)),
                                           options_.srid) +
             ")";
    case Filter::Kind::Ids:
      // Area views are keyed by the derived area id, so area ids match like any other id.
      return dialect_.id_predicate(table, filter.ids);
    case Filter::Kind::Area:
      return area_containment(env.resolve(filter.set, filter.span.start), filter.set,
                              filter.span.start, table);
    case Filter::Kind::Around: {
      const std::string core = relation_for(env.resolve(filter.set, filter.span.start));
      const std::string within =
          dialect_.distance_within("core_set.geom", geom, filter.radius.text, options_.srid);
      return "EXISTS (\n    SELECT 1\n    FROM " + core + " AS core_set\n    WHERE\n" +
             util::indent_lines(within, 8) + "\n)";
    }
  }
  return "true";
}

/// Rows of `table` intersecting any area of `area_set`.
/// MUST throw FilterApplicabilityError unless the set is known to hold only areas.
std::string Compiler::area_containment(const BindingValue& area_set, const std::string& set_name,
                                       size_t position, const std::string& table) {
  if (area_set.kinds != kAreaKind) {
    throw FilterApplicabilityError(
        "Set '" + set_label(set_name) + "' does not hold areas; area filters need the result of an area query",
        position);
  }
  return "EXISTS (\n    SELECT 1\n    FROM " + area_set.relation +
         " AS area_set\n    WHERE ST_Intersects(area_set.geom, " + table + ".geom)\n)";
}

}  // namespace ovsql
