#include "compiler.h"

#include "../util/string_util.h"

namespace ovsql {

namespace {

std::string join_on(const std::string& alias, const std::string& other) {
  return alias + ".osm_type = " + other + ".osm_type AND " + alias + ".id = " + other + ".id";
}

}  // namespace

/// Lowers `<`, `<<`, `>` and `>>` over the input (or default) set.
/// Child kinds are primitives; the all-levels forms also keep the input rows they were seeded with.
BindingValue Compiler::compile_traverse(const Statement& stmt, BindingEnv& env) {
  const BindingValue& input = env.resolve(stmt.input.value_or("_"), stmt.input_span.start);
  const std::string relation = relation_for(input);
  std::string sql;
  unsigned kinds = kNoKinds;
  switch (stmt.direction) {
    case Statement::Direction::ChildOne:
      sql = traverse_children(relation, false);
      kinds = kPrimitiveKinds;
      break;
    case Statement::Direction::ChildAll:
      sql = traverse_children(relation, true);
      kinds = kPrimitiveKinds | input.kinds;
      break;
    case Statement::Direction::ParentOne:
      sql = traverse_parents(relation, false);
      kinds = kWayKind | kRelationKind;
      break;
    case Statement::Direction::ParentAll:
      sql = traverse_parents(relation, true);
      kinds = kWayKind | kRelationKind | input.kinds;
      break;
  }
  return BindingValue{add_fragment(relation_base(stmt), sql), kinds};
}

/// Rows referenced by the input rows: way nodes and relation members.
/// The recursive form is a reflexive fixed point: `UNION` stops once no new (osm_type, id) appears.
std::string Compiler::traverse_children(const std::string& input, bool recursive) const {
  const std::string lookup = dialect_.view_name(EntityKind::Any, ViewRole::Lookup);
  const std::string refs = util::indent_lines(dialect_.reference_rows("parent"), 8);
  if (!recursive) {
    return "SELECT DISTINCT ON (child.osm_type, child.id)\n"
           "    child.*\n"
           "FROM\n"
           "    " + input + " AS parent\n"
           "    CROSS JOIN LATERAL (\n" + refs + "\n    ) AS ref\n"
           "    JOIN " + lookup + " AS child ON " + join_on("child", "ref") + "\n"
           "ORDER BY\n"
           "    child.osm_type, child.id";
  }
  return "WITH RECURSIVE walk(osm_type, id) AS (\n"
         "    SELECT osm_type, id FROM " + input + "\n"
         "    UNION\n"
         "    SELECT ref.osm_type, ref.id\n"
         "    FROM\n"
         "        walk\n"
         "        JOIN " + lookup + " AS parent ON " + join_on("parent", "walk") + "\n"
         "        CROSS JOIN LATERAL (\n" + util::indent_lines(refs, 4) + "\n        ) AS ref\n"
         ")\n"
         "SELECT\n"
         "    found.*\n"
         "FROM\n"
         "    walk\n"
         "    JOIN " + lookup + " AS found ON " + join_on("found", "walk");
}

/// Rows whose reference list contains an input row, one level or up to the fixed point.
std::string Compiler::traverse_parents(const std::string& input, bool recursive) const {
  const std::string lookup = dialect_.view_name(EntityKind::Any, ViewRole::Lookup);
  const std::string refs = util::indent_lines(dialect_.reference_rows("parent"), 8);
  if (!recursive) {
    return "SELECT DISTINCT ON (parent.osm_type, parent.id)\n"
           "    parent.*\n"
           "FROM\n"
           "    " + lookup + " AS parent\n"
           "    CROSS JOIN LATERAL (\n" + refs + "\n    ) AS ref\n"
           "    JOIN " + input + " AS child ON " + join_on("child", "ref") + "\n"
           "ORDER BY\n"
           "    parent.osm_type, parent.id";
  }
  return "WITH RECURSIVE walk(osm_type, id) AS (\n"
         "    SELECT osm_type, id FROM " + input + "\n"
         "    UNION\n"
         "    SELECT parent.osm_type, parent.id\n"
         "    FROM\n"
         "        " + lookup + " AS parent\n"
         "        CROSS JOIN LATERAL (\n" + util::indent_lines(refs, 4) + "\n        ) AS ref\n"
         "        JOIN walk ON " + join_on("walk", "ref") + "\n"
         ")\n"
         "SELECT\n"
         "    found.*\n"
         "FROM\n"
         "    walk\n"
         "    JOIN " + lookup + " AS found ON " + join_on("found", "walk");
}

}  // namespace ovsql
