#include "compiler.h"

#include <utility>

#include "../util/string_util.h"
#include "output_formatter.h"

namespace ovsql {

std::string select_where(const std::string& table, const std::vector<std::string>& predicates) {
  std::string sql = "SELECT\n    " + table + ".*\nFROM\n    " + table;
  if (predicates.empty()) return sql;
  std::vector<std::string> indented;
  indented.reserve(predicates.size());
  for (const auto& predicate : predicates) {
    indented.push_back(util::indent_lines(predicate, 4));
  }
  return sql + "\nWHERE\n" + util::join(indented, " AND\n");
}

Compiler::Compiler(const Dialect& dialect, const CompileOptions& options)
    : dialect_(dialect), options_(options) {}

SqlScript Compiler::compile(const Request& request) {
  BindingEnv env;
  for (const auto& stmt : request.statements) {
    if (stmt.kind == Statement::Kind::Emit) {
      compile_emit(stmt, env);
      continue;
    }
    BindingValue value = compile_statement(stmt, env);
    bind_result(stmt, value, env);
  }

  SqlScript script;
  script.timeout = request.timeout;
  script.output_format = request.output_format;
  if (request.timeout.has_value()) {
    std::optional<std::string> timeout = dialect_.statement_timeout(*request.timeout);
    // WHY: backends without a statement timeout still get the value, for the caller to enforce.
    script.statements.push_back(timeout.has_value()
                                    ? *timeout
                                    : "-- timeout: " + std::to_string(*request.timeout) + "s");
  }
  for (auto& statement : statements_) {
    script.statements.push_back(std::move(statement));
  }
  statements_.clear();
  return script;
}

BindingValue Compiler::compile_statement(const Statement& stmt, BindingEnv& env) {
  switch (stmt.kind) {
    case Statement::Kind::EntityQuery:
      return compile_entity_query(stmt, env);
    case Statement::Kind::Traverse:
      return compile_traverse(stmt, env);
    case Statement::Kind::Union:
      return compile_union(stmt, env);
    case Statement::Kind::Emit:
      break;
  }
  throw Error("out cannot produce a set", stmt.span.start);
}

void Compiler::bind_result(const Statement& stmt, const BindingValue& value, BindingEnv& env) {
  if (stmt.assign.has_value()) {
    env.define(*stmt.assign, value);
  } else {
    env.set_default(value);
  }
}

/// Lowers `kind.input[selectors](filters)`.
/// Without an input set the kind's view is scanned: the lookup view when ids are given,
/// the geometry view otherwise. An input set that holds only areas restricts the scan spatially.
BindingValue Compiler::compile_entity_query(const Statement& stmt, BindingEnv& env) {
  bool has_ids = false;
  for (const auto& filter : stmt.filters) {
    if (filter.kind == Filter::Kind::Ids) has_ids = true;
  }
  const ViewRole role = has_ids ? ViewRole::Lookup : ViewRole::Geometry;

  std::string table;
  std::vector<std::string> predicates;
  unsigned kinds = kind_mask(stmt.entity);
  if (stmt.input.has_value()) {
    const BindingValue& input = env.resolve(*stmt.input, stmt.input_span.start);
    if (input.kinds == kAreaKind && stmt.entity != EntityKind::Area) {
      table = dialect_.view_name(stmt.entity, role);
      predicates.push_back(area_containment(input, *stmt.input, stmt.input_span.start, table));
    } else {
      table = relation_for(input);
      char discriminant = entity_discriminant(stmt.entity);
      if (discriminant != 0) {
        predicates.push_back(table + ".osm_type = '" + std::string(1, discriminant) + "'");
      }
      // A typed query over a set keeps only the rows the set may already hold of that kind.
      kinds = stmt.entity == EntityKind::Any ? input.kinds : input.kinds & kinds;
    }
  } else {
    table = dialect_.view_name(stmt.entity, role);
  }

  for (const auto& selector : stmt.selectors) {
    predicates.push_back(selector_predicate(selector, table));
  }
  for (const auto& filter : stmt.filters) {
    predicates.push_back(filter_predicate(filter, table, env));
  }
  return BindingValue{add_fragment(relation_base(stmt), select_where(table, predicates)), kinds};
}

/// Compiles every member against a snapshot of the environment taken when the union opens.
/// Members never see each other's named assignments; their named results merge back afterwards.
/// The default set chains: an unassigned member's result is the `_` the next member reads.
BindingValue Compiler::compile_union(const Statement& stmt, BindingEnv& env) {
  const BindingEnv snapshot = env;
  BindingValue running = env.current_default();
  std::vector<BindingEnv> branches;
  std::vector<std::string> selects;
  unsigned kinds = kNoKinds;
  for (const auto& member : stmt.members) {
    BindingEnv branch = snapshot;
    branch.set_default(running);
    BindingValue value = compile_statement(member, branch);
    bind_result(member, value, branch);
    if (!member.assign.has_value()) running = value;
    selects.push_back("SELECT * FROM " + value.relation);
    kinds |= value.kinds;
    branches.push_back(std::move(branch));
  }
  for (const auto& branch : branches) {
    for (const auto& name : branch.names_redefined_since(snapshot)) {
      env.define(name, branch.resolve(name));
    }
  }
  std::string sql = "SELECT DISTINCT ON (osm_type, id)\n    *\nFROM (\n" +
                    util::indent_lines(util::join(selects, "\nUNION ALL\n"), 4) +
                    "\n) AS branches\nORDER BY\n    osm_type, id";
  return BindingValue{add_fragment(relation_base(stmt), sql), kinds};
}

void Compiler::compile_emit(const Statement& stmt, const BindingEnv& env) {
  const BindingValue& value = env.resolve(stmt.input.value_or("_"), stmt.input_span.start);
  const std::string relation = relation_for(value);
  const std::string select =
      output_select(output_columns(stmt, dialect_, options_.srid), relation);
  if (dialect_.descriptor().fragment_strategy == FragmentStrategy::TempTables) {
    statements_.push_back(select + "\n;");
    return;
  }
  std::vector<std::string> ctes;
  ctes.reserve(fragments_.size());
  for (const auto& fragment : fragments_) {
    ctes.push_back(fragment.relation + " AS (\n" + util::indent_lines(fragment.sql, 4) + "\n)");
  }
  statements_.push_back("WITH\n" + util::join(ctes, ",\n") + "\n" + select + "\n;");
}

std::string Compiler::relation_for(const BindingValue& value) {
  if (!value.empty_sentinel()) return value.relation;
  if (!empty_relation_.has_value()) {
    const std::string view = dialect_.view_name(EntityKind::Any, ViewRole::Lookup);
    empty_relation_ = add_fragment("_empty", select_where(view, {"false"}));
  }
  return *empty_relation_;
}

std::string Compiler::add_fragment(const std::string& base, const std::string& sql) {
  std::string relation = unique_name(base);
  if (dialect_.descriptor().fragment_strategy == FragmentStrategy::TempTables) {
    statements_.push_back("CREATE OR REPLACE TEMP TABLE " + relation + " AS\n" + sql + "\n;");
  }
  fragments_.push_back(Fragment{relation, sql});
  return relation;
}

std::string Compiler::unique_name(const std::string& base) {
  std::string name = base;
  for (int suffix = 2; used_names_.count(name) != 0; ++suffix) {
    name = base + "_" + std::to_string(suffix);
  }
  used_names_.insert(name);
  return name;
}

std::string Compiler::relation_base(const Statement& stmt) {
  return stmt.assign.has_value() ? "_" + *stmt.assign : "_default";
}

}  // namespace ovsql
