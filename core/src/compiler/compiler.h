#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../lang/ast.h"
#include "binding_env.h"
#include "ovsql/ovsql.h"

namespace ovsql {

/// Named SQL relation produced by one statement.
struct Fragment {
  std::string relation;
  std::string sql;
};

/// Lowers one parsed request into SQL for a dialect.
/// A Compiler instance is single-use: construct, call compile() once, discard.
/// MUST NOT leak partial output: errors propagate as exceptions before the script is returned.
class Compiler {
 public:
  Compiler(const Dialect& dialect, const CompileOptions& options);

  SqlScript compile(const Request& request);

 private:
  BindingValue compile_statement(const Statement& stmt, BindingEnv& env);
  BindingValue compile_entity_query(const Statement& stmt, BindingEnv& env);
  BindingValue compile_traverse(const Statement& stmt, BindingEnv& env);
  BindingValue compile_union(const Statement& stmt, BindingEnv& env);
  void compile_emit(const Statement& stmt, const BindingEnv& env);
  /// Stores the statement's result under its assignment target or as the new default.
  static void bind_result(const Statement& stmt, const BindingValue& value, BindingEnv& env);

  std::string selector_predicate(const Selector& selector, const std::string& table) const;
  std::string filter_predicate(const Filter& filter, const std::string& table,
                               const BindingEnv& env);
  std::string area_containment(const BindingValue& area_set, const std::string& set_name,
                               size_t position, const std::string& table);

  std::string traverse_children(const std::string& input, bool recursive) const;
  std::string traverse_parents(const std::string& input, bool recursive) const;

  /// SQL relation holding `value`; the empty sentinel becomes a lazily created `_empty` fragment.
  std::string relation_for(const BindingValue& value);
  /// Registers a fragment under a unique name derived from `base` and returns that name.
  std::string add_fragment(const std::string& base, const std::string& sql);
  std::string unique_name(const std::string& base);
  static std::string relation_base(const Statement& stmt);

  const Dialect& dialect_;
  CompileOptions options_;
  std::vector<Fragment> fragments_;
  std::set<std::string> used_names_;
  std::vector<std::string> statements_;
  std::optional<std::string> empty_relation_;
};

/// Builds `SELECT table.* FROM table WHERE p1 AND p2 ...`; WHERE is omitted when empty.
std::string select_where(const std::string& table, const std::vector<std::string>& predicates);

}  // namespace ovsql
