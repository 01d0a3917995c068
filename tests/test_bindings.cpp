#include "test_harness.h"
#include "test_utils.h"

#include <string>
#include <vector>

#include "compiler/binding_env.h"
#include "ovsql/errors.h"

namespace {

void test_env_default_is_empty_sentinel() {
  ovsql::BindingEnv env;
  expect_true(env.resolve("_").empty_sentinel(), "default starts as the empty sentinel");
  expect_true(env.current_default().empty_sentinel(), "current default is the sentinel");
  env.set_default(ovsql::BindingValue{"_default", ovsql::kNodeKind});
  expect_true(env.resolve("_").relation == "_default", "default updated");
}

void test_env_unbound_name_throws_with_position() {
  ovsql::BindingEnv env;
  expect_throws<ovsql::UnboundNameError>(
      [&] { env.resolve("missing", 17); },
      [](const ovsql::UnboundNameError& e) {
        expect_true(e.name() == "missing", "name carried");
        expect_eq(e.position(), 17, "position carried");
        expect_true(std::string(e.what()) == "Unbound set '.missing'", "message");
      },
      "unbound name throws");
}

void test_env_redefinition_replaces_value() {
  ovsql::BindingEnv env;
  env.define("a", ovsql::BindingValue{"_a", ovsql::kNodeKind});
  env.define("a", ovsql::BindingValue{"_a_2", ovsql::kWayKind});
  expect_true(env.resolve("a").relation == "_a_2", "latest definition wins");
  expect_true(env.resolve("a").kinds == ovsql::kWayKind, "kinds replaced");
}

void test_env_names_redefined_since() {
  ovsql::BindingEnv base;
  base.define("keep", ovsql::BindingValue{"_keep", ovsql::kNodeKind});
  base.define("swap", ovsql::BindingValue{"_swap", ovsql::kNodeKind});
  ovsql::BindingEnv branch = base;
  branch.define("fresh", ovsql::BindingValue{"_fresh", ovsql::kWayKind});
  branch.define("swap", ovsql::BindingValue{"_swap_2", ovsql::kNodeKind});
  std::vector<std::string> changed = branch.names_redefined_since(base);
  expect_eq(changed.size(), 2, "two names changed");
  if (changed.size() == 2) {
    expect_true(changed[0] == "swap", "first-definition order");
    expect_true(changed[1] == "fresh", "new name after existing ones");
  }
}

void test_kind_masks() {
  expect_true(ovsql::kind_mask(ovsql::EntityKind::Any) == ovsql::kPrimitiveKinds,
              "nwr is the three primitives");
  expect_true(ovsql::kind_mask(ovsql::EntityKind::Area) == ovsql::kAreaKind, "area mask");
  expect_true((ovsql::kind_mask(ovsql::EntityKind::Any) & ovsql::kAreaKind) == 0,
              "nwr excludes areas");
}

void test_unbound_reference_yields_no_sql() {
  for (const std::string dialect : {"postgres", "duckdb"}) {
    std::string sql;
    expect_throws<ovsql::UnboundNameError>(
        [&] { sql = compile_sql("node(1)->.a; out; way.b; out;", dialect); },
        [](const ovsql::UnboundNameError& e) {
          expect_true(e.name() == "b", "unbound name reported");
          expect_eq(e.position(), 21, "position of '.b'");
        },
        "reference before assignment fails for " + dialect);
    expect_true(sql.empty(), "no partial SQL for " + dialect);
  }
}

void test_forward_reference_is_unbound() {
  expect_throws<ovsql::UnboundNameError>(
      [] { compile_sql(".later out; node(1)->.later;", "postgres"); },
      [](const ovsql::UnboundNameError& e) { expect_eq(e.position(), 0, "emit input position"); },
      "names are visible only after their assignment");
}

void test_unbound_in_filters_and_traversal() {
  expect_throws<ovsql::UnboundNameError>(
      [] { compile_sql("node(around.nope:10);", "postgres"); },
      [](const ovsql::UnboundNameError& e) { expect_true(e.name() == "nope", "around set"); },
      "around filter set must be bound");
  expect_throws<ovsql::UnboundNameError>(
      [] { compile_sql(".w >;", "duckdb"); },
      [](const ovsql::UnboundNameError& e) { expect_true(e.name() == "w", "traverse input"); },
      "traverse input must be bound");
}

void test_default_set_threads_through_statements() {
  const std::string sql = compile_sql("way(5); >; out;", "postgres");
  expect_true(contains(sql, "_default_2 AS ("), "traverse gets its own relation");
  expect_true(contains(sql, "_default AS parent"), "traverse reads the previous default");
  expect_true(contains(sql, "FROM\n    _default_2\nORDER BY"), "out reads the latest default");
}

void test_named_set_survives_default_updates() {
  const std::string sql = compile_sql("node(1)->.a; way(2); .a out ids;", "postgres");
  expect_true(contains(sql, "FROM\n    _a\nORDER BY"), "emit reads the named set");
}

void test_redefined_name_gets_new_relation() {
  ovsql::SqlScript script =
      compile_script("node(1)->.a; way(2)->.a; .a out;", "duckdb");
  expect_eq(script.statements.size(), 3, "two temp tables and one select");
  if (script.statements.size() != 3) return;
  expect_true(contains(script.statements[0], "TEMP TABLE _a AS"), "first definition");
  expect_true(contains(script.statements[1], "TEMP TABLE _a_2 AS"), "redefinition");
  expect_true(contains(script.statements[2], "FROM\n    _a_2\n"), "emit reads the redefinition");
}

}  // namespace

void register_binding_tests(std::vector<TestCase>& tests) {
  tests.push_back({"binding_env_default_is_empty_sentinel", test_env_default_is_empty_sentinel});
  tests.push_back({"binding_env_unbound_name_throws_with_position",
                   test_env_unbound_name_throws_with_position});
  tests.push_back({"binding_env_redefinition_replaces_value", test_env_redefinition_replaces_value});
  tests.push_back({"binding_env_names_redefined_since", test_env_names_redefined_since});
  tests.push_back({"binding_kind_masks", test_kind_masks});
  tests.push_back({"binding_unbound_reference_yields_no_sql", test_unbound_reference_yields_no_sql});
  tests.push_back({"binding_forward_reference_is_unbound", test_forward_reference_is_unbound});
  tests.push_back({"binding_unbound_in_filters_and_traversal", test_unbound_in_filters_and_traversal});
  tests.push_back({"binding_default_set_threads_through_statements",
                   test_default_set_threads_through_statements});
  tests.push_back({"binding_named_set_survives_default_updates",
                   test_named_set_survives_default_updates});
  tests.push_back({"binding_redefined_name_gets_new_relation", test_redefined_name_gets_new_relation});
}
