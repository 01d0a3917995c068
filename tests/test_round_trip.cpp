#include "test_harness.h"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lang/query_parser.h"
#include "ovsql/errors.h"
#include "ovsql/ovsql.h"

namespace {

/// Parses, renders canonical text, reparses and compares the two trees.
void check_round_trip(const std::string& query) {
  ovsql::ParseResult first = ovsql::parse_request(query);
  expect_true(first.request.has_value(), "input parses: " + query);
  if (!first.request.has_value()) return;
  const std::string canonical = ovsql::to_query_text(*first.request);
  ovsql::ParseResult second = ovsql::parse_request(canonical);
  expect_true(second.request.has_value(), "canonical text parses: " + canonical);
  if (!second.request.has_value()) return;
  expect_true(*first.request == *second.request, "round trip preserves AST: " + canonical);
  expect_text(ovsql::to_query_text(*second.request), canonical, "canonical text is stable");
}

void test_round_trip_queries() {
  const std::vector<std::string> queries = {
      "[out:json][timeout:25];area(7009125)->.a;nwr.a[\"tourism\"=\"information\"];out center meta;",
      "node(1.0,2.0,3.0,4.0);out;",
      "way[highway][!\"name\"][maxspeed!=50][name~'^A',i][ref!~\"x\\\\d\"](-1.5,-2,3,4.25);out geom;",
      "rel(id:1,2,3)->.r; .r >>; out ids;",
      "(node(5); way(poly:\"50.7 7.1 50.7 7.2 50.75 7.15\")->.w;)->.u; .u <; out skel bb;",
      "node(1)->.c; node(around.c:100)(around:2.5); area[name=Berlin]->.b; way(area.b)(area); out tags;",
      "/* c */ node // line\n[\"a\"=\"it's \\\"quoted\\\"\"]; out;",
      "[timeout:10];nwr[\"addr:street\"=\"\"]; << ->.up; .up out meta center;",
  };
  for (const auto& query : queries) {
    check_round_trip(query);
  }
}

void test_canonical_text_shape() {
  ovsql::ParseResult parsed = ovsql::parse_request(
      "[out:json]; way.a [ highway = primary ] ( 42 ) -> .b ; .b out geom meta ;");
  expect_true(parsed.request.has_value(), "query parses");
  if (!parsed.request.has_value()) return;
  const std::string expected =
      "[out:json];\n"
      "way.a[\"highway\"=\"primary\"](42)->.b;\n"
      ".b out meta geom;\n";
  expect_text(ovsql::to_query_text(*parsed.request), expected, "canonical text");
}

void test_statement_text() {
  ovsql::ParseResult parsed = ovsql::parse_request("rel(id:1,2)(area.x)->.r;");
  expect_true(parsed.request.has_value(), "query parses");
  if (!parsed.request.has_value() || parsed.request->statements.empty()) return;
  expect_text(ovsql::to_query_text(parsed.request->statements[0]),
              "relation(id:1,2)(area.x)->.r", "statement text");
}

void test_ast_dump_shape() {
  nlohmann::json ast = nlohmann::json::parse(
      ovsql::dump_query_ast("[timeout:5];node[amenity](1)->.x; .x out center;"));
  expect_true(ast["output_format"].is_null(), "no output format");
  expect_eq(ast["timeout"].get<int>(), 5, "timeout dumped");
  expect_eq(ast["statements"].size(), 2, "two statements");
  const nlohmann::json& query = ast["statements"][0];
  expect_true(query["type"] == "query" && query["entity"] == "node", "entity query");
  expect_true(query["selectors"][0]["key"] == "amenity" && query["selectors"][0]["op"] == "exists",
              "selector dumped");
  expect_true(query["filters"][0]["type"] == "ids" && query["filters"][0]["ids"][0] == 1,
              "single id normalized to the list form");
  expect_true(query["assign"] == "x" && query["input"].is_null(), "assignment dumped");
  const nlohmann::json& emit = ast["statements"][1];
  expect_true(emit["type"] == "out" && emit["input"] == "x", "emit input");
  expect_true(emit["geometry"] == "center" && emit["detail"] == "body", "emit modifiers");
}

void test_ast_dump_non_ascii_values() {
  nlohmann::json ast = nlohmann::json::parse(ovsql::dump_query_ast("node[\"name\"=\"\xC3\x91\"];out;"));
  expect_true(ast["statements"][0]["selectors"][0]["value"] == "\xC3\x91", "utf-8 value kept");

  const std::string dumped = ovsql::dump_query_ast("node[name='\xFF'];out;");
  expect_true(dumped.find("\xEF\xBF\xBD") != std::string::npos, "invalid byte replaced");
  nlohmann::json replaced = nlohmann::json::parse(dumped);
  expect_eq(replaced["statements"].size(), 2, "dump stays valid json");
}

void test_ast_dump_rejects_invalid_query() {
  expect_throws<ovsql::SyntaxError>(
      [] { ovsql::dump_query_ast("node(1)"); },
      [](const ovsql::SyntaxError& e) { expect_eq(e.position(), 7, "error at end of input"); },
      "syntax errors surface from the dump");
}

}  // namespace

void register_round_trip_tests(std::vector<TestCase>& tests) {
  tests.push_back({"round_trip_queries", test_round_trip_queries});
  tests.push_back({"round_trip_canonical_text_shape", test_canonical_text_shape});
  tests.push_back({"round_trip_statement_text", test_statement_text});
  tests.push_back({"ast_dump_shape", test_ast_dump_shape});
  tests.push_back({"ast_dump_non_ascii_values", test_ast_dump_non_ascii_values});
  tests.push_back({"ast_dump_rejects_invalid_query", test_ast_dump_rejects_invalid_query});
}
