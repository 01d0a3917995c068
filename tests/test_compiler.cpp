#include "test_harness.h"
#include "test_utils.h"

#include <string>
#include <vector>

#include "ovsql/errors.h"

namespace {

const char* kAreaScenario =
    "[out:json][timeout:25];area(7009125)->.a;nwr.a[\"tourism\"=\"information\"];out center meta;";

void test_area_scenario_postgres() {
  const std::string expected =
      "SET statement_timeout = 25000;\n"
      "\n"
      "WITH\n"
      "_a AS (\n"
      "    SELECT\n"
      "        area_by_id.*\n"
      "    FROM\n"
      "        area_by_id\n"
      "    WHERE\n"
      "        area_by_id.id = ANY (ARRAY[7009125])\n"
      "),\n"
      "_default AS (\n"
      "    SELECT\n"
      "        nwr_by_geom.*\n"
      "    FROM\n"
      "        nwr_by_geom\n"
      "    WHERE\n"
      "        EXISTS (\n"
      "            SELECT 1\n"
      "            FROM _a AS area_set\n"
      "            WHERE ST_Intersects(area_set.geom, nwr_by_geom.geom)\n"
      "        ) AND\n"
      "        (nwr_by_geom.tags?'tourism' AND nwr_by_geom.tags->>'tourism' = 'information')\n"
      ")\n"
      "SELECT\n"
      "    osm_type,\n"
      "    id,\n"
      "    CASE osm_type WHEN 'n' THEN 'node' WHEN 'w' THEN 'way' WHEN 'r' THEN 'relation' WHEN 'a' THEN 'area' END AS type,\n"
      "    tags,\n"
      "    nodes,\n"
      "    members,\n"
      "    version,\n"
      "    created,\n"
      "    ST_Centroid(geom) AS center\n"
      "FROM\n"
      "    _default\n"
      "ORDER BY\n"
      "    osm_type, id\n"
      ";\n";
  expect_text(compile_sql(kAreaScenario, "postgres"), expected, "postgres area scenario");
}

void test_area_scenario_duckdb() {
  const std::string expected =
      "-- timeout: 25s\n"
      "\n"
      "CREATE OR REPLACE TEMP TABLE _a AS\n"
      "SELECT\n"
      "    area.*\n"
      "FROM\n"
      "    area\n"
      "WHERE\n"
      "    (area.id_range = 0 AND (area.id = 7009125))\n"
      ";\n"
      "\n"
      "CREATE OR REPLACE TEMP TABLE _default AS\n"
      "SELECT\n"
      "    nwr.*\n"
      "FROM\n"
      "    nwr\n"
      "WHERE\n"
      "    EXISTS (\n"
      "        SELECT 1\n"
      "        FROM _a AS area_set\n"
      "        WHERE ST_Intersects(area_set.geom, nwr.geom)\n"
      "    ) AND\n"
      "    ((nwr.tags->>'tourism') IS NOT NULL AND (nwr.tags->>'tourism') = 'information')\n"
      ";\n"
      "\n"
      "SELECT\n"
      "    osm_type,\n"
      "    id,\n"
      "    CASE osm_type WHEN 'n' THEN 'node' WHEN 'w' THEN 'way' WHEN 'r' THEN 'relation' WHEN 'a' THEN 'area' END AS type,\n"
      "    tags,\n"
      "    nodes,\n"
      "    members,\n"
      "    version,\n"
      "    created,\n"
      "    ST_Centroid(geom) AS center\n"
      "FROM\n"
      "    _default\n"
      "ORDER BY\n"
      "    osm_type, id\n"
      ";\n";
  expect_text(compile_sql(kAreaScenario, "duckdb"), expected, "duckdb area scenario");
}

void test_script_carries_settings() {
  ovsql::SqlScript script = compile_script(kAreaScenario, "postgres");
  expect_true(script.timeout.value_or(0) == 25, "timeout recorded");
  expect_true(script.output_format.value_or("") == "json", "output format recorded");
  expect_eq(script.statements.size(), 2, "timeout plus one output");
  ovsql::SqlScript plain = compile_script("node(1);out;", "postgres");
  expect_eq(plain.statements.size(), 1, "no timeout statement without [timeout]");
}

void test_relation_area_id_scenario() {
  const std::string postgres = compile_sql("area(3600062422);out ids;", "postgres");
  expect_true(contains(postgres, "area_by_id.id = ANY (ARRAY[3600062422])"),
              "relation-sourced area matched on its derived id");
  const std::string duckdb = compile_sql("area(3600062422);out ids;", "duckdb");
  expect_true(contains(duckdb, "(area.id_range = 360 AND (area.id = 3600062422))"),
              "derived id partitioned like any other id");
}

void test_area_rows_keep_their_own_kind() {
  const std::string sql = compile_sql("(way(5); area(5);)->.u; area.u->.a; way.u->.w; .a out;", "postgres");
  expect_true(contains(sql, "area_by_id.id = ANY (ARRAY[5])") &&
                  !contains(sql, "area_by_id.osm_type"),
              "area branch not rewritten to its source way");
  expect_true(contains(sql, "_u.osm_type = 'a'"), "areas selected by their own discriminant");
  expect_true(contains(sql, "_u.osm_type = 'w'"), "ways selected separately");
  expect_true(contains(sql, "WHEN 'a' THEN 'area'"), "area rows reported as areas");
}

void test_bbox_argument_order() {
  const std::string postgres = compile_sql("node(1.0,2.0,3.0,4.0);out;", "postgres");
  expect_true(contains(postgres,
                       "ST_Intersects(node_by_geom.geom, ST_MakeEnvelope(2.0, 1.0, 4.0, 3.0, 4326))"),
              "postgres envelope is (west, south, east, north)");
  const std::string duckdb = compile_sql("node(1.0,2.0,3.0,4.0);out;", "duckdb");
  expect_true(contains(duckdb, "ST_Intersects(node.geom, ST_MakeEnvelope(2.0, 1.0, 4.0, 3.0))"),
              "duckdb envelope is (west, south, east, north)");
}

void test_bbox_with_projected_storage() {
  const std::string postgres = compile_sql("node(1.0,2.0,3.0,4.0);out;", "postgres", 3857);
  expect_true(contains(postgres, "ST_Transform(ST_MakeEnvelope(2.0, 1.0, 4.0, 3.0, 4326), 3857)"),
              "envelope transformed into the storage SRID");
  const std::string duckdb = compile_sql("node(1.0,2.0,3.0,4.0);out;", "duckdb", 3857);
  expect_true(contains(duckdb,
                       "ST_Transform(ST_MakeEnvelope(2.0, 1.0, 4.0, 3.0), 'EPSG:4326', 'EPSG:3857', true)"),
              "duckdb envelope transformed into the storage SRID");
}

void test_literal_bounds_are_not_reformatted() {
  const std::string sql = compile_sql("node(-33.9,18.40,-33.8,18.5);out;", "postgres");
  expect_true(contains(sql, "ST_MakeEnvelope(18.40, -33.9, 18.5, -33.8, 4326)"),
              "bounds keep their lexical form");
}

void test_ids_use_lookup_view() {
  const std::string by_id = compile_sql("way(5);out;", "postgres");
  expect_true(contains(by_id, "FROM\n        way_by_id\n"), "ids read the lookup view");
  expect_true(contains(by_id, "way_by_id.id = ANY (ARRAY[5])"), "id predicate");
  const std::string by_tag = compile_sql("way[highway];out;", "postgres");
  expect_true(contains(by_tag, "FROM\n        way_by_geom\n"), "other filters read the geometry view");
  expect_text(compile_sql("way(5);out;", "duckdb"), compile_sql("way(id:5);out;", "duckdb"),
              "single id equals one-element id list");
}

void test_selector_lowering_postgres() {
  const std::string sql = compile_sql(
      "node[amenity][!disused][\"name\"=\"O'Brien\"][access!=no][ref~\"^A\\d\",i][note!~x][lanes=2][\"fixme\"=\"\"];out;",
      "postgres");
  expect_true(contains(sql, "node_by_geom.tags?'amenity' AND"), "exists");
  expect_true(contains(sql, "NOT node_by_geom.tags?'disused' AND"), "negated exists");
  expect_true(contains(sql,
                       "(node_by_geom.tags?'name' AND node_by_geom.tags->>'name' = 'O''Brien')"),
              "equality with escaped quote");
  expect_true(contains(sql,
                       "(NOT node_by_geom.tags?'access' OR node_by_geom.tags->>'access' != 'no')"),
              "inequality also matches missing keys");
  expect_true(contains(sql,
                       "(node_by_geom.tags?'ref' AND node_by_geom.tags->>'ref' ~* '^A\\d')"),
              "case-insensitive regex keeps escapes");
  expect_true(contains(sql,
                       "(NOT node_by_geom.tags?'note' OR node_by_geom.tags->>'note' !~ 'x')"),
              "negated regex");
  expect_true(contains(sql, "node_by_geom.tags->>'lanes' = '2'"), "numbers compare as text");
  expect_true(contains(sql, "NOT node_by_geom.tags?'fixme'\n"), "empty value means absent key");
}

void test_selector_lowering_duckdb() {
  const std::string sql = compile_sql("node[name!~\"x\",i][!\"a\"=\"b\"];out;", "duckdb");
  expect_true(contains(sql,
                       "(NOT (node.tags->>'name') IS NOT NULL OR "
                       "NOT regexp_matches((node.tags->>'name'), 'x', 'i'))"),
              "duckdb negated regex");
  expect_true(contains(sql,
                       "NOT ((node.tags->>'a') IS NOT NULL AND (node.tags->>'a') = 'b')"),
              "negated selector wraps the comparison");
}

void test_poly_filter() {
  const std::string sql =
      compile_sql("way(poly:\"50.7 7.1 50.7 7.2 50.75 7.15\");out;", "postgres");
  expect_true(contains(sql,
                       "ST_Intersects(way_by_geom.geom, ST_GeomFromText("
                       "'POLYGON((7.1 50.7, 7.2 50.7, 7.15 50.75, 7.1 50.7))', 4326))"),
              "polygon in lon lat order with the ring closed");
  const std::string closed =
      compile_sql("way(poly:\"1 2 3 4 5 6 1 2\");out;", "duckdb");
  expect_true(contains(closed, "'POLYGON((2 1, 4 3, 6 5, 2 1))'"), "closed ring is not repeated");
}

void test_around_filter() {
  const std::string postgres = compile_sql("node(1)->.c; way(around.c:100); out;", "postgres");
  expect_true(contains(postgres,
                       "FROM _c AS core_set\n"
                       "            WHERE\n"
                       "                ST_DWithin(core_set.geom::geography, way_by_geom.geom::geography, 100)"),
              "postgres around uses geography distance");
  const std::string duckdb = compile_sql("node(1); way(around:2.5); out;", "duckdb");
  expect_true(contains(duckdb, "FROM _default AS core_set"), "around reads the default set");
  const std::string zone =
      "'EPSG:' || CAST(CASE WHEN ST_Y(ST_Centroid(core_set.geom)) >= 0 THEN 32601 ELSE 32701 END + "
      "LEAST(CAST(floor((ST_X(ST_Centroid(core_set.geom)) + 180) / 6) AS INTEGER), 59) AS VARCHAR)";
  expect_true(contains(duckdb,
                       "        WHERE\n"
                       "            ST_DWithin(\n"
                       "                ST_Transform(core_set.geom, 'EPSG:4326', " + zone + ", true),\n"
                       "                ST_Transform(way.geom, 'EPSG:4326', " + zone + ", true),\n"
                       "                2.5\n"
                       "            )\n"
                       "    )"),
              "duckdb around measures meters in the UTM zone of the core set");
  expect_true(!contains(duckdb, "111320"), "no fixed meters-per-degree factor");
  const std::string projected = compile_sql("node(1); way(around:2.5); out;", "duckdb", 25832);
  expect_true(contains(projected, "ST_DWithin(core_set.geom, way.geom, 2.5)"),
              "projected storage is already metric");
}

void test_kind_restriction_on_input_set() {
  const std::string sql = compile_sql("nwr(1)->.a; way.a[highway]; out;", "postgres");
  expect_true(contains(sql, "FROM\n        _a\n    WHERE\n        _a.osm_type = 'w' AND\n"),
              "way.a keeps only ways of the input set");
  const std::string any = compile_sql("nwr(1)->.a; nwr.a[highway]; out;", "postgres");
  expect_true(!contains(any, "_a.osm_type ="), "nwr.a does not restrict kinds");
}

void test_area_filter_on_area_set() {
  const std::string sql = compile_sql("area[name=Berlin]->.b; node[amenity](area.b); out;", "duckdb");
  expect_true(contains(sql, "FROM\n    area\nWHERE\n    ((area.tags->>'name') IS NOT NULL"),
              "area query without ids scans the area view");
  expect_true(contains(sql, "FROM _b AS area_set\n        WHERE ST_Intersects(area_set.geom, node.geom)"),
              "area filter intersects the named area set");
}

void test_area_filter_requires_area_set() {
  expect_throws<ovsql::FilterApplicabilityError>(
      [] { compile_sql("node(1)->.x; way(area.x); out;", "postgres"); },
      [](const ovsql::FilterApplicabilityError& e) {
        expect_true(std::string(e.what()).find("Set '.x' does not hold areas") == 0,
                    "message names the set");
        expect_eq(e.position(), 16, "position of the filter");
      },
      "node set is not an area set");
  expect_throws<ovsql::FilterApplicabilityError>(
      [] { compile_sql("way(area); out;", "duckdb"); },
      [](const ovsql::FilterApplicabilityError& e) {
        expect_true(std::string(e.what()).find("Set '_' does not hold areas") == 0,
                    "empty default is not an area set");
      },
      "default set before any area query");
  expect_throws<ovsql::FilterApplicabilityError>(
      [] { compile_sql("(area(1); node(2);)->.mixed; way(area.mixed); out;", "postgres"); },
      [](const ovsql::FilterApplicabilityError&) {}, "mixed set is not an area set");
}

void test_typed_query_narrows_input_kinds() {
  expect_throws<ovsql::FilterApplicabilityError>(
      [] { compile_sql("node(1); area._; node(area); out ids;", "postgres"); },
      [](const ovsql::FilterApplicabilityError& e) {
        expect_true(std::string(e.what()).find("Set '_' does not hold areas") == 0,
                    "area rows of a node set are no area set");
        expect_eq(e.position(), 21, "position of the filter");
      },
      "typed query over a node set");
  const std::string sql = compile_sql("area(1)->.a; area.a->.b; node(area.b); out;", "postgres");
  expect_true(contains(sql, "FROM _b AS area_set"), "area rows of an area set stay an area set");
}

void test_output_on_empty_default() {
  const std::string sql = compile_sql("out;", "postgres");
  expect_true(contains(sql, "_empty AS (\n    SELECT\n        nwr_by_id.*\n    FROM\n        nwr_by_id\n"
                            "    WHERE\n        false\n)"),
              "empty default becomes an empty relation");
  expect_true(contains(sql, "FROM\n    _empty\n"), "out reads the empty relation");
  const std::string duckdb = compile_sql("out; out;", "duckdb");
  expect_eq(count_occurrences(duckdb, "TEMP TABLE _empty AS"), 1, "empty relation created once");
}

void test_each_output_is_self_contained() {
  ovsql::SqlScript script = compile_script("node(1)->.a; .a out; way(2); out;", "postgres");
  expect_eq(script.statements.size(), 2, "one statement per out");
  if (script.statements.size() != 2) return;
  expect_true(contains(script.statements[0], "_a AS ("), "first output defines _a");
  expect_true(!contains(script.statements[0], "_default AS ("), "later fragments are not included");
  expect_true(contains(script.statements[1], "_a AS (") &&
                  contains(script.statements[1], "_default AS ("),
              "second output repeats earlier fragments");
}

void test_query_without_output_emits_only_fragments() {
  ovsql::SqlScript postgres = compile_script("node(1);", "postgres");
  expect_eq(postgres.statements.size(), 0, "no select without out");
  ovsql::SqlScript duckdb = compile_script("node(1);", "duckdb");
  expect_eq(duckdb.statements.size(), 1, "duckdb still materializes the fragment");
}

}  // namespace

void register_compiler_tests(std::vector<TestCase>& tests) {
  tests.push_back({"compiler_area_scenario_postgres", test_area_scenario_postgres});
  tests.push_back({"compiler_area_scenario_duckdb", test_area_scenario_duckdb});
  tests.push_back({"compiler_script_carries_settings", test_script_carries_settings});
  tests.push_back({"compiler_relation_area_id_scenario", test_relation_area_id_scenario});
  tests.push_back({"compiler_area_rows_keep_their_own_kind", test_area_rows_keep_their_own_kind});
  tests.push_back({"compiler_bbox_argument_order", test_bbox_argument_order});
  tests.push_back({"compiler_bbox_with_projected_storage", test_bbox_with_projected_storage});
  tests.push_back({"compiler_literal_bounds_are_not_reformatted",
                   test_literal_bounds_are_not_reformatted});
  tests.push_back({"compiler_ids_use_lookup_view", test_ids_use_lookup_view});
  tests.push_back({"compiler_selector_lowering_postgres", test_selector_lowering_postgres});
  tests.push_back({"compiler_selector_lowering_duckdb", test_selector_lowering_duckdb});
  tests.push_back({"compiler_poly_filter", test_poly_filter});
  tests.push_back({"compiler_around_filter", test_around_filter});
  tests.push_back({"compiler_kind_restriction_on_input_set", test_kind_restriction_on_input_set});
  tests.push_back({"compiler_area_filter_on_area_set", test_area_filter_on_area_set});
  tests.push_back({"compiler_area_filter_requires_area_set", test_area_filter_requires_area_set});
  tests.push_back({"compiler_typed_query_narrows_input_kinds", test_typed_query_narrows_input_kinds});
  tests.push_back({"compiler_output_on_empty_default", test_output_on_empty_default});
  tests.push_back({"compiler_each_output_is_self_contained", test_each_output_is_self_contained});
  tests.push_back({"compiler_query_without_output_emits_only_fragments",
                   test_query_without_output_emits_only_fragments});
}
