#include "dialects.h"

#include <string>
#include <vector>

#include "../util/string_util.h"

namespace ovsql {

namespace {

// EPSG code of the WGS84 / UTM zone containing the centroid of `geom`: 326zz north, 327zz south.
std::string utm_zone_of(const std::string& geom) {
  const std::string centroid = "ST_Centroid(" + geom + ")";
  return "'EPSG:' || CAST(CASE WHEN ST_Y(" + centroid + ") >= 0 THEN 32601 ELSE 32701 END + "
         "LEAST(CAST(floor((ST_X(" + centroid + ") + 180) / 6) AS INTEGER), 59) AS VARCHAR)";
}

/// DuckDB spelling: JSON tags, list columns, regexp_matches and `EPSG:` transforms.
/// Views are partitioned on `id_range = id / 10000000`.
/// Geometries are stored lon/lat, so every transform passes always_xy.
class DuckdbDialect : public Dialect {
 public:
  DuckdbDialect()
      : Dialect(DialectDescriptor{"duckdb", ViewLayout::Single, FragmentStrategy::TempTables,
                                  3600000000LL, 0, 10000000LL, "id_range"}) {}

  std::string tag_exists(const std::string& table, const std::string& key) const override {
    return tag_value(table, key) + " IS NOT NULL";
  }

  std::string tag_value(const std::string& table, const std::string& key) const override {
    return "(" + table + ".tags->>" + escape_literal(key) + ")";
  }

  std::string regex_match(const std::string& lhs, const std::string& pattern,
                          bool case_insensitive, bool negated) const override {
    std::string call = "regexp_matches(" + lhs + ", " + escape_literal(pattern);
    if (case_insensitive) call += ", 'i'";
    call += ")";
    return negated ? "NOT " + call : call;
  }

  std::string id_in_list(const std::string& column, const std::vector<int64_t>& ids) const override {
    std::vector<std::string> parts;
    for (int64_t id : ids) parts.push_back(column + " = " + std::to_string(id));
    return "(" + util::join(parts, " OR ") + ")";
  }

  std::string make_envelope(const std::string& west, const std::string& south,
                            const std::string& east, const std::string& north) const override {
    return "ST_MakeEnvelope(" + west + ", " + south + ", " + east + ", " + north + ")";
  }

  std::string make_polygon(const std::string& wkt) const override {
    return "ST_GeomFromText(" + escape_literal(wkt) + ")";
  }

  std::string transform_from_wgs84(const std::string& geom, int srid) const override {
    if (srid == 4326) return geom;
    return "ST_Transform(" + geom + ", 'EPSG:4326', 'EPSG:" + std::to_string(srid) + "', true)";
  }

  std::string transform_to_wgs84(const std::string& geom, int srid) const override {
    if (srid == 4326) return geom;
    return "ST_Transform(" + geom + ", 'EPSG:" + std::to_string(srid) + "', 'EPSG:4326', true)";
  }

  std::string distance_within(const std::string& geom_a, const std::string& geom_b,
                              const std::string& radius_meters, int srid) const override {
    if (srid != 4326) {
      return "ST_DWithin(" + geom_a + ", " + geom_b + ", " + radius_meters + ")";
    }
    // Degrees are not a distance: both sides are projected into the UTM zone of `geom_a`.
    const std::string zone = utm_zone_of(geom_a);
    return "ST_DWithin(\n"
           "    ST_Transform(" + geom_a + ", 'EPSG:4326', " + zone + ", true),\n"
           "    ST_Transform(" + geom_b + ", 'EPSG:4326', " + zone + ", true),\n"
           "    " + radius_meters + "\n"
           ")";
  }

  std::string reference_rows(const std::string& parent) const override {
    return "SELECT 'n' AS osm_type, node_ref AS id\n"
           "FROM (SELECT unnest(" + parent + ".nodes) AS node_ref) AS node_refs\n"
           "UNION ALL\n"
           "SELECT member.type AS osm_type, member.ref AS id\n"
           "FROM (SELECT unnest(" + parent + ".members) AS member) AS members";
  }

  std::optional<std::string> statement_timeout(int64_t) const override { return std::nullopt; }
};

}  // namespace

std::unique_ptr<Dialect> make_duckdb_dialect() { return std::make_unique<DuckdbDialect>(); }

}  // namespace ovsql
