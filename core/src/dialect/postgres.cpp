#include "dialects.h"

#include <string>
#include <vector>

#include "../util/string_util.h"

namespace ovsql {

namespace {

/// PostgreSQL spelling: jsonb tags, array node lists, jsonb member lists and geography distances.
class PostgresDialect : public Dialect {
 public:
  PostgresDialect()
      : Dialect(DialectDescriptor{"postgres", ViewLayout::Split,
                                  FragmentStrategy::CommonTableExpressions, 3600000000LL, 0, 0,
                                  ""}) {}

  std::string tag_exists(const std::string& table, const std::string& key) const override {
    return table + ".tags?" + escape_literal(key);
  }

  std::string tag_value(const std::string& table, const std::string& key) const override {
    return table + ".tags->>" + escape_literal(key);
  }

  std::string regex_match(const std::string& lhs, const std::string& pattern,
                          bool case_insensitive, bool negated) const override {
    std::string op = negated ? "!~" : "~";
    if (case_insensitive) op += "*";
    return lhs + " " + op + " " + escape_literal(pattern);
  }

  std::string id_in_list(const std::string& column, const std::vector<int64_t>& ids) const override {
    std::vector<std::string> values;
    for (int64_t id : ids) values.push_back(std::to_string(id));
    return column + " = ANY (ARRAY[" + util::join(values, ", ") + "])";
  }

  std::string make_envelope(const std::string& west, const std::string& south,
                            const std::string& east, const std::string& north) const override {
    return "ST_MakeEnvelope(" + west + ", " + south + ", " + east + ", " + north + ", 4326)";
  }

  std::string make_polygon(const std::string& wkt) const override {
    return "ST_GeomFromText(" + escape_literal(wkt) + ", 4326)";
  }

  std::string transform_from_wgs84(const std::string& geom, int srid) const override {
    if (srid == 4326) return geom;
    return "ST_Transform(" + geom + ", " + std::to_string(srid) + ")";
  }

  std::string transform_to_wgs84(const std::string& geom, int srid) const override {
    if (srid == 4326) return geom;
    return "ST_Transform(" + geom + ", 4326)";
  }

  std::string distance_within(const std::string& geom_a, const std::string& geom_b,
                              const std::string& radius_meters, int srid) const override {
    return "ST_DWithin(" + transform_to_wgs84(geom_a, srid) + "::geography, " +
           transform_to_wgs84(geom_b, srid) + "::geography, " + radius_meters + ")";
  }

  std::string reference_rows(const std::string& parent) const override {
    return "SELECT 'n' AS osm_type, node_ref AS id\n"
           "FROM unnest(" + parent + ".nodes) AS node_ref\n"
           "UNION ALL\n"
           "SELECT member.type AS osm_type, member.ref AS id\n"
           "FROM jsonb_to_recordset(" + parent + ".members) AS member(ref bigint, role text, type text)";
  }

  std::optional<std::string> statement_timeout(int64_t seconds) const override {
    return "SET statement_timeout = " + std::to_string(seconds * 1000) + ";";
  }
};

}  // namespace

std::unique_ptr<Dialect> make_postgres_dialect() { return std::make_unique<PostgresDialect>(); }

}  // namespace ovsql
