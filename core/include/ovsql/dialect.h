#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ovsql/entity.h"

namespace ovsql {

/// Which of a kind's views a statement reads from.
enum class ViewRole {
  Lookup,
  Geometry
};

/// Split backends expose `<kind>_by_id` and `<kind>_by_geom`; Single backends one `<kind>` view.
enum class ViewLayout {
  Split,
  Single
};

/// How statement fragments become SQL: one WITH chain per output, or materialized temp tables.
enum class FragmentStrategy {
  CommonTableExpressions,
  TempTables
};

/// Static facts about one backend's schema contract.
/// MUST be the only place that knows view names, id arithmetic and partitioning.
/// Area views carry `osm_type = 'a'` and the derived area id: the native id plus
/// `relation_area_offset` for relation-sourced areas, plus `way_area_offset` for way-sourced ones.
struct DialectDescriptor {
  std::string name;
  ViewLayout view_layout = ViewLayout::Split;
  FragmentStrategy fragment_strategy = FragmentStrategy::CommonTableExpressions;
  int64_t relation_area_offset = 3600000000LL;
  int64_t way_area_offset = 0;
  // Zero when views are not partitioned by id range.
  int64_t id_partition_width = 0;
  std::string id_partition_column;
};

/// SQL spelling of one backend, parameterized by its descriptor.
/// Table-driven facts are answered here; function spellings are supplied by subclasses.
class Dialect {
 public:
  explicit Dialect(DialectDescriptor descriptor);
  virtual ~Dialect() = default;

  const DialectDescriptor& descriptor() const { return descriptor_; }
  const std::string& name() const { return descriptor_.name; }

  /// Returns the view serving `kind` in `role`; Single layouts ignore the role.
  std::string view_name(EntityKind kind, ViewRole role) const;

  /// Id membership predicate on `table`, partition-pruned when the descriptor partitions views.
  std::string id_predicate(const std::string& table, const std::vector<int64_t>& ids) const;

  /// Quotes a string as an SQL literal, doubling embedded single quotes.
  virtual std::string escape_literal(const std::string& value) const;

  virtual std::string tag_exists(const std::string& table, const std::string& key) const = 0;
  virtual std::string tag_value(const std::string& table, const std::string& key) const = 0;
  virtual std::string regex_match(const std::string& lhs,
                                  const std::string& pattern,
                                  bool case_insensitive,
                                  bool negated) const = 0;
  virtual std::string id_in_list(const std::string& column, const std::vector<int64_t>& ids) const = 0;

  /// Envelope literal in WGS84 from lexical bounds.
  virtual std::string make_envelope(const std::string& west,
                                    const std::string& south,
                                    const std::string& east,
                                    const std::string& north) const = 0;
  /// Polygon literal in WGS84 from a WKT string.
  virtual std::string make_polygon(const std::string& wkt) const = 0;
  virtual std::string transform_from_wgs84(const std::string& geom, int srid) const = 0;
  virtual std::string transform_to_wgs84(const std::string& geom, int srid) const = 0;
  /// Predicate true when `geom_a` and `geom_b` are within `radius_meters` of each other.
  virtual std::string distance_within(const std::string& geom_a,
                                      const std::string& geom_b,
                                      const std::string& radius_meters,
                                      int srid) const = 0;
  /// Subquery yielding (osm_type, id) for every node ref and member of row `parent`.
  virtual std::string reference_rows(const std::string& parent) const = 0;
  /// Statement enforcing the request timeout, if the backend has one.
  virtual std::optional<std::string> statement_timeout(int64_t seconds) const = 0;

 private:
  DialectDescriptor descriptor_;
};

/// Returns the backend selected by `name` ("postgres" or "duckdb").
/// MUST throw UnsupportedDialectError for any other value.
std::unique_ptr<Dialect> make_dialect(const std::string& name);
/// Lists accepted dialect names in a stable order.
std::vector<std::string> supported_dialects();

}  // namespace ovsql
