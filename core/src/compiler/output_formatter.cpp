#include "output_formatter.h"

#include "../util/string_util.h"

namespace ovsql {

std::vector<std::string> output_columns(const Statement& emit, const Dialect& dialect, int srid) {
  std::vector<std::string> columns = {"osm_type", "id"};
  if (emit.detail != Statement::Detail::Ids) {
    columns.push_back(
        "CASE osm_type WHEN 'n' THEN 'node' WHEN 'w' THEN 'way' WHEN 'r' THEN 'relation' WHEN 'a' THEN 'area' END AS type");
  }
  // WHY: `tags` adds nothing over `body` because body already carries the tag map.
  if (emit.detail == Statement::Detail::Body || emit.detail == Statement::Detail::Tags ||
      emit.detail == Statement::Detail::Meta) {
    columns.push_back("tags");
    columns.push_back("nodes");
    columns.push_back("members");
  }
  if (emit.detail == Statement::Detail::Meta) {
    columns.push_back("version");
    columns.push_back("created");
  }
  switch (emit.geometry) {
    case Statement::Geometry::None:
      break;
    case Statement::Geometry::Full: {
      std::string geom = dialect.transform_to_wgs84("geom", srid);
      columns.push_back(geom == "geom" ? geom : geom + " AS geom");
      break;
    }
    case Statement::Geometry::Center:
      columns.push_back(dialect.transform_to_wgs84("ST_Centroid(geom)", srid) + " AS center");
      break;
    case Statement::Geometry::Bbox:
      columns.push_back(dialect.transform_to_wgs84("ST_Envelope(geom)", srid) + " AS bbox");
      break;
  }
  return columns;
}

std::string output_select(const std::vector<std::string>& columns, const std::string& relation) {
  return "SELECT\n    " + util::join(columns, ",\n    ") + "\nFROM\n    " + relation +
         "\nORDER BY\n    osm_type, id";
}

}  // namespace ovsql
