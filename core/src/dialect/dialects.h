#pragma once

#include <memory>

#include "ovsql/dialect.h"

namespace ovsql {

/// PostgreSQL + PostGIS over split `<kind>_by_id` / `<kind>_by_geom` views.
std::unique_ptr<Dialect> make_postgres_dialect();
/// DuckDB + spatial over one id-range-partitioned view per kind.
std::unique_ptr<Dialect> make_duckdb_dialect();

}  // namespace ovsql
