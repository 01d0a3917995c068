#pragma once

#include <string>
#include <vector>

#include "../lang/ast.h"
#include "ovsql/dialect.h"

namespace ovsql {

/// Projection list for an `out` statement.
/// Detail levels are cumulative; the geometry expression, if any, comes last and is WGS84.
std::vector<std::string> output_columns(const Statement& emit, const Dialect& dialect, int srid);

/// Terminal SELECT over `relation`, ordered by (osm_type, id), without the trailing `;`.
std::string output_select(const std::vector<std::string>& columns, const std::string& relation);

}  // namespace ovsql
