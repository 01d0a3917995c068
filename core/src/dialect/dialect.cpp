#include "ovsql/dialect.h"

#include <map>
#include <utility>

#include "dialects.h"
#include "ovsql/errors.h"
#include "../util/string_util.h"

namespace ovsql {

Dialect::Dialect(DialectDescriptor descriptor) : descriptor_(std::move(descriptor)) {}

std::string Dialect::view_name(EntityKind kind, ViewRole role) const {
  std::string base = entity_keyword(kind);
  if (descriptor_.view_layout == ViewLayout::Single) {
    return base;
  }
  return base + (role == ViewRole::Lookup ? "_by_id" : "_by_geom");
}

/// Builds the id predicate for `table`.
/// Partitioned layouts group ids by range so the backend can prune partitions.
std::string Dialect::id_predicate(const std::string& table, const std::vector<int64_t>& ids) const {
  const std::string column = table + ".id";
  if (descriptor_.id_partition_width <= 0) {
    return id_in_list(column, ids);
  }
  std::map<int64_t, std::vector<int64_t>> by_partition;
  for (int64_t id : ids) {
    by_partition[id / descriptor_.id_partition_width].push_back(id);
  }
  std::vector<std::string> parts;
  for (const auto& entry : by_partition) {
    parts.push_back("(" + table + "." + descriptor_.id_partition_column + " = " +
                    std::to_string(entry.first) + " AND " + id_in_list(column, entry.second) + ")");
  }
  if (parts.size() == 1) return parts.front();
  return "(" + util::join(parts, " OR ") + ")";
}

std::string Dialect::escape_literal(const std::string& value) const {
  std::string out = "'";
  for (char c : value) {
    if (c == '\'') out.push_back('\'');
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

std::unique_ptr<Dialect> make_dialect(const std::string& name) {
  if (name == "postgres") return make_postgres_dialect();
  if (name == "duckdb") return make_duckdb_dialect();
  throw UnsupportedDialectError(name);
}

std::vector<std::string> supported_dialects() { return {"postgres", "duckdb"}; }

}  // namespace ovsql
