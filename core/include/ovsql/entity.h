#pragma once

#include <string>

namespace ovsql {

/// Map entity kinds addressable by a query statement.
/// Any is the union of the three primitive kinds (written `nwr`).
enum class EntityKind {
  Node,
  Way,
  Relation,
  Area,
  Any
};

/// Keyword spelling of a kind as written in queries (`node`, `way`, `relation`, `area`, `nwr`).
const char* entity_keyword(EntityKind kind);

/// Single-letter `osm_type` discriminant stored in the backend views ('n', 'w', 'r', 'a').
/// Returns 0 for Any, which spans the three primitive kinds.
char entity_discriminant(EntityKind kind);

}  // namespace ovsql
