#include "ovsql/entity.h"

namespace ovsql {

const char* entity_keyword(EntityKind kind) {
  switch (kind) {
    case EntityKind::Node:
      return "node";
    case EntityKind::Way:
      return "way";
    case EntityKind::Relation:
      return "relation";
    case EntityKind::Area:
      return "area";
    case EntityKind::Any:
      return "nwr";
  }
  return "nwr";
}

char entity_discriminant(EntityKind kind) {
  switch (kind) {
    case EntityKind::Node:
      return 'n';
    case EntityKind::Way:
      return 'w';
    case EntityKind::Relation:
      return 'r';
    case EntityKind::Area:
      return 'a';
    case EntityKind::Any:
      return 0;
  }
  return 0;
}

}  // namespace ovsql
