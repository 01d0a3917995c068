#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "ovsql/entity.h"

namespace ovsql {

/// Bit set of entity kinds a relation may hold.
enum KindMask : unsigned {
  kNoKinds = 0,
  kNodeKind = 1u << 0,
  kWayKind = 1u << 1,
  kRelationKind = 1u << 2,
  kAreaKind = 1u << 3,
  kPrimitiveKinds = kNodeKind | kWayKind | kRelationKind
};

/// Mask describing the rows a query over `kind` can return.
unsigned kind_mask(EntityKind kind);

/// Result set produced by an earlier statement: its SQL relation and what it may contain.
/// An empty relation name marks the sentinel default before any statement ran.
struct BindingValue {
  std::string relation;
  unsigned kinds = kNoKinds;

  bool empty_sentinel() const { return relation.empty(); }
};

/// Request-scoped name to result-set map with a distinguished default set `_`.
/// Redefinition replaces the prior value; visibility follows statement order only.
class BindingEnv {
 public:
  void define(const std::string& name, const BindingValue& value);
  /// Looks up `name`; "_" returns the default set.
  /// MUST throw UnboundNameError (positioned at `position`) for unknown names.
  const BindingValue& resolve(const std::string& name, size_t position = 0) const;
  const BindingValue& current_default() const { return default_; }
  void set_default(const BindingValue& value) { default_ = value; }
  /// Names whose binding differs from `base`, in first-definition order.
  /// Used to merge assignments made inside a union member back into the outer scope.
  std::vector<std::string> names_redefined_since(const BindingEnv& base) const;

 private:
  std::map<std::string, BindingValue> bindings_;
  std::vector<std::string> order_;
  BindingValue default_;
};

}  // namespace ovsql
