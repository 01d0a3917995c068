#include "binding_env.h"

#include "ovsql/errors.h"

namespace ovsql {

unsigned kind_mask(EntityKind kind) {
  switch (kind) {
    case EntityKind::Node:
      return kNodeKind;
    case EntityKind::Way:
      return kWayKind;
    case EntityKind::Relation:
      return kRelationKind;
    case EntityKind::Area:
      return kAreaKind;
    case EntityKind::Any:
      return kPrimitiveKinds;
  }
  return kPrimitiveKinds;
}

void BindingEnv::define(const std::string& name, const BindingValue& value) {
  auto it = bindings_.find(name);
  if (it == bindings_.end()) {
    bindings_.emplace(name, value);
    order_.push_back(name);
    return;
  }
  it->second = value;
}

const BindingValue& BindingEnv::resolve(const std::string& name, size_t position) const {
  if (name == "_") return default_;
  auto it = bindings_.find(name);
  if (it == bindings_.end()) {
    throw UnboundNameError(name, position);
  }
  return it->second;
}

std::vector<std::string> BindingEnv::names_redefined_since(const BindingEnv& base) const {
  std::vector<std::string> out;
  for (const auto& name : order_) {
    const BindingValue& value = bindings_.at(name);
    auto it = base.bindings_.find(name);
    if (it == base.bindings_.end() || it->second.relation != value.relation ||
        it->second.kinds != value.kinds) {
      out.push_back(name);
    }
  }
  return out;
}

}  // namespace ovsql
