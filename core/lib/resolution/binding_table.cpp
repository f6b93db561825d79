// typeweave/resolution/binding_table.cpp - Explicit bindings visible from a leaf entity
//
#include "typeweave/resolution/binding_table.hpp"

#include <deque>
#include <unordered_set>

namespace typeweave
{

namespace
{

using AccessorMap = std::unordered_map<const TypeExpr *, const BindingAccessor *>;

/// Follow the substitution chain forward from `start`.
void traverse_assignments(
  AccessorMap & target, const TypeExpr * start, const BindingAccessor * accessor,
  const SubstitutionMap & substitutions)
{
  std::unordered_set<const TypeExpr *> visited{start};
  const TypeExpr * t = substitutions.find(start);
  while (t != nullptr && t->is_placeholder() && visited.insert(t).second) {
    target.emplace(t, accessor);
    t = substitutions.find(t);
  }
}

/// Follow the alias chain backward from `start`.
void traverse_aliases(
  AccessorMap & target, const TypeExpr * start, const BindingAccessor * accessor,
  const SubstitutionMap & substitutions)
{
  std::unordered_set<const TypeExpr *> visited{start};
  std::deque<const TypeExpr *> pending{start};
  while (!pending.empty()) {
    const TypeExpr * current = pending.front();
    pending.pop_front();
    for (const auto * alias : substitutions.aliases_of(current)) {
      if (visited.insert(alias).second) {
        target.emplace(alias, accessor);
        pending.push_back(alias);
      }
    }
  }
}

}  // namespace

BindingTable BindingTable::build(const Entity & leaf, const SubstitutionMap & substitutions)
{
  BindingTable table;

  for (const Entity * entity : hierarchy(leaf)) {
    if (entity->binding_accessors().empty()) {
      continue;
    }

    Level level;
    level.entity = entity;
    for (const auto & accessor : entity->binding_accessors()) {
      level.accessors.emplace(accessor.placeholder, &accessor);
    }

    AccessorMap additional;
    for (const auto & accessor : entity->binding_accessors()) {
      traverse_assignments(additional, accessor.placeholder, &accessor, substitutions);
      traverse_aliases(additional, accessor.placeholder, &accessor, substitutions);
    }
    for (const auto & [placeholder, accessor] : additional) {
      level.accessors.emplace(placeholder, accessor);
    }

    table.levels_.push_back(std::move(level));
  }
  return table;
}

const BindingAccessor * BindingTable::find(const TypeExpr * placeholder) const noexcept
{
  for (const auto & level : levels_) {
    auto it = level.accessors.find(placeholder);
    if (it != level.accessors.end()) {
      return it->second;
    }
  }
  return nullptr;
}

}  // namespace typeweave
