// typeweave/resolution/binding_table.hpp - Explicit bindings visible from a leaf entity
#pragma once

#include <unordered_map>
#include <vector>

#include "typeweave/resolution/substitution_map.hpp"
#include "typeweave/types/entity.hpp"

namespace typeweave
{

/**
 * Explicit-binding accessors visible from one leaf entity.
 *
 * One level per entity of the leaf's hierarchy that declares accessors, in
 * hierarchy order. Each level maps the placeholder an accessor binds, plus
 * every placeholder reached from it through the leaf's substitution chain
 * (forward) or alias chain (backward), to that accessor. A level's own
 * accessors always take precedence over aliases registered at that level.
 */
class BindingTable
{
public:
  struct Level
  {
    const Entity * entity = nullptr;
    std::unordered_map<const TypeExpr *, const BindingAccessor *> accessors;
  };

  BindingTable() = default;

  [[nodiscard]] static BindingTable build(const Entity & leaf, const SubstitutionMap & substitutions);

  /// Accessor of the first level binding `placeholder`, or nullptr
  [[nodiscard]] const BindingAccessor * find(const TypeExpr * placeholder) const noexcept;

  [[nodiscard]] const std::vector<Level> & levels() const noexcept { return levels_; }
  [[nodiscard]] bool empty() const noexcept { return levels_.empty(); }

private:
  std::vector<Level> levels_;
};

}  // namespace typeweave
