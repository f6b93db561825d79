// typeweave/resolution/substitution_map.hpp - Placeholder assignments over a hierarchy
#pragma once

#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "typeweave/types/type_utils.hpp"

namespace typeweave
{

/**
 * Placeholder assignments collected over the whole ancestor set of a type.
 *
 * For every parameterized supertype met while walking the hierarchy, the
 * supertype entity's placeholders are mapped to the arguments supplied at
 * that point. The inverse (alias) view maps a placeholder back to every
 * placeholder that is substituted by it.
 */
class SubstitutionMap
{
public:
  using Entry = std::pair<const TypeExpr *, const TypeExpr *>;

  SubstitutionMap() = default;

  /// Collect the assignments of `entity` used raw (its own placeholders stay free).
  [[nodiscard]] static SubstitutionMap collect(const Entity & entity);

  /// Collect the assignments of `type`, including its own arguments if parameterized.
  [[nodiscard]] static SubstitutionMap collect(const TypeExpr * type);

  /// Direct assignment of a placeholder, or nullptr
  [[nodiscard]] const TypeExpr * find(const TypeExpr * placeholder) const noexcept;

  /// Placeholders whose assignment is exactly `placeholder`, in discovery order
  [[nodiscard]] const std::vector<const TypeExpr *> & aliases_of(const TypeExpr * placeholder) const;

  [[nodiscard]] const TypeVarMap & assignments() const noexcept { return map_; }

  /// Entries in discovery order
  [[nodiscard]] const std::vector<Entry> & entries() const noexcept { return order_; }

  [[nodiscard]] bool empty() const noexcept { return map_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return map_.size(); }

private:
  void spider(std::unordered_set<const Entity *> & seen_interfaces, const TypeExpr * type);
  void put(const TypeExpr * placeholder, const TypeExpr * value);
  void build_inverse();

  TypeVarMap map_;
  std::vector<Entry> order_;
  std::unordered_map<const TypeExpr *, std::vector<const TypeExpr *>> inverse_;
};

}  // namespace typeweave
