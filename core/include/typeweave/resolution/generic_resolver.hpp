// typeweave/resolution/generic_resolver.hpp - Generic signature resolver
//
// Resolves a placeholder declared somewhere in an instance's hierarchy to the
// type bound to it for that instance, honoring explicit-binding accessors
// before structural substitution.
//
#pragma once

#include <memory>
#include <shared_mutex>
#include <unordered_map>

#include "typeweave/resolution/binding_table.hpp"
#include "typeweave/resolution/substitution_map.hpp"
#include "typeweave/types/instance.hpp"

namespace typeweave
{

class GenericResolver
{
public:
  explicit GenericResolver(TypeContext & types);
  ~GenericResolver();

  GenericResolver(const GenericResolver &) = delete;
  GenericResolver & operator=(const GenericResolver &) = delete;

  /**
   * Resolve `placeholder` for `instance`.
   *
   * The first explicit binding found in hierarchy order wins; otherwise the
   * placeholder is unrolled through the entity's substitution map.
   *
   * @return bound type, or nullptr if the placeholder is left unbound
   * @throws ResolutionError (InvalidPlaceholderKind) if `placeholder` is not
   *         a placeholder declared by an entity
   * @throws ResolutionError (PlaceholderNotOwned) if the declaring entity is
   *         not in the instance's hierarchy
   */
  [[nodiscard]] const TypeExpr * resolve(const Instance & instance, const TypeExpr * placeholder) const;

  /// Same as above, unrolling through a caller-supplied substitution map.
  [[nodiscard]] const TypeExpr * resolve(
    const Instance & instance, const TypeExpr * placeholder, const SubstitutionMap & substitutions) const;

  /**
   * Substitute every placeholder inside `type` that is owned by the
   * instance's hierarchy. Placeholders that stay unbound are kept.
   */
  [[nodiscard]] const TypeExpr * resolve_deep(const Instance & instance, const TypeExpr * type) const;

  /// Substitution map of an entity (computed once).
  [[nodiscard]] const SubstitutionMap & substitution_map(const Entity & entity) const;

  /// Explicit bindings visible from an entity (computed once).
  [[nodiscard]] const BindingTable & binding_table(const Entity & entity) const;

  [[nodiscard]] TypeContext & types() const noexcept { return types_; }

private:
  struct LeafCache
  {
    SubstitutionMap substitutions;
    BindingTable bindings;
  };

  const LeafCache & leaf_cache(const Entity & leaf) const;
  void validate(const Instance & instance, const TypeExpr * placeholder) const;
  const TypeExpr * resolve_deep_impl(
    const Instance & instance, const TypeExpr * type, std::vector<const TypeExpr *> & active) const;

  TypeContext & types_;

  mutable std::shared_mutex mutex_;
  mutable std::unordered_map<const Entity *, std::unique_ptr<LeafCache>> cache_;
};

}  // namespace typeweave
