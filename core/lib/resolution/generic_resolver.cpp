// typeweave/resolution/generic_resolver.cpp - Generic signature resolver
//
#include "typeweave/resolution/generic_resolver.hpp"

#include <algorithm>
#include <mutex>
#include <string>

#include "typeweave/basic/error.hpp"

namespace typeweave
{

GenericResolver::GenericResolver(TypeContext & types) : types_(types) {}

GenericResolver::~GenericResolver() = default;

const GenericResolver::LeafCache & GenericResolver::leaf_cache(const Entity & leaf) const
{
  {
    const std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(&leaf);
    if (it != cache_.end()) {
      return *it->second;
    }
  }

  const std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = cache_.find(&leaf);
  if (it != cache_.end()) {
    return *it->second;
  }

  auto entry = std::make_unique<LeafCache>();
  entry->substitutions = SubstitutionMap::collect(leaf);
  entry->bindings = BindingTable::build(leaf, entry->substitutions);
  const LeafCache & ref = *entry;
  cache_.emplace(&leaf, std::move(entry));
  return ref;
}

const SubstitutionMap & GenericResolver::substitution_map(const Entity & entity) const
{
  return leaf_cache(entity).substitutions;
}

const BindingTable & GenericResolver::binding_table(const Entity & entity) const
{
  return leaf_cache(entity).bindings;
}

void GenericResolver::validate(const Instance & instance, const TypeExpr * placeholder) const
{
  if (placeholder == nullptr || !placeholder->is_placeholder()) {
    throw_resolution_error(
      ErrorCode::InvalidPlaceholderKind, to_string(placeholder),
      to_string(placeholder) + " is not a type parameter");
  }
  if (placeholder->declaring_entity == nullptr) {
    throw_resolution_error(
      ErrorCode::InvalidPlaceholderKind, std::string(placeholder->name),
      std::string(placeholder->name) + " is declared by method '" +
        std::string(placeholder->declaring_method) + "', not by an entity");
  }

  const Entity & leaf = instance.entity();
  const Entity & owner = *placeholder->declaring_entity;
  if (!is_subentity(leaf, owner)) {
    throw_resolution_error(
      ErrorCode::PlaceholderNotOwned, std::string(owner.name()) + "." + std::string(placeholder->name),
      std::string(owner.name()) + "." + std::string(placeholder->name) + " does not belong to " +
        std::string(leaf.name()));
  }
}

const TypeExpr * GenericResolver::resolve(const Instance & instance, const TypeExpr * placeholder) const
{
  validate(instance, placeholder);

  const LeafCache & cache = leaf_cache(instance.entity());
  if (const BindingAccessor * accessor = cache.bindings.find(placeholder)) {
    return accessor->invoke(instance);
  }
  return unroll(types_, cache.substitutions.assignments(), placeholder);
}

const TypeExpr * GenericResolver::resolve(
  const Instance & instance, const TypeExpr * placeholder, const SubstitutionMap & substitutions) const
{
  validate(instance, placeholder);

  const LeafCache & cache = leaf_cache(instance.entity());
  if (const BindingAccessor * accessor = cache.bindings.find(placeholder)) {
    return accessor->invoke(instance);
  }
  return unroll(types_, substitutions.assignments(), placeholder);
}

const TypeExpr * GenericResolver::resolve_deep(const Instance & instance, const TypeExpr * type) const
{
  std::vector<const TypeExpr *> active;
  return resolve_deep_impl(instance, type, active);
}

const TypeExpr * GenericResolver::resolve_deep_impl(
  const Instance & instance, const TypeExpr * type, std::vector<const TypeExpr *> & active) const
{
  if (type == nullptr || !contains_placeholders(type)) {
    return type;
  }

  switch (type->kind) {
    case TypeKind::Placeholder: {
      const Entity * owner = type->declaring_entity;
      if (owner == nullptr || !is_subentity(instance.entity(), *owner)) {
        return type;
      }
      if (std::find(active.begin(), active.end(), type) != active.end()) {
        return type;
      }
      const TypeExpr * bound = resolve(instance, type);
      if (bound == nullptr || bound == type) {
        return type;
      }
      active.push_back(type);
      const TypeExpr * result = resolve_deep_impl(instance, bound, active);
      active.pop_back();
      return result;
    }

    case TypeKind::Named: {
      std::vector<const TypeExpr *> args;
      args.reserve(type->type_arguments.size());
      for (const auto * arg : type->type_arguments) {
        args.push_back(resolve_deep_impl(instance, arg, active));
      }
      return types_.get_named(*type->entity, gsl::span<const TypeExpr * const>(args));
    }

    case TypeKind::Wildcard: {
      std::vector<const TypeExpr *> upper;
      std::vector<const TypeExpr *> lower;
      for (const auto * b : type->upper_bounds) upper.push_back(resolve_deep_impl(instance, b, active));
      for (const auto * b : type->lower_bounds) lower.push_back(resolve_deep_impl(instance, b, active));
      return types_.get_wildcard(std::move(upper), std::move(lower));
    }

    case TypeKind::Array:
      return types_.get_array(resolve_deep_impl(instance, type->component, active));
  }
  return type;
}

}  // namespace typeweave
