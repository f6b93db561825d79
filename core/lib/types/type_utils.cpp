// typeweave/types/type_utils.cpp - Subtyping, assignability and substitution helpers
//
#include "typeweave/types/type_utils.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace typeweave
{

namespace
{

void walk_interfaces(
  const Entity & entity, std::unordered_set<const Entity *> & seen,
  std::vector<const Entity *> & out)
{
  for (const auto * iface : entity.interfaces()) {
    const Entity * ie = iface->entity;
    if (!ie || !seen.insert(ie).second) {
      continue;
    }
    out.push_back(ie);
    walk_interfaces(*ie, seen, out);
  }
}

/// Direct supertype of `entity` on the way to `to`.
const TypeExpr * closest_parent(const Entity & entity, const Entity & to)
{
  if (to.is_interface()) {
    const TypeExpr * best = nullptr;
    for (const auto * iface : entity.interfaces()) {
      if (!iface->entity || !is_subentity(*iface->entity, to)) {
        continue;
      }
      if (!best || is_subentity(*iface->entity, *best->entity)) {
        best = iface;
      }
    }
    if (best) {
      return best;
    }
  }
  return entity.superclass();
}

std::optional<TypeVarMap> type_arguments_impl(
  TypeContext & types, const TypeExpr * type, const Entity & to, TypeVarMap map)
{
  if (type == nullptr) {
    return std::nullopt;
  }

  switch (type->kind) {
    case TypeKind::Named: {
      const Entity & entity = *type->entity;
      if (!is_subentity(entity, to)) {
        return std::nullopt;
      }
      if (type->is_parameterized()) {
        for (size_t i = 0; i < type->type_arguments.size(); ++i) {
          const TypeExpr * arg = type->type_arguments[i];
          if (arg->is_placeholder()) {
            auto it = map.find(arg);
            if (it != map.end()) {
              arg = it->second;
            }
          }
          map[entity.params()[i]] = arg;
        }
      } else if (entity.is_generic() && &entity != &to) {
        // Raw usage: nothing further can be determined
        return map;
      }
      if (&entity == &to) {
        return map;
      }
      return type_arguments_impl(types, closest_parent(entity, to), to, std::move(map));
    }

    case TypeKind::Placeholder:
    case TypeKind::Wildcard:
      for (const auto * bound : type->upper_bounds) {
        if (auto result = type_arguments_impl(types, bound, to, map)) {
          return result;
        }
      }
      return std::nullopt;

    case TypeKind::Array:
      if (&to == &types.object_entity()) {
        return map;
      }
      return std::nullopt;
  }
  return std::nullopt;
}

const TypeExpr * unroll_impl(
  TypeContext & types, const TypeVarMap & map, const TypeExpr * type,
  std::vector<const TypeExpr *> & active)
{
  if (type == nullptr || !contains_placeholders(type)) {
    return type;
  }

  switch (type->kind) {
    case TypeKind::Placeholder: {
      if (std::find(active.begin(), active.end(), type) != active.end()) {
        return nullptr;
      }
      auto it = map.find(type);
      if (it == map.end() || it->second == type) {
        return nullptr;
      }
      active.push_back(type);
      const TypeExpr * result = unroll_impl(types, map, it->second, active);
      active.pop_back();
      return result;
    }

    case TypeKind::Named: {
      std::vector<const TypeExpr *> args;
      args.reserve(type->type_arguments.size());
      for (const auto * arg : type->type_arguments) {
        const TypeExpr * unrolled = unroll_impl(types, map, arg, active);
        args.push_back(unrolled ? unrolled : arg);
      }
      return types.get_named(*type->entity, gsl::span<const TypeExpr * const>(args));
    }

    case TypeKind::Wildcard: {
      auto unroll_bounds = [&](const std::vector<const TypeExpr *> & bounds) {
        std::vector<const TypeExpr *> out;
        out.reserve(bounds.size());
        for (const auto * b : bounds) {
          const TypeExpr * unrolled = unroll_impl(types, map, b, active);
          out.push_back(unrolled ? unrolled : b);
        }
        return out;
      };
      return types.get_wildcard(unroll_bounds(type->upper_bounds), unroll_bounds(type->lower_bounds));
    }

    case TypeKind::Array: {
      const TypeExpr * component = unroll_impl(types, map, type->component, active);
      return types.get_array(component ? component : type->component);
    }
  }
  return type;
}

bool assignable_to_raw(TypeContext & types, const TypeExpr * type, const Entity & to)
{
  if (&to == &types.object_entity()) {
    return true;
  }
  switch (type->kind) {
    case TypeKind::Named:
      return is_subentity(*type->entity, to);
    case TypeKind::Placeholder:
    case TypeKind::Wildcard:
      return std::any_of(type->upper_bounds.begin(), type->upper_bounds.end(), [&](const TypeExpr * b) {
        return assignable_to_raw(types, b, to);
      });
    case TypeKind::Array:
      return false;
  }
  return false;
}

bool assignable_to_parameterized(TypeContext & types, const TypeExpr * type, const TypeExpr * to)
{
  switch (type->kind) {
    case TypeKind::Placeholder:
    case TypeKind::Wildcard:
      return std::any_of(type->upper_bounds.begin(), type->upper_bounds.end(), [&](const TypeExpr * b) {
        return is_assignable(types, b, to);
      });
    case TypeKind::Array:
      return false;
    case TypeKind::Named:
      break;
  }

  const Entity & to_entity = *to->entity;
  const auto from_map = get_type_arguments(types, type, to_entity);
  if (!from_map) {
    return false;
  }

  for (size_t i = 0; i < to_entity.params().size(); ++i) {
    const TypeExpr * to_arg = to->type_arguments[i];
    const TypeExpr * from_arg = unroll(types, *from_map, to_entity.params()[i]);
    if (
      from_arg != nullptr && from_arg != to_arg &&
      !(to_arg->is_wildcard() && is_assignable(types, from_arg, to_arg))) {
      return false;
    }
  }
  return true;
}

bool assignable_to_wildcard(TypeContext & types, const TypeExpr * type, const TypeExpr * to)
{
  if (type->is_wildcard()) {
    for (const auto * to_bound : to->upper_bounds) {
      for (const auto * bound : type->upper_bounds) {
        if (!is_assignable(types, bound, to_bound)) {
          return false;
        }
      }
    }
    for (const auto * to_bound : to->lower_bounds) {
      for (const auto * bound : type->lower_bounds) {
        if (!is_assignable(types, to_bound, bound)) {
          return false;
        }
      }
    }
    return true;
  }

  for (const auto * to_bound : to->upper_bounds) {
    if (!is_assignable(types, type, to_bound)) {
      return false;
    }
  }
  for (const auto * to_bound : to->lower_bounds) {
    if (!is_assignable(types, to_bound, type)) {
      return false;
    }
  }
  return true;
}

std::string join(const std::vector<const TypeExpr *> & types, const char * sep)
{
  std::string out;
  for (size_t i = 0; i < types.size(); ++i) {
    if (i > 0) out += sep;
    out += to_string(types[i]);
  }
  return out;
}

bool is_object_type(const TypeExpr * type) noexcept
{
  return type->is_named() && !type->is_parameterized() &&
         type->entity == &type->entity->types().object_entity();
}

}  // namespace

// ============================================================================
// Entity Relationships
// ============================================================================

bool is_subentity(const Entity & sub, const Entity & super) noexcept
{
  if (&sub == &super) {
    return true;
  }
  if (const auto * s = sub.superclass(); s && s->entity && is_subentity(*s->entity, super)) {
    return true;
  }
  return std::any_of(sub.interfaces().begin(), sub.interfaces().end(), [&](const TypeExpr * i) {
    return i->entity && is_subentity(*i->entity, super);
  });
}

std::vector<const Entity *> hierarchy(const Entity & entity)
{
  std::vector<const Entity *> result;
  std::unordered_set<const Entity *> seen_interfaces;

  for (const Entity * c = &entity; c != nullptr;) {
    if (c->is_interface()) {
      seen_interfaces.insert(c);
    }
    result.push_back(c);
    walk_interfaces(*c, seen_interfaces, result);

    const TypeExpr * super = c->superclass();
    c = super ? super->entity : nullptr;
  }
  return result;
}

const Entity * raw_entity(const TypeExpr * type) noexcept
{
  if (type == nullptr) {
    return nullptr;
  }
  switch (type->kind) {
    case TypeKind::Named:
      return type->entity;
    case TypeKind::Placeholder:
    case TypeKind::Wildcard:
      return type->upper_bounds.empty() ? nullptr : raw_entity(type->upper_bounds.front());
    case TypeKind::Array:
      return nullptr;
  }
  return nullptr;
}

// ============================================================================
// Type Arguments
// ============================================================================

std::optional<TypeVarMap> get_type_arguments(
  TypeContext & types, const TypeExpr * type, const Entity & to)
{
  return type_arguments_impl(types, type, to, TypeVarMap{});
}

const TypeExpr * unroll(TypeContext & types, const TypeVarMap & map, const TypeExpr * type)
{
  std::vector<const TypeExpr *> active;
  return unroll_impl(types, map, type, active);
}

bool contains_placeholders(const TypeExpr * type) noexcept
{
  if (type == nullptr) {
    return false;
  }
  switch (type->kind) {
    case TypeKind::Placeholder:
      return true;
    case TypeKind::Named:
      return std::any_of(
        type->type_arguments.begin(), type->type_arguments.end(),
        [](const TypeExpr * a) { return contains_placeholders(a); });
    case TypeKind::Wildcard:
      return std::any_of(
               type->upper_bounds.begin(), type->upper_bounds.end(),
               [](const TypeExpr * b) { return contains_placeholders(b); }) ||
             std::any_of(
               type->lower_bounds.begin(), type->lower_bounds.end(),
               [](const TypeExpr * b) { return contains_placeholders(b); });
    case TypeKind::Array:
      return contains_placeholders(type->component);
  }
  return false;
}

// ============================================================================
// Type Compatibility
// ============================================================================

bool is_assignable(TypeContext & types, const TypeExpr * type, const TypeExpr * to)
{
  if (type == nullptr) {
    return true;
  }
  if (to == nullptr) {
    return false;
  }
  if (type == to) {
    return true;
  }

  switch (to->kind) {
    case TypeKind::Named:
      return to->is_parameterized() ? assignable_to_parameterized(types, type, to)
                                    : assignable_to_raw(types, type, *to->entity);

    case TypeKind::Wildcard:
      return assignable_to_wildcard(types, type, to);

    case TypeKind::Placeholder:
      if (type->is_placeholder()) {
        return std::any_of(type->upper_bounds.begin(), type->upper_bounds.end(), [&](const TypeExpr * b) {
          return is_assignable(types, b, to);
        });
      }
      return false;

    case TypeKind::Array:
      switch (type->kind) {
        case TypeKind::Array:
          return is_assignable(types, type->component, to->component);
        case TypeKind::Placeholder:
        case TypeKind::Wildcard:
          return std::any_of(type->upper_bounds.begin(), type->upper_bounds.end(), [&](const TypeExpr * b) {
            return is_assignable(types, b, to);
          });
        case TypeKind::Named:
          return false;
      }
      return false;
  }
  return false;
}

// ============================================================================
// Normalization
// ============================================================================

const TypeExpr * refine(TypeContext & types, const TypeExpr * type, const TypeExpr * context_type)
{
  if (type == nullptr || !(type->is_placeholder() || type->is_wildcard())) {
    return type;
  }

  const TypeExpr * bound =
    type->upper_bounds.empty() ? types.object_type() : type->upper_bounds.front();

  if (context_type && context_type->is_parameterized() && contains_placeholders(bound)) {
    if (auto args = get_type_arguments(types, context_type, *context_type->entity)) {
      if (const TypeExpr * unrolled = unroll(types, *args, bound)) {
        return unrolled;
      }
    }
  }
  return bound;
}

const TypeExpr * erase_placeholders(TypeContext & types, const TypeExpr * type)
{
  if (type == nullptr || !contains_placeholders(type)) {
    return type;
  }

  switch (type->kind) {
    case TypeKind::Placeholder:
      return types.get_wildcard(type->upper_bounds);

    case TypeKind::Named: {
      std::vector<const TypeExpr *> args;
      args.reserve(type->type_arguments.size());
      for (const auto * arg : type->type_arguments) {
        args.push_back(erase_placeholders(types, arg));
      }
      return types.get_named(*type->entity, gsl::span<const TypeExpr * const>(args));
    }

    case TypeKind::Wildcard: {
      std::vector<const TypeExpr *> upper;
      std::vector<const TypeExpr *> lower;
      for (const auto * b : type->upper_bounds) upper.push_back(erase_placeholders(types, b));
      for (const auto * b : type->lower_bounds) lower.push_back(erase_placeholders(types, b));
      return types.get_wildcard(std::move(upper), std::move(lower));
    }

    case TypeKind::Array:
      return types.get_array(erase_placeholders(types, type->component));
  }
  return type;
}

const TypeExpr * narrowest_parameterized_type(
  TypeContext & types, const Entity * concrete, const TypeExpr * ancestor)
{
  if (concrete == nullptr || ancestor == nullptr || !ancestor->is_named()) {
    return ancestor;
  }
  const Entity & target = *ancestor->entity;
  if (!is_subentity(*concrete, target)) {
    return ancestor;
  }
  if (!ancestor->is_parameterized()) {
    return concrete->raw_type();
  }

  for (const Entity * candidate : hierarchy(*concrete)) {
    if (!is_subentity(*candidate, target)) {
      continue;
    }
    const auto map = get_type_arguments(types, candidate->declared_type(), target);
    if (!map) {
      continue;
    }

    // Solve the candidate's placeholders from the ancestor's arguments
    TypeVarMap assigned;
    bool consistent = true;
    for (size_t i = 0; i < target.params().size() && consistent; ++i) {
      const TypeExpr * wanted = ancestor->type_arguments[i];
      auto it = map->find(target.params()[i]);
      const TypeExpr * have = it == map->end() ? nullptr : it->second;

      if (have == nullptr) {
        consistent = false;
      } else if (have->is_placeholder()) {
        if (have->declaring_entity != candidate) {
          consistent = false;
        } else {
          auto [slot, inserted] = assigned.emplace(have, wanted);
          consistent = inserted || slot->second == wanted;
        }
      } else {
        consistent = have == wanted || (wanted->is_wildcard() && is_assignable(types, have, wanted));
      }
    }
    if (!consistent) {
      continue;
    }

    if (!candidate->is_generic()) {
      return candidate->raw_type();
    }
    std::vector<const TypeExpr *> args;
    for (const auto * p : candidate->params()) {
      auto it = assigned.find(p);
      if (it == assigned.end()) {
        break;
      }
      args.push_back(it->second);
    }
    if (args.size() == candidate->params().size()) {
      return types.get_named(*candidate, gsl::span<const TypeExpr * const>(args));
    }
  }
  return ancestor;
}

// ============================================================================
// Formatting
// ============================================================================

std::string to_string(const TypeExpr * type)
{
  if (type == nullptr) {
    return "<unresolved>";
  }

  switch (type->kind) {
    case TypeKind::Named: {
      std::string out(type->entity->name());
      if (type->is_parameterized()) {
        out += "<" + join(type->type_arguments, ", ") + ">";
      }
      return out;
    }

    case TypeKind::Placeholder:
      return std::string(type->name);

    case TypeKind::Wildcard:
      if (!type->lower_bounds.empty()) {
        return "? super " + join(type->lower_bounds, " & ");
      }
      if (type->upper_bounds.size() > 1 || !is_object_type(type->upper_bounds.front())) {
        return "? extends " + join(type->upper_bounds, " & ");
      }
      return "?";

    case TypeKind::Array:
      return to_string(type->component) + "[]";
  }
  return "<unknown>";
}

}  // namespace typeweave
