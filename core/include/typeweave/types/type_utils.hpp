// typeweave/types/type_utils.hpp - Subtyping, assignability and substitution helpers
//
// Shared by the generic resolver, the dispatch engine and the standard
// operators.
//
#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "typeweave/types/entity.hpp"
#include "typeweave/types/type.hpp"

namespace typeweave
{

/// Placeholder -> type assignments.
using TypeVarMap = std::unordered_map<const TypeExpr *, const TypeExpr *>;

// ============================================================================
// Entity Relationships
// ============================================================================

/**
 * Check whether `sub` is `super` or inherits from it (through superclasses or
 * interfaces).
 */
[[nodiscard]] bool is_subentity(const Entity & sub, const Entity & super) noexcept;

/**
 * Deterministic hierarchy walk of an entity.
 *
 * Yields the entity, then its interfaces depth-first (pre-order), then the
 * superclass followed by its not yet seen interfaces, and so on up to Object.
 * Every interface is yielded once even when it is implemented at several
 * levels.
 */
[[nodiscard]] std::vector<const Entity *> hierarchy(const Entity & entity);

/**
 * Entity a type erases to: the entity of a Named type, the erasure of the
 * first upper bound of a placeholder or wildcard; nullptr for arrays.
 */
[[nodiscard]] const Entity * raw_entity(const TypeExpr * type) noexcept;

// ============================================================================
// Type Arguments
// ============================================================================

/**
 * Collect the placeholder assignments that take `type` to entity `to`.
 *
 * The result maps the placeholders of every entity on the path from the
 * type's entity up to `to` (inclusive) to the arguments supplied along that
 * path. Assignments that cannot be determined (raw types) are absent.
 *
 * @return std::nullopt if `type` is not assignable to `to`
 */
[[nodiscard]] std::optional<TypeVarMap> get_type_arguments(
  TypeContext & types, const TypeExpr * type, const Entity & to);

/**
 * Substitute placeholders in `type` using `map`.
 *
 * A placeholder is followed through the map until a non-placeholder is
 * reached; an unmapped (or cyclic) chain yields nullptr. Nested placeholders
 * inside Named, Wildcard and Array types are substituted where mapped and
 * kept otherwise.
 */
[[nodiscard]] const TypeExpr * unroll(
  TypeContext & types, const TypeVarMap & map, const TypeExpr * type);

[[nodiscard]] bool contains_placeholders(const TypeExpr * type) noexcept;

// ============================================================================
// Type Compatibility
// ============================================================================

/**
 * Check if a value of `type` can be assigned to `to`.
 *
 * Wildcard arguments of `to` accept any argument within their bounds; other
 * arguments must match exactly. A null `type` is assignable to anything.
 */
[[nodiscard]] bool is_assignable(TypeContext & types, const TypeExpr * type, const TypeExpr * to);

// ============================================================================
// Normalization
// ============================================================================

/**
 * Normalize a placeholder or wildcard to its first upper bound.
 *
 * If `context_type` is a parameterized type, placeholders in the bound are
 * substituted from its arguments. Other kinds are returned unchanged.
 */
[[nodiscard]] const TypeExpr * refine(
  TypeContext & types, const TypeExpr * type, const TypeExpr * context_type = nullptr);

/// Replace every placeholder in `type` by a wildcard with the same upper bounds.
[[nodiscard]] const TypeExpr * erase_placeholders(TypeContext & types, const TypeExpr * type);

/**
 * Most specific Named type that `concrete` is assignable to and that is
 * assignable to `ancestor`, with arguments carried over from `ancestor`.
 *
 * Walks the hierarchy of `concrete` and returns the first entity whose own
 * placeholders are all determined by the ancestor's arguments (for example
 * ArrayList with List<String> gives ArrayList<String>). Returns `ancestor`
 * unchanged when `concrete` is null or no entity qualifies.
 */
[[nodiscard]] const TypeExpr * narrowest_parameterized_type(
  TypeContext & types, const Entity * concrete, const TypeExpr * ancestor);

// ============================================================================
// Formatting
// ============================================================================

/**
 * Convert a type to its string representation (e.g. "List<? extends Number>").
 *
 * A null type prints as "<unresolved>".
 */
[[nodiscard]] std::string to_string(const TypeExpr * type);

}  // namespace typeweave
