// typeweave/dump/json_dump.hpp - JSON serialization for types and registries
//
// Produces nlohmann::json objects for debugging and golden tests.
//
#pragma once

#include <nlohmann/json.hpp>

#include "typeweave/dispatch/operator_registry.hpp"
#include "typeweave/types/type.hpp"

namespace typeweave
{

/**
 * Serialize a type expression.
 *
 * Every object carries a "kind" ("Named", "Placeholder", "Wildcard", "Array"
 * or "Unresolved") and a "display" string.
 */
[[nodiscard]] nlohmann::json to_json(const TypeExpr * type);

/**
 * Serialize a registry as an array of {"operator", "module", "operation"}
 * objects in registry order.
 */
[[nodiscard]] nlohmann::json to_json(const OperatorRegistry & registry);

}  // namespace typeweave
