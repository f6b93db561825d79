// typeweave/operations/builtins.hpp - Built-in operation entities
#pragma once

#include "typeweave/types/type.hpp"

namespace typeweave
{

/**
 * Declare Operation, Operator and every built-in operation entity.
 *
 * Entities are otherwise declared on first use; calling this up front keeps
 * declaration out of concurrent evaluation. Idempotent.
 */
void register_builtins(TypeContext & types);

}  // namespace typeweave
