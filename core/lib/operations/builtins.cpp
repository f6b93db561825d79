// typeweave/operations/builtins.cpp - Built-in operation entities
//
#include "typeweave/operations/builtins.hpp"

#include "typeweave/dispatch/operator.hpp"
#include "typeweave/operations/element_type.hpp"
#include "typeweave/operations/immutable_check.hpp"
#include "typeweave/operations/size.hpp"
#include "typeweave/operations/transform.hpp"

namespace typeweave
{

void register_builtins(TypeContext & types)
{
  Operation::declare(types);
  Operator::declare(types);
  declare_transform(types);
  Convert::declare(types);
  Copy::declare(types);
  Size::declare(types);
  GetElementType::declare(types);
  ImmutableCheck::declare(types);
}

}  // namespace typeweave
