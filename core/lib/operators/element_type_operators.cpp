// typeweave/operators/element_type_operators.cpp - Standard GetElementType operators
//
#include "typeweave/operators/element_type_operators.hpp"

#include "typeweave/dispatch/context.hpp"
#include "typeweave/types/type_utils.hpp"

namespace typeweave
{

namespace
{

const TypeExpr * element_type_of(TypeContext & types, const TypeExpr * subject)
{
  return types.get_named(GetElementType::declare(types), {subject});
}

const TypeExpr * wildcard_args(TypeContext & types, const Entity & entity)
{
  std::vector<const TypeExpr *> args(entity.params().size(), types.wildcard_all());
  return types.get_named(entity, gsl::span<const TypeExpr * const>(args));
}

/// Argument of `param` (declared by `owner`) in `type`, normalized; Object if raw.
const TypeExpr * argument_of(
  TypeContext & types, const TypeExpr * type, const Entity & owner, const TypeExpr * param)
{
  const TypeExpr * arg = nullptr;
  if (auto args = get_type_arguments(types, type, owner)) {
    arg = unroll(types, *args, param);
  }
  if (arg == nullptr) {
    return types.object_type();
  }
  return refine(types, arg, type);
}

}  // namespace

GetArrayElementType::GetArrayElementType(TypeContext & types)
: TypedOperator<GetElementType>(
    Operator::declare_for(types, "GetArrayElementType", element_type_of(types, types.wildcard_all())))
{
}

bool GetArrayElementType::accepts(Context & /*context*/, const GetElementType & operation) const
{
  return operation.subject() != nullptr && operation.subject()->is_array();
}

bool GetArrayElementType::apply(Context & /*context*/, GetElementType & operation) const
{
  operation.set_result(operation.subject()->component);
  return true;
}

GetIterableElementType::GetIterableElementType(TypeContext & types)
: OptimisticOperator<GetElementType>(Operator::declare_for(
    types, "GetIterableElementType",
    element_type_of(types, wildcard_args(types, *types.core().iterable))))
{
}

bool GetIterableElementType::apply(Context & context, GetElementType & operation) const
{
  TypeContext & types = context.types();
  const Entity & iterable = *types.core().iterable;
  operation.set_result(argument_of(types, operation.subject(), iterable, iterable.param(0)));
  return true;
}

GetMapElementType::GetMapElementType(TypeContext & types)
: OptimisticOperator<GetElementType>(Operator::declare_for(
    types, "GetMapElementType", element_type_of(types, wildcard_args(types, *types.core().map))))
{
}

bool GetMapElementType::apply(Context & context, GetElementType & operation) const
{
  TypeContext & types = context.types();
  const Entity & map = *types.core().map;
  operation.set_result(argument_of(types, operation.subject(), map, map.param(1)));
  return true;
}

}  // namespace typeweave
