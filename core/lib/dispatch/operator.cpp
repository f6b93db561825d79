// typeweave/dispatch/operator.cpp - Operator entity
//
#include "typeweave/dispatch/operator.hpp"

namespace typeweave
{

const Entity & Operator::declare(TypeContext & types)
{
  const Entity & operation = Operation::declare(types);
  return types.declare_once("Operator", true, {"OPERATION"}, [&](Entity & e) {
    e.set_bounds("OPERATION", {operation.raw_type()});
  });
}

const TypeExpr * Operator::signature(TypeContext & types, const TypeExpr * operation_type)
{
  return types.get_named(declare(types), {operation_type});
}

const Entity & Operator::declare_for(
  TypeContext & types, std::string_view name, const TypeExpr * operation_type)
{
  const TypeExpr * sig = signature(types, operation_type);
  return types.declare_once(name, false, {}, [sig](Entity & e) { e.add_interface(sig); });
}

}  // namespace typeweave
