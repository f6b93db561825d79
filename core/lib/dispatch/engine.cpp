// typeweave/dispatch/engine.cpp - Engine assembly and signature matching
//
#include "typeweave/dispatch/engine.hpp"

#include "typeweave/types/type_utils.hpp"

namespace typeweave
{

Engine::Engine(TypeContext & types, const std::vector<Module> & modules, EngineOptions options)
: types_(types),
  resolver_(types),
  registry_(OperatorRegistry::assemble(resolver_, modules, options.assembly)),
  property_resolver_(std::move(options.property_resolver)),
  default_hints_(std::move(options.default_hints)),
  trace_(options.trace),
  operation_entity_(&Operation::declare(types))
{
  if (!property_resolver_) {
    property_resolver_ = std::make_shared<RecordPropertyResolver>(types_);
  }
}

bool Engine::matches(const RegisteredOperator & entry, const Operation & operation) const
{
  const TypeExpr * expected = entry.operation_type;
  const Entity & expected_entity = *expected->entity;
  if (!is_subentity(operation.entity(), expected_entity)) {
    return false;
  }

  const auto declared_args = get_type_arguments(types_, expected, *operation_entity_);
  if (!declared_args) {
    return false;
  }

  for (const Entity * e = &expected_entity; e != nullptr && e != operation_entity_;) {
    for (const TypeExpr * param : e->params()) {
      const TypeExpr * actual = resolver_.resolve(operation, param);
      const TypeExpr * declared = unroll(types_, *declared_args, param);
      if (actual == nullptr || declared == nullptr) {
        continue;
      }
      if (!is_assignable(types_, actual, declared)) {
        return false;
      }
    }
    const TypeExpr * super = e->superclass();
    e = super ? super->entity : nullptr;
  }
  return true;
}

}  // namespace typeweave
