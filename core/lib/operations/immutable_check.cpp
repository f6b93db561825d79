// typeweave/operations/immutable_check.cpp - ImmutableCheck<T> entity
//
#include "typeweave/operations/immutable_check.hpp"

namespace typeweave
{

ImmutableCheck::ImmutableCheck(TypeContext & types, std::shared_ptr<const Readable> subject)
: ResultOperation<bool>(declare(types)), subject_(std::move(subject))
{
  add_position(subject_);
}

const Entity & ImmutableCheck::declare(TypeContext & types)
{
  const Entity & operation = Operation::declare(types);
  return types.declare_once("ImmutableCheck", false, {"T"}, [&](Entity & e) {
    e.set_superclass(types.get_named(operation, {types.core().boolean->raw_type()}));
    e.add_binding_accessor(MethodDecl{
      "subject_type", {}, types.get_named(*types.core().typed, {e.param("T")}),
      [](const Instance & instance) -> const TypeExpr * {
        const auto * check = dynamic_cast<const ImmutableCheck *>(&instance);
        return check ? check->subject()->type() : nullptr;
      }});
  });
}

}  // namespace typeweave
