// typeweave/operations/size.cpp - Size<T> entity
//
#include "typeweave/operations/size.hpp"

namespace typeweave
{

Size::Size(TypeContext & types, std::shared_ptr<const Readable> subject)
: ResultOperation<int>(declare(types)), subject_(std::move(subject))
{
  add_position(subject_);
}

const Entity & Size::declare(TypeContext & types)
{
  const Entity & operation = Operation::declare(types);
  return types.declare_once("Size", false, {"T"}, [&](Entity & e) {
    e.set_superclass(types.get_named(operation, {types.core().integer->raw_type()}));
    e.add_binding_accessor(MethodDecl{
      "subject_type", {}, types.get_named(*types.core().typed, {e.param("T")}),
      [](const Instance & instance) -> const TypeExpr * {
        const auto * size = dynamic_cast<const Size *>(&instance);
        return size ? size->subject()->type() : nullptr;
      }});
  });
}

}  // namespace typeweave
