// typeweave/operations/element_type.cpp - GetElementType<T> entity
//
#include "typeweave/operations/element_type.hpp"

#include "typeweave/types/type_utils.hpp"

namespace typeweave
{

GetElementType::GetElementType(TypeContext & types, const TypeExpr * subject)
: ResultOperation<const TypeExpr *>(declare(types)), subject_(subject)
{
}

bool GetElementType::same_shape(const Operation & other) const noexcept
{
  const auto * op = dynamic_cast<const GetElementType *>(&other);
  return op != nullptr && op->subject_ == subject_;
}

std::string GetElementType::describe() const { return "GetElementType[" + to_string(subject_) + "]"; }

const Entity & GetElementType::declare(TypeContext & types)
{
  const Entity & operation = Operation::declare(types);
  return types.declare_once("GetElementType", false, {"T"}, [&](Entity & e) {
    e.set_superclass(types.get_named(operation, {types.object_type()}));
    e.add_binding_accessor(MethodDecl{
      "subject_type", {}, types.get_named(*types.core().typed, {e.param("T")}),
      [](const Instance & instance) -> const TypeExpr * {
        const auto * op = dynamic_cast<const GetElementType *>(&instance);
        return op ? op->subject() : nullptr;
      }});
  });
}

}  // namespace typeweave
