// typeweave/operators/size_operators.cpp - Standard Size operators
//
#include "typeweave/operators/size_operators.hpp"

#include <memory>

#include "typeweave/dispatch/context.hpp"
#include "typeweave/runtime/values.hpp"

namespace typeweave
{

namespace
{

const TypeExpr * size_of(TypeContext & types, const Entity * container)
{
  const TypeExpr * subject = container ? types.get_named(*container, {types.wildcard_all()})
                                       : types.wildcard_all();
  return types.get_named(Size::declare(types), {subject});
}

}  // namespace

// ============================================================================
// SizeOfCollection
// ============================================================================

SizeOfCollection::SizeOfCollection(TypeContext & types)
: OptimisticOperator<Size>(
    Operator::declare_for(types, "SizeOfCollection", size_of(types, types.core().collection)))
{
}

bool SizeOfCollection::apply(Context & /*context*/, Size & operation) const
{
  const std::any value = operation.subject()->value();
  if (!value.has_value()) {
    operation.set_result(0);
    return true;
  }
  if (const auto * seq = std::any_cast<Sequence>(&value)) {
    operation.set_result(static_cast<int>(seq->size()));
    return true;
  }
  return false;
}

// ============================================================================
// SizeOfIterable
// ============================================================================

SizeOfIterable::SizeOfIterable(TypeContext & types)
: OptimisticOperator<Size>(
    Operator::declare_for(types, "SizeOfIterable", size_of(types, types.core().iterable)))
{
}

bool SizeOfIterable::apply(Context & context, Size & operation) const
{
  const std::any value = operation.subject()->value();
  if (!value.has_value()) {
    operation.set_result(0);
    return true;
  }
  const auto * seq = std::any_cast<Sequence>(&value);
  if (seq == nullptr) {
    return false;
  }

  TypeContext & types = context.types();
  const TypeExpr * iterator_type = types.get_named(*types.core().iterator, {types.wildcard_all()});
  Size nested(types, read_only(iterator_type, Cursor{std::make_shared<const Sequence>(*seq), 0}));
  operation.set_result(context.eval(nested));
  return true;
}

// ============================================================================
// SizeOfIterator
// ============================================================================

SizeOfIterator::SizeOfIterator(TypeContext & types)
: OptimisticOperator<Size>(
    Operator::declare_for(types, "SizeOfIterator", size_of(types, types.core().iterator)))
{
}

bool SizeOfIterator::apply(Context & /*context*/, Size & operation) const
{
  const std::any value = operation.subject()->value();
  if (!value.has_value()) {
    operation.set_result(0);
    return true;
  }
  if (const auto * cursor = std::any_cast<Cursor>(&value)) {
    operation.set_result(static_cast<int>(cursor->remaining()));
    return true;
  }
  return false;
}

// ============================================================================
// SizeOfArray
// ============================================================================

SizeOfArray::SizeOfArray(TypeContext & types)
: TypedOperator<Size>(Operator::declare_for(types, "SizeOfArray", size_of(types, nullptr)))
{
}

bool SizeOfArray::accepts(Context & /*context*/, const Size & operation) const
{
  const TypeExpr * type = operation.subject()->type();
  return type != nullptr && type->is_array();
}

bool SizeOfArray::apply(Context & /*context*/, Size & operation) const
{
  const std::any value = operation.subject()->value();
  if (!value.has_value()) {
    operation.set_result(0);
    return true;
  }
  if (const auto * seq = std::any_cast<Sequence>(&value)) {
    operation.set_result(static_cast<int>(seq->size()));
    return true;
  }
  return false;
}

}  // namespace typeweave
