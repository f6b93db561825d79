// typeweave/operators/size_operators.hpp - Standard Size operators
#pragma once

#include "typeweave/dispatch/operator.hpp"
#include "typeweave/operations/size.hpp"

namespace typeweave
{

/// Size<Collection<?>>: element count of a Sequence; null counts as empty.
class SizeOfCollection : public OptimisticOperator<Size>
{
public:
  explicit SizeOfCollection(TypeContext & types);

protected:
  bool apply(Context & context, Size & operation) const override;
};

/// Size<Iterable<?>>: forwards Size<Iterator<?>> over a cursor.
class SizeOfIterable : public OptimisticOperator<Size>
{
public:
  explicit SizeOfIterable(TypeContext & types);

protected:
  bool apply(Context & context, Size & operation) const override;
};

/// Size<Iterator<?>>: elements remaining in a Cursor.
class SizeOfIterator : public OptimisticOperator<Size>
{
public:
  explicit SizeOfIterator(TypeContext & types);

protected:
  bool apply(Context & context, Size & operation) const override;
};

/// Size<?> restricted to array types.
class SizeOfArray : public TypedOperator<Size>
{
public:
  explicit SizeOfArray(TypeContext & types);

protected:
  [[nodiscard]] bool accepts(Context & context, const Size & operation) const override;
  bool apply(Context & context, Size & operation) const override;
};

}  // namespace typeweave
