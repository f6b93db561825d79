// typeweave/operators/element_type_operators.hpp - Standard GetElementType operators
#pragma once

#include "typeweave/dispatch/operator.hpp"
#include "typeweave/operations/element_type.hpp"

namespace typeweave
{

/// Component type of an array type.
class GetArrayElementType : public TypedOperator<GetElementType>
{
public:
  explicit GetArrayElementType(TypeContext & types);

protected:
  [[nodiscard]] bool accepts(Context & context, const GetElementType & operation) const override;
  bool apply(Context & context, GetElementType & operation) const override;
};

/// Iterable.T of an iterable type; Object for raw types.
class GetIterableElementType : public OptimisticOperator<GetElementType>
{
public:
  explicit GetIterableElementType(TypeContext & types);

protected:
  bool apply(Context & context, GetElementType & operation) const override;
};

/// Map.V of a map type; Object for raw types.
class GetMapElementType : public OptimisticOperator<GetElementType>
{
public:
  explicit GetMapElementType(TypeContext & types);

protected:
  bool apply(Context & context, GetElementType & operation) const override;
};

}  // namespace typeweave
