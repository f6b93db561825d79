// typeweave/operators/immutable_checker.hpp - Default ImmutableCheck operator
#pragma once

#include "typeweave/dispatch/operator.hpp"
#include "typeweave/operations/immutable_check.hpp"

namespace typeweave
{

/**
 * Null, strings, booleans and numbers are immutable; any other value is
 * reported as mutable.
 */
class DefaultImmutableChecker : public OptimisticOperator<ImmutableCheck>
{
public:
  explicit DefaultImmutableChecker(TypeContext & types);

protected:
  bool apply(Context & context, ImmutableCheck & operation) const override;
};

}  // namespace typeweave
