// typeweave/operators/immutable_checker.cpp - Default ImmutableCheck operator
//
#include "typeweave/operators/immutable_checker.hpp"

#include <any>
#include <string>

#include "typeweave/dispatch/context.hpp"

namespace typeweave
{

namespace
{

bool is_immutable_value(const std::any & value)
{
  if (!value.has_value()) {
    return true;
  }
  const std::type_info & t = value.type();
  return t == typeid(std::string) || t == typeid(bool) || t == typeid(int) || t == typeid(long) ||
         t == typeid(long long) || t == typeid(double) || t == typeid(float);
}

}  // namespace

DefaultImmutableChecker::DefaultImmutableChecker(TypeContext & types)
: OptimisticOperator<ImmutableCheck>(Operator::declare_for(
    types, "DefaultImmutableChecker",
    types.get_named(ImmutableCheck::declare(types), {types.wildcard_all()})))
{
}

bool DefaultImmutableChecker::apply(Context & /*context*/, ImmutableCheck & operation) const
{
  operation.set_result(is_immutable_value(operation.subject()->value()));
  return true;
}

}  // namespace typeweave
