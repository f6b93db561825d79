// typeweave/operators/converters.cpp - Standard Convert operators
//
#include "typeweave/operators/converters.hpp"

#include <string>

#include "typeweave/basic/error.hpp"
#include "typeweave/dispatch/context.hpp"
#include "typeweave/types/type_utils.hpp"

namespace typeweave
{

// ============================================================================
// NopConverter
// ============================================================================

NopConverter::NopConverter(TypeContext & types)
: TypedOperator<Convert>(Operator::declare_for(
    types, "NopConverter",
    types.get_named(Convert::declare(types), {types.wildcard_all(), types.wildcard_all()})))
{
}

bool NopConverter::accepts(Context & context, const Convert & operation) const
{
  return is_assignable(context.types(), operation.source_type(), operation.target_type());
}

bool NopConverter::apply(Context & /*context*/, Convert & operation) const
{
  operation.assign(operation.source()->value());
  return true;
}

// ============================================================================
// CopyingConverter
// ============================================================================

namespace
{

void require_default_constructor(const Entity & entity)
{
  if (!entity.has_default_constructor()) {
    throw_definition_error(
      ErrorCode::MissingDefaultConstructor, std::string(entity.name()),
      "could not find default constructor for " + std::string(entity.name()));
  }
}

}  // namespace

CopyingConverter::CopyingConverter(
  TypeContext & types, const TypeExpr * target_type, const Entity & concrete)
: TypedOperator<Convert>(declare(types)),
  target_type_(target_type),
  value_type_(narrowest_parameterized_type(types, &concrete, target_type)),
  concrete_(&concrete)
{
}

const Entity & CopyingConverter::declare(TypeContext & types)
{
  const Entity & convert = Convert::declare(types);
  return types.declare_once("CopyingConverter", false, {"TARGET"}, [&](Entity & e) {
    const TypeExpr * target = e.param("TARGET");
    e.add_interface(Operator::signature(
      types, types.get_named(convert, {types.wildcard_all(), types.wildcard_super(target)})));
    e.add_binding_accessor(MethodDecl{
      "target_type", {}, types.get_named(*types.core().typed, {target}),
      [](const Instance & instance) -> const TypeExpr * {
        const auto * op = dynamic_cast<const CopyingConverter *>(&instance);
        return op ? op->target_type() : nullptr;
      }});
  });
}

std::shared_ptr<CopyingConverter> CopyingConverter::for_target_type(
  TypeContext & types, const TypeExpr * target_type)
{
  const Entity * entity = raw_entity(target_type);
  if (entity == nullptr || !target_type->is_named()) {
    throw_definition_error(
      ErrorCode::MalformedDeclaration, to_string(target_type),
      "copying converter target " + to_string(target_type) + " is not a class type");
  }
  require_default_constructor(*entity);
  return std::shared_ptr<CopyingConverter>(new CopyingConverter(types, target_type, *entity));
}

CopyingConverter::Implementing CopyingConverter::implementing(
  TypeContext & types, const TypeExpr * target_type)
{
  return Implementing(types, target_type);
}

std::shared_ptr<CopyingConverter> CopyingConverter::Implementing::with(const Entity & concrete) const
{
  const Entity * target = raw_entity(target_type_);
  if (target == nullptr || !is_subentity(concrete, *target)) {
    throw_definition_error(
      ErrorCode::MalformedDeclaration, std::string(concrete.name()),
      std::string(concrete.name()) + " does not implement " + to_string(target_type_));
  }
  require_default_constructor(concrete);
  return std::shared_ptr<CopyingConverter>(new CopyingConverter(*types_, target_type_, concrete));
}

bool CopyingConverter::accepts(Context & context, const Convert & operation) const
{
  if (!is_assignable(context.types(), target_type_, operation.target_type())) {
    return false;
  }
  // Probe with a read-only destination so that the probe cannot convert again
  Copy probe(context.types(), operation.source(), read_only(value_type_, {}));
  return context.supports(probe);
}

bool CopyingConverter::apply(Context & context, Convert & operation) const
{
  std::any value = concrete_->default_constructor()();
  operation.assign(value);

  Copy copy(context.types(), operation.source(), read_only(value_type_, value));
  context.forward_to(copy);
  return true;
}

}  // namespace typeweave
