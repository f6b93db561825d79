// typeweave/operators/copiers.cpp - Standard Copy operators
//
#include "typeweave/operators/copiers.hpp"

#include <algorithm>

#include "typeweave/basic/error.hpp"
#include "typeweave/dispatch/context.hpp"
#include "typeweave/position/property.hpp"

namespace typeweave
{

namespace
{

const TypeExpr * any_copy(TypeContext & types)
{
  return types.get_named(Copy::declare(types), {types.wildcard_all(), types.wildcard_all()});
}

bool contains(const std::vector<std::string> & names, const std::string & name)
{
  return std::find(names.begin(), names.end(), name) != names.end();
}

/// Names writable on the target and readable on the source, in target order.
std::vector<std::string> shared_property_names(Context & context, const Copy & operation)
{
  const PropertyResolver & props = context.property_resolver();
  const auto source_names = props.property_names(*operation.source());
  std::vector<std::string> names;
  for (auto & name : props.property_names(*operation.target(), PropertyFilter::Writable)) {
    if (contains(source_names, name)) {
      names.push_back(std::move(name));
    }
  }
  return names;
}

}  // namespace

// ============================================================================
// ConvertingCopier
// ============================================================================

ConvertingCopier::ConvertingCopier(TypeContext & types)
: TypedOperator<Copy>(Operator::declare_for(types, "ConvertingCopier", any_copy(types)))
{
}

bool ConvertingCopier::accepts(Context & context, const Copy & operation) const
{
  auto target = operation.writable_target();
  if (!target) {
    return false;
  }
  Convert probe(context.types(), operation.source(), std::move(target));
  return context.supports(probe);
}

bool ConvertingCopier::apply(Context & context, Copy & operation) const
{
  auto target = operation.writable_target();
  if (!target) {
    return false;
  }
  Convert convert(context.types(), operation.source(), std::move(target));
  return context.eval_success(convert);
}

// ============================================================================
// BeanCopier
// ============================================================================

namespace
{

std::vector<std::unique_ptr<Copy>> property_copies(Context & context, const Copy & operation)
{
  const PropertyResolver & props = context.property_resolver();
  std::vector<std::unique_ptr<Copy>> copies;
  for (const auto & name : shared_property_names(context, operation)) {
    auto copy = Copy::safely(
      context.types(), Property::at(name).of(operation.source(), props),
      Property::at(name).of(operation.target(), props));
    if (context.supports(*copy)) {
      copies.push_back(std::move(copy));
    }
  }
  return copies;
}

}  // namespace

BeanCopier::BeanCopier(TypeContext & types)
: TypedOperator<Copy>(Operator::declare_for(types, "BeanCopier", any_copy(types)))
{
}

std::vector<std::string> BeanCopier::depends_on() const { return {"ConvertingCopier", "NopConverter"}; }

bool BeanCopier::accepts(Context & context, const Copy & operation) const
{
  return !property_copies(context, operation).empty();
}

bool BeanCopier::apply(Context & context, Copy & operation) const
{
  if (!operation.target()->value().has_value()) {
    return false;
  }
  bool result = false;
  for (auto & copy : property_copies(context, operation)) {
    if (context.eval_success(*copy)) {
      result = true;
    }
  }
  return result;
}

// ============================================================================
// PropertyCopier
// ============================================================================

PropertyCopier::Builder & PropertyCopier::Builder::map(std::string from, std::string to)
{
  mappings_.push_back(PropertyMapping{std::move(from), std::move(to)});
  return *this;
}

PropertyCopier::Builder & PropertyCopier::Builder::match(
  std::vector<std::string> properties, std::vector<std::string> exclude)
{
  matching_ = PropertyMatching{std::move(properties), std::move(exclude)};
  return *this;
}

std::shared_ptr<PropertyCopier> PropertyCopier::Builder::build() const
{
  const std::string subject = "PropertyCopier<" + to_string(source_type_) + ", " +
                              to_string(target_type_) + ">";
  if (mappings_.empty() && !matching_) {
    throw_definition_error(
      ErrorCode::MalformedDeclaration, subject, subject + " specifies neither mappings nor matching");
  }
  for (const auto & m : mappings_) {
    if (m.from.empty() && m.to.empty()) {
      throw_definition_error(
        ErrorCode::MalformedDeclaration, subject,
        "both from and to cannot be empty for a single mapping");
    }
  }
  return std::shared_ptr<PropertyCopier>(
    new PropertyCopier(*types_, source_type_, target_type_, mappings_, matching_));
}

PropertyCopier::Builder PropertyCopier::between(
  TypeContext & types, const TypeExpr * source_type, const TypeExpr * target_type)
{
  return Builder(types, source_type, target_type);
}

PropertyCopier::PropertyCopier(
  TypeContext & types, const TypeExpr * source_type, const TypeExpr * target_type,
  std::vector<PropertyMapping> mappings, std::optional<PropertyMatching> matching)
: TypedOperator<Copy>(declare(types)),
  source_type_(source_type),
  target_type_(target_type),
  mappings_(std::move(mappings)),
  matching_(std::move(matching))
{
}

const Entity & PropertyCopier::declare(TypeContext & types)
{
  const Entity & copy = Copy::declare(types);
  return types.declare_once("PropertyCopier", false, {"SOURCE", "TARGET"}, [&](Entity & e) {
    const Entity & typed = *types.core().typed;
    e.add_interface(
      Operator::signature(types, types.get_named(copy, {e.param("SOURCE"), e.param("TARGET")})));
    e.add_binding_accessor(MethodDecl{
      "source_type", {}, types.get_named(typed, {e.param("SOURCE")}),
      [](const Instance & instance) -> const TypeExpr * {
        const auto * op = dynamic_cast<const PropertyCopier *>(&instance);
        return op ? op->source_type() : nullptr;
      }});
    e.add_binding_accessor(MethodDecl{
      "target_type", {}, types.get_named(typed, {e.param("TARGET")}),
      [](const Instance & instance) -> const TypeExpr * {
        const auto * op = dynamic_cast<const PropertyCopier *>(&instance);
        return op ? op->target_type() : nullptr;
      }});
  });
}

std::vector<std::string> PropertyCopier::depends_on() const
{
  return {"ConvertingCopier", "NopConverter"};
}

std::vector<std::unique_ptr<Copy>> PropertyCopier::mapped(Context & context, const Copy & operation) const
{
  const PropertyResolver & props = context.property_resolver();
  std::vector<std::unique_ptr<Copy>> result;
  for (const auto & m : mappings_) {
    std::shared_ptr<const Readable> source = operation.source();
    if (!m.from.empty()) {
      source = Property::optional(m.from).of(source, props);
    }
    std::shared_ptr<Readable> target = operation.target();
    if (!m.to.empty()) {
      target = Property::at(m.to).of(target, props);
    }
    result.push_back(std::make_unique<Copy>(context.types(), std::move(source), std::move(target)));
  }
  return result;
}

std::vector<std::unique_ptr<Copy>> PropertyCopier::matched(Context & context, const Copy & operation) const
{
  std::vector<std::unique_ptr<Copy>> result;
  if (!matching_) {
    return result;
  }

  const bool lenient = matching_->properties.empty();
  std::vector<std::string> names = lenient ? shared_property_names(context, operation)
                                           : matching_->properties;
  names.erase(
    std::remove_if(names.begin(), names.end(), [&](const std::string & n) {
      return contains(matching_->exclude, n);
    }),
    names.end());

  const PropertyResolver & props = context.property_resolver();
  for (const auto & name : names) {
    auto source = Property::optional(name).of(operation.source(), props);
    auto target = Property::at(name).of(operation.target(), props);
    if (lenient) {
      auto copy = Copy::safely(context.types(), std::move(source), std::move(target));
      if (context.supports(*copy)) {
        result.push_back(std::move(copy));
      }
    } else {
      result.push_back(std::make_unique<Copy>(context.types(), std::move(source), std::move(target)));
    }
  }
  return result;
}

bool PropertyCopier::accepts(Context & context, const Copy & operation) const
{
  if (!operation.source()->value().has_value() &&
      context.hint(NullBehavior::Noop) == NullBehavior::Unsupported) {
    return false;
  }

  const auto all_supported = [&](const std::vector<std::unique_ptr<Copy>> & copies) {
    if (copies.empty()) {
      return false;
    }
    return std::all_of(copies.begin(), copies.end(), [&](const std::unique_ptr<Copy> & copy) {
      return copy->is_safe() || context.supports(*copy);
    });
  };
  return all_supported(mapped(context, operation)) || all_supported(matched(context, operation));
}

bool PropertyCopier::apply(Context & context, Copy & operation) const
{
  const bool null_source = !operation.source()->value().has_value();
  const NullBehavior null_behavior = null_source ? context.hint(NullBehavior::Noop) : NullBehavior::SetNulls;
  if (null_source && null_behavior == NullBehavior::Unsupported) {
    return false;
  }

  auto mapped_copies = mapped(context, operation);
  if (null_source && null_behavior == NullBehavior::Noop && !mapped_copies.empty()) {
    return true;
  }
  auto matched_copies = matched(context, operation);
  if (null_source && null_behavior == NullBehavior::Noop && !matched_copies.empty()) {
    return true;
  }

  bool result = false;
  for (auto * copies : {&mapped_copies, &matched_copies}) {
    for (auto & copy : *copies) {
      context.forward_to(*copy);
      result = true;
    }
  }
  return result;
}

}  // namespace typeweave
