// typeweave/position/property.cpp - Property introspection and property positions
//
#include "typeweave/position/property.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "typeweave/basic/error.hpp"
#include "typeweave/runtime/values.hpp"
#include "typeweave/types/type_utils.hpp"

namespace typeweave
{

namespace
{

struct FoundProperty
{
  const PropertyDecl * decl = nullptr;
  const Entity * owner = nullptr;
};

/// Entity to introspect: the record's entity, else the erasure of the declared type.
const Entity * introspected_entity(const Readable & position, const std::any & value)
{
  if (auto record = as_record(value)) {
    return &record->entity();
  }
  return raw_entity(position.type());
}

FoundProperty find_property(const Entity * entity, std::string_view name)
{
  for (const Entity * e = entity; e != nullptr;) {
    if (const PropertyDecl * decl = e->find_property(name)) {
      return FoundProperty{decl, e};
    }
    const TypeExpr * super = e->superclass();
    e = super ? super->entity : nullptr;
  }
  return FoundProperty{};
}

}  // namespace

// ============================================================================
// RecordPropertyResolver
// ============================================================================

std::vector<std::string> RecordPropertyResolver::property_names(
  const Readable & position, PropertyFilter filter) const
{
  std::vector<std::string> names;
  for (const Entity * e = introspected_entity(position, position.value()); e != nullptr;) {
    for (const auto & prop : e->properties()) {
      if (filter == PropertyFilter::Writable && !prop.writable) {
        continue;
      }
      if (std::find(names.begin(), names.end(), prop.name) == names.end()) {
        names.emplace_back(prop.name);
      }
    }
    const TypeExpr * super = e->superclass();
    e = super ? super->entity : nullptr;
  }
  return names;
}

const TypeExpr * RecordPropertyResolver::property_type(
  const Readable & parent, std::string_view name) const
{
  const std::any value = parent.value();
  const Entity * entity = introspected_entity(parent, value);
  const FoundProperty found = find_property(entity, name);
  if (found.decl == nullptr) {
    return nullptr;
  }

  const TypeExpr * type = found.decl->type;
  if (contains_placeholders(type)) {
    // Substitute the owner's placeholders from the parent's declared type
    const TypeExpr * context = parent.type();
    const Entity * context_entity = raw_entity(context);
    if (context_entity == nullptr || !is_subentity(*context_entity, *found.owner)) {
      context = entity->raw_type();
    }
    if (auto args = get_type_arguments(types(), context, *found.owner)) {
      if (const TypeExpr * unrolled = unroll(types(), *args, type)) {
        type = unrolled;
      }
    }
  }
  return refine(types(), type, parent.type());
}

bool RecordPropertyResolver::is_writable(const Readable & parent, std::string_view name) const
{
  const FoundProperty found = find_property(introspected_entity(parent, parent.value()), name);
  return found.decl != nullptr && found.decl->writable;
}

std::any RecordPropertyResolver::get(const Readable & parent, std::string_view name) const
{
  if (auto record = as_record(parent.value())) {
    return record->get(name);
  }
  return {};
}

void RecordPropertyResolver::set(const Readable & parent, std::string_view name, std::any value) const
{
  auto record = as_record(parent.value());
  if (!record) {
    throw std::invalid_argument(
      "cannot set property '" + std::string(name) + "' of " + parent.describe() + ": no record");
  }
  const FoundProperty found = find_property(&record->entity(), name);
  if (found.decl == nullptr || !found.decl->writable) {
    throw std::invalid_argument(
      "property '" + std::string(name) + "' of " + std::string(record->entity().name()) +
      " is not writable");
  }
  record->set(name, std::move(value));
}

// ============================================================================
// PropertyPosition
// ============================================================================

PropertyPosition::PropertyPosition(
  std::shared_ptr<const Readable> parent, std::string name, bool optional,
  const PropertyResolver & resolver)
: parent_(std::move(parent)), name_(std::move(name)), optional_(optional), resolver_(&resolver)
{
}

const TypeExpr * PropertyPosition::type() const
{
  const TypeExpr * type = resolver_->property_type(*parent_, name_);
  return type ? type : resolver_->types().object_type();
}

bool PropertyPosition::exists() const
{
  const auto names = resolver_->property_names(*parent_);
  return std::find(names.begin(), names.end(), name_) != names.end();
}

std::any PropertyPosition::value() const
{
  if (optional_ && !parent_->value().has_value()) {
    return {};
  }
  return resolver_->get(*parent_, name_);
}

void PropertyPosition::set_value(std::any value) { resolver_->set(*parent_, name_, std::move(value)); }

bool PropertyPosition::same_as(const Position & other) const noexcept
{
  if (this == &other) {
    return true;
  }
  const auto * prop = dynamic_cast<const PropertyPosition *>(&other);
  return prop != nullptr && prop->name_ == name_ && prop->parent_->same_as(*parent_);
}

std::string PropertyPosition::describe() const { return parent_->describe() + "." + name_; }

// ============================================================================
// Property
// ============================================================================

Property Property::at(std::string name)
{
  if (name.empty()) {
    throw_definition_error(ErrorCode::MalformedDeclaration, "Property", "property name is empty");
  }
  return Property(std::move(name), false);
}

Property Property::optional(std::string name)
{
  if (name.empty()) {
    throw_definition_error(ErrorCode::MalformedDeclaration, "Property", "property name is empty");
  }
  return Property(std::move(name), true);
}

std::shared_ptr<PropertyPosition> Property::of(
  std::shared_ptr<const Readable> parent, const PropertyResolver & resolver) const
{
  return std::make_shared<PropertyPosition>(std::move(parent), name_, optional_, resolver);
}

}  // namespace typeweave
