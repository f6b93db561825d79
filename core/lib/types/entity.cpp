// typeweave/types/entity.cpp - Entity descriptor implementation
//
#include "typeweave/types/entity.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "typeweave/basic/error.hpp"
#include "typeweave/types/type_utils.hpp"

namespace typeweave
{

Entity::Entity(TypeContext & types, std::string_view name, EntityKind kind)
: types_(types), name_(name), kind_(kind)
{
}

void Entity::add_param(TypeExpr * placeholder)
{
  params_.push_back(placeholder);
  mutable_params_.push_back(placeholder);
}

const TypeExpr * Entity::param(size_t index) const
{
  if (index >= params_.size()) {
    throw_definition_error(
      ErrorCode::ArityMismatch, std::string(name_),
      "entity '" + std::string(name_) + "' has no type parameter #" + std::to_string(index));
  }
  return params_[index];
}

const TypeExpr * Entity::param(std::string_view name) const noexcept
{
  auto it = std::find_if(params_.begin(), params_.end(), [&](const TypeExpr * p) {
    return p->name == name;
  });
  return it == params_.end() ? nullptr : *it;
}

const PropertyDecl * Entity::find_property(std::string_view name) const noexcept
{
  auto it = std::find_if(properties_.begin(), properties_.end(), [&](const PropertyDecl & p) {
    return p.name == name;
  });
  return it == properties_.end() ? nullptr : &*it;
}

const TypeExpr * Entity::raw_type() const { return types_.get_named(*this); }

const TypeExpr * Entity::declared_type() const
{
  return types_.get_named(*this, gsl::span<const TypeExpr * const>(params_));
}

// ============================================================================
// Declaration
// ============================================================================

Entity & Entity::set_superclass(const TypeExpr * type)
{
  if (type != nullptr && (!type->is_named() || !type->entity->is_class())) {
    throw_definition_error(
      ErrorCode::MalformedDeclaration, std::string(name_),
      "superclass of '" + std::string(name_) + "' must be a class type, got " + to_string(type));
  }
  superclass_ = type;
  return *this;
}

Entity & Entity::add_interface(const TypeExpr * type)
{
  if (type == nullptr || !type->is_named() || !type->entity->is_interface()) {
    throw_definition_error(
      ErrorCode::MalformedDeclaration, std::string(name_),
      "'" + std::string(name_) + "' can only implement interface types, got " + to_string(type));
  }
  interfaces_.push_back(type);
  return *this;
}

Entity & Entity::set_bounds(std::string_view param, std::vector<const TypeExpr *> upper_bounds)
{
  auto it = std::find_if(mutable_params_.begin(), mutable_params_.end(), [&](const TypeExpr * p) {
    return p->name == param;
  });
  if (it == mutable_params_.end()) {
    throw_definition_error(
      ErrorCode::MalformedDeclaration, std::string(name_),
      "'" + std::string(name_) + "' declares no type parameter '" + std::string(param) + "'");
  }
  if (upper_bounds.empty()) {
    upper_bounds.push_back(types_.object_type());
  }
  (*it)->upper_bounds = std::move(upper_bounds);
  return *this;
}

Entity & Entity::add_binding_accessor(MethodDecl method)
{
  const std::string subject = std::string(name_) + "::" + method.name;
  auto fail = [&](const std::string & what) {
    throw_definition_error(
      ErrorCode::MalformedBindingAccessor, subject,
      "binding accessor " + subject + " " + what);
  };

  if (!method.parameter_types.empty()) {
    fail("must accept 0 parameters");
  }

  const Entity & typed = *types_.core().typed;
  const TypeExpr * ret = method.return_type;
  if (ret == nullptr || !ret->is_named() || !is_subentity(*ret->entity, typed)) {
    fail("must return Typed<T>");
  }

  const auto args = get_type_arguments(types_, ret, typed);
  const TypeExpr * bound = nullptr;
  if (args) {
    auto it = args->find(typed.params().front());
    bound = it == args->end() ? nullptr : it->second;
  }
  if (bound == nullptr || !bound->is_placeholder() || bound->declaring_entity != this) {
    fail("should bind a type parameter of " + std::string(name_) + " to Typed<T>");
  }
  if (!method.invoke) {
    fail("has no implementation");
  }

  accessors_.push_back(BindingAccessor{types_.intern(method.name), bound, std::move(method.invoke)});
  return *this;
}

Entity & Entity::add_property(std::string_view name, const TypeExpr * type, bool writable)
{
  properties_.push_back(PropertyDecl{types_.intern(name), type, writable});
  return *this;
}

Entity & Entity::set_default_constructor(ValueFactory factory)
{
  default_constructor_ = std::move(factory);
  return *this;
}

}  // namespace typeweave
