// typeweave/types/type.cpp - Type context implementation
//
#include "typeweave/types/type.hpp"

#include <string>

#include "typeweave/basic/error.hpp"
#include "typeweave/runtime/values.hpp"
#include "typeweave/types/entity.hpp"

namespace typeweave
{

// ============================================================================
// TypeContext Implementation
// ============================================================================

TypeContext::TypeContext() : core_(std::make_unique<CoreEntities>())
{
  declare_core_entities();
}

TypeContext::~TypeContext() = default;

std::string_view TypeContext::intern(std::string_view str)
{
  const std::lock_guard<std::recursive_mutex> lock(mutex_);

  auto it = interned_.find(str);
  if (it != interned_.end()) {
    return it->second;
  }
  const std::string & stored = strings_.emplace_back(str);
  const std::string_view view(stored);
  interned_.emplace(view, view);
  return view;
}

Entity & TypeContext::declare_entity_locked(
  std::string_view name, bool is_interface, const std::vector<std::string_view> & params)
{
  if (entities_by_name_.count(name) != 0) {
    throw_definition_error(
      ErrorCode::DuplicateEntity, std::string(name),
      "entity '" + std::string(name) + "' is already declared");
  }

  const std::string_view stored_name = intern(name);
  auto entity = std::make_unique<Entity>(
    *this, stored_name, is_interface ? EntityKind::Interface : EntityKind::Class);
  for (const auto & p : params) {
    entity->add_param(create_placeholder(*entity, p));
  }
  if (!is_interface && object_type_ != nullptr) {
    entity->set_superclass(object_type_);
  }

  Entity & ref = *entity;
  entities_.push_back(std::move(entity));
  entities_by_name_.emplace(stored_name, &ref);
  return ref;
}

Entity & TypeContext::declare_class(std::string_view name, std::vector<std::string_view> params)
{
  const std::lock_guard<std::recursive_mutex> lock(mutex_);
  return declare_entity_locked(name, false, params);
}

Entity & TypeContext::declare_interface(std::string_view name, std::vector<std::string_view> params)
{
  const std::lock_guard<std::recursive_mutex> lock(mutex_);
  return declare_entity_locked(name, true, params);
}

const Entity & TypeContext::declare_once(
  std::string_view name, bool is_interface, std::vector<std::string_view> params,
  const std::function<void(Entity &)> & init)
{
  const std::lock_guard<std::recursive_mutex> lock(mutex_);

  auto it = entities_by_name_.find(name);
  if (it != entities_by_name_.end()) {
    return *it->second;
  }
  Entity & entity = declare_entity_locked(name, is_interface, params);
  if (init) {
    init(entity);
  }
  return entity;
}

const Entity * TypeContext::find_entity(std::string_view name) const
{
  const std::lock_guard<std::recursive_mutex> lock(mutex_);

  auto it = entities_by_name_.find(name);
  return it == entities_by_name_.end() ? nullptr : it->second;
}

TypeExpr * TypeContext::create_placeholder(const Entity & owner, std::string_view name)
{
  TypeExpr t{TypeKind::Placeholder};
  t.name = intern(name);
  t.declaring_entity = &owner;
  if (object_type_ != nullptr) {
    t.upper_bounds.push_back(object_type_);
  }
  types_.push_back(std::move(t));
  return &types_.back();
}

const TypeExpr * TypeContext::create_method_placeholder(std::string_view method, std::string_view name)
{
  const std::lock_guard<std::recursive_mutex> lock(mutex_);

  const std::string_view key = intern(std::string(method) + "#" + std::string(name));
  auto it = method_placeholders_.find(key);
  if (it != method_placeholders_.end()) {
    return it->second;
  }

  TypeExpr t{TypeKind::Placeholder};
  t.name = intern(name);
  t.declaring_method = intern(method);
  t.upper_bounds.push_back(object_type_);
  types_.push_back(std::move(t));
  method_placeholders_.emplace(key, &types_.back());
  return &types_.back();
}

const TypeExpr * TypeContext::get_named(
  const Entity & entity, gsl::span<const TypeExpr * const> args)
{
  if (!args.empty() && args.size() != entity.params().size()) {
    throw_definition_error(
      ErrorCode::ArityMismatch, std::string(entity.name()),
      "entity '" + std::string(entity.name()) + "' declares " +
        std::to_string(entity.params().size()) + " type parameter(s), got " +
        std::to_string(args.size()));
  }

  const std::lock_guard<std::recursive_mutex> lock(mutex_);

  auto key = std::make_pair(&entity, std::vector<const TypeExpr *>(args.begin(), args.end()));
  auto it = named_.find(key);
  if (it != named_.end()) {
    return it->second;
  }

  TypeExpr t{TypeKind::Named};
  t.entity = &entity;
  t.type_arguments = key.second;
  types_.push_back(std::move(t));
  named_.emplace(std::move(key), &types_.back());
  return &types_.back();
}

const TypeExpr * TypeContext::get_wildcard(
  std::vector<const TypeExpr *> upper_bounds, std::vector<const TypeExpr *> lower_bounds)
{
  const std::lock_guard<std::recursive_mutex> lock(mutex_);

  if (upper_bounds.empty()) {
    upper_bounds.push_back(object_type_);
  }

  auto key = std::make_pair(std::move(upper_bounds), std::move(lower_bounds));
  auto it = wildcards_.find(key);
  if (it != wildcards_.end()) {
    return it->second;
  }

  TypeExpr t{TypeKind::Wildcard};
  t.upper_bounds = key.first;
  t.lower_bounds = key.second;
  types_.push_back(std::move(t));
  wildcards_.emplace(std::move(key), &types_.back());
  return &types_.back();
}

const TypeExpr * TypeContext::get_array(const TypeExpr * component)
{
  const std::lock_guard<std::recursive_mutex> lock(mutex_);

  auto it = arrays_.find(component);
  if (it != arrays_.end()) {
    return it->second;
  }

  TypeExpr t{TypeKind::Array};
  t.component = component;
  types_.push_back(std::move(t));
  arrays_.emplace(component, &types_.back());
  return &types_.back();
}

// ============================================================================
// Core Entities
// ============================================================================

void TypeContext::declare_core_entities()
{
  const std::lock_guard<std::recursive_mutex> lock(mutex_);
  CoreEntities & core = *core_;

  Entity & object = declare_entity_locked("Object", false, {});
  object_ = &object;
  object_type_ = get_named(object);
  core.object = &object;

  core.void_ = &declare_entity_locked("Void", false, {});

  Entity & string = declare_entity_locked("String", false, {});
  string.set_default_constructor([]() { return std::any(std::string()); });
  core.string = &string;

  core.boolean = &declare_entity_locked("Boolean", false, {});

  Entity & number = declare_entity_locked("Number", false, {});
  core.number = &number;
  core.integer = &declare_entity_locked("Integer", false, {}).set_superclass(get_named(number));
  core.long_ = &declare_entity_locked("Long", false, {}).set_superclass(get_named(number));
  core.double_ = &declare_entity_locked("Double", false, {}).set_superclass(get_named(number));

  // Collections
  Entity & iterable = declare_entity_locked("Iterable", true, {"T"});
  core.iterable = &iterable;

  Entity & collection = declare_entity_locked("Collection", true, {"E"});
  collection.add_interface(get_named(iterable, {collection.param(0)}));
  core.collection = &collection;

  Entity & list = declare_entity_locked("List", true, {"E"});
  list.add_interface(get_named(collection, {list.param(0)}));
  core.list = &list;

  Entity & set = declare_entity_locked("Set", true, {"E"});
  set.add_interface(get_named(collection, {set.param(0)}));
  core.set = &set;

  Entity & abstract_collection = declare_entity_locked("AbstractCollection", false, {"E"});
  abstract_collection.add_interface(get_named(collection, {abstract_collection.param(0)}));
  core.abstract_collection = &abstract_collection;

  Entity & abstract_list = declare_entity_locked("AbstractList", false, {"E"});
  abstract_list.set_superclass(get_named(abstract_collection, {abstract_list.param(0)}));
  abstract_list.add_interface(get_named(list, {abstract_list.param(0)}));
  core.abstract_list = &abstract_list;

  // ArrayList re-implements List: the walk must visit it once.
  Entity & array_list = declare_entity_locked("ArrayList", false, {"E"});
  array_list.set_superclass(get_named(abstract_list, {array_list.param(0)}));
  array_list.add_interface(get_named(list, {array_list.param(0)}));
  array_list.set_default_constructor([]() { return std::any(Sequence{}); });
  core.array_list = &array_list;

  Entity & hash_set = declare_entity_locked("HashSet", false, {"E"});
  hash_set.set_superclass(get_named(abstract_collection, {hash_set.param(0)}));
  hash_set.add_interface(get_named(set, {hash_set.param(0)}));
  hash_set.set_default_constructor([]() { return std::any(Sequence{}); });
  core.hash_set = &hash_set;

  core.iterator = &declare_entity_locked("Iterator", true, {"E"});

  Entity & map = declare_entity_locked("Map", true, {"K", "V"});
  core.map = &map;

  Entity & hash_map = declare_entity_locked("HashMap", false, {"K", "V"});
  hash_map.add_interface(get_named(map, {hash_map.param(0), hash_map.param(1)}));
  hash_map.set_default_constructor([]() { return std::any(Dictionary{}); });
  core.hash_map = &hash_map;

  core.typed = &declare_entity_locked("Typed", true, {"T"});
}

}  // namespace typeweave
