// typeweave/types/entity.hpp - Class / interface descriptors
//
// An Entity describes a class- or interface-like declaration: its generic
// placeholders, its supertypes, its properties, an optional default
// constructor and the explicit-binding accessors that supply per-instance
// bindings for its placeholders.
//
#pragma once

#include <any>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "typeweave/types/type.hpp"

namespace typeweave
{

class Instance;

enum class EntityKind : uint8_t {
  Class,
  Interface,
};

/// Reads a type from an instance (used by explicit-binding accessors).
using TypeAccessor = std::function<const TypeExpr *(const Instance &)>;

/// Creates a fresh value of an entity.
using ValueFactory = std::function<std::any()>;

/**
 * Method declaration offered as an explicit-binding accessor.
 *
 * A well-formed accessor takes no parameters and returns Typed<P> where P is
 * a placeholder declared by the entity the accessor is added to.
 */
struct MethodDecl
{
  std::string name;
  std::vector<const TypeExpr *> parameter_types;
  const TypeExpr * return_type = nullptr;
  TypeAccessor invoke;
};

/**
 * Validated explicit-binding accessor.
 */
struct BindingAccessor
{
  std::string_view name;
  const TypeExpr * placeholder = nullptr;
  TypeAccessor invoke;
};

/**
 * Declared property (bean-style).
 */
struct PropertyDecl
{
  std::string_view name;
  const TypeExpr * type = nullptr;
  bool writable = true;
};

// ============================================================================
// Entity
// ============================================================================

class Entity
{
public:
  Entity(TypeContext & types, std::string_view name, EntityKind kind);

  Entity(const Entity &) = delete;
  Entity & operator=(const Entity &) = delete;

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] std::string_view name() const noexcept { return name_; }
  [[nodiscard]] EntityKind kind() const noexcept { return kind_; }
  [[nodiscard]] bool is_interface() const noexcept { return kind_ == EntityKind::Interface; }
  [[nodiscard]] bool is_class() const noexcept { return kind_ == EntityKind::Class; }

  /// Declared placeholders, in declaration order
  [[nodiscard]] const std::vector<const TypeExpr *> & params() const noexcept { return params_; }
  [[nodiscard]] bool is_generic() const noexcept { return !params_.empty(); }

  [[nodiscard]] const TypeExpr * param(size_t index) const;

  /// Placeholder by name, or nullptr
  [[nodiscard]] const TypeExpr * param(std::string_view name) const noexcept;

  /// Superclass type; nullptr for Object and for interfaces
  [[nodiscard]] const TypeExpr * superclass() const noexcept { return superclass_; }

  /// Directly implemented (class) or extended (interface) interface types
  [[nodiscard]] const std::vector<const TypeExpr *> & interfaces() const noexcept
  {
    return interfaces_;
  }

  [[nodiscard]] const std::vector<BindingAccessor> & binding_accessors() const noexcept
  {
    return accessors_;
  }

  [[nodiscard]] const std::vector<PropertyDecl> & properties() const noexcept
  {
    return properties_;
  }

  /// Property declared directly on this entity, or nullptr
  [[nodiscard]] const PropertyDecl * find_property(std::string_view name) const noexcept;

  [[nodiscard]] bool has_default_constructor() const noexcept
  {
    return static_cast<bool>(default_constructor_);
  }
  [[nodiscard]] const ValueFactory & default_constructor() const noexcept
  {
    return default_constructor_;
  }

  /// Raw type (no type arguments)
  [[nodiscard]] const TypeExpr * raw_type() const;

  /// Entity<P1, ..., Pn> parameterized with its own placeholders (raw if not generic)
  [[nodiscard]] const TypeExpr * declared_type() const;

  [[nodiscard]] TypeContext & types() const noexcept { return types_; }

  // ===========================================================================
  // Declaration
  // ===========================================================================

  Entity & set_superclass(const TypeExpr * type);
  Entity & add_interface(const TypeExpr * type);

  /// Replace the upper bounds of one of this entity's placeholders.
  Entity & set_bounds(std::string_view param, std::vector<const TypeExpr *> upper_bounds);

  /**
   * Add an explicit-binding accessor.
   *
   * @throws DefinitionError (MalformedBindingAccessor) if the method takes
   *         parameters, does not return Typed<X>, or X is not one of this
   *         entity's placeholders
   */
  Entity & add_binding_accessor(MethodDecl method);

  Entity & add_property(std::string_view name, const TypeExpr * type, bool writable = true);

  Entity & set_default_constructor(ValueFactory factory);

private:
  friend class TypeContext;

  void add_param(TypeExpr * placeholder);

  TypeContext & types_;
  std::string_view name_;
  EntityKind kind_;

  std::vector<const TypeExpr *> params_;
  std::vector<TypeExpr *> mutable_params_;
  const TypeExpr * superclass_ = nullptr;
  std::vector<const TypeExpr *> interfaces_;
  std::vector<BindingAccessor> accessors_;
  std::vector<PropertyDecl> properties_;
  ValueFactory default_constructor_;
};

// ============================================================================
// Core Entities
// ============================================================================

/**
 * Entities every TypeContext declares on construction.
 *
 * Modelled on a small subset of a conventional object library: a root
 * `Object`, boxed scalars, collection interfaces with one concrete
 * implementation each, and `Typed<T>`, the return type of explicit-binding
 * accessors.
 */
struct CoreEntities
{
  const Entity * object = nullptr;
  const Entity * void_ = nullptr;
  const Entity * string = nullptr;
  const Entity * boolean = nullptr;
  const Entity * number = nullptr;
  const Entity * integer = nullptr;
  const Entity * long_ = nullptr;
  const Entity * double_ = nullptr;

  const Entity * iterable = nullptr;          // Iterable<T>
  const Entity * collection = nullptr;        // Collection<E> extends Iterable<E>
  const Entity * list = nullptr;              // List<E> extends Collection<E>
  const Entity * set = nullptr;               // Set<E> extends Collection<E>
  const Entity * abstract_collection = nullptr;  // AbstractCollection<E> implements Collection<E>
  const Entity * abstract_list = nullptr;     // AbstractList<E> extends AbstractCollection<E> implements List<E>
  const Entity * array_list = nullptr;        // ArrayList<E> extends AbstractList<E> implements List<E>
  const Entity * hash_set = nullptr;          // HashSet<E> extends AbstractCollection<E> implements Set<E>
  const Entity * iterator = nullptr;          // Iterator<E>
  const Entity * map = nullptr;               // Map<K, V>
  const Entity * hash_map = nullptr;          // HashMap<K, V> implements Map<K, V>

  const Entity * typed = nullptr;             // Typed<T>
};

}  // namespace typeweave
