// typeweave/types/type.hpp - Type expression representation
//
// Represents a type as used throughout resolution and dispatch: a named
// (possibly parameterized) entity type, a generic placeholder, a bounded
// wildcard, or an array type.
//
#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <memory_resource>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <gsl/span>

namespace typeweave
{

class Entity;
struct CoreEntities;

// ============================================================================
// Type Kind
// ============================================================================

/**
 * Kind of type expression.
 */
enum class TypeKind : uint8_t {
  Named,        ///< Entity<Args...> or raw Entity
  Placeholder,  ///< generic parameter T declared by an entity (or a method)
  Wildcard,     ///< ? extends U / ? super L
  Array,        ///< T[]
};

// ============================================================================
// TypeExpr
// ============================================================================

/**
 * Type expression.
 *
 * TypeExprs are interned by TypeContext: two structurally equal expressions
 * are the same object, so comparison is pointer comparison. Placeholders are
 * unique per (declaring entity, name).
 */
struct TypeExpr
{
  TypeKind kind;

  /// For Named: the entity
  const Entity * entity = nullptr;

  /// For Named: type arguments (empty for non-generic or raw usage)
  std::vector<const TypeExpr *> type_arguments;

  /// For Placeholder: parameter name
  std::string_view name;

  /// For Placeholder: declaring entity (nullptr if declared by a method)
  const Entity * declaring_entity = nullptr;

  /// For Placeholder declared by a generic method: method name
  std::string_view declaring_method;

  /// For Placeholder / Wildcard: upper bounds (never empty, Object by default)
  std::vector<const TypeExpr *> upper_bounds;

  /// For Wildcard: lower bounds
  std::vector<const TypeExpr *> lower_bounds;

  /// For Array: component type
  const TypeExpr * component = nullptr;

  // ===========================================================================
  // Type Queries
  // ===========================================================================

  [[nodiscard]] bool is_named() const noexcept { return kind == TypeKind::Named; }
  [[nodiscard]] bool is_placeholder() const noexcept { return kind == TypeKind::Placeholder; }
  [[nodiscard]] bool is_wildcard() const noexcept { return kind == TypeKind::Wildcard; }
  [[nodiscard]] bool is_array() const noexcept { return kind == TypeKind::Array; }

  /// Named type with type arguments
  [[nodiscard]] bool is_parameterized() const noexcept
  {
    return kind == TypeKind::Named && !type_arguments.empty();
  }

  /// Placeholder declared by an entity (as opposed to a generic method)
  [[nodiscard]] bool is_entity_placeholder() const noexcept
  {
    return kind == TypeKind::Placeholder && declaring_entity != nullptr;
  }
};

// ============================================================================
// Type Context
// ============================================================================

/**
 * Owns entities and interns type expressions.
 *
 * The core entities (Object, String, the collection interfaces, Typed, ...)
 * are declared on construction. Pointers handed out by the context stay valid
 * for its lifetime. Interning and entity declaration are guarded by a mutex;
 * an entity's own declaration (supertypes, accessors, properties) must be
 * complete before the entity is used from several threads.
 */
class TypeContext
{
public:
  TypeContext();
  ~TypeContext();

  TypeContext(const TypeContext &) = delete;
  TypeContext & operator=(const TypeContext &) = delete;

  // ===========================================================================
  // Core Entities
  // ===========================================================================

  [[nodiscard]] const CoreEntities & core() const noexcept { return *core_; }
  [[nodiscard]] const Entity & object_entity() const noexcept { return *object_; }
  [[nodiscard]] const TypeExpr * object_type() const noexcept { return object_type_; }

  // ===========================================================================
  // Entity Declaration
  // ===========================================================================

  /**
   * Declare a class entity. Classes extend Object unless told otherwise.
   *
   * @throws DefinitionError (DuplicateEntity) if the name is taken
   */
  Entity & declare_class(std::string_view name, std::vector<std::string_view> params = {});

  /**
   * Declare an interface entity.
   *
   * @throws DefinitionError (DuplicateEntity) if the name is taken
   */
  Entity & declare_interface(std::string_view name, std::vector<std::string_view> params = {});

  /**
   * Declare an entity unless one with this name exists already.
   *
   * `init` runs once, right after declaration, and may itself declare other
   * entities (the lock is recursive).
   */
  const Entity & declare_once(
    std::string_view name, bool is_interface, std::vector<std::string_view> params,
    const std::function<void(Entity &)> & init);

  /// Look up an entity by name. Returns nullptr if not declared.
  [[nodiscard]] const Entity * find_entity(std::string_view name) const;

  // ===========================================================================
  // Composite Type Creation (Interned)
  // ===========================================================================

  /**
   * Get Entity<args...>; an empty argument list yields the raw type.
   *
   * @throws DefinitionError (ArityMismatch) if the argument count is neither
   *         zero nor the entity's parameter count
   */
  const TypeExpr * get_named(const Entity & entity, gsl::span<const TypeExpr * const> args = {});

  const TypeExpr * get_named(const Entity & entity, std::initializer_list<const TypeExpr *> args)
  {
    return get_named(entity, gsl::span<const TypeExpr * const>(args.begin(), args.size()));
  }

  /// Get the wildcard with the given bounds. An empty upper bound list means Object.
  const TypeExpr * get_wildcard(
    std::vector<const TypeExpr *> upper_bounds, std::vector<const TypeExpr *> lower_bounds = {});

  /// Get `?`
  const TypeExpr * wildcard_all() { return get_wildcard({}, {}); }

  /// Get `? extends bound`
  const TypeExpr * wildcard_extends(const TypeExpr * bound) { return get_wildcard({bound}, {}); }

  /// Get `? super bound`
  const TypeExpr * wildcard_super(const TypeExpr * bound) { return get_wildcard({}, {bound}); }

  /// Get component[]
  const TypeExpr * get_array(const TypeExpr * component);

  /**
   * Create a placeholder declared by a generic method rather than an entity.
   *
   * Such placeholders are representable but cannot be resolved.
   */
  const TypeExpr * create_method_placeholder(std::string_view method, std::string_view name);

  /// Intern a string; the returned view lives as long as the context.
  std::string_view intern(std::string_view str);

private:
  friend class Entity;

  Entity & declare_entity_locked(std::string_view name, bool is_interface,
    const std::vector<std::string_view> & params);
  TypeExpr * create_placeholder(const Entity & owner, std::string_view name);
  void declare_core_entities();

  mutable std::recursive_mutex mutex_;

  std::pmr::monotonic_buffer_resource arena_{4096};
  // NOTE: pointers to interned types and entities are handed out widely.
  // We must use containers with stable element addresses.
  std::pmr::deque<TypeExpr> types_{&arena_};
  std::vector<std::unique_ptr<Entity>> entities_;
  std::deque<std::string> strings_;

  std::unordered_map<std::string_view, std::string_view> interned_;
  std::unordered_map<std::string_view, const TypeExpr *> method_placeholders_;
  std::unordered_map<std::string_view, Entity *> entities_by_name_;
  std::map<std::pair<const Entity *, std::vector<const TypeExpr *>>, const TypeExpr *> named_;
  std::map<std::pair<std::vector<const TypeExpr *>, std::vector<const TypeExpr *>>, const TypeExpr *>
    wildcards_;
  std::unordered_map<const TypeExpr *, const TypeExpr *> arrays_;

  std::unique_ptr<CoreEntities> core_;
  const Entity * object_ = nullptr;
  const TypeExpr * object_type_ = nullptr;
};

}  // namespace typeweave
