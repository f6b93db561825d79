// typeweave/position/property.hpp - Property introspection and property positions
#pragma once

#include <any>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "typeweave/position/position.hpp"
#include "typeweave/types/entity.hpp"

namespace typeweave
{

enum class PropertyFilter : uint8_t {
  All,
  Writable,
};

// ============================================================================
// PropertyResolver
// ============================================================================

/**
 * Bean-style introspection of the value held by a readable position.
 *
 * Consulted by property-oriented operators only; the resolver and the
 * dispatch engine never call it.
 */
class PropertyResolver
{
public:
  explicit PropertyResolver(TypeContext & types) : types_(types) {}
  virtual ~PropertyResolver() = default;

  /// Property names of the value at `position` (or of its declared type if null)
  [[nodiscard]] virtual std::vector<std::string> property_names(
    const Readable & position, PropertyFilter filter = PropertyFilter::All) const = 0;

  /// Declared type of a property, refined against the parent's type; nullptr if unknown
  [[nodiscard]] virtual const TypeExpr * property_type(
    const Readable & parent, std::string_view name) const = 0;

  [[nodiscard]] virtual bool is_writable(const Readable & parent, std::string_view name) const = 0;

  [[nodiscard]] virtual std::any get(const Readable & parent, std::string_view name) const = 0;

  virtual void set(const Readable & parent, std::string_view name, std::any value) const = 0;

  [[nodiscard]] TypeContext & types() const noexcept { return types_; }

private:
  TypeContext & types_;
};

/**
 * Property resolver over Record values.
 *
 * Properties are those declared by the record's entity and its superclasses.
 * A null parent is introspected through its declared type.
 */
class RecordPropertyResolver : public PropertyResolver
{
public:
  using PropertyResolver::PropertyResolver;

  [[nodiscard]] std::vector<std::string> property_names(
    const Readable & position, PropertyFilter filter = PropertyFilter::All) const override;
  [[nodiscard]] const TypeExpr * property_type(
    const Readable & parent, std::string_view name) const override;
  [[nodiscard]] bool is_writable(const Readable & parent, std::string_view name) const override;
  [[nodiscard]] std::any get(const Readable & parent, std::string_view name) const override;
  void set(const Readable & parent, std::string_view name, std::any value) const override;
};

// ============================================================================
// Property Positions
// ============================================================================

/**
 * Position of a named property relative to a parent position.
 */
class PropertyPosition : public ReadWrite
{
public:
  PropertyPosition(
    std::shared_ptr<const Readable> parent, std::string name, bool optional,
    const PropertyResolver & resolver);

  [[nodiscard]] const TypeExpr * type() const override;
  [[nodiscard]] std::any value() const override;
  void set_value(std::any value) override;

  [[nodiscard]] bool same_as(const Position & other) const noexcept override;
  [[nodiscard]] std::string describe() const override;

  [[nodiscard]] const std::string & name() const noexcept { return name_; }
  [[nodiscard]] const Readable & parent() const noexcept { return *parent_; }

  /// Whether the parent currently has this property
  [[nodiscard]] bool exists() const;

private:
  std::shared_ptr<const Readable> parent_;
  std::string name_;
  bool optional_;
  const PropertyResolver * resolver_;
};

/**
 * Factory of property positions.
 *
 * `Property::at("title").of(book, resolver)` denotes the title of whatever
 * the `book` position holds. An optional property reads as null when the
 * parent is null or lacks the property.
 */
class Property
{
public:
  [[nodiscard]] static Property at(std::string name);
  [[nodiscard]] static Property optional(std::string name);

  [[nodiscard]] std::shared_ptr<PropertyPosition> of(
    std::shared_ptr<const Readable> parent, const PropertyResolver & resolver) const;

  [[nodiscard]] const std::string & name() const noexcept { return name_; }
  [[nodiscard]] bool is_optional() const noexcept { return optional_; }

private:
  Property(std::string name, bool optional) : name_(std::move(name)), optional_(optional) {}

  std::string name_;
  bool optional_;
};

}  // namespace typeweave
