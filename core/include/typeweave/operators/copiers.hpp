// typeweave/operators/copiers.hpp - Standard Copy operators
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "typeweave/dispatch/operator.hpp"
#include "typeweave/operations/transform.hpp"

namespace typeweave
{

/**
 * Copy<?, ?> into a writable target: converts the source to the target's
 * type and writes the result.
 */
class ConvertingCopier : public TypedOperator<Copy>
{
public:
  explicit ConvertingCopier(TypeContext & types);

protected:
  [[nodiscard]] bool accepts(Context & context, const Copy & operation) const override;
  bool apply(Context & context, Copy & operation) const override;
};

/**
 * Copy<?, ?> property by property.
 *
 * Every property readable on the source and writable on the target yields a
 * safe nested Copy; those the context supports are evaluated. Succeeds if
 * any nested copy did.
 */
class BeanCopier : public TypedOperator<Copy>
{
public:
  explicit BeanCopier(TypeContext & types);

  [[nodiscard]] std::vector<std::string> depends_on() const override;

protected:
  [[nodiscard]] bool accepts(Context & context, const Copy & operation) const override;
  bool apply(Context & context, Copy & operation) const override;
};

// ============================================================================
// PropertyCopier
// ============================================================================

/**
 * How a PropertyCopier treats a null source. Read as a context hint.
 */
enum class NullBehavior : uint8_t {
  Unsupported,  ///< decline the copy
  Noop,         ///< succeed without touching the target
  SetNulls,     ///< copy null into the target properties
};

/// Explicit property mapping. An empty side denotes the parent position itself.
struct PropertyMapping
{
  std::string from;
  std::string to;
};

/**
 * Property matching rule. An empty property list matches every property
 * readable on the source and writable on the target.
 */
struct PropertyMatching
{
  std::vector<std::string> properties;
  std::vector<std::string> exclude;
};

/**
 * Configured copier between two types.
 *
 * Entity PropertyCopier<SOURCE, TARGET> implements
 * Operator<Copy<SOURCE, TARGET>>; both placeholders are bound explicitly to
 * the configured types.
 */
class PropertyCopier : public TypedOperator<Copy>
{
public:
  class Builder
  {
  public:
    Builder & map(std::string from, std::string to);
    Builder & match(std::vector<std::string> properties = {}, std::vector<std::string> exclude = {});

    /**
     * @throws DefinitionError (MalformedDeclaration) when neither mappings
     *         nor matching are configured, or a mapping has two empty sides
     */
    [[nodiscard]] std::shared_ptr<PropertyCopier> build() const;

  private:
    friend class PropertyCopier;
    Builder(TypeContext & types, const TypeExpr * source_type, const TypeExpr * target_type)
    : types_(&types), source_type_(source_type), target_type_(target_type)
    {
    }

    TypeContext * types_;
    const TypeExpr * source_type_;
    const TypeExpr * target_type_;
    std::vector<PropertyMapping> mappings_;
    std::optional<PropertyMatching> matching_;
  };

  [[nodiscard]] static Builder between(
    TypeContext & types, const TypeExpr * source_type, const TypeExpr * target_type);

  [[nodiscard]] const TypeExpr * source_type() const noexcept { return source_type_; }
  [[nodiscard]] const TypeExpr * target_type() const noexcept { return target_type_; }

  [[nodiscard]] std::vector<std::string> depends_on() const override;

  static const Entity & declare(TypeContext & types);

protected:
  [[nodiscard]] bool accepts(Context & context, const Copy & operation) const override;
  bool apply(Context & context, Copy & operation) const override;

private:
  PropertyCopier(
    TypeContext & types, const TypeExpr * source_type, const TypeExpr * target_type,
    std::vector<PropertyMapping> mappings, std::optional<PropertyMatching> matching);

  std::vector<std::unique_ptr<Copy>> mapped(Context & context, const Copy & operation) const;
  std::vector<std::unique_ptr<Copy>> matched(Context & context, const Copy & operation) const;

  const TypeExpr * source_type_;
  const TypeExpr * target_type_;
  std::vector<PropertyMapping> mappings_;
  std::optional<PropertyMatching> matching_;
};

}  // namespace typeweave
