// typeweave/operators/converters.hpp - Standard Convert operators
#pragma once

#include <memory>

#include "typeweave/dispatch/operator.hpp"
#include "typeweave/operations/transform.hpp"

namespace typeweave
{

/**
 * Convert<?, ?> where the source type is assignable to the target type: the
 * source value is written unchanged.
 */
class NopConverter : public TypedOperator<Convert>
{
public:
  explicit NopConverter(TypeContext & types);

protected:
  [[nodiscard]] bool accepts(Context & context, const Convert & operation) const override;
  bool apply(Context & context, Convert & operation) const override;
};

/**
 * Converts by creating a fresh value and copying the source into it.
 *
 * Entity CopyingConverter<TARGET> implements
 * Operator<Convert<?, ? super TARGET>>; TARGET is bound explicitly to the
 * configured target type, so one entity serves every target.
 */
class CopyingConverter : public TypedOperator<Convert>
{
public:
  /// Fluent form of `implementing(types, type).with(concrete)`.
  class Implementing
  {
  public:
    /**
     * @throws DefinitionError (MissingDefaultConstructor) if `concrete` has
     *         no default constructor
     * @throws DefinitionError (MalformedDeclaration) if `concrete` does not
     *         extend the target type's entity
     */
    [[nodiscard]] std::shared_ptr<CopyingConverter> with(const Entity & concrete) const;

  private:
    friend class CopyingConverter;
    Implementing(TypeContext & types, const TypeExpr * target_type)
    : types_(&types), target_type_(target_type)
    {
    }

    TypeContext * types_;
    const TypeExpr * target_type_;
  };

  /**
   * Converter creating values of `target_type` itself.
   *
   * @throws DefinitionError (MissingDefaultConstructor) if the type's entity
   *         has no default constructor
   */
  [[nodiscard]] static std::shared_ptr<CopyingConverter> for_target_type(
    TypeContext & types, const TypeExpr * target_type);

  /// Converter declaring `target_type` and creating instances of a concrete entity.
  [[nodiscard]] static Implementing implementing(TypeContext & types, const TypeExpr * target_type);

  /// Declared target type (bound to TARGET)
  [[nodiscard]] const TypeExpr * target_type() const noexcept { return target_type_; }

  /// Type of the values created (the concrete entity, parameterized where possible)
  [[nodiscard]] const TypeExpr * value_type() const noexcept { return value_type_; }

  static const Entity & declare(TypeContext & types);

protected:
  [[nodiscard]] bool accepts(Context & context, const Convert & operation) const override;
  bool apply(Context & context, Convert & operation) const override;

private:
  CopyingConverter(TypeContext & types, const TypeExpr * target_type, const Entity & concrete);

  const TypeExpr * target_type_;
  const TypeExpr * value_type_;
  const Entity * concrete_;
};

}  // namespace typeweave
