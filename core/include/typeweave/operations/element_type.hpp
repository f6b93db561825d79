// typeweave/operations/element_type.hpp - GetElementType<T>
#pragma once

#include <string>

#include "typeweave/dispatch/operation.hpp"

namespace typeweave
{

/**
 * Element type of a container type (List<String> gives String).
 *
 * Works on a type rather than a position. GetElementType<T> extends
 * Operation<Object>; T is bound to the subject type.
 */
class GetElementType : public ResultOperation<const TypeExpr *>
{
public:
  GetElementType(TypeContext & types, const TypeExpr * subject);

  [[nodiscard]] const TypeExpr * subject() const noexcept { return subject_; }

  [[nodiscard]] bool same_shape(const Operation & other) const noexcept override;
  [[nodiscard]] std::string describe() const override;

  static const Entity & declare(TypeContext & types);

private:
  const TypeExpr * subject_;
};

}  // namespace typeweave
