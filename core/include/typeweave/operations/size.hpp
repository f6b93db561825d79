// typeweave/operations/size.hpp - Size<T>
#pragma once

#include <memory>

#include "typeweave/dispatch/operation.hpp"

namespace typeweave
{

/**
 * Number of elements of the value held by a position.
 *
 * Size<T> extends Operation<Integer>; T is bound to the subject's type.
 */
class Size : public ResultOperation<int>
{
public:
  Size(TypeContext & types, std::shared_ptr<const Readable> subject);

  [[nodiscard]] const std::shared_ptr<const Readable> & subject() const noexcept { return subject_; }

  static const Entity & declare(TypeContext & types);

private:
  std::shared_ptr<const Readable> subject_;
};

}  // namespace typeweave
