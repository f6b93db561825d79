// typeweave/operations/immutable_check.hpp - ImmutableCheck<T>
#pragma once

#include <memory>

#include "typeweave/dispatch/operation.hpp"

namespace typeweave
{

/**
 * Whether the value held by a position can be shared instead of copied.
 *
 * ImmutableCheck<T> extends Operation<Boolean>; T is bound to the subject's
 * type.
 */
class ImmutableCheck : public ResultOperation<bool>
{
public:
  ImmutableCheck(TypeContext & types, std::shared_ptr<const Readable> subject);

  [[nodiscard]] const std::shared_ptr<const Readable> & subject() const noexcept { return subject_; }

  static const Entity & declare(TypeContext & types);

private:
  std::shared_ptr<const Readable> subject_;
};

}  // namespace typeweave
