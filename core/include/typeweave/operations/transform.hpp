// typeweave/operations/transform.hpp - Source-to-target operations
//
// Transform<SOURCE, TARGET, RESULT> extends Operation<RESULT> and binds
// SOURCE and TARGET explicitly to the types of its two positions. Convert
// and Copy inherit those bindings through their own placeholders.
//
#pragma once

#include <any>
#include <memory>
#include <utility>

#include "typeweave/dispatch/operation.hpp"

namespace typeweave
{

/// The entity Transform<SOURCE, TARGET, RESULT>.
const Entity & declare_transform(TypeContext & types);

/**
 * Operation reading a source position and acting on a target position.
 *
 * positions()[0] is the source, positions()[1] the target.
 */
template <typename R>
class Transform : public ResultOperation<R>
{
public:
  [[nodiscard]] const std::shared_ptr<const Readable> & source() const noexcept { return source_; }
  [[nodiscard]] const TypeExpr * source_type() const { return source_->type(); }
  [[nodiscard]] const TypeExpr * target_type() const { return this->positions()[1]->type(); }

protected:
  Transform(
    const Entity & entity, std::shared_ptr<const Readable> source,
    std::shared_ptr<const Position> target, AggregationMode aggregation = AggregationMode::FirstSuccess)
  : ResultOperation<R>(entity, aggregation), source_(std::move(source))
  {
    this->add_position(source_);
    this->add_position(std::move(target));
  }

private:
  std::shared_ptr<const Readable> source_;
};

// ============================================================================
// Convert
// ============================================================================

/**
 * Produce a value of the target's type from the source and write it to the
 * target. The result is the written value.
 */
class Convert : public Transform<std::any>
{
public:
  Convert(TypeContext & types, std::shared_ptr<const Readable> source, std::shared_ptr<Writable> target);

  [[nodiscard]] const std::shared_ptr<Writable> & target() const noexcept { return target_; }

  /// Write `value` to the target and record it as the result.
  void assign(std::any value);

  /// Convert<SOURCE, TARGET> extends Transform<SOURCE, TARGET, TARGET>
  static const Entity & declare(TypeContext & types);

private:
  std::shared_ptr<Writable> target_;
};

// ============================================================================
// Copy
// ============================================================================

/**
 * Copy the state of the source value into the value the target holds.
 *
 * A copy created through `safely` may be submitted again once evaluated and
 * reports its recorded outcome.
 */
class Copy : public Transform<void>
{
public:
  Copy(TypeContext & types, std::shared_ptr<const Readable> source, std::shared_ptr<Readable> target);

  [[nodiscard]] static std::unique_ptr<Copy> safely(
    TypeContext & types, std::shared_ptr<const Readable> source, std::shared_ptr<Readable> target);

  [[nodiscard]] const std::shared_ptr<Readable> & target() const noexcept { return target_; }

  /// Target as a writable position, or nullptr
  [[nodiscard]] std::shared_ptr<Writable> writable_target() const;

  /// Copy<SOURCE, TARGET> extends Transform<SOURCE, TARGET, Void>
  static const Entity & declare(TypeContext & types);

private:
  std::shared_ptr<Readable> target_;
};

}  // namespace typeweave
