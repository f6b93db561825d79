// typeweave/dispatch/operation.hpp - Dispatchable units of work
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "typeweave/position/position.hpp"
#include "typeweave/types/instance.hpp"

namespace typeweave
{

class Context;

/**
 * Evaluation lifecycle. Succeeded and Failed are terminal.
 */
enum class OperationState : uint8_t {
  Created,
  Matching,
  Executing,
  Succeeded,
  Failed,
};

/**
 * How candidates are executed.
 */
enum class AggregationMode : uint8_t {
  FirstSuccess,  ///< stop at the first candidate that succeeds
  AggregateAny,  ///< run every candidate; succeed if any did
};

[[nodiscard]] std::string_view to_string(OperationState state) noexcept;

// ============================================================================
// Operation
// ============================================================================

/**
 * Base of all operations.
 *
 * An operation is an instance of an entity extending `Operation<RESULT>`; the
 * entity's placeholders are the operation's type arguments, typically bound
 * explicitly to the types of its positions.
 *
 * An operation is evaluated at most once. Safe operations (see Copy::safely)
 * may be resubmitted and report their recorded outcome.
 */
class Operation : public Instance
{
public:
  ~Operation() override = default;

  Operation(const Operation &) = delete;
  Operation & operator=(const Operation &) = delete;

  [[nodiscard]] const Entity & entity() const noexcept override { return *entity_; }

  [[nodiscard]] OperationState state() const noexcept { return state_; }
  [[nodiscard]] bool is_terminal() const noexcept
  {
    return state_ == OperationState::Succeeded || state_ == OperationState::Failed;
  }
  [[nodiscard]] bool is_successful() const noexcept { return state_ == OperationState::Succeeded; }

  [[nodiscard]] AggregationMode aggregation() const noexcept { return aggregation_; }
  [[nodiscard]] bool is_safe() const noexcept { return safe_; }

  /// Positions carried by the operation, in declaration order
  [[nodiscard]] const std::vector<std::shared_ptr<const Position>> & positions() const noexcept
  {
    return positions_;
  }

  /**
   * Whether `other` denotes the same work: same entity and pairwise the same
   * positions. Used to detect re-entrant evaluation.
   */
  [[nodiscard]] virtual bool same_shape(const Operation & other) const noexcept;

  /// e.g. "Convert[Integer -> String]"
  [[nodiscard]] virtual std::string describe() const;

  /// The root entity `Operation<RESULT>`.
  static const Entity & declare(TypeContext & types);

protected:
  explicit Operation(const Entity & entity, AggregationMode aggregation = AggregationMode::FirstSuccess)
  : entity_(&entity), aggregation_(aggregation)
  {
  }

  void add_position(std::shared_ptr<const Position> position) { positions_.push_back(std::move(position)); }
  void mark_safe() noexcept { safe_ = true; }

private:
  friend class Context;

  void transition(OperationState next) noexcept { state_ = next; }

  const Entity * entity_;
  AggregationMode aggregation_;
  OperationState state_ = OperationState::Created;
  bool safe_ = false;
  std::vector<std::shared_ptr<const Position>> positions_;
};

/**
 * Operation with a typed result slot.
 */
template <typename R>
class ResultOperation : public Operation
{
public:
  using result_type = R;

  [[nodiscard]] const std::optional<R> & result() const noexcept { return result_; }
  void set_result(R value) { result_ = std::move(value); }

protected:
  using Operation::Operation;

private:
  std::optional<R> result_;
};

template <>
class ResultOperation<void> : public Operation
{
public:
  using result_type = void;

protected:
  using Operation::Operation;
};

}  // namespace typeweave
