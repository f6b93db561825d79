// typeweave/dispatch/operator.hpp - Handlers for operations
//
// An operator is an instance of an entity implementing Operator<OPERATION>.
// The type argument is the operation shape it accepts; the engine matches it
// against each submitted operation before asking the operator itself.
//
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "typeweave/dispatch/operation.hpp"

namespace typeweave
{

class Context;

class Operator : public Instance
{
public:
  explicit Operator(const Entity & entity) : entity_(&entity) {}
  ~Operator() override = default;

  Operator(const Operator &) = delete;
  Operator & operator=(const Operator &) = delete;

  [[nodiscard]] const Entity & entity() const noexcept override { return *entity_; }
  [[nodiscard]] std::string_view name() const noexcept { return entity_->name(); }

  /**
   * Operator-specific predicate, consulted once the declared signature
   * matches. May submit nested support checks through `context`.
   */
  [[nodiscard]] virtual bool supports(Context & context, const Operation & operation) const = 0;

  /**
   * Execute the operation.
   *
   * @return false if the operator declined
   */
  virtual bool perform(Context & context, Operation & operation) const = 0;

  /// Names of operator entities that must be ordered before this one
  [[nodiscard]] virtual std::vector<std::string> depends_on() const { return {}; }

  /// The interface `Operator<OPERATION extends Operation>`.
  static const Entity & declare(TypeContext & types);

  /// Operator<operation_type>
  static const TypeExpr * signature(TypeContext & types, const TypeExpr * operation_type);

  /// Non-generic operator entity `name` implementing Operator<operation_type>.
  static const Entity & declare_for(
    TypeContext & types, std::string_view name, const TypeExpr * operation_type);

private:
  const Entity * entity_;
};

/**
 * Operator bound to one C++ operation class.
 *
 * Operations of another class are neither supported nor performed.
 */
template <typename Op>
class TypedOperator : public Operator
{
public:
  using Operator::Operator;

  [[nodiscard]] bool supports(Context & context, const Operation & operation) const final
  {
    const auto * op = dynamic_cast<const Op *>(&operation);
    return op != nullptr && accepts(context, *op);
  }

  bool perform(Context & context, Operation & operation) const final
  {
    auto * op = dynamic_cast<Op *>(&operation);
    return op != nullptr && apply(context, *op);
  }

protected:
  [[nodiscard]] virtual bool accepts(Context & context, const Op & operation) const = 0;
  virtual bool apply(Context & context, Op & operation) const = 0;
};

/**
 * Typed operator relying on its signature alone.
 */
template <typename Op>
class OptimisticOperator : public TypedOperator<Op>
{
public:
  using TypedOperator<Op>::TypedOperator;

protected:
  [[nodiscard]] bool accepts(Context & /*context*/, const Op & /*operation*/) const override
  {
    return true;
  }
};

}  // namespace typeweave
