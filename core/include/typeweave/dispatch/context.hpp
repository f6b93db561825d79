// typeweave/dispatch/context.hpp - Per-thread evaluation context
//
// A Context evaluates operations against a shared Engine. It tracks the
// operations in flight (to reject re-entrant evaluation), the scoped hints
// pushed by callers and operators, and an optional diagnostic trace.
//
#pragma once

#include <any>
#include <cstddef>
#include <exception>
#include <optional>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

#include "typeweave/basic/diagnostic.hpp"
#include "typeweave/dispatch/engine.hpp"

namespace typeweave
{

class Context
{
public:
  /**
   * @param trace Bag receiving the trace; when null, the context records
   *        into its own bag if the engine enables tracing
   */
  explicit Context(const Engine & engine, DiagnosticBag * trace = nullptr);

  Context(const Context &) = delete;
  Context & operator=(const Context &) = delete;

  [[nodiscard]] const Engine & engine() const noexcept { return *engine_; }
  [[nodiscard]] TypeContext & types() const noexcept { return engine_->types(); }
  [[nodiscard]] const GenericResolver & resolver() const noexcept { return engine_->resolver(); }
  [[nodiscard]] const PropertyResolver & property_resolver() const noexcept
  {
    return engine_->property_resolver();
  }

  /// Trace bag, or nullptr when tracing is off
  [[nodiscard]] DiagnosticBag * trace() const noexcept { return trace_; }

  // ===========================================================================
  // Evaluation
  // ===========================================================================

  /**
   * Whether at least one operator accepts the operation.
   *
   * A support check re-entering an operation of the same shape declines.
   */
  [[nodiscard]] bool supports(const Operation & operation);

  /// Ordered candidate list
  [[nodiscard]] std::vector<const RegisteredOperator *> candidates(const Operation & operation);

  /**
   * Evaluate the operation and report success.
   *
   * @throws OperationError (AlreadyEvaluated) for a terminal, unsafe operation
   * @throws OperationError (ReentrantOperation) if an operation of the same
   *         shape is being evaluated
   * @throws OperationError (OperatorFailed) if an operator raised
   */
  bool eval_success(Operation & operation);

  /**
   * Evaluate and require success.
   *
   * @throws OperationError (Unsupported) if no candidate succeeded
   */
  void forward_to(Operation & operation);

  /// Evaluate and return the result.
  template <typename R>
  R eval(ResultOperation<R> & operation)
  {
    forward_to(operation);
    if constexpr (!std::is_void_v<R>) {
      return operation.result().value();
    }
  }

  /// Evaluate only if supported; empty (false for void results) otherwise.
  template <typename R>
  std::conditional_t<std::is_void_v<R>, bool, std::optional<R>> eval_if_supported(
    ResultOperation<R> & operation)
  {
    if constexpr (std::is_void_v<R>) {
      return supports(operation) && eval_success(operation);
    } else {
      if (!supports(operation) || !eval_success(operation)) {
        return std::nullopt;
      }
      return operation.result();
    }
  }

  // ===========================================================================
  // Hints
  // ===========================================================================

  /**
   * Pops the hints pushed since its creation.
   */
  class HintScope
  {
  public:
    HintScope(Context & context, size_t depth) : context_(&context), depth_(depth) {}
    HintScope(HintScope && other) noexcept : context_(other.context_), depth_(other.depth_)
    {
      other.context_ = nullptr;
    }
    HintScope(const HintScope &) = delete;
    HintScope & operator=(const HintScope &) = delete;
    HintScope & operator=(HintScope &&) = delete;

    ~HintScope()
    {
      if (context_ != nullptr) {
        context_->pop_hints(depth_);
      }
    }

  private:
    Context * context_;
    size_t depth_;
  };

  template <typename T>
  [[nodiscard]] HintScope push_hint(T value)
  {
    const size_t depth = hints_.size();
    hints_.emplace_back(std::type_index(typeid(T)), std::any(std::move(value)));
    return HintScope(*this, depth);
  }

  /// Innermost hint of type T, then the engine default, then `fallback`.
  template <typename T>
  [[nodiscard]] T hint(T fallback) const
  {
    const std::type_index key(typeid(T));
    for (auto it = hints_.rbegin(); it != hints_.rend(); ++it) {
      if (it->first == key) {
        return std::any_cast<T>(it->second);
      }
    }
    if (const T * value = engine_->default_hints().template find<T>()) {
      return *value;
    }
    return fallback;
  }

private:
  void pop_hints(size_t depth)
  {
    hints_.erase(hints_.begin() + static_cast<std::ptrdiff_t>(depth), hints_.end());
  }

  bool check_support(const RegisteredOperator & entry, const Operation & operation);
  bool run(const RegisteredOperator & entry, Operation & operation);
  [[noreturn]] void operator_failed(
    const RegisteredOperator & entry, const Operation & operation, std::exception_ptr cause);

  const Engine * engine_;
  DiagnosticBag own_trace_;
  DiagnosticBag * trace_;

  std::vector<const Operation *> eval_stack_;
  std::vector<const Operation *> support_stack_;
  std::vector<std::pair<std::type_index, std::any>> hints_;
};

}  // namespace typeweave
