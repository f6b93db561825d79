// typeweave/dispatch/context.cpp - Operation evaluation
//
#include "typeweave/dispatch/context.hpp"

#include <algorithm>
#include <string>

#include <fmt/format.h>

#include "typeweave/basic/error.hpp"

namespace typeweave
{

namespace
{

/// Pushes an operation on a stack for the guard's lifetime.
class StackGuard
{
public:
  StackGuard(std::vector<const Operation *> & stack, const Operation & operation) : stack_(stack)
  {
    stack_.push_back(&operation);
  }
  ~StackGuard() { stack_.pop_back(); }

  StackGuard(const StackGuard &) = delete;
  StackGuard & operator=(const StackGuard &) = delete;

private:
  std::vector<const Operation *> & stack_;
};

bool on_stack(const std::vector<const Operation *> & stack, const Operation & operation)
{
  return std::any_of(stack.begin(), stack.end(), [&](const Operation * in_flight) {
    return in_flight->same_shape(operation);
  });
}

std::string cause_message(const std::exception_ptr & cause)
{
  try {
    std::rethrow_exception(cause);
  } catch (const std::exception & e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

}  // namespace

Context::Context(const Engine & engine, DiagnosticBag * trace)
: engine_(&engine), trace_(trace)
{
  if (trace_ == nullptr && engine.trace_enabled()) {
    trace_ = &own_trace_;
  }
}

// ============================================================================
// Support
// ============================================================================

bool Context::check_support(const RegisteredOperator & entry, const Operation & operation)
{
  if (!engine_->matches(entry, operation)) {
    return false;
  }
  try {
    return entry.op->supports(*this, operation);
  } catch (const DefinitionError &) {
    throw;
  } catch (const ResolutionError &) {
    throw;
  } catch (const OperationError & e) {
    if (e.code() == ErrorCode::ReentrantOperation) {
      throw;
    }
    operator_failed(entry, operation, std::current_exception());
  } catch (...) {
    operator_failed(entry, operation, std::current_exception());
  }
}

bool Context::supports(const Operation & operation)
{
  if (on_stack(support_stack_, operation)) {
    return false;
  }
  const StackGuard guard(support_stack_, operation);
  const auto & entries = engine_->registry().entries();
  return std::any_of(entries.begin(), entries.end(), [&](const RegisteredOperator & entry) {
    return check_support(entry, operation);
  });
}

std::vector<const RegisteredOperator *> Context::candidates(const Operation & operation)
{
  std::vector<const RegisteredOperator *> result;
  if (on_stack(support_stack_, operation)) {
    return result;
  }
  const StackGuard guard(support_stack_, operation);
  for (const auto & entry : engine_->registry().entries()) {
    if (check_support(entry, operation)) {
      result.push_back(&entry);
    }
  }
  return result;
}

// ============================================================================
// Evaluation
// ============================================================================

void Context::operator_failed(
  const RegisteredOperator & entry, const Operation & operation, std::exception_ptr cause)
{
  const std::string op_name(entry.op->name());
  Diagnostic diag = make_error_diagnostic(
    ErrorCode::OperatorFailed, op_name,
    fmt::format("operator '{}' failed on {}: {}", op_name, operation.describe(), cause_message(cause)));
  diag.labels.push_back(Label{operation.describe(), "while evaluating", LabelStyle::Secondary});
  if (trace_ != nullptr) {
    trace_->add(diag);
  }
  throw OperationError(ErrorCode::OperatorFailed, std::move(diag), std::move(cause));
}

bool Context::run(const RegisteredOperator & entry, Operation & operation)
{
  try {
    return entry.op->perform(*this, operation);
  } catch (const DefinitionError &) {
    throw;
  } catch (const ResolutionError &) {
    throw;
  } catch (const OperationError & e) {
    if (e.code() == ErrorCode::ReentrantOperation) {
      throw;
    }
    operator_failed(entry, operation, std::current_exception());
  } catch (...) {
    operator_failed(entry, operation, std::current_exception());
  }
}

bool Context::eval_success(Operation & operation)
{
  if (operation.is_terminal()) {
    if (operation.is_safe()) {
      return operation.is_successful();
    }
    throw_operation_error(
      ErrorCode::AlreadyEvaluated, operation.describe(),
      fmt::format("{} has already been evaluated", operation.describe()));
  }
  if (on_stack(eval_stack_, operation)) {
    throw_operation_error(
      ErrorCode::ReentrantOperation, operation.describe(),
      fmt::format("{} is already being evaluated", operation.describe()));
  }

  const StackGuard guard(eval_stack_, operation);
  operation.transition(OperationState::Matching);

  std::vector<const RegisteredOperator *> selected;
  try {
    selected = candidates(operation);
  } catch (...) {
    operation.transition(OperationState::Failed);
    throw;
  }

  operation.transition(OperationState::Executing);
  bool succeeded = false;
  for (const RegisteredOperator * entry : selected) {
    const std::string op_name(entry->op->name());
    if (trace_ != nullptr) {
      trace_->report_info(op_name, fmt::format("selected for {}", operation.describe()));
    }

    bool performed = false;
    try {
      performed = run(*entry, operation);
    } catch (...) {
      operation.transition(OperationState::Failed);
      throw;
    }

    if (trace_ != nullptr) {
      if (performed) {
        trace_->report_info(op_name, fmt::format("performed {}", operation.describe()));
      } else {
        trace_->report_warning(op_name, fmt::format("declined {}", operation.describe()));
      }
    }

    if (performed) {
      succeeded = true;
      if (operation.aggregation() == AggregationMode::FirstSuccess) {
        break;
      }
    }
  }

  operation.transition(succeeded ? OperationState::Succeeded : OperationState::Failed);
  return succeeded;
}

void Context::forward_to(Operation & operation)
{
  if (!eval_success(operation)) {
    throw_operation_error(
      ErrorCode::Unsupported, operation.describe(),
      fmt::format("no operator succeeded for {}", operation.describe()));
  }
}

}  // namespace typeweave
