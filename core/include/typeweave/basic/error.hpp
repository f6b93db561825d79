// typeweave/basic/error.hpp - Error taxonomy
//
// Definition errors are raised while entities, operators and modules are
// assembled. Resolution errors indicate misuse of the resolver API. Operation
// errors are raised by the dispatch engine.
//
#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "typeweave/basic/diagnostic.hpp"

namespace typeweave
{

enum class ErrorCode : uint8_t {
  // Definition errors
  MalformedBindingAccessor,
  CyclicPrecedence,
  MissingDefaultConstructor,
  ArityMismatch,
  DuplicateEntity,
  MalformedDeclaration,

  // Resolution errors
  InvalidPlaceholderKind,
  PlaceholderNotOwned,

  // Dispatch / execution errors
  Unsupported,
  AlreadyEvaluated,
  OperatorFailed,
  ReentrantOperation,
};

/// Stable diagnostic code for an error code (e.g. "TW0201").
[[nodiscard]] std::string_view error_code_id(ErrorCode code) noexcept;

/// Human-readable name of an error code (e.g. "CyclicPrecedence").
[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

/**
 * Base class of all errors raised by the library.
 *
 * Carries the error code and a diagnostic describing the failure; the
 * diagnostic's primary label names the entity, operator or operation at fault.
 */
class Error : public std::runtime_error
{
public:
  Error(ErrorCode code, Diagnostic diagnostic);

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }
  [[nodiscard]] const Diagnostic & diagnostic() const noexcept { return diagnostic_; }

private:
  ErrorCode code_;
  Diagnostic diagnostic_;
};

/// Raised once, at entity / operator / module assembly time.
class DefinitionError : public Error
{
public:
  using Error::Error;
};

/// Raised when the resolver is called with a placeholder it cannot resolve.
class ResolutionError : public Error
{
public:
  using Error::Error;
};

/// Raised by the dispatch engine.
class OperationError : public Error
{
public:
  using Error::Error;

  OperationError(ErrorCode code, Diagnostic diagnostic, std::exception_ptr cause)
  : Error(code, std::move(diagnostic)), cause_(std::move(cause))
  {
  }

  /// Exception raised by the operator, for OperatorFailed.
  [[nodiscard]] std::exception_ptr cause() const noexcept { return cause_; }

private:
  std::exception_ptr cause_;
};

/**
 * Build the diagnostic for an error.
 *
 * @param code Error code (also determines the diagnostic code)
 * @param subject Primary subject (entity, operator or operation)
 * @param message Main message
 */
[[nodiscard]] Diagnostic make_error_diagnostic(
  ErrorCode code, std::string subject, std::string message);

[[noreturn]] void throw_definition_error(ErrorCode code, std::string subject, std::string message);
[[noreturn]] void throw_resolution_error(ErrorCode code, std::string subject, std::string message);
[[noreturn]] void throw_operation_error(ErrorCode code, std::string subject, std::string message);

}  // namespace typeweave
