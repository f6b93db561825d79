// typeweave/basic/error.cpp - Error taxonomy implementation
#include "typeweave/basic/error.hpp"

#include <utility>

namespace typeweave
{

std::string_view error_code_id(ErrorCode code) noexcept
{
  switch (code) {
    case ErrorCode::MalformedBindingAccessor:
      return "TW0101";
    case ErrorCode::CyclicPrecedence:
      return "TW0102";
    case ErrorCode::MissingDefaultConstructor:
      return "TW0103";
    case ErrorCode::ArityMismatch:
      return "TW0104";
    case ErrorCode::DuplicateEntity:
      return "TW0105";
    case ErrorCode::MalformedDeclaration:
      return "TW0106";
    case ErrorCode::InvalidPlaceholderKind:
      return "TW0201";
    case ErrorCode::PlaceholderNotOwned:
      return "TW0202";
    case ErrorCode::Unsupported:
      return "TW0301";
    case ErrorCode::AlreadyEvaluated:
      return "TW0302";
    case ErrorCode::OperatorFailed:
      return "TW0303";
    case ErrorCode::ReentrantOperation:
      return "TW0304";
  }
  return "TW0000";
}

std::string_view error_code_name(ErrorCode code) noexcept
{
  switch (code) {
    case ErrorCode::MalformedBindingAccessor:
      return "MalformedBindingAccessor";
    case ErrorCode::CyclicPrecedence:
      return "CyclicPrecedence";
    case ErrorCode::MissingDefaultConstructor:
      return "MissingDefaultConstructor";
    case ErrorCode::ArityMismatch:
      return "ArityMismatch";
    case ErrorCode::DuplicateEntity:
      return "DuplicateEntity";
    case ErrorCode::MalformedDeclaration:
      return "MalformedDeclaration";
    case ErrorCode::InvalidPlaceholderKind:
      return "InvalidPlaceholderKind";
    case ErrorCode::PlaceholderNotOwned:
      return "PlaceholderNotOwned";
    case ErrorCode::Unsupported:
      return "Unsupported";
    case ErrorCode::AlreadyEvaluated:
      return "AlreadyEvaluated";
    case ErrorCode::OperatorFailed:
      return "OperatorFailed";
    case ErrorCode::ReentrantOperation:
      return "ReentrantOperation";
  }
  return "Unknown";
}

Error::Error(ErrorCode code, Diagnostic diagnostic)
: std::runtime_error(diagnostic.message), code_(code), diagnostic_(std::move(diagnostic))
{
}

Diagnostic make_error_diagnostic(ErrorCode code, std::string subject, std::string message)
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.code = std::string(error_code_id(code));
  d.message = std::move(message);
  d.labels.push_back(Label{std::move(subject), "", LabelStyle::Primary});
  return d;
}

void throw_definition_error(ErrorCode code, std::string subject, std::string message)
{
  throw DefinitionError(code, make_error_diagnostic(code, std::move(subject), std::move(message)));
}

void throw_resolution_error(ErrorCode code, std::string subject, std::string message)
{
  throw ResolutionError(code, make_error_diagnostic(code, std::move(subject), std::move(message)));
}

void throw_operation_error(ErrorCode code, std::string subject, std::string message)
{
  throw OperationError(code, make_error_diagnostic(code, std::move(subject), std::move(message)));
}

}  // namespace typeweave
