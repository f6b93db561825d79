// typeweave/dispatch/operation.cpp - Operation base implementation
//
#include "typeweave/dispatch/operation.hpp"

#include "typeweave/types/type_utils.hpp"

namespace typeweave
{

std::string_view to_string(OperationState state) noexcept
{
  switch (state) {
    case OperationState::Created:
      return "created";
    case OperationState::Matching:
      return "matching";
    case OperationState::Executing:
      return "executing";
    case OperationState::Succeeded:
      return "succeeded";
    case OperationState::Failed:
      return "failed";
  }
  return "unknown";
}

const Entity & Operation::declare(TypeContext & types)
{
  return types.declare_once("Operation", false, {"RESULT"}, nullptr);
}

bool Operation::same_shape(const Operation & other) const noexcept
{
  if (this == &other) {
    return true;
  }
  if (entity_ != &other.entity() || positions_.size() != other.positions().size()) {
    return false;
  }
  for (size_t i = 0; i < positions_.size(); ++i) {
    if (!positions_[i]->same_as(*other.positions()[i])) {
      return false;
    }
  }
  return true;
}

std::string Operation::describe() const
{
  std::string out(entity_->name());
  out += "[";
  for (size_t i = 0; i < positions_.size(); ++i) {
    if (i > 0) out += " -> ";
    out += to_string(positions_[i]->type());
  }
  out += "]";
  return out;
}

}  // namespace typeweave
