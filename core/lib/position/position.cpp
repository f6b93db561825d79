// typeweave/position/position.cpp - Position defaults
//
#include "typeweave/position/position.hpp"

#include "typeweave/types/type_utils.hpp"

namespace typeweave
{

std::string Position::describe() const { return "position of " + to_string(type()); }

}  // namespace typeweave
